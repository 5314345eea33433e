#include "parser.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <sstream>
#include <string>

using namespace parser;

template<class Parser>
static void assert_parse(Parser parser, std::string input) {
  range in{input.data(), input.data() + input.size()};
  ASSERT_TRUE(parser(in)) << input;
}

template<class Parser>
static void assert_fail(Parser parser, std::string input) {
  range in{input.data(), input.data() + input.size()};
  auto res = parser(in);
  ASSERT_FALSE(res) << input;
  // failure never moves the cursor
  ASSERT_EQ(in.first, res.left().first) << input;
}

static std::string rest(range in) {
  return std::string(in.first, in.last);
}


TEST(parser, character) {
  const std::string input = "()";
  auto res = character(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ('(', res.get()->value);
  ASSERT_EQ(")", rest(*res.get()));

  assert_fail(character, "");
}


TEST(parser, pred) {
  const auto digit = pred([](char c) { return c >= '0' && c <= '9'; });
  assert_parse(digit, "1a");
  assert_fail(digit, "a1");
  assert_fail(digit, "");
}


TEST(parser, single) {
  const std::string input = "12";
  auto res = single('1')(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ('1', res.get()->value);
  ASSERT_EQ("2", rest(*res.get()));

  assert_fail(single('2'), "12");
  assert_fail(single('2'), "");
}


TEST(parser, literal) {
  const std::string input = "foobar";
  auto res = literal("foo")(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ("foo", res.get()->value);
  ASSERT_EQ("bar", rest(*res.get()));

  assert_parse(literal("foo"), "foo");
  assert_parse(literal(""), "foo");
  assert_fail(literal("foo"), "fo");
  assert_fail(literal("foo"), "bar");
  assert_fail(literal("foo"), "");
}


TEST(parser, one_of) {
  const std::string input = "2231235";
  auto res = kleene(one_of("123"))(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ(6u, res.get()->value.size());
  ASSERT_EQ("5", rest(*res.get()));

  assert_fail(one_of(""), "123");
}


TEST(parser, between) {
  const std::string input = "hello!";
  auto res = kleene(between('a', 'z'))(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ("hello", std::string(res.get()->value.begin(), res.get()->value.end()));
  ASSERT_EQ("!", rest(*res.get()));

  assert_fail(between('a', 'a'), "123");
  assert_fail(between('z', 'a'), "m");
}


TEST(parser, sequence) {
  const std::string input = "abc";
  auto res = sequence(single('a'), single('b'))(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ('a', res.get()->value.first);
  ASSERT_EQ('b', res.get()->value.second);
  ASSERT_EQ("c", rest(*res.get()));

  // 'a' matched but the whole sequence fails from the start
  assert_fail(sequence(single('a'), single('b')), "ac");
  assert_fail(sequence(single('a'), single('b')), "a");
}


TEST(parser, then) {
  const std::string input = "ab";
  auto res = (single('a') >> single('b'))(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ('b', res.get()->value);
  ASSERT_EQ("", rest(*res.get()));

  assert_fail(single('a') >> single('b'), "");
}


TEST(parser, drop) {
  const std::string input = "ab";
  auto res = (single('a') >>= drop(single('b')))(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ('a', res.get()->value);

  assert_fail(single('a') >>= drop(single('b')), "aa");
}


TEST(parser, bind) {
  // the second char must repeat the first one
  const auto twice = character >>= [](char c) { return single(c); };
  assert_parse(twice, "aa");
  assert_parse(twice, "zz");
  assert_fail(twice, "ab");
  assert_fail(twice, "a");
}


TEST(parser, coproduct) {
  const auto parser = single('a') | single('b');

  assert_parse(parser, "a");
  assert_parse(parser, "b");
  assert_fail(parser, "c");
  assert_fail(parser, "");
}


TEST(parser, coproduct_backtracks) {
  // both alternatives start with 'a': the second one must see it again
  const auto parser = (single('a') >> single('b')) | (single('a') >> single('c'));

  const std::string input = "ac";
  auto res = parser(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ('c', res.get()->value);
  ASSERT_EQ("", rest(*res.get()));

  assert_fail(parser, "ad");
}


TEST(parser, coproduct_first_match_wins) {
  const auto parser = (literal("a") |= [](std::string) { return 1; }) |
                      (literal("ab") |= [](std::string) { return 2; });

  const std::string input = "ab";
  auto res = parser(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ(1, res.get()->value);
  ASSERT_EQ("b", rest(*res.get()));
}


TEST(parser, kleene) {
  const std::string input = "1111222";
  auto ones = kleene(single('1'))(make_range(input));
  ASSERT_TRUE(ones);
  ASSERT_EQ(4u, ones.get()->value.size());

  auto twos = kleene(single('2'))(*ones.get());
  ASSERT_TRUE(twos);
  ASSERT_EQ(3u, twos.get()->value.size());
  ASSERT_EQ("", rest(*twos.get()));

  const std::string empty;
  auto none = kleene(single('1'))(make_range(empty));
  ASSERT_TRUE(none);
  ASSERT_TRUE(none.get()->value.empty());
}


TEST(parser, kleene_requires_progress) {
  const std::string input = "abc";
  ASSERT_THROW(kleene(pure('x'))(make_range(input)), grammar_error);
  ASSERT_THROW(kleene(whitespace())(make_range(input)), grammar_error);
  ASSERT_THROW(skip(optional(single('z')))(make_range(input)), grammar_error);
}


TEST(parser, plus) {
  const std::string input = "11x";
  auto res = plus(single('1'))(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ(2u, res.get()->value.size());
  ASSERT_EQ("x", rest(*res.get()));

  assert_fail(plus(single('1')), "x");
  assert_fail(plus(single('1')), "");
}


TEST(parser, optional) {
  const std::string present = "ab";
  auto res = optional(single('a'))(make_range(present));
  ASSERT_TRUE(res);
  ASSERT_TRUE(res.get()->value);
  ASSERT_EQ('a', res.get()->value.get());
  ASSERT_EQ("b", rest(*res.get()));

  const std::string absent = "b";
  auto other = optional(single('a'))(make_range(absent));
  ASSERT_TRUE(other);
  ASSERT_FALSE(other.get()->value);
  ASSERT_EQ('z', other.get()->value.value_or('z'));
  ASSERT_EQ("b", rest(*other.get()));
}


TEST(parser, map) {
  const auto upper = single('a') |= [](char c) { return char(std::toupper(c)); };

  const std::string input = "a";
  auto res = upper(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ('A', res.get()->value);

  assert_fail(upper, "b");
  assert_fail(upper, "");
}


TEST(parser, delimited) {
  const auto number = delimited(single('['), plus(between('0', '9')), single(']'));

  const std::string input = "[42]x";
  auto res = number(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ("42", std::string(res.get()->value.begin(), res.get()->value.end()));
  ASSERT_EQ("x", rest(*res.get()));

  assert_fail(number, "[42");
  assert_fail(number, "42]");
  assert_fail(number, "[]");
}


TEST(parser, list) {
  const auto items = single('a') % single(',');

  const std::string input = "a,a,a";
  auto res = items(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ(3u, res.get()->value.size());

  assert_fail(items, "");
  assert_fail(items, ",a");
}


TEST(parser, separated) {
  const auto items = separated(single('a'), single(','));

  const std::string input = "a,a,a";
  auto res = items(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ(3u, res.get()->value.size());
  ASSERT_EQ("", rest(*res.get()));

  const std::string empty;
  auto none = items(make_range(empty));
  ASSERT_TRUE(none);
  ASSERT_TRUE(none.get()->value.empty());

  // trailing separator is left alone
  const std::string trailing = "a,a,";
  auto two = items(make_range(trailing));
  ASSERT_TRUE(two);
  ASSERT_EQ(2u, two.get()->value.size());
  ASSERT_EQ(",", rest(*two.get()));
}


TEST(parser, until) {
  const auto parser = until(character, single('!'));

  const std::string input = "hello!";
  auto res = parser(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ("hello", std::string(res.get()->value.begin(), res.get()->value.end()));
  ASSERT_EQ("!", rest(*res.get()));

  assert_parse(parser, "!");
  assert_fail(parser, "hello");
  assert_fail(parser, "");
}


TEST(parser, whitespace) {
  const std::string input = "   \n    \tasdf";
  auto res = whitespace()(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ("asdf", rest(*res.get()));

  assert_parse(whitespace(), "");
  assert_parse(whitespace(), "asdf");
}


TEST(parser, token) {
  const std::string input = " \t x";
  auto res = token(single('x'))(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ("", rest(*res.get()));

  const std::string dashes = "--x";
  auto other = token(single('x'), single('-'))(make_range(dashes));
  ASSERT_TRUE(other);

  assert_fail(token(single('x')), "  y");
}


TEST(parser, eos) {
  assert_parse(eos, "");
  assert_fail(eos, "a");
}


TEST(parser, pure_fail) {
  const std::string input = "abc";
  auto res = pure(42)(make_range(input));
  ASSERT_TRUE(res);
  ASSERT_EQ(42, res.get()->value);
  ASSERT_EQ("abc", rest(*res.get()));

  assert_fail(fail<int>(), "abc");
}


TEST(parser, guard) {
  const auto even = character >>= guard([](char c) { return (c - '0') % 2 == 0; });
  assert_parse(even, "4");
  assert_fail(even, "3");
}


TEST(parser, ref) {
  const auto a = single('a');
  const auto parser = plus(ref(a));
  assert_parse(parser, "aaa");
  assert_fail(parser, "b");
}


// parenthesis nesting depth
template<class Parser>
static std::size_t nesting(Parser parser, const std::string& input) {
  return run(parser, input);
}

TEST(parser, fix) {
  const auto parens = [](std::size_t depth) {
    return fix<std::size_t>([](auto self) {
        return delimited(single('('), optional(self), single(')')) |= [](maybe<std::size_t> inner) {
          return inner.value_or(0) + 1;
        };
      }, depth);
  };

  ASSERT_EQ(1u, nesting(parens(8), "()"));
  ASSERT_EQ(3u, nesting(parens(8), "((()))"));
  ASSERT_THROW(nesting(parens(8), "((())"), parse_error);
  ASSERT_THROW(parens(2)(make_range("((()))")), depth_error);
}


TEST(parser, parse) {
  auto ok = parse(single('a'), "a");
  ASSERT_TRUE(ok);
  ASSERT_EQ('a', ok.right());

  auto trailing = parse(single('a'), "ab");
  ASSERT_FALSE(trailing);
  ASSERT_EQ(failure::trailing_input, trailing.left().kind);

  auto mismatch = parse(single('a'), "b");
  ASSERT_FALSE(mismatch);
  ASSERT_EQ(failure::mismatch, mismatch.left().kind);

  const auto deep = fix<unit>([](auto self) {
      return delimited(single('('), optional(self), single(')')) |= [](maybe<unit>) {
        return unit{};
      };
    }, 1);

  auto too_deep = parse(deep, "(())");
  ASSERT_FALSE(too_deep);
  ASSERT_EQ(failure::too_deep, too_deep.left().kind);
}


TEST(parser, run) {
  ASSERT_EQ('a', run(single('a'), "a"));
  ASSERT_THROW(run(single('a'), "b"), parse_error);
  ASSERT_THROW(run(single('a'), "ab"), parse_error);

  std::stringstream ss("abc");
  ASSERT_EQ(3u, run(plus(character), ss).size());
}


TEST(parser, trace) {
  std::stringstream log;
  const auto parser = trace("a", single('a'), log);

  assert_parse(parser, "ab");
  ASSERT_EQ("> a: \"ab\"\n< a ok: \"b\"\n", log.str());

  log.str("");
  assert_fail(parser, "b");
  ASSERT_EQ("> a: \"b\"\n< a failed\n", log.str());
}


TEST(parser, debug) {
  std::stringstream log;
  const auto parser = debug("a", log) <<= single('a');

  assert_parse(parser, "a");
  assert_fail(parser, "b");

#ifdef PARSER_ENABLE_DEBUG
  ASSERT_FALSE(log.str().empty());
#else
  ASSERT_TRUE(log.str().empty());
#endif
}
