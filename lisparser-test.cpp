#include "lisparser/grammar.hpp"
#include "lisparser/parse.hpp"

#include <gtest/gtest.h>

#include <pthread.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <thread>
#include <typeinfo>
#include <vector>

using namespace lisparser;

static object id(const char* name) {
  return lisparser::ident{name};
}

static object str(const char* value) {
  return lisparser::string{value};
}

static object lst(std::vector<object> items) {
  return lisparser::list{std::move(items)};
}

static std::size_t depth(const object& self) {
  if(const lisparser::list* value = self.get_if<lisparser::list>()) {
    std::size_t result = 0;
    for(const auto& item: value->items) {
      result = std::max(result, depth(item));
    }
    return result + 1;
  }

  return 0;
}

static std::string nested(std::size_t count) {
  return std::string(count, '(') + std::string(count, ')');
}

template<class T>
static parser::failure::kind_type failed(const outcome<T>& res) {
  EXPECT_FALSE(res);
  if(res) return parser::failure::mismatch;
  return res.left().kind;
}

template<class Func>
static void* call(void* data) {
  (*static_cast<Func*>(data))();
  return nullptr;
}

// run func on a thread with the given stack size
template<class Func>
static void with_stack(std::size_t bytes, Func func) {
  pthread_attr_t attr;
  ASSERT_EQ(0, pthread_attr_init(&attr));
  ASSERT_EQ(0, pthread_attr_setstacksize(&attr, bytes));

  pthread_t thread;
  ASSERT_EQ(0, pthread_create(&thread, &attr, &call<Func>, &func));
  ASSERT_EQ(0, pthread_join(thread, nullptr));
  pthread_attr_destroy(&attr);
}

static const char* example = "(asd (\"asdasd\" asd (\"asd\") asd) \"asdasd\" ())";


TEST(lisparser, ident) {
  ASSERT_EQ(id("hello"), read("hello"));
  ASSERT_EQ(id("a-b?c!"), read("a-b?c!"));
  ASSERT_EQ(id("42"), read("42"));
  ASSERT_EQ(id("x"), read("x"));
}


TEST(lisparser, ident_stops_at_delimiters) {
  for(const char* text: {"ab cd", "ab(cd", "ab)cd", "ab\"cd\""}) {
    auto res = parser::parse(grammar::ident(), text);
    ASSERT_FALSE(res) << text;
    ASSERT_EQ(parser::failure::trailing_input, res.left().kind) << text;
  }

  // no implicit leading whitespace
  ASSERT_EQ(parser::failure::mismatch, parser::parse(grammar::ident(), " ab").left().kind);
  ASSERT_EQ(parser::failure::mismatch, parser::parse(grammar::ident(), "").left().kind);
}


TEST(lisparser, string) {
  ASSERT_EQ(str("hello world"), read("\"hello world\""));
  ASSERT_EQ(str(""), read("\"\""));
  ASSERT_EQ(str("  a\tb \n"), read("\"  a\tb \n\""));
  ASSERT_EQ(str("(a b)"), read("\"(a b)\""));

  const std::string chars = "x_y z(w)!";
  ASSERT_EQ(lisparser::string{chars}, read("\"" + chars + "\"").get<lisparser::string>());
}


TEST(lisparser, unterminated_string) {
  ASSERT_EQ(parser::failure::mismatch, failed(parse("\"abc")));
  ASSERT_EQ(parser::failure::mismatch, failed(parse("(\"abc)")));

  const std::string input = "\"abc";
  auto res = grammar::string()(parser::make_range(input));
  ASSERT_FALSE(res);
  ASSERT_EQ(input.data(), res.left().first);
}


TEST(lisparser, list) {
  auto res = parser::parse(grammar::list(), "( a )");
  ASSERT_TRUE(res);
  ASSERT_EQ(lst({id("a")}), res.right());

  ASSERT_EQ(parser::failure::mismatch, parser::parse(grammar::list(), "a").left().kind);
  ASSERT_EQ(parser::failure::mismatch, parser::parse(grammar::list(), "\"a\"").left().kind);
  ASSERT_EQ(parser::failure::too_deep, parser::parse(grammar::list(1), "(())").left().kind);
}


TEST(lisparser, empty_list) {
  ASSERT_EQ(lst({}), read("()"));
  ASSERT_EQ(lst({}), read("( )"));
  ASSERT_EQ(lst({}), read("(\n\t )"));
}


TEST(lisparser, list_order) {
  ASSERT_EQ(lst({id("a"), id("b"), id("c")}), read("(a b c)"));
  ASSERT_EQ(lst({id("c"), id("b"), id("a")}), read("(  c\n b\t a  )"));
  ASSERT_NE(read("(a b c)"), read("(c b a)"));
}


TEST(lisparser, list_without_separators) {
  ASSERT_EQ(lst({id("a"), lst({id("b")}), str("c"), id("d")}),
            read("(a(b)\"c\"d)"));
}


TEST(lisparser, nesting) {
  for(std::size_t i = 1; i <= 64; ++i) {
    const object res = read(nested(i));
    ASSERT_EQ(i, depth(res));
  }

  options opts;
  opts.max_depth = 200;
  ASSERT_EQ(200u, depth(read(nested(200), opts)));
}


TEST(lisparser, default_depth_fits_small_stacks) {
  bool ok = false;
  with_stack(1 << 20, [&] {
      ok = bool(parse(nested(default_max_depth)));
    });

  ASSERT_TRUE(ok);
}


TEST(lisparser, example) {
  const object expected =
    lst({id("asd"),
         lst({str("asdasd"), id("asd"), lst({str("asd")}), id("asd")}),
         str("asdasd"),
         lst({})});

  ASSERT_EQ(expected, read(example));
}


TEST(lisparser, surrounding_whitespace) {
  ASSERT_EQ(lst({id("a")}), read("  (a)\n"));
  ASSERT_EQ(id("a"), read("\ta "));
}


TEST(lisparser, trailing_input) {
  ASSERT_EQ(parser::failure::trailing_input, failed(parse("(a) b)")));
  ASSERT_EQ(parser::failure::trailing_input, failed(parse("(a))")));
  ASSERT_EQ(parser::failure::trailing_input, failed(parse("a b")));
}


TEST(lisparser, mismatch) {
  ASSERT_EQ(parser::failure::mismatch, failed(parse("")));
  ASSERT_EQ(parser::failure::mismatch, failed(parse("   ")));
  ASSERT_EQ(parser::failure::mismatch, failed(parse(")")));
  ASSERT_EQ(parser::failure::mismatch, failed(parse("(a")));
  ASSERT_EQ(parser::failure::mismatch, failed(parse("((a)")));
}


TEST(lisparser, max_depth) {
  options opts;
  opts.max_depth = 2;

  ASSERT_TRUE(parse("(())", opts));
  ASSERT_EQ(parser::failure::too_deep, failed(parse("((()))", opts)));
  ASSERT_THROW(read("((()))", opts), parser::parse_error);

  opts.max_depth = 0;
  ASSERT_TRUE(parse("a", opts));
  ASSERT_TRUE(parse("\"a\"", opts));
  ASSERT_EQ(parser::failure::too_deep, failed(parse("()", opts)));

  ASSERT_TRUE(parse(nested(default_max_depth)));
  ASSERT_EQ(parser::failure::too_deep, failed(parse(nested(default_max_depth + 1))));
}


TEST(lisparser, read_throws) {
  ASSERT_THROW(read("(a"), parser::parse_error);
  ASSERT_THROW(read("a b"), parser::parse_error);

  try {
    read("a b");
    FAIL();
  } catch(parser::parse_error& e) {
    ASSERT_EQ(std::string("unexpected trailing input"), e.what());
  }
}


TEST(lisparser, parse_all) {
  const std::vector<object> all = read_all(" a (b)\n\"c\" ");
  ASSERT_EQ(3u, all.size());
  ASSERT_EQ(id("a"), all[0]);
  ASSERT_EQ(lst({id("b")}), all[1]);
  ASSERT_EQ(str("c"), all[2]);

  ASSERT_TRUE(read_all("").empty());
  ASSERT_TRUE(read_all(" \n ").empty());

  ASSERT_EQ(parser::failure::trailing_input, failed(parse_all("a (b")));
  ASSERT_THROW(read_all("a )"), parser::parse_error);
}


TEST(lisparser, print) {
  std::stringstream ss;
  ss << read(example);
  ASSERT_EQ(example, ss.str());

  ss.str("");
  ss << read("  ( a\n\"b c\"  ( ) )");
  ASSERT_EQ("(a \"b c\" ())", ss.str());
}


TEST(lisparser, object_access) {
  const object self = read("(a \"b\")");

  ASSERT_TRUE(self.is<lisparser::list>());
  ASSERT_FALSE(self.is<lisparser::ident>());
  ASSERT_EQ(nullptr, self.get_if<lisparser::string>());
  ASSERT_THROW(self.get<lisparser::ident>(), std::bad_cast);

  const auto& items = self.get<lisparser::list>().items;
  ASSERT_EQ("a", items[0].get<lisparser::ident>().name);
  ASSERT_EQ("b", items[1].get<lisparser::string>().value);
}


TEST(lisparser, copies_are_deep) {
  const object source = read("(a (b))");
  object copy = source;
  ASSERT_EQ(source, copy);

  copy.get<lisparser::list>().items.push_back(id("c"));
  ASSERT_NE(source, copy);
  ASSERT_EQ(2u, source.get<lisparser::list>().items.size());

  copy = source;
  ASSERT_EQ(source, copy);
}


TEST(lisparser, compose) {
  // grammar rules are ordinary parsers
  const auto pair = parser::sequence(grammar::object(), parser::token(grammar::object()));

  auto res = parser::parse(pair, "(a) \"b\"");
  ASSERT_TRUE(res);
  ASSERT_EQ(lst({id("a")}), res.right().first);
  ASSERT_EQ(str("b"), res.right().second);

  const auto quoted = parser::literal("'") >> grammar::object();
  ASSERT_EQ(id("x"), parser::run(quoted, "'x"));
}


TEST(lisparser, shared_grammar) {
  const auto rule = parser::token(grammar::object());
  const object expected = read(example);

  static const std::size_t threads = 4;
  std::vector<char> ok(threads, false);
  std::vector<std::thread> workers;

  for(std::size_t i = 0; i < threads; ++i) {
    workers.emplace_back([&, i] {
        bool all = true;
        for(std::size_t j = 0; j < 100; ++j) {
          auto res = parser::parse(rule, example);
          all = all && res && res.right() == expected;
        }
        ok[i] = all;
      });
  }

  for(auto& worker: workers) {
    worker.join();
  }

  for(std::size_t i = 0; i < threads; ++i) {
    ASSERT_TRUE(ok[i]) << "thread " << i;
  }
}
