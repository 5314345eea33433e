// #define PARSER_ENABLE_DEBUG
#include "grammar.hpp"

#include <deque>
#include <iterator>
#include <vector>

namespace lisparser {

  namespace grammar {

    using namespace parser;

    static bool is_ident(char c) {
      return !is_space(c) && c != '(' && c != ')' && c != '"';
    }

    static bool is_not_quote(char c) {
      return c != '"';
    }

    static std::string collect(const std::deque<char>& chars) {
      return std::string(chars.begin(), chars.end());
    }

    static lisparser::object to_list(std::deque<lisparser::object> items) {
      return lisparser::list{std::vector<lisparser::object>(std::make_move_iterator(items.begin()),
                                                            std::make_move_iterator(items.end()))};
    }


    static auto ident_rule() {
      return debug("ident") <<= plus(pred(is_ident)) |= [](std::deque<char> chars) {
        return lisparser::object(lisparser::ident{collect(chars)});
      };
    }


    static auto string_rule() {
      const auto quote = single('"');

      return debug("string") <<=
        delimited(quote, kleene(pred(is_not_quote)), quote) |= [](std::deque<char> chars) {
        return lisparser::object(lisparser::string{collect(chars)});
      };
    }


    // the recursive reference sits right after an opening parenthesis, so
    // each unit of depth is one list actually entered
    static auto list_rule(std::size_t max_depth) {
      const auto body = fix<lisparser::object>([](auto self) {
          const auto element = (single('(') >> self) | string_rule() | ident_rule();
          const auto close = whitespace() >> single(')');

          return delimited(whitespace(), separated(element, whitespace()), close) |= to_list;
        }, max_depth);

      return debug("list") <<= single('(') >> body;
    }


    parser::any<lisparser::object> ident() {
      return ident_rule();
    }

    parser::any<lisparser::object> string() {
      return string_rule();
    }

    parser::any<lisparser::object> list(std::size_t max_depth) {
      return list_rule(max_depth);
    }

    parser::any<lisparser::object> object(std::size_t max_depth) {
      return debug("object") <<= list_rule(max_depth) | string_rule() | ident_rule();
    }

  }

}
