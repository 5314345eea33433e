#include "parse.hpp"
#include "grammar.hpp"

#include <deque>
#include <iterator>

namespace lisparser {

  using namespace parser;

  static auto single_object(const options& opts) {
    return whitespace() >> grammar::object(opts.max_depth) >>= drop(whitespace());
  }

  static auto program(const options& opts) {
    const auto space = whitespace();
    return space >> separated(grammar::object(opts.max_depth), space) >>= [=](std::deque<object> items) {
      return space >> pure(std::vector<object>(std::make_move_iterator(items.begin()),
                                               std::make_move_iterator(items.end())));
    };
  }


  outcome<object> parse(const std::string& text, const options& opts) {
    return parser::parse(single_object(opts), text);
  }

  object read(const std::string& text, const options& opts) {
    return parser::run(single_object(opts), text);
  }

  outcome<std::vector<object>> parse_all(const std::string& text, const options& opts) {
    return parser::parse(program(opts), text);
  }

  std::vector<object> read_all(const std::string& text, const options& opts) {
    return parser::run(program(opts), text);
  }

}
