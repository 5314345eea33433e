#ifndef LISPARSER_PARSE_HPP
#define LISPARSER_PARSE_HPP

#include "../parser.hpp"

#include "object.hpp"
#include "options.hpp"

#include <string>
#include <vector>

namespace lisparser {

  template<class T>
  using outcome = either<parser::failure, T>;

  // a single object, optionally surrounded by whitespace, spanning the whole
  // text
  outcome<object> parse(const std::string& text, const options& opts = {});

  // same, throws parser::parse_error
  object read(const std::string& text, const options& opts = {});

  // whitespace-separated objects spanning the whole text (possibly none)
  outcome<std::vector<object>> parse_all(const std::string& text, const options& opts = {});

  std::vector<object> read_all(const std::string& text, const options& opts = {});

}


#endif
