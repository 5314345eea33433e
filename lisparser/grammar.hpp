#ifndef LISPARSER_GRAMMAR_HPP
#define LISPARSER_GRAMMAR_HPP

#include "../parser.hpp"

#include "object.hpp"
#include "options.hpp"

namespace lisparser {

  // grammar rules, built on demand. each returned parser is immutable and can
  // be shared, reused, or composed into larger grammars
  namespace grammar {

    // run of characters other than whitespace, parentheses and double quotes
    parser::any<lisparser::object> ident();

    // characters between double quotes, no escapes
    parser::any<lisparser::object> string();

    // whitespace-separated objects between parentheses
    parser::any<lisparser::object> list(std::size_t max_depth = default_max_depth);

    // list, string or ident, tried in this order
    parser::any<lisparser::object> object(std::size_t max_depth = default_max_depth);

  }

}


#endif
