#ifndef PARSER_HPP
#define PARSER_HPP

#include "either.hpp"
#include "maybe.hpp"

#include <deque>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <cassert>
#include <cctype>
#include <cstring>

#include <iostream>

namespace parser {

// character range
struct range {
  const char* first;
  const char* last;

  explicit operator bool() const { return first != last; }

  std::size_t size() const { return last - first; }

  char get() const {
    assert(bool(*this));
    return *first;
  }

  range next() const {
    assert(bool(*this));
    return {first + 1, last};
  }

};


inline void peek(range self, std::ostream& out, std::size_t count=42) {
  for(std::size_t i = 0; self && (i < count);
            ++i, self = self.next()) {
    out << self.get();
  }
}


struct unit { };


// successful parse
template<class T>
struct success: range {
  using value_type = T;
  T value;
  success(T value, range rest): range(rest), value(std::move(value)) {}
};


template<class T>
static success<T> make_success(T value, range rest) {
  return {std::move(value), rest};
}

// parse error: holds the range the failing parser was given, so a failure
// never advances the caller's cursor
struct error: range {
  explicit error(range at): range(at) {}
};


// parse result
template<class T>
using result = either<error, success<T>>;


// parser value type
template<class Parser>
using value =
    typename std::result_of<Parser(range)>::type::value_type::value_type;


// type-erased parser
template<class T>
using any = std::function<result<T>(range in)>;


// a grammar rule looped without consuming input
struct grammar_error: std::logic_error {
  using std::logic_error::logic_error;
};

// recursion went past its depth bound
struct depth_error: std::runtime_error {
  using std::runtime_error::runtime_error;
};

// top-level failure, thrown by run
struct parse_error: std::runtime_error {
  using std::runtime_error::runtime_error;
};


////////////////////////////////////////////////////////////////////////////////
// combinators

// monad unit
template<class T>
static auto pure(T value) {
  return [value = std::move(value)](range in) -> result<T> {
    return make_success(value, in);
  };
}

// monad zero
template<class T>
static auto fail() {
  return [](range in) -> result<T> {
    return error(in);
  };
}

// functor map
template<class Parser, class Func, class=value<Parser>>
static auto map(Parser parser, Func func) {
  return [parser = std::move(parser), func = std::move(func)](range in) {
    using source_type = value<Parser>;
    using value_type =
      typename std::decay<typename std::result_of<const Func&(source_type)>::type>::type;
    using result_type = result<value_type>;

    auto res = parser(in);
    if(!res) {
      return result_type(error(in));
    }

    success<source_type>& self = *res.get();
    return result_type(make_success(func(std::move(self.value)), self));
  };
}

template<class Parser, class Func, class=value<Parser>>
static auto operator|=(Parser parser, Func func) {
  return map(std::move(parser), std::move(func));
}


// monad bind. note: on failure the *original* range is reported, whichever
// side failed
template<class Parser, class Func, class=value<Parser>>
static auto bind(Parser parser, Func func) {
  return [parser = std::move(parser), func = std::move(func)](range in) {
    using source_type = value<Parser>;
    using parser_type =
      typename std::decay<typename std::result_of<const Func&(source_type)>::type>::type;
    using result_type = result<value<parser_type>>;

    auto res = parser(in);
    if(!res) {
      return result_type(error(in));
    }

    success<source_type>& self = *res.get();
    const range rest = self;

    auto next = func(std::move(self.value))(rest);
    if(!next) {
      return result_type(error(in));
    }

    return next;
  };
}

template<class Parser, class Func, class=value<Parser>>
static auto operator>>=(Parser parser, Func func) {
  // qualified: std::function parsers would bring std::bind in
  return parser::bind(std::move(parser), std::move(func));
}

// sequence parser, keeping rhs value
template<class LHS, class RHS, class=value<LHS>, class=value<RHS>>
static auto operator>>(LHS lhs, RHS rhs) {
  return std::move(lhs) >>= [rhs = std::move(rhs)](auto&&) { return rhs; };
}

// sequence parser, keeping both values
template<class LHS, class RHS>
static auto sequence(LHS lhs, RHS rhs) {
  return std::move(lhs) >>= [rhs = std::move(rhs)](value<LHS> first) {
    return rhs |= [first = std::move(first)](value<RHS> second) {
      return std::make_pair(first, std::move(second));
    };
  };
}

// guarded continuation
template<class Pred>
static auto guard(Pred pred) {
  return [pred = std::move(pred)](auto value) {
    using value_type = decltype(value);

    return [pred, value = std::move(value)](range in) -> result<value_type> {
      if(pred(value)) {
        return make_success(value, in);
      }
      return error(in);
    };
  };
}

// drop continuation
template<class Parser>
static auto drop(Parser parser) {
  return [parser = std::move(parser)](auto value) {
    return parser >> pure(std::move(value));
  };
}

// reference parser
template<class Parser>
static auto ref(const Parser& parser) {
  return [&parser](range in) -> result<value<Parser>> { return parser(in); };
}

// kleene star parser (zero-or-more). note: always succeeds
template<class Parser>
static auto kleene(Parser parser) {
  return [parser = std::move(parser)](range in) -> result<std::deque<value<Parser>>> {
    std::deque<value<Parser>> values;
    while(auto res = parser(in)) {
      if(res.get()->first == in.first) {
        throw grammar_error("kleene: parser succeeded without consuming input");
      }

      values.emplace_back(std::move(res.get()->value));
      in = *res.get();
    }

    return make_success(std::move(values), in);
  };
}

// one-or-more parser
template<class Parser>
static auto plus(Parser parser) {
  return parser >>= [parser](value<Parser> first) {
    return kleene(parser) >>= [first = std::move(first)](std::deque<value<Parser>> rest) {
      rest.emplace_front(first);
      return pure(std::move(rest));
    };
  };
}


// coproduct parser (alternative). note: rhs is only called if lhs fails, from
// the same range
template<class LHS, class RHS>
static auto coproduct(LHS lhs, RHS rhs) {
  static_assert(std::is_same<value<LHS>, value<RHS>>::value,
                "alternatives should have the same type");

  return [lhs = std::move(lhs), rhs = std::move(rhs)](range in) -> result<value<LHS>> {
    if(auto res = lhs(in)) {
      return res;
    }

    return rhs(in);
  };
}


template<class LHS, class RHS, class=value<LHS>, class=value<RHS>>
static auto operator|(LHS lhs, RHS rhs) {
  return coproduct(std::move(lhs), std::move(rhs));
}

// optional parser: always succeeds, nothing consumed when absent
template<class Parser>
static auto optional(Parser parser) {
  using value_type = maybe<value<Parser>>;

  return [parser = std::move(parser)](range in) -> result<value_type> {
    if(auto res = parser(in)) {
      return make_success(value_type(std::move(res.get()->value)), *res.get());
    }

    return make_success(value_type(), in);
  };
}

// inner value between two delimiters
template<class Open, class Parser, class Close>
static auto delimited(Open open, Parser parser, Close close) {
  return std::move(open) >> std::move(parser) >>= drop(std::move(close));
}

// non-empty list with separator
template<class Parser, class Separator>
static auto list(Parser parser, Separator separator) {
  return parser >>= [=](value<Parser> first) {
    return kleene(separator >> parser) >>=
           [first = std::move(first)](std::deque<value<Parser>> rest) {
             rest.emplace_front(first);
             return pure(std::move(rest));
           };
  };
}


template<class Parser, class Separator, class=value<Parser>, class=value<Separator>>
static auto operator%(Parser parser, Separator separator) {
  return list(std::move(parser), std::move(separator));
}

// possibly empty list with separator. no trailing separator is consumed
template<class Parser, class Separator>
static auto separated(Parser parser, Separator separator) {
  return list(std::move(parser), std::move(separator)) |
         pure(std::deque<value<Parser>>{});
}

// collect parser values until stop matches. stop is not consumed
template<class Parser, class Stop>
static auto until(Parser parser, Stop stop) {
  return [parser = std::move(parser), stop = std::move(stop)](range start)
    -> result<std::deque<value<Parser>>> {
    std::deque<value<Parser>> values;
    range in = start;

    while(!stop(in)) {
      auto res = parser(in);
      if(!res) {
        return error(start);
      }

      if(res.get()->first == in.first) {
        throw grammar_error("until: parser succeeded without consuming input");
      }

      values.emplace_back(std::move(res.get()->value));
      in = *res.get();
    }

    return make_success(std::move(values), in);
  };
}

// skip parser: parse zero-or-more without collecting
template<class Parser>
static auto skip(Parser parser) {
  return [parser = std::move(parser)](range in) -> result<unit> {
    while(auto res = parser(in)) {
      if(res.get()->first == in.first) {
        throw grammar_error("skip: parser succeeded without consuming input");
      }

      in = *res.get();
    }
    return make_success(unit{}, in);
  };
}

// tokenizer: skip before parsing
template<class Parser, class Skipper>
static auto token(Parser parser, Skipper skipper) {
  return skip(std::move(skipper)) >> std::move(parser);
}

// trace parser entry/exit on a stream
template<class Parser>
static auto trace(std::string name, Parser parser,
                  std::ostream& out = std::clog) {
  return [name = std::move(name), parser = std::move(parser), &out](range in) {
    out << "> " << name << ": \"";
    peek(in, out);
    out << "\"\n";

    auto res = parser(in);
    if(res) {
      out << "< " << name << " ok: \"";
      peek(*res.get(), out);
      out << "\"\n";
    } else {
      out << "< " << name << " failed\n";
    }

    return res;
  };
}

// named grammar rules, traced to std::clog when built with PARSER_ENABLE_DEBUG
struct debug {
  const char* name;
  std::ostream& out;

  debug(const char* name, std::ostream& out = std::clog)
    : name(name),
      out(out) {

  }

#ifdef PARSER_ENABLE_DEBUG
  template<class Parser>
  auto operator<<=(Parser parser) const {
    return trace(name, std::move(parser), out);
  }
#else
  template<class Parser>
  Parser operator<<=(Parser parser) const {
    return parser;
  }
#endif

};

// fixpoint (result type needs to be given because c++). each trip through the
// recursive reference costs one unit of depth
template<class T, class Def>
struct fixpoint {
  const Def def;
  const std::size_t depth;

  result<T> operator()(range in) const {
    if(!depth) {
      throw depth_error("maximum nesting depth exceeded");
    }

    return def(fixpoint{def, depth - 1})(in);
  }
};

template<class T, class Def>
static fixpoint<T, Def> fix(Def def, std::size_t depth) {
  return {std::move(def), depth};
}


////////////////////////////////////////////////////////////////////////////////
// concrete parsers

// char parser
inline result<char> character(range in) {
  if(!in) {
    return error(in);
  }

  return make_success(in.get(), in.next());
}

// parse char matching a predicate
template<class Pred>
static auto pred(Pred pred) {
  return character >>= guard(std::move(pred));
}

// parse a given char
inline auto single(char c) {
  return pred([c](char x) { return x == c; });
}

// parse any char from a set
inline auto one_of(std::string chars) {
  return pred([chars = std::move(chars)](char x) {
    return chars.find(x) != std::string::npos;
  });
}

// parse a char in [lo, hi]
inline auto between(char lo, char hi) {
  return pred([lo, hi](char x) { return lo <= x && x <= hi; });
}

// parse a fixed string
inline auto literal(std::string value) {
  return [value = std::move(value)](range in) -> result<std::string> {
    if(in.size() < value.size()) {
      return error(in);
    }

    if(value.compare(0, value.size(), in.first, value.size()) == 0) {
      return make_success(value, range{in.first + value.size(), in.last});
    }

    return error(in);
  };
}

// std::isspace in the "C" locale
inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c));
}

// zero-or-more whitespace. note: always succeeds
inline auto whitespace() {
  return skip(pred(is_space));
}

// convenience tokenizer
template<class Parser>
static auto token(Parser parser) {
  return whitespace() >> std::move(parser);
}

// end of stream parser
inline result<unit> eos(range in) {
  if(!in) {
    return make_success(unit{}, in);
  }

  return error(in);
}

////////////////////////////////////////////////////////////////////////////////
// top-level failure
struct failure {
  enum kind_type {
    mismatch,
    trailing_input,
    too_deep
  };

  kind_type kind;

  const char* what() const {
    switch(kind) {
    case mismatch: return "parse error";
    case trailing_input: return "unexpected trailing input";
    case too_deep: return "maximum nesting depth exceeded";
    }

    return "parse error";
  }
};


inline range make_range(const char* in) {
  return {in, in + std::strlen(in)};
}

inline range make_range(const std::string& in) {
  return {in.data(), in.data() + in.size()};
}


// run parser over the whole range
template<class Parser>
static either<failure, value<Parser>> parse(Parser parser, range in) {
  using result_type = either<failure, value<Parser>>;

  try {
    auto res = parser(in);
    if(!res) {
      return result_type(failure{failure::mismatch});
    }

    const range rest = *res.get();
    if(rest) {
      return result_type(failure{failure::trailing_input});
    }

    return result_type(std::move(res.get()->value));
  } catch(depth_error&) {
    return result_type(failure{failure::too_deep});
  }
}

template<class Parser>
static either<failure, value<Parser>> parse(Parser parser, const std::string& in) {
  return parse(parser, make_range(in));
}

template<class Parser>
static either<failure, value<Parser>> parse(Parser parser, const char* in) {
  return parse(parser, make_range(in));
}


// run parser over the whole range, throw parse_error on failure
template<class Parser>
static value<Parser> run(Parser parser, range in) {
  return match(parse(parser, in),
               [](failure& err) -> value<Parser> {
                 throw parse_error(err.what());
               },
               [](value<Parser>& ok) -> value<Parser> {
                 return std::move(ok);
               });
}

template<class Parser>
static value<Parser> run(Parser parser, const char* in) {
  return run(parser, make_range(in));
}

template<class Parser>
static value<Parser> run(Parser parser, const std::string& in) {
  return run(parser, make_range(in));
}

template<class Parser>
static value<Parser> run(Parser parser, std::istream& in) {
  const std::string contents(std::istreambuf_iterator<char>(in), {});
  return run(parser, make_range(contents));
}

} // namespace parser

#endif
