#ifndef LISPARSER_OPTIONS_HPP
#define LISPARSER_OPTIONS_HPP

#include <cstddef>

namespace lisparser {

  // lists nested deeper than this are rejected. each list level costs about
  // 4KB of stack in optimized builds (more without optimization), so the
  // default stays within 512KB
  static constexpr std::size_t default_max_depth = 128;

  struct options {
    std::size_t max_depth = default_max_depth;
  };

}

#endif
