#ifndef LISPARSER_OBJECT_HPP
#define LISPARSER_OBJECT_HPP

#include "../variant.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace lisparser {

  // bare token
  struct ident {
    std::string name;

    bool operator==(const ident& other) const { return name == other.name; }
  };

  // double-quoted text, quotes removed
  struct string {
    std::string value;

    bool operator==(const string& other) const { return value == other.value; }
  };

  struct list;

  struct object : variant< ident,
                           string,
                           list > {
    using object::variant::variant;
  };

  // parenthesized objects. owns its items
  struct list {
    std::vector<object> items;

    bool operator==(const list& other) const { return items == other.items; }
  };

  std::ostream& operator<<(std::ostream& out, const object& self);

}


#endif
