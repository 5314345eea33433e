#include "object.hpp"

#include <ostream>

namespace lisparser {

  std::ostream& operator<<(std::ostream& out, const object& self) {
    self.match([&](const ident& value) {
        out << value.name;
      },
      [&](const string& value) {
        out << '"' << value.value << '"';
      },
      [&](const list& value) {
        out << '(';
        bool first = true;
        for(const auto& item: value.items) {
          if(first) first = false;
          else out << ' ';
          out << item;
        }
        out << ')';
      });

    return out;
  }

}
