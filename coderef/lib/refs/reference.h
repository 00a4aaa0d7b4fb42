#ifndef CODEREF_LIB_REFS_REFERENCE_H_
#define CODEREF_LIB_REFS_REFERENCE_H_

#include <rt/rt.h>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace coderef::refs {

// an unresolved dotted path, built by chaining attribute loads onto a name
struct partial_name {
  std::string path;
  bool operator==(const partial_name &o) const { return path == o.path; }
};

typedef std::variant<rt::value, partial_name> reference;
typedef std::optional<reference> symbolic_value; // nullopt is "nothing pending"
typedef std::vector<reference> reference_list;

std::ostream &operator<<(std::ostream &os, const reference &r);

}

#endif //CODEREF_LIB_REFS_REFERENCE_H_
