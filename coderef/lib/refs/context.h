#ifndef CODEREF_LIB_REFS_CONTEXT_H_
#define CODEREF_LIB_REFS_CONTEXT_H_

#include <refs/reference.h>
#include <rt/rt.h>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace coderef::refs {

/*
 * The bindings a callable's instructions can see.
 * globals is the live enclosing namespace: later changes to it are seen by later walks.
 */
struct code_context {
  std::shared_ptr<const rt::dict> globals;
  std::map<std::string, reference, std::less<>> cells;
  std::map<std::string, reference, std::less<>> locals;
};

namespace error {
class contract_violation : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};
}

code_context build_context(const rt::value &callable);
code_context build_context(const rt::function &fn, const std::optional<rt::value> &receiver = std::nullopt);

}

#endif //CODEREF_LIB_REFS_CONTEXT_H_
