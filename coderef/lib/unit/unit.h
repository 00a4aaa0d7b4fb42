#ifndef CODEREF_LIB_UNIT_UNIT_H_
#define CODEREF_LIB_UNIT_UNIT_H_

#include <rt/rt.h>
#include <util/message.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace coderef::unit {

/*
 * A unit file describes one global namespace and the modules it can import:
 *
 *   .module NAME                   .export MODULE KEY = VALUE
 *   .global NAME = VALUE
 *   .class NAME                    .classattr CLASS KEY = VALUE
 *   .instance NAME CLASS           .set INSTANCE KEY = VALUE
 *   .bind NAME INSTANCE METHOD
 *   .function NAME    (or .method CLASS NAME)
 *     .file F  .firstline N  .cellvars A B  .freevars C  .varnames X Y
 *     .closure C = VALUE       one per name of .freevars, in that order
 *     [LINE] MNEMONIC [OPERAND]
 *   .end
 *
 * VALUE is an integer, a quoted string, None, or the name of an earlier
 * global or of a registered module.
 */
struct unit {
  std::shared_ptr<rt::dict> globals = std::make_shared<rt::dict>();
  rt::importer modules;
};

unit asm_parse_unit(std::string_view source, std::string_view filename = "source.casm");

namespace error {
class base : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class syntax_error : public base, public util::message::error_token {
 public:
  syntax_error(std::string_view token, std::string_view what);
  void describe(std::ostream &os) const override;
 private:
  std::string msg;
};

class unbound_identifier : public base, public util::message::error_token {
 public:
  explicit unbound_identifier(std::string_view token);
  void describe(std::ostream &os) const override;
};
}

}

#endif //CODEREF_LIB_UNIT_UNIT_H_
