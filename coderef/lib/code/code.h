#ifndef CODEREF_LIB_CODE_CODE_H_
#define CODEREF_LIB_CODE_CODE_H_

#include <util/util.h>
#include <util/message.h>
#include <cstdint>
#include <variant>
#include <vector>
#include <string>
#include <optional>
#include <memory>
#include <ostream>

namespace coderef::code {

/*
 * The opcodes of the stack machine whose compiled functions we inspect.
 * Only a handful matter to the reference walker (see kind_of), the rest
 * are kept so that listings round-trip and fingerprints see them.
 */
enum opcode_t : uint8_t {
  // names
  load_global,
  load_name,
  load_deref,
  load_closure,
  load_fast,
  store_fast,
  delete_fast,
  store_global,
  store_name,
  store_deref,
  delete_global,
  // attributes and imports
  load_attr,
  load_method,
  store_attr,
  delete_attr,
  import_name,
  import_from,
  import_star,
  // constants and stack
  load_const,
  pop_top,
  rot_two,
  rot_three,
  dup_top,
  // calls and builders
  call_function,
  call_function_kw,
  call_method,
  make_function,
  build_tuple,
  build_list,
  build_map,
  build_string,
  // operators
  unary_not,
  unary_negative,
  binary_add,
  binary_subtract,
  binary_multiply,
  binary_true_divide,
  binary_subscr,
  store_subscr,
  compare_op,
  // control flow
  jump_forward,
  jump_absolute,
  pop_jump_if_false,
  pop_jump_if_true,
  get_iter,
  for_iter,
  setup_finally,
  pop_block,
  raise_varargs,
  return_value,
  nop,
};

namespace parse {
std::optional<opcode_t> opcode_of_string(std::string_view str);
}
std::string_view opcode_to_string(opcode_t op);

/*
 * What an opcode means to the reference walker.
 */
enum class kind_t : uint8_t {
  load_global,
  load_captured,
  import_module,
  load_attribute,
  delete_local,
  store_local,
  load_local,
  other
};
kind_t kind_of(opcode_t op);

namespace operand {
struct none {
  bool operator==(const none &) const { return true; }
};
struct name {
  std::string id;
  bool operator==(const name &o) const { return id == o.id; }
};
struct integer {
  int64_t v;
  bool operator==(const integer &o) const { return v == o.v; }
};
struct string {
  std::string v;
  bool operator==(const string &o) const { return v == o.v; }
};
typedef std::variant<std::monostate, name, integer, string, none> t;
}

struct instruction {
  opcode_t op;
  operand::t arg;
  std::optional<uint32_t> starts_line;

  // the name operand; throws error::operand_mismatch when the operand is not a name
  [[nodiscard]] const std::string &argname() const;
  bool operator==(const instruction &o) const { return op == o.op && arg == o.arg && starts_line == o.starts_line; }
};
std::ostream &operator<<(std::ostream &os, const operand::t &a);
std::ostream &operator<<(std::ostream &os, const instruction &i);

struct code_object {
  std::string name;
  std::string filename;
  uint32_t first_line = 0;
  std::vector<instruction> instructions;
  std::vector<std::string> cellvars; // captured by closures defined inside this code
  std::vector<std::string> freevars; // captured by this code from an enclosing scope
  std::vector<std::string> varnames;
};

namespace error {
class base : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class operand_mismatch : public base {
 public:
  operand_mismatch(opcode_t op);
};

class unknown_opcode : public base, public util::message::error_token {
 public:
  unknown_opcode(std::string_view mnemonic);
  void describe(std::ostream &os) const override;
};

class malformed_operand : public base, public util::message::error_token {
 public:
  malformed_operand(std::string_view token, std::string_view why);
  void describe(std::ostream &os) const override;
 private:
  std::string why;
};
}

}

#endif //CODEREF_LIB_CODE_CODE_H_
