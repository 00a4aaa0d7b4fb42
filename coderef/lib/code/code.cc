#include <code/code.h>
#include <array>
#include <utility>

namespace coderef::code {

namespace {
constexpr std::array<std::pair<opcode_t, std::string_view>, nop + 1> opcode_names = {{
    {load_global, "LOAD_GLOBAL"},
    {load_name, "LOAD_NAME"},
    {load_deref, "LOAD_DEREF"},
    {load_closure, "LOAD_CLOSURE"},
    {load_fast, "LOAD_FAST"},
    {store_fast, "STORE_FAST"},
    {delete_fast, "DELETE_FAST"},
    {store_global, "STORE_GLOBAL"},
    {store_name, "STORE_NAME"},
    {store_deref, "STORE_DEREF"},
    {delete_global, "DELETE_GLOBAL"},
    {load_attr, "LOAD_ATTR"},
    {load_method, "LOAD_METHOD"},
    {store_attr, "STORE_ATTR"},
    {delete_attr, "DELETE_ATTR"},
    {import_name, "IMPORT_NAME"},
    {import_from, "IMPORT_FROM"},
    {import_star, "IMPORT_STAR"},
    {load_const, "LOAD_CONST"},
    {pop_top, "POP_TOP"},
    {rot_two, "ROT_TWO"},
    {rot_three, "ROT_THREE"},
    {dup_top, "DUP_TOP"},
    {call_function, "CALL_FUNCTION"},
    {call_function_kw, "CALL_FUNCTION_KW"},
    {call_method, "CALL_METHOD"},
    {make_function, "MAKE_FUNCTION"},
    {build_tuple, "BUILD_TUPLE"},
    {build_list, "BUILD_LIST"},
    {build_map, "BUILD_MAP"},
    {build_string, "BUILD_STRING"},
    {unary_not, "UNARY_NOT"},
    {unary_negative, "UNARY_NEGATIVE"},
    {binary_add, "BINARY_ADD"},
    {binary_subtract, "BINARY_SUBTRACT"},
    {binary_multiply, "BINARY_MULTIPLY"},
    {binary_true_divide, "BINARY_TRUE_DIVIDE"},
    {binary_subscr, "BINARY_SUBSCR"},
    {store_subscr, "STORE_SUBSCR"},
    {compare_op, "COMPARE_OP"},
    {jump_forward, "JUMP_FORWARD"},
    {jump_absolute, "JUMP_ABSOLUTE"},
    {pop_jump_if_false, "POP_JUMP_IF_FALSE"},
    {pop_jump_if_true, "POP_JUMP_IF_TRUE"},
    {get_iter, "GET_ITER"},
    {for_iter, "FOR_ITER"},
    {setup_finally, "SETUP_FINALLY"},
    {pop_block, "POP_BLOCK"},
    {raise_varargs, "RAISE_VARARGS"},
    {return_value, "RETURN_VALUE"},
    {nop, "NOP"},
}};
static_assert(opcode_names[nop].first == nop, "opcode_names must be indexed by opcode");
}

namespace parse {
std::optional<opcode_t> opcode_of_string(std::string_view str) {
  for (const auto &[op, name] : opcode_names)if (name == str)return op;
  return {};
}
}

std::string_view opcode_to_string(opcode_t op) {
  if (op > nop)THROW_INTERNAL_ERROR
  return opcode_names[op].second;
}

kind_t kind_of(opcode_t op) {
  switch (op) {
    case load_global:
    case load_name:return kind_t::load_global;
    case load_deref:
    case load_closure:return kind_t::load_captured;
    case import_name:return kind_t::import_module;
    case load_attr:
    case load_method:
    case import_from:return kind_t::load_attribute;
    case delete_fast:return kind_t::delete_local;
    case store_fast:return kind_t::store_local;
    case load_fast:return kind_t::load_local;
    default:return kind_t::other;
  }
}

const std::string &instruction::argname() const {
  if (auto *n = std::get_if<operand::name>(&arg))return n->id;
  throw error::operand_mismatch(op);
}

std::ostream &operator<<(std::ostream &os, const operand::t &a) {
  std::visit(util::overloaded{
      [](const std::monostate &) {},
      [&os](const operand::name &n) { os << n.id; },
      [&os](const operand::integer &i) { os << i.v; },
      [&os](const operand::string &s) { os << util::quote(s.v); },
      [&os](const operand::none &) { os << "None"; }
  }, a);
  return os;
}

std::ostream &operator<<(std::ostream &os, const instruction &i) {
  if (i.starts_line.has_value())os << i.starts_line.value() << " ";
  os << opcode_to_string(i.op);
  if (!std::holds_alternative<std::monostate>(i.arg))os << " " << i.arg;
  return os;
}

namespace error {
operand_mismatch::operand_mismatch(opcode_t op)
    : base(std::string(opcode_to_string(op)) + " expects a name operand") {}

unknown_opcode::unknown_opcode(std::string_view mnemonic)
    : code::error::base("unknown opcode"), util::message::error_token(mnemonic) {}

void unknown_opcode::describe(std::ostream &os) const {
  os << "unknown opcode " << util::message::style::on(util::message::style::bold) << token
     << util::message::style::on(util::message::style::clear);
}

malformed_operand::malformed_operand(std::string_view token, std::string_view why)
    : code::error::base("malformed operand"), util::message::error_token(token), why(why) {}

void malformed_operand::describe(std::ostream &os) const {
  os << "malformed operand " << util::message::style::on(util::message::style::bold) << token
     << util::message::style::on(util::message::style::clear) << ": " << why;
}
}

}
