#include <refs/context.h>

namespace coderef::refs {

code_context build_context(const rt::value &callable) {
  if (callable.is<std::shared_ptr<rt::function>>())
    return build_context(*callable.as<std::shared_ptr<rt::function>>());
  if (callable.is<std::shared_ptr<rt::bound_method>>()) {
    const auto &m = callable.as<std::shared_ptr<rt::bound_method>>();
    return build_context(*m->fn, m->self);
  }
  throw error::contract_violation("'" + std::string(callable.type_name()) + "' object has no code to inspect");
}

code_context build_context(const rt::function &fn, const std::optional<rt::value> &receiver) {
  if (!fn.code)throw error::contract_violation("function '" + fn.name + "' has no code object");
  const code::code_object &code = *fn.code;
  code_context ctx;
  ctx.globals = fn.globals;
  if (!ctx.globals)ctx.globals = std::make_shared<const rt::dict>();

  // no value exists yet for cells created by this very function
  for (const auto &var : code.cellvars)ctx.cells.insert_or_assign(var, partial_name{var});

  if (code.freevars.size() != fn.closure.size())
    throw error::contract_violation(
        "function '" + fn.name + "' captures " + std::to_string(code.freevars.size()) + " variables but its closure has "
            + std::to_string(fn.closure.size()) + " cells");
  for (size_t i = 0; i < code.freevars.size(); ++i) {
    const auto &c = fn.closure[i];
    if (!c || !c->contents.has_value())
      throw error::contract_violation("cell '" + code.freevars[i] + "' of function '" + fn.name + "' is empty");
    ctx.cells.insert_or_assign(code.freevars[i], c->contents.value());
  }

  if (receiver.has_value())ctx.locals.emplace("self", receiver.value());
  return ctx;
}

}
