#include <refs/walker.h>
#include <util/util.h>

namespace coderef::refs {

std::ostream &operator<<(std::ostream &os, const reference &r) {
  std::visit(util::overloaded{
      [&os](const rt::value &v) { os << v; },
      [&os](const partial_name &p) { os << p.path; }
  }, r);
  return os;
}

namespace {

struct walk_state {
  symbolic_value tos;
  std::optional<uint32_t> lineno;
  reference_list refs;
  std::map<std::string, reference, std::less<>> locals;

  void commit() {
    if (tos.has_value())refs.push_back(std::move(tos.value()));
    tos.reset();
  }
  void set_tos(reference r) {
    commit();
    tos = std::move(r);
  }
};

void load_attribute(walk_state &s, const std::string &attr) {
  if (!s.tos.has_value()) {
    s.refs.emplace_back(partial_name{attr});
    return;
  }
  std::visit(util::overloaded{
      [&attr](partial_name &p) { p.path.append(".").append(attr); },
      [&attr](rt::value &v) { v = rt::getattr(v, attr); }
  }, s.tos.value());
}

void step(walk_state &s, const code::instruction &op, const code_context &ctx, const rt::importer &modules) {
  using code::kind_t;
  switch (code::kind_of(op.op)) {
    case kind_t::load_global: {
      const std::string &name = op.argname();
      if (auto it = ctx.globals->find(name); it != ctx.globals->end())s.set_tos(it->second);
      else s.set_tos(partial_name{name});
      return;
    }
    case kind_t::load_captured: {
      const std::string &name = op.argname();
      auto it = ctx.cells.find(name);
      if (it == ctx.cells.end())throw std::out_of_range("no captured variable named '" + name + "'");
      s.set_tos(it->second);
      return;
    }
    case kind_t::import_module: {
      const std::string &name = op.argname();
      try {
        s.set_tos(rt::value(modules.import_module(name)));
      } catch (const rt::error::import_error &) {
        s.set_tos(partial_name{name});
      }
      return;
    }
    case kind_t::load_attribute:load_attribute(s, op.argname());
      return;
    case kind_t::delete_local:
      if (s.tos.has_value()) {
        const std::string &name = op.argname();
        s.tos.reset();
        if (s.locals.erase(name) == 0)throw std::out_of_range("no local variable named '" + name + "'");
        return;
      }
      break;
    case kind_t::store_local:
      if (s.tos.has_value()) {
        s.locals.insert_or_assign(op.argname(), std::move(s.tos.value()));
        s.tos.reset();
        return;
      }
      break;
    case kind_t::load_local:
      if (auto *n = std::get_if<code::operand::name>(&op.arg)) {
        if (auto it = s.locals.find(n->id); it != s.locals.end()) {
          s.set_tos(it->second);
          return;
        }
      }
      break;
    case kind_t::other:break;
  }
  // any other instruction consumes whatever was pending
  s.commit();
}

}

reference_list extract_references(const code::code_object &code,
                                  const code_context &context,
                                  const rt::importer &modules,
                                  diag::sink &sink) {
  walk_state s{.tos = std::nullopt, .lineno = std::nullopt, .refs = {}, .locals = context.locals};
  for (const auto &op : code.instructions) {
    // starts_line is often missing; keep the last one so a failure is reported near its origin
    if (op.starts_line.has_value())s.lineno = op.starts_line;
    try {
      step(s, op, context, modules);
    } catch (const std::exception &e) {
      sink.report(diag::diagnostic{.callable = code.name, .filename = code.filename, .line = s.lineno, .what = e.what()});
      s.tos.reset();
    }
  }
  s.commit();
  return std::move(s.refs);
}

reference_list references_of(const rt::value &callable, const rt::importer &modules, diag::sink &sink) {
  code_context ctx = build_context(callable);
  const rt::function &fn = callable.is<std::shared_ptr<rt::bound_method>>()
                           ? *callable.as<std::shared_ptr<rt::bound_method>>()->fn
                           : *callable.as<std::shared_ptr<rt::function>>();
  return extract_references(*fn.code, ctx, modules, sink);
}

}
