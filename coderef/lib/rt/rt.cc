#include <rt/rt.h>
#include <util/util.h>
#include <sstream>

namespace coderef::rt {

const void *value::identity() const {
  return std::visit(util::overloaded{
      [](const none_t &) -> const void * { return nullptr; },
      [](const int64_t &) -> const void * { return nullptr; },
      [](const std::string &) -> const void * { return nullptr; },
      [](const auto &p) -> const void * { return p.get(); }
  }, x);
}

std::string_view value::type_name() const {
  return std::visit(util::overloaded{
      [](const none_t &) -> std::string_view { return "NoneType"; },
      [](const int64_t &) -> std::string_view { return "int"; },
      [](const std::string &) -> std::string_view { return "str"; },
      [](const std::shared_ptr<function> &) -> std::string_view { return "function"; },
      [](const std::shared_ptr<klass> &) -> std::string_view { return "type"; },
      [](const std::shared_ptr<instance> &i) -> std::string_view { return i->cls ? std::string_view(i->cls->name) : "object"; },
      [](const std::shared_ptr<module> &) -> std::string_view { return "module"; },
      [](const std::shared_ptr<bound_method> &) -> std::string_view { return "method"; }
  }, x);
}

namespace error {
attribute_error::attribute_error(const value &v, std::string_view attr)
    : base("'" + std::string(v.type_name()) + "' object has no attribute '" + std::string(attr) + "'") {}

import_error::import_error(std::string_view name)
    : base("no module named '" + std::string(name) + "'") {}
}

namespace {
std::optional<value> lookup(const dict &d, std::string_view attr) {
  auto it = d.find(attr);
  if (it == d.end())return {};
  return it->second;
}
}

value getattr(const value &v, std::string_view attr) {
  std::optional<value> found = std::visit(util::overloaded{
      [attr](const std::shared_ptr<module> &m) { return lookup(m->attributes, attr); },
      [attr](const std::shared_ptr<klass> &c) { return lookup(c->attributes, attr); },
      [attr](const std::shared_ptr<function> &f) { return lookup(f->attributes, attr); },
      [attr, &v](const std::shared_ptr<instance> &i) -> std::optional<value> {
        if (auto own = lookup(i->attributes, attr))return own;
        if (!i->cls)return {};
        auto from_class = lookup(i->cls->attributes, attr);
        if (from_class && from_class->is<std::shared_ptr<function>>())
          return value(bind(from_class->as<std::shared_ptr<function>>(), v));
        return from_class;
      },
      [attr](const std::shared_ptr<bound_method> &b) -> std::optional<value> {
        if (attr == "__self__")return b->self;
        if (attr == "__func__")return value(b->fn);
        return lookup(b->fn->attributes, attr);
      },
      [](const auto &) -> std::optional<value> { return {}; }
  }, v.x);
  if (!found.has_value())throw error::attribute_error(v, attr);
  return std::move(found.value());
}

std::string repr(const value &v) {
  return std::visit(util::overloaded{
      [](const none_t &) -> std::string { return "None"; },
      [](const int64_t &i) -> std::string { return std::to_string(i); },
      [](const std::string &s) -> std::string { return util::quote(s); },
      [](const std::shared_ptr<function> &f) -> std::string { return "<function " + f->name + ">"; },
      [](const std::shared_ptr<klass> &c) -> std::string { return "<class " + c->name + ">"; },
      [](const std::shared_ptr<instance> &i) -> std::string {
        return "<" + std::string(value(i).type_name()) + " instance>";
      },
      [](const std::shared_ptr<module> &m) -> std::string { return "<module " + m->name + ">"; },
      [](const std::shared_ptr<bound_method> &b) -> std::string {
        return "<bound method " + std::string(b->self.type_name()) + "." + b->fn->name + ">";
      }
  }, v.x);
}

std::ostream &operator<<(std::ostream &os, const value &v) {
  return os << repr(v);
}

std::shared_ptr<function> make_function(std::string name,
                                        std::shared_ptr<const code::code_object> code,
                                        std::shared_ptr<dict> globals,
                                        std::vector<std::shared_ptr<cell>> closure) {
  auto f = std::make_shared<function>();
  f->name = std::move(name);
  f->code = std::move(code);
  f->globals = std::move(globals);
  f->closure = std::move(closure);
  return f;
}

std::shared_ptr<bound_method> bind(std::shared_ptr<function> fn, value self) {
  return std::make_shared<bound_method>(bound_method{.fn = std::move(fn), .self = std::move(self)});
}

void importer::add(std::shared_ptr<module> m) {
  std::string_view name = m->name;
  if (auto dot = name.rfind('.'); dot != std::string_view::npos) {
    std::string_view parent_name = name.substr(0, dot);
    auto it = modules.find(parent_name);
    std::shared_ptr<module> parent = it != modules.end() ? it->second : add(parent_name);
    parent->attributes.insert_or_assign(std::string(name.substr(dot + 1)), value(m));
  }
  modules.insert_or_assign(m->name, m);
}

std::shared_ptr<module> importer::add(std::string_view name) {
  auto m = std::make_shared<module>(module{.name = std::string(name), .attributes = {}});
  add(m);
  return m;
}

std::shared_ptr<module> importer::import_module(std::string_view name) const {
  auto it = modules.find(name);
  if (it == modules.end())throw error::import_error(name);
  return it->second;
}

bool importer::contains(std::string_view name) const {
  return modules.find(name) != modules.end();
}

}
