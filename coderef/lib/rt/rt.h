#ifndef CODEREF_LIB_RT_RT_H_
#define CODEREF_LIB_RT_RT_H_

#include <code/code.h>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <stdexcept>
#include <ostream>

namespace coderef::rt {

struct function;
struct klass;
struct instance;
struct module;
struct bound_method;

struct none_t {
  bool operator==(const none_t &) const { return true; }
};
static constexpr none_t none{};

/*
 * A runtime value as seen by an introspecting tool.
 * Scalars compare by value, everything living on the heap compares by identity.
 */
struct value {
  typedef std::variant<none_t,
                       int64_t,
                       std::string,
                       std::shared_ptr<function>,
                       std::shared_ptr<klass>,
                       std::shared_ptr<instance>,
                       std::shared_ptr<module>,
                       std::shared_ptr<bound_method>> variant;
  variant x;

  value() : x(none) {}
  value(none_t) : x(none) {}
  value(int64_t i) : x(i) {}
  value(int i) : x(int64_t(i)) {}
  value(std::string s) : x(std::move(s)) {}
  value(const char *s) : x(std::string(s)) {}
  template<typename T>
  value(std::shared_ptr<T> p) : x(std::move(p)) {}

  template<typename T>
  [[nodiscard]] bool is() const { return std::holds_alternative<T>(x); }
  template<typename T>
  [[nodiscard]] const T &as() const { return std::get<T>(x); }

  // the heap object this value points to, nullptr for scalars
  [[nodiscard]] const void *identity() const;
  [[nodiscard]] std::string_view type_name() const;

  bool operator==(const value &o) const { return x == o.x; }
  bool operator!=(const value &o) const { return !(x == o.x); }
};

typedef std::map<std::string, value, std::less<>> dict;

struct module {
  std::string name;
  dict attributes;
};

struct klass {
  std::string name;
  dict attributes;
};

struct instance {
  std::shared_ptr<klass> cls; // may be null for an object of unknown type
  dict attributes;
};

struct cell {
  std::optional<value> contents;
};

struct function {
  std::string name;
  std::shared_ptr<const code::code_object> code;
  // the enclosing namespace, shared with every other function defined there
  std::shared_ptr<dict> globals;
  std::vector<std::shared_ptr<cell>> closure;
  dict attributes;
};

struct bound_method {
  std::shared_ptr<function> fn;
  value self;
};

namespace error {
class base : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class attribute_error : public base {
 public:
  attribute_error(const value &v, std::string_view attr);
};

class import_error : public base {
 public:
  explicit import_error(std::string_view name);
};
}

value getattr(const value &v, std::string_view attr);

std::string repr(const value &v);
std::ostream &operator<<(std::ostream &os, const value &v);

std::shared_ptr<function> make_function(std::string name,
                                        std::shared_ptr<const code::code_object> code,
                                        std::shared_ptr<dict> globals,
                                        std::vector<std::shared_ptr<cell>> closure = {});
std::shared_ptr<bound_method> bind(std::shared_ptr<function> fn, value self);

/*
 * The registry of importable modules, keyed by dotted name.
 */
class importer {
 public:
  // registers m, creating the missing parent packages and binding m into its parent
  void add(std::shared_ptr<module> m);
  std::shared_ptr<module> add(std::string_view name);
  [[nodiscard]] std::shared_ptr<module> import_module(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const;
 private:
  std::map<std::string, std::shared_ptr<module>, std::less<>> modules;
};

}

#endif //CODEREF_LIB_RT_RT_H_
