#include <unit/unit.h>
#include <code/parse_asm.h>
#include <util/util.h>
#include <charconv>
#include <optional>
#include <vector>

namespace coderef::unit {

namespace error {
syntax_error::syntax_error(std::string_view token, std::string_view what)
    : error::base(std::string(what)), util::message::error_token(token), msg(what) {}

void syntax_error::describe(std::ostream &os) const {
  os << msg;
}

unbound_identifier::unbound_identifier(std::string_view token)
    : error::base("unbound identifier " + std::string(token)), util::message::error_token(token) {}

void unbound_identifier::describe(std::ostream &os) const {
  os << "unbound identifier " << util::message::style::on(util::message::style::bold) << token
     << util::message::style::on(util::message::style::clear)
     << " (globals and modules must be defined before they are used)";
}
}

namespace {

// splits on blanks, keeping double quoted strings in one piece
std::vector<std::string_view> words(std::string_view s) {
  std::vector<std::string_view> w;
  s = util::trim(s);
  while (!s.empty()) {
    auto it = s.begin();
    if (*it == '"') {
      for (++it; it != s.end() && *it != '"'; ++it)if (*it == '\\' && std::next(it) != s.end())++it;
      if (it != s.end())++it;
    } else {
      while (it != s.end() && static_cast<unsigned char>(*it) > 32)++it;
    }
    w.push_back(util::itr_sv(s.begin(), it));
    s.remove_prefix(w.back().size());
    s = util::trim(s);
  }
  return w;
}

struct function_builder {
  std::string_view keyword, name_token; // for errors
  std::string name;
  std::shared_ptr<rt::klass> owner; // set for .method
  code::code_object code;
  std::vector<std::shared_ptr<rt::cell>> closure;
};

class unit_parser {
 public:
  unit_parser(std::string_view filename) : filename(filename) {}

  void line(std::string_view l) {
    auto w = words(l);
    if (w.empty())return;
    if (w.front().front() != '.') {
      if (!current)throw error::syntax_error(w.front(), "instruction outside of a function body");
      current->code.instructions.push_back(code::asm_parse_instruction(l));
      return;
    }
    std::string_view d = w.front();
    if (current) {
      body_directive(d, w);
    } else {
      unit_directive(d, w);
    }
  }

  unit finish() {
    if (current)throw error::syntax_error(current->keyword, "function body is never closed by .end");
    return std::move(u);
  }

 private:
  static void expect_arity(std::string_view d, const std::vector<std::string_view> &w, size_t n) {
    if (w.size() != n)
      throw error::syntax_error(d, std::string(d) + " expects " + std::to_string(n - 1) + " arguments");
  }

  // "DIRECTIVE A ... = VALUE"
  static void expect_assignment(std::string_view d, const std::vector<std::string_view> &w, size_t n) {
    expect_arity(d, w, n);
    if (w[n - 2] != "=")throw error::syntax_error(w[n - 2], "expected \"=\"");
  }

  rt::value parse_value(std::string_view tk) const {
    return std::visit(util::overloaded{
        [tk](const std::monostate &) -> rt::value { throw error::syntax_error(tk, "expected a value"); },
        [](const code::operand::integer &i) -> rt::value { return i.v; },
        [](const code::operand::string &s) -> rt::value { return s.v; },
        [](const code::operand::none &) -> rt::value { return rt::none; },
        [this, tk](const code::operand::name &n) -> rt::value {
          if (auto it = u.globals->find(n.id); it != u.globals->end())return it->second;
          if (u.modules.contains(n.id))return u.modules.import_module(n.id);
          throw error::unbound_identifier(tk);
        }
    }, code::operand::asm_parse(tk));
  }

  template<typename T>
  std::shared_ptr<T> global_of(std::string_view tk, std::string_view what) const {
    auto it = u.globals->find(tk);
    if (it == u.globals->end())throw error::unbound_identifier(tk);
    if (!it->second.is<std::shared_ptr<T>>())throw error::syntax_error(tk, std::string(tk) + " is not " + std::string(what));
    return it->second.as<std::shared_ptr<T>>();
  }

  void define(std::string_view tk, rt::value v) {
    if (!u.globals->emplace(std::string(tk), std::move(v)).second)
      throw error::syntax_error(tk, "redefinition of " + std::string(tk));
  }

  void unit_directive(std::string_view d, const std::vector<std::string_view> &w) {
    if (d == ".module") {
      expect_arity(d, w, 2);
      if (u.modules.contains(w[1]))throw error::syntax_error(w[1], "module defined twice");
      u.modules.add(w[1]);
    } else if (d == ".export") {
      expect_assignment(d, w, 5);
      if (!u.modules.contains(w[1]))throw error::unbound_identifier(w[1]);
      u.modules.import_module(w[1])->attributes.insert_or_assign(std::string(w[2]), parse_value(w[4]));
    } else if (d == ".global") {
      expect_assignment(d, w, 4);
      define(w[1], parse_value(w[3]));
    } else if (d == ".class") {
      expect_arity(d, w, 2);
      define(w[1], std::make_shared<rt::klass>(rt::klass{.name = std::string(w[1]), .attributes = {}}));
    } else if (d == ".classattr") {
      expect_assignment(d, w, 5);
      global_of<rt::klass>(w[1], "a class")->attributes.insert_or_assign(std::string(w[2]), parse_value(w[4]));
    } else if (d == ".instance") {
      expect_arity(d, w, 3);
      define(w[1], std::make_shared<rt::instance>(rt::instance{.cls = global_of<rt::klass>(w[2], "a class"), .attributes = {}}));
    } else if (d == ".set") {
      expect_assignment(d, w, 5);
      global_of<rt::instance>(w[1], "an instance")->attributes.insert_or_assign(std::string(w[2]), parse_value(w[4]));
    } else if (d == ".bind") {
      expect_arity(d, w, 4);
      rt::value receiver = global_of<rt::instance>(w[2], "an instance");
      rt::value method = [&]() {
        try {
          return rt::getattr(receiver, w[3]);
        } catch (const rt::error::attribute_error &e) {
          throw error::syntax_error(w[3], e.what());
        }
      }();
      if (!method.is<std::shared_ptr<rt::bound_method>>())throw error::syntax_error(w[3], "not a method");
      define(w[1], std::move(method));
    } else if (d == ".function") {
      expect_arity(d, w, 2);
      begin(d, w[1], nullptr);
    } else if (d == ".method") {
      expect_arity(d, w, 3);
      begin(d, w[2], global_of<rt::klass>(w[1], "a class"));
    } else {
      throw error::syntax_error(d, "unknown directive");
    }
  }

  void begin(std::string_view keyword, std::string_view name, std::shared_ptr<rt::klass> owner) {
    current.emplace();
    current->keyword = keyword;
    current->name_token = name;
    current->name = std::string(name);
    current->owner = std::move(owner);
    current->code.name = std::string(name);
    current->code.filename = filename;
  }

  static std::vector<std::string> names(const std::vector<std::string_view> &w) {
    return std::vector<std::string>(w.begin() + 1, w.end());
  }

  void body_directive(std::string_view d, const std::vector<std::string_view> &w) {
    code::code_object &code = current->code;
    if (d == ".file") {
      expect_arity(d, w, 2);
      auto v = parse_value(w[1]);
      if (!v.is<std::string>())throw error::syntax_error(w[1], "expected a quoted file name");
      code.filename = v.as<std::string>();
    } else if (d == ".firstline") {
      expect_arity(d, w, 2);
      auto[p, ec] = std::from_chars(w[1].data(), w[1].data() + w[1].size(), code.first_line);
      if (ec != std::errc() || p != w[1].data() + w[1].size())throw error::syntax_error(w[1], "expected a line number");
    } else if (d == ".cellvars") {
      code.cellvars = names(w);
    } else if (d == ".freevars") {
      code.freevars = names(w);
    } else if (d == ".varnames") {
      code.varnames = names(w);
    } else if (d == ".closure") {
      expect_assignment(d, w, 4);
      // cells are paired with .freevars by position, so they must come in the same order
      const size_t next = current->closure.size();
      if (next >= code.freevars.size())
        throw error::syntax_error(w[1], "more closure cells than free variables declared by .freevars");
      if (w[1] != code.freevars[next])
        throw error::syntax_error(w[1], "expected the cell of " + code.freevars[next] + " (free variables are bound in .freevars order)");
      current->closure.push_back(std::make_shared<rt::cell>(rt::cell{.contents = parse_value(w[3])}));
    } else if (d == ".end") {
      expect_arity(d, w, 1);
      end();
    } else {
      throw error::syntax_error(d, "unknown directive inside a function body");
    }
  }

  void end() {
    function_builder f = std::move(current.value());
    current.reset();
    auto fn = rt::make_function(f.name,
                                std::make_shared<const code::code_object>(std::move(f.code)),
                                u.globals,
                                std::move(f.closure));
    if (f.owner) {
      f.owner->attributes.insert_or_assign(f.name, rt::value(fn));
    } else {
      define(f.name_token, rt::value(fn));
    }
  }

  std::string filename;
  unit u;
  std::optional<function_builder> current;
};

}

unit asm_parse_unit(std::string_view source, std::string_view filename) {
  unit_parser p(filename);
  for (auto begin = source.begin(), end = std::find(begin, source.end(), 10); begin != source.end();
       begin = end + (end != source.end()), end = std::find(begin, source.end(), 10)) {
    std::string_view l = util::trim(code::strip_comment(util::itr_sv(begin, end)));
    if (l.empty())continue;
    p.line(l);
  }
  return p.finish();
}

}
