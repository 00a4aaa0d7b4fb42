#include <fingerprint/fingerprint.h>
#include <util/util.h>
#include <algorithm>
#include <cstdio>

namespace coderef::fingerprint {

namespace tags {
static constexpr char none = 'N';
static constexpr char integer = 'I';
static constexpr char string = 'S';
static constexpr char name = 'R';
static constexpr char module = 'M';
static constexpr char klass = 'C';
static constexpr char instance = 'O';
static constexpr char function = 'F';
static constexpr char bound_method = 'B';
static constexpr char back_reference = '^';
static constexpr char list = 'L';
static constexpr char code = 'X';
static constexpr char custom = 'U';
}

std::string digest::to_hex() const {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
  return std::string(buf, 16);
}

std::ostream &operator<<(std::ostream &os, const digest &d) {
  return os << d.to_hex();
}

void hasher::feed(uint8_t b) {
  h ^= b;
  h *= prime;
}

hasher &hasher::tag(char t) {
  feed(uint8_t(t));
  return *this;
}

hasher &hasher::integer(int64_t i) {
  auto u = uint64_t(i);
  for (int k = 0; k < 8; ++k)feed(uint8_t(u >> (8 * k)));
  return *this;
}

hasher &hasher::bytes(std::string_view s) {
  integer(int64_t(s.size()));
  for (char c : s)feed(uint8_t(c));
  return *this;
}

hasher &hasher::combine(digest d) {
  return integer(int64_t(d.v));
}

void tokenizer::register_serializer(std::string class_name, serializer_t s) {
  serializers.insert_or_assign(std::move(class_name), std::move(s));
}

digest tokenizer::tokenize(const refs::reference &r) {
  hasher h;
  feed(h, r);
  return h.finish();
}

digest tokenizer::tokenize(const rt::value &v) {
  hasher h;
  feed(h, v);
  return h.finish();
}

digest tokenizer::tokenize(const refs::reference_list &refs) {
  hasher h;
  feed(h, refs);
  return h.finish();
}

void tokenizer::feed(hasher &h, const refs::reference_list &refs) {
  h.tag(tags::list).integer(int64_t(refs.size()));
  for (const auto &r : refs)feed(h, r);
}

void tokenizer::feed(hasher &h, const refs::reference &r) {
  std::visit(util::overloaded{
      [this, &h](const rt::value &v) { feed(h, v); },
      [&h](const refs::partial_name &p) { h.tag(tags::name).bytes(p.path); }
  }, r);
}

void tokenizer::feed(hasher &h, const rt::value &v) {
  std::visit(util::overloaded{
      [&h](const rt::none_t &) { h.tag(tags::none); },
      [&h](const int64_t &i) { h.tag(tags::integer).integer(i); },
      [&h](const std::string &s) { h.tag(tags::string).bytes(s); },
      // modules are hashed by name, their contents are not ours to track
      [&h](const std::shared_ptr<rt::module> &m) { h.tag(tags::module).bytes(m->name); },
      [this, &h, &v](const auto &) { feed_heap(h, v); }
  }, v.x);
}

void tokenizer::feed(hasher &h, const rt::dict &d) {
  h.integer(int64_t(d.size()));
  for (const auto &[k, v] : d) {
    h.bytes(k);
    feed(h, v);
  }
}

void tokenizer::feed(hasher &h, const code::code_object &code) {
  h.tag(tags::code).bytes(code.name).integer(int64_t(code.instructions.size()));
  for (const auto &i : code.instructions) {
    h.integer(i.op);
    std::visit(util::overloaded{
        [&h](const std::monostate &) { h.tag(tags::none); },
        [&h](const code::operand::name &n) { h.tag(tags::name).bytes(n.id); },
        [&h](const code::operand::integer &n) { h.tag(tags::integer).integer(n.v); },
        [&h](const code::operand::string &s) { h.tag(tags::string).bytes(s.v); },
        [&h](const code::operand::none &) { h.tag(tags::none).tag(tags::none); }
    }, i.arg);
  }
  for (const auto *vars : {&code.cellvars, &code.freevars, &code.varnames}) {
    h.integer(int64_t(vars->size()));
    for (const auto &var : *vars)h.bytes(var);
  }
}

void tokenizer::feed_heap(hasher &h, const rt::value &v) {
  const void *id = v.identity();
  if (auto it = std::find(ancestors.rbegin(), ancestors.rend(), id); it != ancestors.rend()) {
    h.tag(tags::back_reference).integer(std::distance(ancestors.rbegin(), it));
    return;
  }
  ancestors.push_back(id);
  struct pop_on_exit {
    std::vector<const void *> &a;
    ~pop_on_exit() { a.pop_back(); }
  } guard{ancestors};

  std::visit(util::overloaded{
      [this, &h](const std::shared_ptr<rt::klass> &c) {
        h.tag(tags::klass).bytes(c->name);
        feed(h, c->attributes);
      },
      [this, &h](const std::shared_ptr<rt::instance> &i) {
        h.tag(tags::instance);
        if (!i->cls) {
          h.tag(tags::none);
        } else if (auto s = serializers.find(i->cls->name); s != serializers.end()) {
          h.tag(tags::custom).bytes(i->cls->name);
          s->second(*i, h);
          return;
        } else {
          feed(h, rt::value(i->cls));
        }
        feed(h, i->attributes);
      },
      [this, &h, &v](const std::shared_ptr<rt::function> &f) {
        h.tag(tags::function).bytes(f->name);
        if (f->code)feed(h, *f->code);
        feed(h, refs::references_of(v, modules, sink));
      },
      [this, &h, &v](const std::shared_ptr<rt::bound_method> &b) {
        // walked with self bound, so attributes read from the receiver resolve
        h.tag(tags::bound_method).bytes(b->fn->name);
        if (b->fn->code)feed(h, *b->fn->code);
        feed(h, refs::references_of(v, modules, sink));
        feed(h, b->self);
      },
      [](const auto &) { THROW_INTERNAL_ERROR }
  }, v.x);
}

}
