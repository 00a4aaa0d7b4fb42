#ifndef CODEREF_LIB_FINGERPRINT_FINGERPRINT_H_
#define CODEREF_LIB_FINGERPRINT_FINGERPRINT_H_

#include <refs/reference.h>
#include <refs/walker.h>
#include <code/code.h>
#include <diag/diag.h>
#include <rt/rt.h>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace coderef::fingerprint {

struct digest {
  uint64_t v = 0;
  [[nodiscard]] std::string to_hex() const;
  bool operator==(const digest &o) const { return v == o.v; }
  bool operator!=(const digest &o) const { return v != o.v; }
};
std::ostream &operator<<(std::ostream &os, const digest &d);

/*
 * 64-bit FNV-1a over a stream of tagged items.
 * Variable length items are length-prefixed so that concatenations cannot collide.
 */
class hasher {
 public:
  static constexpr uint64_t offset_basis = 0xcbf29ce484222325ULL;
  static constexpr uint64_t prime = 0x100000001b3ULL;

  hasher &tag(char t);
  hasher &integer(int64_t i);
  hasher &bytes(std::string_view s);
  hasher &combine(digest d);
  [[nodiscard]] digest finish() const { return digest{h}; }
 private:
  void feed(uint8_t b);
  uint64_t h = offset_basis;
};

/*
 * Turns references into deterministic digests.
 *
 * Functions are hashed through their instructions (not their line numbers) and,
 * recursively, through everything they refer to, so a change to a helper, a global
 * constant or a method invalidates every function that uses it.
 * Recursion is cut by the ancestors stack: a value being hashed further up
 * contributes a back reference holding its distance instead.
 *
 * Not thread safe; use one tokenizer per thread.
 */
class tokenizer {
 public:
  typedef std::function<void(const rt::instance &, hasher &)> serializer_t;

  tokenizer(const rt::importer &modules, diag::sink &sink) : modules(modules), sink(sink) {}

  // overrides how instances of the named class are hashed
  void register_serializer(std::string class_name, serializer_t s);

  digest tokenize(const refs::reference &r);
  digest tokenize(const rt::value &v);
  digest tokenize(const refs::reference_list &refs);

 private:
  void feed(hasher &h, const refs::reference &r);
  void feed(hasher &h, const rt::value &v);
  void feed(hasher &h, const rt::dict &d);
  void feed(hasher &h, const refs::reference_list &refs);
  void feed_heap(hasher &h, const rt::value &v);
  static void feed(hasher &h, const code::code_object &code);

  const rt::importer &modules;
  diag::sink &sink;
  std::map<std::string, serializer_t, std::less<>> serializers;
  std::vector<const void *> ancestors;
};

}

#endif //CODEREF_LIB_FINGERPRINT_FINGERPRINT_H_
