#ifndef CODEREF_LIB_DIAG_DIAG_H_
#define CODEREF_LIB_DIAG_DIAG_H_

#include <cstdint>
#include <optional>
#include <set>
#include <tuple>
#include <ostream>
#include <string>
#include <vector>

namespace coderef::diag {

/*
 * A reference that could not be resolved while walking a callable.
 * Never fatal: the walk goes on without it.
 */
struct diagnostic {
  std::string callable;
  std::string filename;
  std::optional<uint32_t> line;
  std::string what;
};

std::ostream &operator<<(std::ostream &os, const diagnostic &d);

class sink {
 public:
  virtual void report(diagnostic &&d) = 0;
  virtual ~sink() = default;
};

// prints every diagnostic as a warning
class stream_sink : public sink {
 public:
  explicit stream_sink(std::ostream &os) : os(os) {}
  void report(diagnostic &&d) override;
 private:
  std::ostream &os;
};

class collecting_sink : public sink {
 public:
  void report(diagnostic &&d) override { collected.push_back(std::move(d)); }
  [[nodiscard]] const std::vector<diagnostic> &diagnostics() const { return collected; }
  [[nodiscard]] bool empty() const { return collected.empty(); }
 private:
  std::vector<diagnostic> collected;
};

/*
 * Forwards each distinct diagnostic once.
 * A callable is walked again every time it is reached, and each walk reports
 * the same failures.
 */
class unique_sink : public sink {
 public:
  explicit unique_sink(sink &next) : next(next) {}
  void report(diagnostic &&d) override;
 private:
  sink &next;
  std::set<std::tuple<std::string, std::string, std::optional<uint32_t>, std::string>> seen;
};

class null_sink : public sink {
 public:
  void report(diagnostic &&) override {}
};

}

#endif //CODEREF_LIB_DIAG_DIAG_H_
