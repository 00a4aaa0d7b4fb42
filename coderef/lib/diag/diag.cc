#include <diag/diag.h>
#include <util/message.h>

namespace coderef::diag {

namespace {
util::message::warning_location to_message(const diagnostic &d) {
  return util::message::warning_location(
      d.filename, d.line,
      "cannot resolve a code reference while hashing '" + d.callable
          + "'; changes to it will not invalidate the cache",
      d.what);
}
}

std::ostream &operator<<(std::ostream &os, const diagnostic &d) {
  to_message(d).print(os);
  return os;
}

void stream_sink::report(diagnostic &&d) {
  os << d;
}

void unique_sink::report(diagnostic &&d) {
  if (seen.emplace(d.callable, d.filename, d.line, d.what).second)next.report(std::move(d));
}

}
