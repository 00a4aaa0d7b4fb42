#include <unit/unit.h>
#include <refs/walker.h>
#include <fingerprint/fingerprint.h>
#include <diag/diag.h>
#include <util/util.h>
#include <util/message.h>
#include <algorithm>
#include <iostream>

namespace {
std::string_view get_arg(int argc, const char *argv[], std::string_view argname, std::string_view on_fail) {
  auto it = std::find_if(argv, argv + argc, [argname](const char *p) { return argname == p; });
  if (it == argv + argc)return on_fail;
  if (it == argv + argc - 1)return on_fail;
  return it[1];
}

bool has_flag(int argc, const char *argv[], std::string_view flag) {
  return std::any_of(argv, argv + argc, [flag](const char *p) { return flag == p; });
}

// sends every diagnostic to the wrapped sink and counts them
class counting_sink : public coderef::diag::sink {
 public:
  explicit counting_sink(coderef::diag::sink &next) : next(next) {}
  void report(coderef::diag::diagnostic &&d) override {
    ++count;
    next.report(std::move(d));
  }
  size_t count = 0;
 private:
  coderef::diag::sink &next;
};

int usage(const char *argv0) {
  std::cerr << "usage: " << argv0 << " UNIT FUNCTION [-method CLASS] [-strict] [-plain] [-no-fingerprint]" << std::endl;
  return 1;
}
}

int main(int argc, const char *argv[]) {
  if (argc < 3 || argv[1][0] == '-' || argv[2][0] == '-')return usage(argv[0]);
  std::string_view source_path = argv[1];
  std::string_view function_name = argv[2];
  std::string_view class_name = get_arg(argc, argv, "-method", "");
  const bool strict = has_flag(argc, argv, "-strict");
  const bool fingerprint = !has_flag(argc, argv, "-no-fingerprint");
  util::message::style::enabled = !has_flag(argc, argv, "-plain");

  std::string source;
  try {
    source = util::load_file(source_path);
  } catch (const std::runtime_error &e) {
    util::message::error_string(e.what()).print(std::cerr);
    return 1;
  }

  coderef::unit::unit u;
  try {
    u = coderef::unit::asm_parse_unit(source, source_path);
  } catch (util::message::base &e) {
    e.link_file(source, source_path);
    e.print(std::cerr);
    return 1;
  }

  coderef::rt::value callable;
  auto global = u.globals->find(class_name.empty() ? function_name : class_name);
  if (global == u.globals->end()) {
    util::message::error_string("no global named " + std::string(class_name.empty() ? function_name : class_name))
        .print(std::cerr);
    return 1;
  }
  try {
    callable = class_name.empty() ? global->second : coderef::rt::getattr(global->second, function_name);
  } catch (const coderef::rt::error::attribute_error &e) {
    util::message::error_string(e.what()).print(std::cerr);
    return 1;
  }

  coderef::diag::stream_sink printer(std::cerr);
  counting_sink counter(printer);
  // the callable is walked once for the listing and again while hashing
  coderef::diag::unique_sink sink(counter);
  try {
    for (const auto &r : coderef::refs::references_of(callable, u.modules, sink))std::cout << r << std::endl;
    if (fingerprint) {
      coderef::fingerprint::tokenizer t(u.modules, sink);
      std::cout << "fingerprint: " << t.tokenize(callable) << std::endl;
    }
  } catch (const coderef::refs::error::contract_violation &e) {
    util::message::error_string(std::string("cannot fingerprint ") + std::string(function_name) + ": " + e.what())
        .print(std::cerr);
    return 3;
  }
  if (strict && counter.count > 0) {
    util::message::note_string(std::to_string(counter.count) + " reference(s) could not be resolved").print(std::cerr);
    return 2;
  }
  return 0;
}
