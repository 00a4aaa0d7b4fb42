#ifndef CODEREF_LIB_UTIL_MESSAGE_H_
#define CODEREF_LIB_UTIL_MESSAGE_H_
#include <string>
#include <iostream>
#include <optional>
#include <cstdint>
#include <iterator>
#include <algorithm>
#include <util/util.h>
namespace util::message {

struct base {
  virtual void print(std::ostream &) const = 0;
  virtual void link_file(std::string_view file, std::string_view filename = "source.casm") = 0;
  virtual ~base() = default;
};

namespace style {

// cleared by tools writing to something that is not a terminal
inline bool enabled = true;

inline std::string_view on(std::string_view escape) { return enabled ? escape : std::string_view(); }

static constexpr std::string_view bold = "\e[1m";
static constexpr std::string_view clear = "\e[0m";

struct none {
  static constexpr std::string_view name = "";
  static constexpr std::string_view escape = "\e[0m";
};

struct error {
  static constexpr std::string_view name = "error";
  static constexpr std::string_view escape = "\e[31m";
};

struct note {
  static constexpr std::string_view name = "note";
  static constexpr std::string_view escape = "\e[36m";
};

struct warning {
  static constexpr std::string_view name = "warning";
  static constexpr std::string_view escape = "\e[35m";
};

}

template<typename Style>
struct styled_string : public virtual base {
  std::string what;
  styled_string(std::string_view what) : what(what) {}
  void print(std::ostream &os) const final {
    os << style::on(Style::escape) << Style::name << ": " << style::on(style::none::escape) << what << std::endl;
  }
  void link_file(std::string_view file, std::string_view filename) final {
  }

};
typedef styled_string<style::error> error_string;
typedef styled_string<style::warning> warning_string;
typedef styled_string<style::note> note_string;

template<typename Style>
struct report_token : public virtual base {

  std::string_view token, file, filename;
  report_token(std::string_view token, std::string_view file, std::string_view filename)
      : token(token), file(file), filename(filename) {}
  report_token(std::string_view token)
      : token(token) {}
  void link_file(std::string_view file, std::string_view filename) final {
    if (token.begin() >= file.begin() && token.end() <= file.end()) {
      this->file = file;
      this->filename = filename;
    }
  }

  virtual void describe(std::ostream &os) const = 0;
  void print(std::ostream &os) const final {
    constexpr std::string_view sep = ":";
    constexpr std::string_view ssep = ": ";
    std::string_view tk = token;
    std::size_t posy, posx;
    os << style::on(style::bold);
    const bool linked = !file.empty() && tk.begin() >= file.begin() && tk.end() <= file.end();
    if (linked) {
      posy = std::count(file.begin(), tk.begin(), 10) + 1;
      posx = std::distance(std::find(std::string_view::const_reverse_iterator(tk.begin() + 1), file.crend(), 10).base(),
                           tk.begin()) + 1;
      os << filename << sep << posy << sep << posx << ssep;
    }
    os << style::on(Style::escape) << Style::name << ssep << style::on(style::clear);
    describe(os);
    os << std::endl;
    if (linked) {
      auto it_endline = tk.begin();
      if (auto ite = std::find(tk.begin(), tk.end(), 10);ite != tk.end()) {
        it_endline = ite;
        tk.remove_suffix(std::distance(ite, tk.end()));
      } else {
        it_endline = std::find(tk.end(), file.end(), 10);
      }
      for (int w = int(5) - std::to_string(posy).size(); w > 0; w--)os << ' ';
      os << posy << " | " << itr_sv(tk.begin() - posx + 1, tk.begin()) << style::on(style::bold)
         << style::on(Style::escape) << tk
         << style::on(style::clear) << itr_sv(tk.end(), it_endline) << std::endl;
      os << "      |" << std::string(posx, ' ') << style::on(style::bold) << style::on(Style::escape) << "^";
      for (int w = int(tk.size()) - 1; w > 0; w--)os << '~';
      os << style::on(style::clear) << std::endl;
    }
  }
}; // virtual class
typedef report_token<style::error> error_token;
typedef report_token<style::warning> warning_token;
typedef report_token<style::note> note_token;

/**
 * A message pointing at a line of a file that is not loaded in memory,
 * e.g. a line recorded in a code object.
 * Prints as "filename:line: warning: headline" followed by an indented detail.
 */
template<typename Style>
struct report_location : public virtual base {
  std::string filename;
  std::optional<uint32_t> line;
  std::string headline, detail;
  report_location(std::string_view filename, std::optional<uint32_t> line, std::string_view headline,
                  std::string_view detail) : filename(filename), line(line), headline(headline), detail(detail) {}
  void link_file(std::string_view, std::string_view) final {}
  void print(std::ostream &os) const final {
    os << style::on(style::bold);
    if (!filename.empty()) {
      os << filename << ":";
      if (line.has_value())os << line.value() << ":";
      os << " ";
    }
    os << style::on(Style::escape) << Style::name << ": " << style::on(style::clear) << headline << std::endl;
    if (!detail.empty())os << "      | " << detail << std::endl;
  }
};
typedef report_location<style::error> error_location;
typedef report_location<style::warning> warning_location;
typedef report_location<style::note> note_location;

}
#endif //CODEREF_LIB_UTIL_MESSAGE_H_
