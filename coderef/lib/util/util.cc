#include <util/util.h>
#include <fstream>
#include <iterator>

namespace util {
std::string_view itr_sv(std::string_view::iterator begin, std::string_view::iterator end) {
  return std::string_view(begin, end - begin);
}

std::string load_file(std::string_view path) {
  std::ifstream t(std::string(path).c_str());
  if (!t.is_open())throw std::runtime_error("cannot open \"" + std::string(path) + "\"");
  return std::string((std::istreambuf_iterator<char>(t)),
                     std::istreambuf_iterator<char>());
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && static_cast<unsigned char>(s.front()) <= 32)s.remove_prefix(1);
  while (!s.empty() && static_cast<unsigned char>(s.back()) <= 32)s.remove_suffix(1);
  return s;
}

std::string quote(std::string_view s) {
  std::string q = "\"";
  for (char c : s) {
    if (chars::has_escaped_mnemonic(c)) {
      q.push_back('\\');
      q.push_back(chars::escaped_mnemonic(c));
    } else q.push_back(c);
  }
  q.push_back('"');
  return q;
}

namespace chars {
bool has_escaped_mnemonic(char c) {
  switch (c) {
    case '\"':return true;
    case '\\':return true;
    case '\n':return true;
    case '\r':return true;
    case '\t':return true;
    case '\b':return true;
    case '\f':return true;
    case '\a':return true;
    case '\v':return true;
    default: return false;
  }
}

char escaped_mnemonic(char c) {
  switch (c) {
    case '\"':return c;
    case '\\':return c;
    case '\n':return 'n';
    case '\r':return 'r';
    case '\t':return 't';
    case '\b':return 'b';
    case '\f':return 'f';
    case '\a':return 'a';
    case '\v':return 'v';
    default: THROW_INTERNAL_ERROR;
  }
}

bool is_valid_mnemonic(char c) {
  switch (c) {
    case '\'':
    case '\"':
    case '\\':
    case 'n':
    case 'r':
    case 't':
    case 'b':
    case 'f':
    case 'a':
    case 'v':return true;
    default: return false;
  }
}
char parse_mnemonic(char c) {
  switch (c) {
    case '\'':return c;
    case '\"':return c;
    case '\\':return c;
    case 'n':return '\n';
    case 'r':return '\r';
    case 't':return '\t';
    case 'b':return '\b';
    case 'f':return '\f';
    case 'a':return '\a';
    case 'v':return '\v';
    default: THROW_INTERNAL_ERROR;
  }
}

bool is_identifier_start(char c) {
  return c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_identifier_char(char c) {
  return is_identifier_start(c) || (c >= '0' && c <= '9');
}

}
}
