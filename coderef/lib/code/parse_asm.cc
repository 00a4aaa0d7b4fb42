#include <code/parse_asm.h>
#include <charconv>
#include <algorithm>

namespace coderef::code {

namespace {

bool is_dotted_name(std::string_view s) {
  bool at_start = true;
  for (char c : s) {
    if (at_start) {
      if (!util::chars::is_identifier_start(c))return false;
      at_start = false;
    } else if (c == '.') {
      at_start = true;
    } else if (!util::chars::is_identifier_char(c)) {
      return false;
    }
  }
  return !at_start;
}

operand::string parse_string_literal(std::string_view s) {
  std::string_view literal = s;
  s.remove_prefix(1);
  std::string v;
  while (!s.empty() && s.front() != '"') {
    if (s.front() == '\\') {
      s.remove_prefix(1);
      if (s.empty() || !util::chars::is_valid_mnemonic(s.front()))
        throw error::malformed_operand(literal, "invalid escape sequence");
      v.push_back(util::chars::parse_mnemonic(s.front()));
    } else {
      v.push_back(s.front());
    }
    s.remove_prefix(1);
  }
  if (s.empty())throw error::malformed_operand(literal, "unterminated string literal");
  if (s.size() != 1)throw error::malformed_operand(literal, "trailing characters after string literal");
  return operand::string{std::move(v)};
}

operand::integer parse_integer(std::string_view s) {
  int64_t n;
  auto[p, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
  if (ec != std::errc() || p != s.data() + s.size())throw error::malformed_operand(s, "not a valid integer literal");
  return operand::integer{n};
}

}

namespace operand {
t asm_parse(std::string_view s) {
  s = util::trim(s);
  if (s.empty())return std::monostate();
  if (s.front() == '"')return parse_string_literal(s);
  if (s.front() == '-' || (s.front() >= '0' && s.front() <= '9'))return parse_integer(s);
  if (s == "None")return none{};
  if (is_dotted_name(s))return name{std::string(s)};
  throw error::malformed_operand(s, "expected an integer, a string, None or a name");
}
}

std::string_view strip_comment(std::string_view line) {
  bool in_string = false;
  for (auto it = line.begin(); it != line.end(); ++it) {
    if (in_string && *it == '\\') {
      if (std::next(it) != line.end())++it;
    } else if (*it == '"') {
      in_string = !in_string;
    } else if (!in_string && *it == '#') {
      return util::itr_sv(line.begin(), it);
    }
  }
  return line;
}

instruction asm_parse_instruction(std::string_view s) {
  s = util::trim(strip_comment(s));
  instruction i{.op = nop, .arg = std::monostate(), .starts_line = std::nullopt};
  if (!s.empty() && s.front() >= '0' && s.front() <= '9') {
    std::string_view digits(s.data(), std::distance(s.begin(), std::find_if(s.begin(), s.end(), [](char c) {
      return c < '0' || c > '9';
    })));
    uint32_t line;
    auto[p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), line);
    if (ec != std::errc())throw error::malformed_operand(digits, "not a valid line number");
    i.starts_line = line;
    s.remove_prefix(digits.size());
    s = util::trim(s);
  }
  std::string_view o(s.data(), std::distance(s.begin(), std::find_if(s.begin(), s.end(), [](char p) { return static_cast<unsigned char>(p) <= 32; })));
  s.remove_prefix(o.size());
  auto op = parse::opcode_of_string(o);
  if (!op.has_value())throw error::unknown_opcode(o);
  i.op = op.value();
  i.arg = operand::asm_parse(s);
  return i;
}

std::vector<instruction> asm_parse_listing(std::string_view s) {
  std::vector<instruction> instructions;
  for (auto begin = s.begin(), end = std::find(begin, s.end(), 10); begin != s.end();
       begin = end + (end != s.end()), end = std::find(begin, s.end(), 10)) {
    std::string_view line = util::trim(strip_comment(util::itr_sv(begin, end)));
    if (line.empty())continue;
    instructions.push_back(asm_parse_instruction(line));
  }
  return instructions;
}

}
