#ifndef CODEREF_LIB_CODE_PARSE_ASM_H_
#define CODEREF_LIB_CODE_PARSE_ASM_H_

#include <code/code.h>
#include <string_view>
#include <vector>

namespace coderef::code {

/*
 * Textual listings, one instruction per line:
 *
 *   [LINE] MNEMONIC [OPERAND]
 *
 * OPERAND is an integer, a double quoted string, None or a (dotted) name.
 * Everything after an unquoted '#' is a comment.
 * All string_views in thrown errors point into the parsed text.
 */
namespace operand {
t asm_parse(std::string_view s);
}

std::string_view strip_comment(std::string_view line);

instruction asm_parse_instruction(std::string_view line);

std::vector<instruction> asm_parse_listing(std::string_view s);

}

#endif //CODEREF_LIB_CODE_PARSE_ASM_H_
