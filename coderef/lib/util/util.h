#ifndef CODEREF_LIB_UTIL_UTIL_H_
#define CODEREF_LIB_UTIL_UTIL_H_

#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>

namespace util {

std::string load_file(std::string_view path);

std::string_view itr_sv(std::string_view::iterator begin, std::string_view::iterator end);

std::string_view trim(std::string_view s);

template<class... Ts>
struct overloaded : Ts ... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

namespace chars {
bool has_escaped_mnemonic(char c);
char escaped_mnemonic(char c);
bool is_valid_mnemonic(char c);
char parse_mnemonic(char c);
bool is_identifier_start(char c);
bool is_identifier_char(char c);
}

// quotes and escapes s the way string literals are written in listings
std::string quote(std::string_view s);
}

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)
#define AT __FILE__ ":" TOSTRING(__LINE__)
#define THROW_INTERNAL_ERROR throw std::runtime_error( AT ": internal_error" );

#endif //CODEREF_LIB_UTIL_UTIL_H_
