#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace jpx::util {

/// Lowercases every code point with the full Unicode mappings of the ICU root locale.
/// MUST NOT depend on the process locale. Malformed UTF-8 only has its ASCII letters mapped.
std::string to_lower(std::string_view s);
/// Uppercases every code point with the full Unicode mappings of the ICU root locale.
/// The result may be longer than the input (e.g. "ß" becomes "SS").
std::string to_upper(std::string_view s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(std::string_view s);
/// Counts UTF-8 code points; stray continuation bytes are not counted.
size_t utf8_length(std::string_view s);
/// Returns true when the bytes form well-formed UTF-8.
bool is_valid_utf8(std::string_view s);
/// Appends the character a quoted-literal escape \<escaped> stands for.
/// Decodes \" \' \\ \n \t \r; any other escape is appended verbatim with its backslash.
void append_unescaped(char escaped, std::string& out);

}  // namespace jpx::util
