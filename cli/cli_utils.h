#pragma once

#include <cstddef>
#include <string>

#include "jpx/jpx.h"

namespace jpx::cli {

/// Reads a whole file.
/// MUST throw std::runtime_error when the file cannot be opened.
std::string read_file(const std::string& path);
/// Removes a single trailing \n or \r\n, as left by editors at the end of expression files.
std::string strip_trailing_newline(const std::string& text);
/// Renders the line containing byte_pos with a caret under it.
std::string render_code_frame(const std::string& text, size_t byte_pos);
/// Stable short name for an issue kind, e.g. "invalid-json".
const char* issue_kind_name(EvalIssueKind kind);
/// Serializes a result for stdout; invalid UTF-8 inside strings is replaced, never thrown.
std::string format_result(const Value& value, bool compact);

}  // namespace jpx::cli
