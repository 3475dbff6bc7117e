#include "cli_utils.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace jpx::cli {

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string strip_trailing_newline(const std::string& text) {
  std::string out = text;
  if (!out.empty() && out.back() == '\n') {
    out.pop_back();
    if (!out.empty() && out.back() == '\r') out.pop_back();
  }
  return out;
}

std::string render_code_frame(const std::string& text, size_t byte_pos) {
  if (byte_pos > text.size()) byte_pos = text.size();
  size_t line_start = 0;
  if (byte_pos > 0) {
    size_t newline = text.rfind('\n', byte_pos - 1);
    if (newline != std::string::npos) line_start = newline + 1;
  }
  size_t line_end = text.find('\n', byte_pos);
  if (line_end == std::string::npos) line_end = text.size();
  size_t line_number = 1;
  for (size_t i = 0; i < line_start; ++i) {
    if (text[i] == '\n') ++line_number;
  }
  std::string line_text = text.substr(line_start, line_end - line_start);
  if (!line_text.empty() && line_text.back() == '\r') line_text.pop_back();
  size_t column = byte_pos - line_start;
  const std::string gutter(std::to_string(line_number).size(), ' ');

  std::ostringstream out;
  out << " --> line " << line_number << ", col " << (column + 1) << "\n";
  out << gutter << " |\n";
  out << line_number << " | " << line_text << "\n";
  out << gutter << " | " << std::string(column, ' ') << "^";
  return out.str();
}

const char* issue_kind_name(EvalIssueKind kind) {
  switch (kind) {
    case EvalIssueKind::ExpressionSyntax:
      return "expression-syntax";
    case EvalIssueKind::UnknownFunction:
      return "unknown-function";
    case EvalIssueKind::WrongArity:
      return "wrong-arity";
    case EvalIssueKind::ArgumentNotString:
      return "argument-not-string";
    case EvalIssueKind::InvalidJson:
      return "invalid-json";
    case EvalIssueKind::PathSyntax:
      return "path-syntax";
  }
  return "unknown";
}

std::string format_result(const Value& value, bool compact) {
  return value.dump(compact ? -1 : 2, ' ', false, Value::error_handler_t::replace);
}

}  // namespace jpx::cli
