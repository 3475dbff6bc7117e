#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "path_parser.h"

namespace jpx {

/// Single-pass recursive descent parser over path text, including [?( ... )] filters.
/// Segment rules live in parser_path.cpp, filter rules in parser_filter.cpp.
class PathParser {
 public:
  explicit PathParser(const std::string& input);
  PathParseResult parse();

 private:
  // parser_path.cpp
  bool parse_segment(PathSegment& out);
  bool parse_dot_segment(PathSegment& out);
  bool parse_descent_segment(PathSegment& out);
  bool parse_bracket_segment(PathSegment& out);
  bool parse_index_or_slice(PathSegment& out);

  // parser_filter.cpp
  bool parse_filter_or(FilterExpr& out);
  bool parse_filter_and(FilterExpr& out);
  bool parse_filter_not(FilterExpr& out);
  bool parse_filter_primary(FilterExpr& out);
  bool parse_operand(FilterOperand& out);
  bool parse_accessor_steps(std::vector<AccessorStep>& steps);
  bool parse_number_literal(Value& out);
  std::optional<CompareExpr::Op> parse_compare_op();

  // Character-level helpers shared by both halves.
  bool eof() const;
  char peek(size_t offset = 0) const;
  bool peek_str(const char* literal) const;
  bool consume_char(char c);
  bool expect(char c, const char* message);
  void skip_ws();
  bool at_signed_int() const;
  bool parse_identifier(std::string& out);
  bool parse_quoted(std::string& out);
  bool parse_signed_int(int64_t& out);
  bool set_error(const std::string& message);

  const std::string& input_;
  size_t pos_ = 0;
  // Open !, ( and helper calls above the rule being parsed; capped at kMaxNestingDepth.
  size_t depth_ = 0;
  std::optional<ParseError> error_;
};

}  // namespace jpx
