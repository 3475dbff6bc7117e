#include "path_parser_internal.h"

#include <cctype>
#include <charconv>
#include <utility>

#include "util/string_util.h"

namespace jpx {

PathParser::PathParser(const std::string& input) : input_(input) {}

/// Parses Path := '$' Segment*.
/// MUST consume the whole input; anything left over is a syntax error.
PathParseResult PathParser::parse() {
  PathParseResult result;
  PathQuery query;
  skip_ws();
  PathSegment root;
  root.kind = PathSegment::Kind::Root;
  root.span = Span{pos_, pos_ + 1};
  if (!expect('$', "Path must start with $")) {
    result.error = error_;
    return result;
  }
  query.segments.push_back(std::move(root));
  while (true) {
    skip_ws();
    if (eof()) break;
    PathSegment segment;
    if (!parse_segment(segment)) {
      result.error = error_;
      return result;
    }
    query.segments.push_back(std::move(segment));
  }
  result.path = std::move(query);
  return result;
}

bool PathParser::parse_segment(PathSegment& out) {
  size_t start = pos_;
  bool ok = false;
  if (peek_str("..")) {
    pos_ += 2;
    ok = parse_descent_segment(out);
  } else if (consume_char('.')) {
    ok = parse_dot_segment(out);
  } else if (consume_char('[')) {
    ok = parse_bracket_segment(out);
  } else {
    return set_error("Expected ., .. or [ to start a path segment");
  }
  out.span = Span{start, pos_};
  return ok;
}

bool PathParser::parse_dot_segment(PathSegment& out) {
  if (consume_char('*')) {
    out.kind = PathSegment::Kind::Wildcard;
    return true;
  }
  out.kind = PathSegment::Kind::Key;
  return parse_identifier(out.key);
}

bool PathParser::parse_descent_segment(PathSegment& out) {
  out.kind = PathSegment::Kind::RecursiveDescent;
  if (consume_char('*')) {
    out.descend_wildcard = true;
    return true;
  }
  if (!std::isalpha(static_cast<unsigned char>(peek())) && peek() != '_') {
    return set_error("Expected name or * after ..");
  }
  return parse_identifier(out.key);
}

/// Parses Bracket := Quoted | '*' | SignedInt | Slice | '?(' FilterExpr ')' and the closing ].
bool PathParser::parse_bracket_segment(PathSegment& out) {
  skip_ws();
  if (consume_char('*')) {
    out.kind = PathSegment::Kind::Wildcard;
    skip_ws();
    return expect(']', "Expected ] after *");
  }
  if (consume_char('?')) {
    skip_ws();
    if (!expect('(', "Expected ( after ?")) return false;
    FilterExpr filter;
    if (!parse_filter_or(filter)) return false;
    skip_ws();
    if (!expect(')', "Expected ) to close filter")) return false;
    skip_ws();
    if (!expect(']', "Expected ] after filter")) return false;
    out.kind = PathSegment::Kind::Filter;
    out.filter = std::make_shared<FilterExpr>(std::move(filter));
    return true;
  }
  if (peek() == '\'' || peek() == '"') {
    out.kind = PathSegment::Kind::Key;
    if (!parse_quoted(out.key)) return false;
    skip_ws();
    return expect(']', "Expected ] after quoted key");
  }
  return parse_index_or_slice(out);
}

/// Parses SignedInt or Slice := [SignedInt] ':' [SignedInt] [':' [SignedInt]].
bool PathParser::parse_index_or_slice(PathSegment& out) {
  std::optional<int64_t> parts[3];
  size_t colons = 0;
  if (at_signed_int()) {
    int64_t value = 0;
    if (!parse_signed_int(value)) return false;
    parts[0] = value;
  }
  skip_ws();
  while (consume_char(':')) {
    ++colons;
    if (colons > 2) {
      --pos_;
      return set_error("Too many slice components");
    }
    skip_ws();
    if (at_signed_int()) {
      int64_t value = 0;
      if (!parse_signed_int(value)) return false;
      parts[colons] = value;
    }
    skip_ws();
  }
  if (colons == 0) {
    if (!parts[0].has_value()) {
      return set_error("Expected index, slice, quoted key, * or filter inside []");
    }
    out.kind = PathSegment::Kind::Index;
    out.index = *parts[0];
    return expect(']', "Expected ] after index");
  }
  out.kind = PathSegment::Kind::Slice;
  out.slice_start = parts[0];
  out.slice_end = parts[1];
  out.slice_step = parts[2];
  return expect(']', "Expected ] after slice");
}

bool PathParser::eof() const { return pos_ >= input_.size(); }

char PathParser::peek(size_t offset) const {
  return pos_ + offset < input_.size() ? input_[pos_ + offset] : '\0';
}

bool PathParser::peek_str(const char* literal) const {
  return input_.compare(pos_, std::char_traits<char>::length(literal), literal) == 0;
}

bool PathParser::consume_char(char c) {
  if (eof() || input_[pos_] != c) return false;
  ++pos_;
  return true;
}

bool PathParser::expect(char c, const char* message) {
  if (consume_char(c)) return true;
  return set_error(message);
}

void PathParser::skip_ws() {
  while (!eof() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
}

bool PathParser::at_signed_int() const {
  char c = peek();
  if (c == '-') c = peek(1);
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool PathParser::parse_identifier(std::string& out) {
  size_t start = pos_;
  if (eof() || !(std::isalpha(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '_')) {
    return set_error("Expected identifier");
  }
  while (!eof() && (std::isalnum(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '_')) {
    ++pos_;
  }
  out = input_.substr(start, pos_ - start);
  return true;
}

bool PathParser::parse_quoted(std::string& out) {
  size_t start = pos_;
  char quote = input_[pos_++];
  out.clear();
  while (!eof()) {
    char c = input_[pos_++];
    if (c == quote) return true;
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (eof()) break;
    util::append_unescaped(input_[pos_++], out);
  }
  pos_ = start;
  return set_error("Unterminated string literal");
}

bool PathParser::parse_signed_int(int64_t& out) {
  size_t start = pos_;
  if (peek() == '-') ++pos_;
  while (!eof() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
  const char* first = input_.data() + start;
  const char* last = input_.data() + pos_;
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc() || ptr != last) {
    pos_ = start;
    return set_error("Integer out of range");
  }
  return true;
}

bool PathParser::set_error(const std::string& message) {
  if (!error_.has_value()) {
    error_ = ParseError{message, pos_};
  }
  return false;
}

PathParseResult parse_path(const std::string& input) {
  PathParser parser(input);
  return parser.parse();
}

}  // namespace jpx
