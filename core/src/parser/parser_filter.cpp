#include "path_parser_internal.h"

#include <cctype>
#include <memory>
#include <utility>

namespace jpx {

/// Parses a filter expression with || precedence.
/// MUST collect consecutive operands into one LogicalExpr in source order.
bool PathParser::parse_filter_or(FilterExpr& out) {
  size_t start = pos_;
  FilterExpr first;
  if (!parse_filter_and(first)) return false;
  skip_ws();
  if (!peek_str("||")) {
    out = std::move(first);
    return true;
  }
  auto node = std::make_shared<LogicalExpr>();
  node->op = LogicalExpr::Op::Or;
  node->operands.push_back(std::move(first));
  while (peek_str("||")) {
    pos_ += 2;
    FilterExpr next;
    if (!parse_filter_and(next)) return false;
    node->operands.push_back(std::move(next));
    skip_ws();
  }
  node->span = Span{start, pos_};
  out = node;
  return true;
}

/// Parses a filter expression with && precedence.
bool PathParser::parse_filter_and(FilterExpr& out) {
  size_t start = pos_;
  FilterExpr first;
  if (!parse_filter_not(first)) return false;
  skip_ws();
  if (!peek_str("&&")) {
    out = std::move(first);
    return true;
  }
  auto node = std::make_shared<LogicalExpr>();
  node->op = LogicalExpr::Op::And;
  node->operands.push_back(std::move(first));
  while (peek_str("&&")) {
    pos_ += 2;
    FilterExpr next;
    if (!parse_filter_not(next)) return false;
    node->operands.push_back(std::move(next));
    skip_ws();
  }
  node->span = Span{start, pos_};
  out = node;
  return true;
}

bool PathParser::parse_filter_not(FilterExpr& out) {
  skip_ws();
  size_t start = pos_;
  if (peek() == '!' && peek(1) != '=') {
    ++pos_;
    if (++depth_ > kMaxNestingDepth) return set_error("Nesting too deep");
    auto node = std::make_shared<NotExpr>();
    if (!parse_filter_not(node->inner)) return false;
    --depth_;
    node->span = Span{start, pos_};
    out = node;
    return true;
  }
  return parse_filter_primary(out);
}

/// Parses a parenthesized group, a comparison, or a bare operand.
bool PathParser::parse_filter_primary(FilterExpr& out) {
  skip_ws();
  size_t start = pos_;
  if (consume_char('(')) {
    if (++depth_ > kMaxNestingDepth) return set_error("Nesting too deep");
    auto node = std::make_shared<GroupExpr>();
    if (!parse_filter_or(node->inner)) return false;
    --depth_;
    skip_ws();
    if (!expect(')', "Expected ) to close group")) return false;
    node->span = Span{start, pos_};
    out = node;
    return true;
  }
  FilterOperand lhs;
  if (!parse_operand(lhs)) return false;
  skip_ws();
  if (peek() == '=' && peek(1) != '=') {
    return set_error("Use == for equality");
  }
  std::optional<CompareExpr::Op> op = parse_compare_op();
  if (!op.has_value()) {
    TruthyExpr truthy;
    truthy.operand = std::move(lhs);
    truthy.span = Span{start, pos_};
    out = std::move(truthy);
    return true;
  }
  CompareExpr cmp;
  cmp.op = *op;
  cmp.lhs = std::move(lhs);
  if (!parse_operand(cmp.rhs)) return false;
  cmp.span = Span{start, pos_};
  out = std::move(cmp);
  return true;
}

std::optional<CompareExpr::Op> PathParser::parse_compare_op() {
  if (peek_str("==")) {
    pos_ += 2;
    return CompareExpr::Op::Eq;
  }
  if (peek_str("!=")) {
    pos_ += 2;
    return CompareExpr::Op::NotEq;
  }
  if (peek_str("<=")) {
    pos_ += 2;
    return CompareExpr::Op::Lte;
  }
  if (peek_str(">=")) {
    pos_ += 2;
    return CompareExpr::Op::Gte;
  }
  if (consume_char('<')) return CompareExpr::Op::Lt;
  if (consume_char('>')) return CompareExpr::Op::Gt;
  return std::nullopt;
}

/// Parses a literal, an @ accessor, or lower/upper/length(operand).
bool PathParser::parse_operand(FilterOperand& out) {
  skip_ws();
  size_t start = pos_;
  char c = peek();
  if (c == '\'' || c == '"') {
    std::string text;
    if (!parse_quoted(text)) return false;
    out.kind = FilterOperand::Kind::Literal;
    out.literal = Value(std::move(text));
  } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
    out.kind = FilterOperand::Kind::Literal;
    if (!parse_number_literal(out.literal)) return false;
  } else if (c == '@') {
    ++pos_;
    out.kind = FilterOperand::Kind::Current;
    if (!parse_accessor_steps(out.steps)) return false;
  } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
    std::string name;
    if (!parse_identifier(name)) return false;
    if (name == "true" || name == "false") {
      out.kind = FilterOperand::Kind::Literal;
      out.literal = Value(name == "true");
    } else if (name == "null") {
      out.kind = FilterOperand::Kind::Literal;
      out.literal = Value();
    } else if (name == "lower" || name == "upper" || name == "length") {
      out.kind = name == "lower"   ? FilterOperand::Kind::Lower
                 : name == "upper" ? FilterOperand::Kind::Upper
                                   : FilterOperand::Kind::Length;
      skip_ws();
      if (!expect('(', "Expected ( after filter helper name")) return false;
      if (++depth_ > kMaxNestingDepth) return set_error("Nesting too deep");
      out.inner = std::make_shared<FilterOperand>();
      if (!parse_operand(*out.inner)) return false;
      --depth_;
      skip_ws();
      if (!expect(')', "Expected ) to close filter helper call")) return false;
    } else {
      pos_ = start;
      return set_error("Unknown filter identifier: " + name);
    }
  } else {
    return set_error("Expected filter operand");
  }
  out.span = Span{start, pos_};
  return true;
}

/// Parses the steps after @: .key, ['key'] and [index].
/// MUST reject wildcards and slices, which filters do not support.
bool PathParser::parse_accessor_steps(std::vector<AccessorStep>& steps) {
  while (true) {
    skip_ws();
    if (peek() == '.' && peek(1) != '.') {
      ++pos_;
      if (peek() == '*') return set_error("Wildcards are not supported inside filters");
      AccessorStep step;
      step.kind = AccessorStep::Kind::Key;
      if (!parse_identifier(step.key)) return false;
      steps.push_back(std::move(step));
      continue;
    }
    if (peek() == '.') {
      return set_error("Recursive descent is not supported inside filters");
    }
    if (!consume_char('[')) return true;
    skip_ws();
    AccessorStep step;
    if (peek() == '\'' || peek() == '"') {
      step.kind = AccessorStep::Kind::Key;
      if (!parse_quoted(step.key)) return false;
    } else if (at_signed_int()) {
      step.kind = AccessorStep::Kind::Index;
      if (!parse_signed_int(step.index)) return false;
    } else {
      return set_error("Expected quoted key or index inside filter accessor");
    }
    skip_ws();
    if (peek() == ':') return set_error("Slices are not supported inside filters");
    if (!expect(']', "Expected ] in filter accessor")) return false;
    steps.push_back(std::move(step));
  }
}

/// Parses -?digits[.digits][(e|E)[+-]digits] and keeps integers as integers.
bool PathParser::parse_number_literal(Value& out) {
  size_t start = pos_;
  auto skip_digits = [&]() {
    size_t before = pos_;
    while (!eof() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    return pos_ > before;
  };
  consume_char('-');
  bool ok = skip_digits();
  if (ok && consume_char('.')) ok = skip_digits();
  if (ok && (peek() == 'e' || peek() == 'E')) {
    ++pos_;
    if (peek() == '+' || peek() == '-') ++pos_;
    ok = skip_digits();
  }
  if (ok) {
    out = Value::parse(input_.substr(start, pos_ - start), nullptr, false);
    ok = !out.is_discarded();
  }
  if (!ok) {
    pos_ = start;
    return set_error("Invalid number literal");
  }
  return true;
}

}  // namespace jpx
