#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "jpx/value.h"

namespace jpx {

/// Deepest nesting of calls, filter groups, negations or helper calls a parser accepts.
constexpr size_t kMaxNestingDepth = 256;

struct Span {
  size_t start = 0;
  size_t end = 0;
};

// ---------------------------------------------------------------------------
// Filter sub-language ([?( ... )])
// ---------------------------------------------------------------------------

/// One simple step after @: .key, ['key'] or [index].
struct AccessorStep {
  enum class Kind { Key, Index } kind = Kind::Key;
  std::string key;
  int64_t index = 0;
};

struct FilterOperand {
  enum class Kind {
    Literal,
    Current,
    Lower,
    Upper,
    Length
  } kind = Kind::Literal;
  Value literal;
  /// Steps applied to the current node when kind is Current.
  std::vector<AccessorStep> steps;
  /// Wrapped operand for Lower/Upper/Length.
  std::shared_ptr<FilterOperand> inner;
  Span span;
};

struct CompareExpr {
  enum class Op { Eq, NotEq, Lt, Lte, Gt, Gte } op = Op::Eq;
  FilterOperand lhs;
  FilterOperand rhs;
  Span span;
};

/// Bare operand such as [?(@.isbn)]; passes when the operand value is truthy.
struct TruthyExpr {
  FilterOperand operand;
  Span span;
};

struct LogicalExpr;
struct NotExpr;
struct GroupExpr;
using FilterExpr = std::variant<CompareExpr,
                                TruthyExpr,
                                std::shared_ptr<LogicalExpr>,
                                std::shared_ptr<NotExpr>,
                                std::shared_ptr<GroupExpr>>;

/// && or || over two or more operands, evaluated left to right with short-circuit.
struct LogicalExpr {
  enum class Op { And, Or } op = Op::And;
  std::vector<FilterExpr> operands;
  Span span;
};

struct NotExpr {
  FilterExpr inner;
  Span span;
};

struct GroupExpr {
  FilterExpr inner;
  Span span;
};

// ---------------------------------------------------------------------------
// Path ($.a[*]..b[1:3][?(...)])
// ---------------------------------------------------------------------------

struct PathSegment {
  enum class Kind {
    Root,
    Key,
    Wildcard,
    RecursiveDescent,
    Index,
    Slice,
    Filter
  } kind = Kind::Root;
  /// Key name for Key, and for RecursiveDescent when descend_wildcard is false.
  std::string key;
  bool descend_wildcard = false;
  int64_t index = 0;
  std::optional<int64_t> slice_start;
  std::optional<int64_t> slice_end;
  std::optional<int64_t> slice_step;
  std::shared_ptr<FilterExpr> filter;
  Span span;
};

struct PathQuery {
  std::vector<PathSegment> segments;
};

// ---------------------------------------------------------------------------
// Outer expression language (first(from_json("...", "$..x")))
// ---------------------------------------------------------------------------

struct ExprNode {
  enum class Kind { StringLiteral, Call } kind = Kind::StringLiteral;
  std::string string_value;
  std::string function_name;
  std::vector<ExprNode> args;
  Span span;
};

}  // namespace jpx
