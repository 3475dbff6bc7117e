#pragma once

#include "jpx/value.h"
#include "lang/ast.h"

namespace jpx {

/// Evaluates a filter predicate with current bound to @.
/// MUST short-circuit && and || left to right and MUST NOT throw.
bool eval_filter(const FilterExpr& expr, const Value& current);

/// Resolves an operand against @; a missing key or index resolves to null.
Value resolve_operand(const FilterOperand& operand, const Value& current);

/// Applies a comparison operator with number/string coercion.
/// Incomparable operands (object vs number, null vs anything under ordering) yield false.
bool compare_values(CompareExpr::Op op, const Value& lhs, const Value& rhs);

}  // namespace jpx
