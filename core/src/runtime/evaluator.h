#pragma once

#include <vector>

#include "jpx/jpx.h"
#include "lang/ast.h"

namespace jpx {

/// Evaluates a call tree bottom-up.
/// Unknown names, wrong arity and non-string text arguments collapse the call to null
/// and are recorded in issues.
Value evaluate_node(const ExprNode& node, std::vector<EvalIssue>& issues);

}  // namespace jpx
