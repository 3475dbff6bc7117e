#pragma once

#include <optional>
#include <string>

#include "jpx/value.h"
#include "lang/ast.h"

namespace jpx {

struct ExprParseResult {
  std::optional<ExprNode> expr;
  std::optional<ParseError> error;
};

/// Parses Expr := Call | StringLiteral, Call := Ident '(' [Expr (',' Expr)*] ')'.
/// MUST reject trailing input and MUST NOT throw.
ExprParseResult parse_expression(const std::string& input);

}  // namespace jpx
