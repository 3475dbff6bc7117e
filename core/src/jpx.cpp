#include "jpx/jpx.h"

#include "expr_parser.h"
#include "runtime/evaluator.h"

namespace jpx {

EvalReport evaluate_expression_report(const std::string& expression) {
  EvalReport report;
  ExprParseResult parsed = parse_expression(expression);
  if (!parsed.expr.has_value()) {
    report.issues.push_back(EvalIssue{EvalIssueKind::ExpressionSyntax,
                                      parsed.error->message,
                                      parsed.error->position});
    return report;
  }
  report.value = evaluate_node(*parsed.expr, report.issues);
  return report;
}

std::optional<ParseError> check_expression(const std::string& expression) {
  return parse_expression(expression).error;
}

Value evaluate_expression(const std::string& expression) {
  return evaluate_expression_report(expression).value;
}

}  // namespace jpx
