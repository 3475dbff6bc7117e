#include "evaluator.h"

#include <string>

#include "builtins.h"

namespace jpx {

namespace {

bool require_text(const Value& arg,
                  Builtin builtin,
                  const ExprNode& node,
                  std::vector<EvalIssue>& issues) {
  if (arg.is_string()) return true;
  issues.push_back(EvalIssue{EvalIssueKind::ArgumentNotString,
                             std::string(builtin_name(builtin)) + " expects text arguments",
                             node.span.start});
  return false;
}

}  // namespace

Value evaluate_node(const ExprNode& node, std::vector<EvalIssue>& issues) {
  if (node.kind == ExprNode::Kind::StringLiteral) {
    return Value(node.string_value);
  }
  std::optional<Builtin> builtin = lookup_builtin(node.function_name);
  if (!builtin.has_value()) {
    issues.push_back(EvalIssue{EvalIssueKind::UnknownFunction,
                               "Unknown function: " + node.function_name,
                               node.span.start});
    return Value();
  }
  size_t arity = builtin_arity(*builtin);
  if (node.args.size() != arity) {
    issues.push_back(EvalIssue{EvalIssueKind::WrongArity,
                               node.function_name + " expects " + std::to_string(arity) +
                                   " argument(s), got " + std::to_string(node.args.size()),
                               node.span.start});
    return Value();
  }

  std::vector<Value> args;
  args.reserve(node.args.size());
  for (const auto& arg : node.args) {
    args.push_back(evaluate_node(arg, issues));
  }

  switch (*builtin) {
    case Builtin::FromJson:
      if (!require_text(args[0], *builtin, node, issues) ||
          !require_text(args[1], *builtin, node, issues)) {
        return Value();
      }
      return run_from_json(args[0].get_ref<const std::string&>(),
                           args[1].get_ref<const std::string&>(), &issues);
    case Builtin::First:
      return first(args[0]);
    case Builtin::Unique:
      return unique(args[0]);
    case Builtin::OrDefault:
      if (!require_text(args[1], *builtin, node, issues)) return Value();
      return or_default(args[0], args[1].get_ref<const std::string&>());
  }
  return Value();
}

}  // namespace jpx
