#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "jpx/value.h"

namespace jpx {

/// Classifies a failure that evaluation collapsed into a null result.
/// MUST remain stable for CLI output and tests.
enum class EvalIssueKind {
  ExpressionSyntax,
  UnknownFunction,
  WrongArity,
  ArgumentNotString,
  InvalidJson,
  PathSyntax,
};

/// One collapsed failure. Position is a byte offset into the text the issue refers to
/// (the expression for syntax/call issues, the JSON or path argument otherwise).
struct EvalIssue {
  EvalIssueKind kind = EvalIssueKind::ExpressionSyntax;
  std::string message;
  size_t position = 0;
};

/// Result of evaluating an expression together with every failure that was collapsed.
/// MUST hold null in value whenever the top-level expression failed to parse.
struct EvalReport {
  Value value;
  std::vector<EvalIssue> issues;
};

/// Evaluates a full expression such as first(from_json("<json>", "$.a[*]")).
/// MUST NOT throw; any failure yields null.
/// Inputs are expression text; outputs are the resulting value with no side effects.
Value evaluate_expression(const std::string& expression);
/// Evaluates a full expression and keeps the reasons behind any null results.
/// MUST return the same value as evaluate_expression for the same input.
EvalReport evaluate_expression_report(const std::string& expression);

/// Parses expression text without evaluating it.
/// Returns the first syntax error, or nullopt when the expression is well-formed.
std::optional<ParseError> check_expression(const std::string& expression);

/// Parses json_text and applies path_text to it.
/// Returns an array of matches in discovery order, or null when nothing matched
/// or either text is malformed.
Value from_json(const std::string& json_text, const std::string& path_text);
/// Applies path_text to an already-parsed document with the same result contract as from_json.
Value query_value(const Value& document, const std::string& path_text);

/// Build provenance reported by `jpx --version`.
struct BuildInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Values baked in at compile time; MUST NOT perform IO.
BuildInfo build_info();
/// "<version> (<commit>[-dirty])".
std::string version_string();

/// First element of a non-empty array; null for null or []; other values pass through.
Value first(const Value& value);
/// Keeps the first of each group of deep-equal array elements, in order.
/// Non-array values pass through unchanged.
Value unique(const Value& value);
/// Substitutes the parsed default_json when value is null or [].
/// MUST fall back to default_json as a plain string when it is not valid JSON.
Value or_default(const Value& value, const std::string& default_json);

}  // namespace jpx
