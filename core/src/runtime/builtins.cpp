#include "builtins.h"

#include <utility>

#include "matcher.h"
#include "path_parser.h"

namespace jpx {

std::optional<Builtin> lookup_builtin(const std::string& name) {
  if (name == "from_json") return Builtin::FromJson;
  if (name == "first") return Builtin::First;
  if (name == "unique") return Builtin::Unique;
  if (name == "or_default") return Builtin::OrDefault;
  return std::nullopt;
}

size_t builtin_arity(Builtin builtin) {
  switch (builtin) {
    case Builtin::FromJson:
    case Builtin::OrDefault:
      return 2;
    case Builtin::First:
    case Builtin::Unique:
      return 1;
  }
  return 0;
}

const char* builtin_name(Builtin builtin) {
  switch (builtin) {
    case Builtin::FromJson:
      return "from_json";
    case Builtin::First:
      return "first";
    case Builtin::Unique:
      return "unique";
    case Builtin::OrDefault:
      return "or_default";
  }
  return "";
}

Value run_query(const Value& document,
                const std::string& path_text,
                std::vector<EvalIssue>* issues) {
  PathParseResult parsed = parse_path(path_text);
  if (!parsed.path.has_value()) {
    if (issues != nullptr) {
      issues->push_back(EvalIssue{EvalIssueKind::PathSyntax,
                                  "Invalid path: " + parsed.error->message,
                                  parsed.error->position});
    }
    return Value();
  }
  return collect_matches(match_path(document, *parsed.path));
}

Value run_from_json(const std::string& json_text,
                    const std::string& path_text,
                    std::vector<EvalIssue>* issues) {
  JsonParseResult document = parse_json(json_text);
  if (!document.value.has_value()) {
    if (issues != nullptr) {
      issues->push_back(EvalIssue{EvalIssueKind::InvalidJson,
                                  "Invalid JSON: " + document.error->message,
                                  document.error->position});
    }
    return Value();
  }
  return run_query(*document.value, path_text, issues);
}

Value from_json(const std::string& json_text, const std::string& path_text) {
  return run_from_json(json_text, path_text, nullptr);
}

Value query_value(const Value& document, const std::string& path_text) {
  return run_query(document, path_text, nullptr);
}

Value first(const Value& value) {
  if (value.is_array()) {
    return value.empty() ? Value() : value.front();
  }
  // Scalars and objects pass through; null stays null.
  return value;
}

Value unique(const Value& value) {
  if (!value.is_array()) return value;
  Value out = Value::array();
  for (const Value& element : value) {
    bool seen = false;
    for (const Value& kept : out) {
      if (values_equal(kept, element)) {
        seen = true;
        break;
      }
    }
    if (!seen) out.push_back(element);
  }
  return out;
}

Value or_default(const Value& value, const std::string& default_json) {
  bool missing = value.is_null() || (value.is_array() && value.empty());
  if (!missing) return value;
  JsonParseResult parsed = parse_json(default_json);
  if (parsed.value.has_value()) return std::move(*parsed.value);
  return Value(default_json);
}

}  // namespace jpx
