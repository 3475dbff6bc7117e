#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "jpx/jpx.h"

namespace jpx {

/// Closed set of functions callable from expression text.
enum class Builtin {
  FromJson,
  First,
  Unique,
  OrDefault
};

/// Maps a call name to its built-in; names are case-sensitive.
std::optional<Builtin> lookup_builtin(const std::string& name);
size_t builtin_arity(Builtin builtin);
const char* builtin_name(Builtin builtin);

/// from_json/query_value with failure reasons appended to issues when it is non-null.
Value run_from_json(const std::string& json_text,
                    const std::string& path_text,
                    std::vector<EvalIssue>* issues);
Value run_query(const Value& document,
                const std::string& path_text,
                std::vector<EvalIssue>* issues);

}  // namespace jpx
