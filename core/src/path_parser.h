#pragma once

#include <optional>
#include <string>

#include "jpx/value.h"
#include "lang/ast.h"

namespace jpx {

struct PathParseResult {
  std::optional<PathQuery> path;
  std::optional<ParseError> error;
};

/// Parses path text ($ followed by segments) into a segment sequence.
/// MUST reject any syntax violation, including trailing input, and MUST NOT throw.
PathParseResult parse_path(const std::string& input);

}  // namespace jpx
