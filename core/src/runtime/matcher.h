#pragma once

#include <vector>

#include "jpx/value.h"
#include "lang/ast.h"

namespace jpx {

/// Walks root according to the path and returns matched nodes in discovery order.
/// MUST NOT recurse natively over the document; deep trees are walked with an explicit work list.
/// Returned pointers reference nodes inside root and stay valid while root is unchanged.
std::vector<const Value*> match_path(const Value& root, const PathQuery& path);

/// Copies matches into an array, or returns null when there are none.
Value collect_matches(const std::vector<const Value*>& matches);

}  // namespace jpx
