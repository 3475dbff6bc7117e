#include "matcher.h"

#include <cstdint>

#include "filter.h"

namespace jpx {

namespace {

using NodeList = std::vector<const Value*>;

void append_children(const Value& node, NodeList& out) {
  if (!node.is_array() && !node.is_object()) return;
  for (const Value& child : node) {
    out.push_back(&child);
  }
}

void apply_key(const Value& node, const std::string& key, NodeList& out) {
  if (!node.is_object()) return;
  auto it = node.find(key);
  if (it != node.end()) out.push_back(&*it);
}

void apply_index(const Value& node, int64_t index, NodeList& out) {
  if (!node.is_array()) return;
  int64_t size = static_cast<int64_t>(node.size());
  if (index < 0) index += size;
  if (index < 0 || index >= size) return;
  out.push_back(&node[static_cast<size_t>(index)]);
}

/// Python slice semantics: defaults follow the step direction, negatives count from the end,
/// bounds clamp, and a zero step selects nothing.
void apply_slice(const Value& node, const PathSegment& segment, NodeList& out) {
  if (!node.is_array()) return;
  int64_t step = segment.slice_step.value_or(1);
  if (step == 0) return;
  int64_t size = static_cast<int64_t>(node.size());
  auto normalize = [size](int64_t i, int64_t lo, int64_t hi) {
    if (i < 0) i += size;
    if (i < lo) return lo;
    if (i > hi) return hi;
    return i;
  };
  if (step > 0) {
    int64_t start = segment.slice_start ? normalize(*segment.slice_start, 0, size) : 0;
    int64_t end = segment.slice_end ? normalize(*segment.slice_end, 0, size) : size;
    for (int64_t i = start; i < end;) {
      out.push_back(&node[static_cast<size_t>(i)]);
      // end - i cannot overflow here; i + step could.
      if (step >= end - i) break;
      i += step;
    }
    return;
  }
  int64_t start = segment.slice_start ? normalize(*segment.slice_start, -1, size - 1) : size - 1;
  int64_t end = segment.slice_end ? normalize(*segment.slice_end, -1, size - 1) : -1;
  for (int64_t i = start; i > end;) {
    out.push_back(&node[static_cast<size_t>(i)]);
    if (step <= end - i) break;
    i += step;
  }
}

/// Pre-order walk of the subtree rooted at node, node included.
void apply_descent(const Value& node, const PathSegment& segment, NodeList& out) {
  NodeList pending{&node};
  NodeList children;
  while (!pending.empty()) {
    const Value* visit = pending.back();
    pending.pop_back();
    if (segment.descend_wildcard) {
      out.push_back(visit);
    } else {
      apply_key(*visit, segment.key, out);
    }
    children.clear();
    append_children(*visit, children);
    // Reversed so the first child is popped next.
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      pending.push_back(*it);
    }
  }
}

void apply_filter(const Value& node, const FilterExpr& filter, NodeList& out) {
  if (!node.is_array() && !node.is_object()) return;
  for (const Value& candidate : node) {
    if (eval_filter(filter, candidate)) out.push_back(&candidate);
  }
}

}  // namespace

std::vector<const Value*> match_path(const Value& root, const PathQuery& path) {
  NodeList current{&root};
  NodeList next;
  for (const auto& segment : path.segments) {
    next.clear();
    for (const Value* node : current) {
      switch (segment.kind) {
        case PathSegment::Kind::Root:
          break;
        case PathSegment::Kind::Key:
          apply_key(*node, segment.key, next);
          break;
        case PathSegment::Kind::Wildcard:
          append_children(*node, next);
          break;
        case PathSegment::Kind::RecursiveDescent:
          apply_descent(*node, segment, next);
          break;
        case PathSegment::Kind::Index:
          apply_index(*node, segment.index, next);
          break;
        case PathSegment::Kind::Slice:
          apply_slice(*node, segment, next);
          break;
        case PathSegment::Kind::Filter:
          if (segment.filter) apply_filter(*node, *segment.filter, next);
          break;
      }
    }
    if (segment.kind == PathSegment::Kind::Root) {
      next.assign(1, &root);
    }
    current.swap(next);
    if (current.empty()) break;
  }
  return current;
}

Value collect_matches(const std::vector<const Value*>& matches) {
  if (matches.empty()) return Value();
  Value out = Value::array();
  for (const Value* match : matches) {
    out.push_back(*match);
  }
  return out;
}

}  // namespace jpx
