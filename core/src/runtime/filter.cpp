#include "filter.h"

#include <memory>
#include <optional>
#include <variant>

namespace jpx {

namespace {

bool is_scalar_comparable(const Value& value) {
  return value.is_number() || value.is_string();
}

/// Orders two values: numerically when both coerce to numbers, otherwise by string form
/// when both are numbers or strings. Returns nullopt for incomparable operands.
std::optional<int> order_values(const Value& lhs, const Value& rhs) {
  if (lhs.is_boolean() && rhs.is_boolean()) {
    return static_cast<int>(lhs.get<bool>()) - static_cast<int>(rhs.get<bool>());
  }
  if (!is_scalar_comparable(lhs) || !is_scalar_comparable(rhs)) return std::nullopt;
  std::optional<double> lnum = coerce_number(lhs);
  std::optional<double> rnum = coerce_number(rhs);
  if (lnum.has_value() && rnum.has_value()) {
    if (*lnum < *rnum) return -1;
    if (*lnum > *rnum) return 1;
    return 0;
  }
  int cmp = string_form(lhs).compare(string_form(rhs));
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

bool loosely_equal(const Value& lhs, const Value& rhs) {
  if (values_equal(lhs, rhs)) return true;
  // "3" == 3: mixed number/string pairs compare by numeric value.
  if ((lhs.is_number() && rhs.is_string()) || (lhs.is_string() && rhs.is_number())) {
    std::optional<double> lnum = coerce_number(lhs);
    std::optional<double> rnum = coerce_number(rhs);
    return lnum.has_value() && rnum.has_value() && *lnum == *rnum;
  }
  return false;
}

const Value* step_into(const Value& node, const AccessorStep& step) {
  if (step.kind == AccessorStep::Kind::Key) {
    if (!node.is_object()) return nullptr;
    auto it = node.find(step.key);
    return it == node.end() ? nullptr : &*it;
  }
  if (!node.is_array()) return nullptr;
  int64_t size = static_cast<int64_t>(node.size());
  int64_t index = step.index < 0 ? step.index + size : step.index;
  if (index < 0 || index >= size) return nullptr;
  return &node[static_cast<size_t>(index)];
}

}  // namespace

Value resolve_operand(const FilterOperand& operand, const Value& current) {
  switch (operand.kind) {
    case FilterOperand::Kind::Literal:
      return operand.literal;
    case FilterOperand::Kind::Current: {
      const Value* node = &current;
      for (const auto& step : operand.steps) {
        node = step_into(*node, step);
        if (node == nullptr) return Value();
      }
      return *node;
    }
    case FilterOperand::Kind::Lower:
      return value_lower(resolve_operand(*operand.inner, current));
    case FilterOperand::Kind::Upper:
      return value_upper(resolve_operand(*operand.inner, current));
    case FilterOperand::Kind::Length:
      return Value(value_length(resolve_operand(*operand.inner, current)));
  }
  return Value();
}

bool compare_values(CompareExpr::Op op, const Value& lhs, const Value& rhs) {
  if (op == CompareExpr::Op::Eq) return loosely_equal(lhs, rhs);
  if (op == CompareExpr::Op::NotEq) return !loosely_equal(lhs, rhs);
  std::optional<int> order = order_values(lhs, rhs);
  if (!order.has_value()) return false;
  switch (op) {
    case CompareExpr::Op::Lt:
      return *order < 0;
    case CompareExpr::Op::Lte:
      return *order <= 0;
    case CompareExpr::Op::Gt:
      return *order > 0;
    case CompareExpr::Op::Gte:
      return *order >= 0;
    default:
      return false;
  }
}

bool eval_filter(const FilterExpr& expr, const Value& current) {
  if (std::holds_alternative<CompareExpr>(expr)) {
    const auto& cmp = std::get<CompareExpr>(expr);
    return compare_values(cmp.op, resolve_operand(cmp.lhs, current),
                          resolve_operand(cmp.rhs, current));
  }
  if (std::holds_alternative<TruthyExpr>(expr)) {
    return is_truthy(resolve_operand(std::get<TruthyExpr>(expr).operand, current));
  }
  if (std::holds_alternative<std::shared_ptr<LogicalExpr>>(expr)) {
    const auto& logical = *std::get<std::shared_ptr<LogicalExpr>>(expr);
    bool is_and = logical.op == LogicalExpr::Op::And;
    for (const auto& operand : logical.operands) {
      bool value = eval_filter(operand, current);
      if (is_and && !value) return false;
      if (!is_and && value) return true;
    }
    return is_and;
  }
  if (std::holds_alternative<std::shared_ptr<NotExpr>>(expr)) {
    return !eval_filter(std::get<std::shared_ptr<NotExpr>>(expr)->inner, current);
  }
  return eval_filter(std::get<std::shared_ptr<GroupExpr>>(expr)->inner, current);
}

}  // namespace jpx
