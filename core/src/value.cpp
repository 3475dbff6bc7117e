#include "jpx/value.h"

#include <string>
#include <utility>
#include <vector>

#include "util/string_util.h"

namespace jpx {

JsonParseResult parse_json(const std::string& text) {
  JsonParseResult result;
  bool too_deep = false;
  Value::parser_callback_t track_depth = [&too_deep](int depth, Value::parse_event_t, Value&) {
    if (depth > static_cast<int>(kMaxJsonDepth)) too_deep = true;
    return true;
  };
  try {
    Value parsed = Value::parse(text, track_depth);
    if (too_deep) {
      result.error = ParseError{"JSON nesting deeper than " + std::to_string(kMaxJsonDepth), 0};
      return result;
    }
    result.value = std::move(parsed);
  } catch (const Value::parse_error& ex) {
    // nlohmann reports the 1-based index of the last byte it read.
    result.error = ParseError{ex.what(), ex.byte > 0 ? ex.byte - 1 : 0};
  } catch (const Value::exception& ex) {
    // Well-formed text the value model cannot hold, e.g. 1e999 overflowing a double.
    result.error = ParseError{ex.what(), 0};
  }
  return result;
}

Value parse_json_or_null(const std::string& text) {
  JsonParseResult parsed = parse_json(text);
  if (!parsed.value.has_value()) return Value();
  return std::move(*parsed.value);
}

bool values_equal(const Value& left, const Value& right) {
  std::vector<std::pair<const Value*, const Value*>> pending;
  pending.emplace_back(&left, &right);
  while (!pending.empty()) {
    const Value& a = *pending.back().first;
    const Value& b = *pending.back().second;
    pending.pop_back();
    if (a.is_number() && b.is_number()) {
      if (a != b) return false;
      continue;
    }
    if (a.type() != b.type()) return false;
    switch (a.type()) {
      case Value::value_t::null:
        break;
      case Value::value_t::boolean:
        if (a.get<bool>() != b.get<bool>()) return false;
        break;
      case Value::value_t::string:
        if (a.get_ref<const std::string&>() != b.get_ref<const std::string&>()) return false;
        break;
      case Value::value_t::array:
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
          pending.emplace_back(&a[i], &b[i]);
        }
        break;
      case Value::value_t::object:
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
          auto match = b.find(it.key());
          if (match == b.end()) return false;
          pending.emplace_back(&it.value(), &*match);
        }
        break;
      default:
        if (a != b) return false;
        break;
    }
  }
  return true;
}

size_t value_length(const Value& value) {
  if (value.is_array() || value.is_object()) return value.size();
  if (value.is_string()) return util::utf8_length(value.get_ref<const std::string&>());
  return 0;
}

Value value_lower(const Value& value) {
  if (!value.is_string()) return value;
  return Value(util::to_lower(value.get_ref<const std::string&>()));
}

Value value_upper(const Value& value) {
  if (!value.is_string()) return value;
  return Value(util::to_upper(value.get_ref<const std::string&>()));
}

bool is_truthy(const Value& value) {
  switch (value.type()) {
    case Value::value_t::null:
      return false;
    case Value::value_t::boolean:
      return value.get<bool>();
    case Value::value_t::number_integer:
    case Value::value_t::number_unsigned:
    case Value::value_t::number_float:
      return value.get<double>() != 0.0;
    case Value::value_t::string:
      return !value.get_ref<const std::string&>().empty();
    case Value::value_t::array:
    case Value::value_t::object:
      return !value.empty();
    default:
      return false;
  }
}

std::string string_form(const Value& value) {
  if (value.is_string()) return value.get<std::string>();
  return value.dump(-1, ' ', false, Value::error_handler_t::replace);
}

std::optional<double> coerce_number(const Value& value) {
  if (value.is_number()) return value.get<double>();
  if (!value.is_string()) return std::nullopt;
  std::string text = util::trim_ws(value.get_ref<const std::string&>());
  if (text.empty()) return std::nullopt;
  // Only JSON number syntax counts: "inf", "0x10" and "+1" stay strings.
  Value parsed = Value::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_number()) return std::nullopt;
  return parsed.get<double>();
}

}  // namespace jpx
