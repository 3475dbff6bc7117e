#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace jpx {

/// JSON value used throughout the engine.
/// Objects keep insertion order for output; equality is defined by values_equal.
using Value = nlohmann::ordered_json;

/// Describes why a piece of text could not be parsed.
/// MUST carry a 0-based byte position into the parsed text.
struct ParseError {
  std::string message;
  size_t position = 0;
};

/// Deepest array/object nesting parse_json accepts. Copying and serializing values
/// recurse natively, so deeper documents are rejected up front.
constexpr size_t kMaxJsonDepth = 2048;

struct JsonParseResult {
  std::optional<Value> value;
  std::optional<ParseError> error;
};

/// Parses JSON text into a Value.
/// MUST NOT throw; malformed text yields an error with the failing byte offset.
/// Numbers that overflow a double and nesting beyond kMaxJsonDepth are errors too.
JsonParseResult parse_json(const std::string& text);
/// Parses JSON text and returns null when the text is not well-formed.
Value parse_json_or_null(const std::string& text);

/// Deep structural equality.
/// MUST compare objects by key set regardless of key order and numbers by numeric value.
/// Inputs are two values; outputs are booleans with no side effects.
bool values_equal(const Value& left, const Value& right);

/// Entry count for arrays/objects, code point count for strings, 0 otherwise.
size_t value_length(const Value& value);

/// Unicode lowercase for strings; any other value is returned unchanged.
Value value_lower(const Value& value);
/// Unicode uppercase for strings; any other value is returned unchanged.
Value value_upper(const Value& value);

/// null, false, 0, "", [] and {} are falsy; everything else is truthy.
bool is_truthy(const Value& value);

/// Raw text for strings, compact JSON for everything else.
std::string string_form(const Value& value);

/// Numeric view of a value used by filter comparisons.
/// MUST accept strings only when the whole trimmed text is a number.
std::optional<double> coerce_number(const Value& value);

}  // namespace jpx
