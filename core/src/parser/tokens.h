#pragma once

#include <cstddef>
#include <string>

namespace jpx {

/// Enumerates lexical tokens of the outer expression language.
/// MUST remain consistent with parser expectations.
enum class TokenType {
  Identifier,
  String,
  Comma,
  LParen,
  RParen,
  End,
  Invalid
};

/// Represents a single token with source text and position metadata.
/// String tokens carry their unescaped contents; Invalid tokens carry the lexical error message.
struct Token {
  TokenType type;
  std::string text;
  size_t pos = 0;
};

}  // namespace jpx
