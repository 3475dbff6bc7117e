#pragma once

#include <string>

#include "tokens.h"

namespace jpx {

/// Tokenizes expression text into identifiers, parentheses, commas and quoted strings.
/// MUST be deterministic and MUST not skip meaningful characters.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST return End at input exhaustion and Invalid once a lexical error was seen.
  Token next();

 private:
  /// Lexes a single- or double-quoted string.
  /// MUST decode \" \' \\ \n \t \r and keep any other escape verbatim.
  Token lex_string();
  Token lex_identifier();
  void skip_ws();
  Token make_token(TokenType type, const std::string& text, size_t start_pos) const;
  /// Records the first lexical error; later calls keep the original.
  Token fail(const std::string& message, size_t position);
  static bool is_ident_start(char c);
  static bool is_ident_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
  bool has_error_ = false;
  std::string error_message_;
  size_t error_position_ = 0;
};

}  // namespace jpx
