#include "lexer.h"

#include <cctype>

#include "util/string_util.h"

namespace jpx {

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::next() {
  if (has_error_) {
    return make_token(TokenType::Invalid, error_message_, error_position_);
  }
  skip_ws();
  if (pos_ >= input_.size()) {
    return make_token(TokenType::End, "", pos_);
  }

  size_t start = pos_;
  char c = input_[pos_];
  if (c == ',') {
    ++pos_;
    return make_token(TokenType::Comma, ",", start);
  }
  if (c == '(') {
    ++pos_;
    return make_token(TokenType::LParen, "(", start);
  }
  if (c == ')') {
    ++pos_;
    return make_token(TokenType::RParen, ")", start);
  }
  if (c == '\'' || c == '"') {
    return lex_string();
  }
  if (is_ident_start(c)) {
    return lex_identifier();
  }
  return fail(std::string("Unexpected character '") + c + "'", start);
}

Token Lexer::lex_string() {
  size_t start = pos_;
  char quote = input_[pos_++];
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_++];
    if (c == quote) {
      return make_token(TokenType::String, out, start);
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (pos_ >= input_.size()) break;
    util::append_unescaped(input_[pos_++], out);
  }
  return fail("Unterminated string literal", start);
}

Token Lexer::lex_identifier() {
  size_t start = pos_;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    ++pos_;
  }
  return make_token(TokenType::Identifier, input_.substr(start, pos_ - start), start);
}

void Lexer::skip_ws() {
  while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
}

Token Lexer::make_token(TokenType type, const std::string& text, size_t start_pos) const {
  return Token{type, text, start_pos};
}

Token Lexer::fail(const std::string& message, size_t position) {
  if (!has_error_) {
    has_error_ = true;
    error_message_ = message;
    error_position_ = position;
  }
  return make_token(TokenType::Invalid, error_message_, error_position_);
}

bool Lexer::is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool Lexer::is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace jpx
