#include "expr_parser.h"

#include <utility>

#include "lexer.h"

namespace jpx {

namespace {

class ExprParser {
 public:
  explicit ExprParser(const std::string& input) : lexer_(input) { advance(); }

  ExprParseResult parse() {
    ExprParseResult result;
    ExprNode root;
    if (parse_node(root)) {
      if (current_.type == TokenType::End) {
        result.expr = std::move(root);
        return result;
      }
      set_error("Unexpected trailing input");
    }
    result.error = error_;
    return result;
  }

 private:
  /// Parses one string literal or function call.
  bool parse_node(ExprNode& out) {
    if (current_.type == TokenType::String) {
      out.kind = ExprNode::Kind::StringLiteral;
      out.string_value = current_.text;
      out.span = Span{current_.pos, current_.pos};
      advance();
      out.span.end = current_.pos;
      return true;
    }
    if (current_.type != TokenType::Identifier) {
      return set_error("Expected function name or string literal");
    }
    out.kind = ExprNode::Kind::Call;
    out.function_name = current_.text;
    out.span.start = current_.pos;
    advance();
    if (!consume(TokenType::LParen, "Expected ( after function name")) return false;
    if (++depth_ > kMaxNestingDepth) return set_error("Nesting too deep");
    if (current_.type != TokenType::RParen) {
      while (true) {
        ExprNode arg;
        if (!parse_node(arg)) return false;
        out.args.push_back(std::move(arg));
        if (current_.type != TokenType::Comma) break;
        advance();
      }
    }
    --depth_;
    out.span.end = current_.pos + 1;
    return consume(TokenType::RParen, "Expected , or ) in argument list");
  }

  void advance() { current_ = lexer_.next(); }

  bool consume(TokenType type, const char* message) {
    if (current_.type != type) return set_error(message);
    advance();
    return true;
  }

  /// Records the first error; lexical errors take precedence over the parser's message.
  bool set_error(const std::string& message) {
    if (error_.has_value()) return false;
    if (current_.type == TokenType::Invalid) {
      error_ = ParseError{current_.text, current_.pos};
    } else {
      error_ = ParseError{message, current_.pos};
    }
    return false;
  }

  Lexer lexer_;
  Token current_{TokenType::End, "", 0};
  size_t depth_ = 0;
  std::optional<ParseError> error_;
};

}  // namespace

ExprParseResult parse_expression(const std::string& input) {
  ExprParser parser(input);
  return parser.parse();
}

}  // namespace jpx
