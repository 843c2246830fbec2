#include "token.h"

Token::Token(TokenKind kind, const std::string &text, size_t pos, size_t length)
  : kind_(kind), text_(text), pos_(pos), len_(length ? length : text.size()) {
}

TokenKind Token::kind() const {
  return kind_;
}

std::string Token::text() const {
  return text_;
}

size_t Token::position() const {
  return pos_;
}

size_t Token::end() const {
  return pos_ + len_;
}

const char *tokenKindName(TokenKind kind) {
  switch (kind) {
    case TokenKind::Keyword: return "keyword";
    case TokenKind::Identifier: return "identifier";
    case TokenKind::Intrinsic: return "intrinsic";
    case TokenKind::Number: return "number";
    case TokenKind::String: return "string";
    case TokenKind::Bytes: return "bytes";
    case TokenKind::Operator: return "operator";
    case TokenKind::Comparison: return "comparison";
    case TokenKind::Punctuation: return "punctuation";
    case TokenKind::Eof: return "end of file";
    case TokenKind::Unknown: return "unknown";
  }
  return "unknown";
}
