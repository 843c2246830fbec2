#ifndef TOKEN_H
#define TOKEN_H
#include <string>
#include <unordered_set>
#include <cstddef>

static const std::unordered_set<std::string> keywords = {
  "contract", "struct", "interface", "event",
  "modifier", "state", "const", "fn",
  "public", "private", "let", "mut",
  "if", "else", "while", "for", "in",
  "match", "require", "emit", "return",
  "true", "false", "as"
};

// 编译器提供的值，不进入符号表
static const std::unordered_set<std::string> intrinsic_names = {
  "msg_sender", "msg_value", "block_number", "block_timestamp"
};

enum class TokenKind {
  // 关键字
  Keyword,
  // 标识符
  Identifier,
  // msg_sender 等内建标识符
  Intrinsic,
  Number, String, Bytes,
  // 运算符
  Operator,
  // 比较运算符
  Comparison,
  // 标点
  Punctuation,
  // 文件末尾
  Eof,
  // 错误
  Unknown
};

class Token {
public:
  Token(TokenKind, const std::string &, size_t, size_t length = 0);

  TokenKind kind() const;
  std::string text() const;

  size_t position() const;
  size_t end() const;

private:
  TokenKind kind_;
  std::string text_;
  size_t pos_;
  size_t len_;
};

const char *tokenKindName(TokenKind kind);
#endif //TOKEN_H
