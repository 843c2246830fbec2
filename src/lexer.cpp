#include "lexer.h"
#include <cctype>
#include <cstdio>
#include <string>

#define DSL_INT_SUFFIX "(u8|u16|u32|u64|u128|u256|i8|i16|i32|i64|i128)"

struct LexRule {
  TokenKind kind;
  boost::regex pattern;
};

static const boost::regex re_identifier(R"([a-zA-Z_]\w*)");
static const boost::regex re_bytes(R"(b"([^"\\]|\\.)*")");
static const std::vector<LexRule> lex_rules = {
  {TokenKind::Number, boost::regex("0[xX][0-9a-fA-F](?:_?[0-9a-fA-F])*" DSL_INT_SUFFIX "?")},
  {TokenKind::Number, boost::regex("\\d(?:_?\\d)*" DSL_INT_SUFFIX "?")},
  {TokenKind::String, boost::regex(R"("([^"\\]|\\.)*")")},

  {TokenKind::Operator, boost::regex(R"(->)")}, // ->
  {TokenKind::Operator, boost::regex(R"(=>)")}, // =>
  {TokenKind::Comparison, boost::regex(R"(==)")}, // ==
  {TokenKind::Comparison, boost::regex(R"(!=)")}, // !=
  {TokenKind::Comparison, boost::regex(R"(<=)")}, // <=
  {TokenKind::Comparison, boost::regex(R"(>=)")}, // >=
  {TokenKind::Comparison, boost::regex(R"(<)")}, // <
  {TokenKind::Comparison, boost::regex(R"(>)")}, // >

  {TokenKind::Operator, boost::regex(R"(\+=)")}, // +=
  {TokenKind::Operator, boost::regex(R"(\-=)")}, // -=
  {TokenKind::Operator, boost::regex(R"(\*=)")}, // *=
  {TokenKind::Operator, boost::regex(R"(\/=)")}, // /=
  {TokenKind::Operator, boost::regex(R"(%=)")}, // %=
  {TokenKind::Operator, boost::regex(R"(=)")}, // =
  {TokenKind::Operator, boost::regex(R"(\+)")}, // +
  {TokenKind::Operator, boost::regex(R"(\-)")}, // -
  {TokenKind::Operator, boost::regex(R"(\*)")}, // *
  {TokenKind::Operator, boost::regex(R"(\/)")}, // /
  {TokenKind::Operator, boost::regex(R"(%)")}, // %
  {TokenKind::Operator, boost::regex(R"(&&)")}, // &&
  {TokenKind::Operator, boost::regex(R"(\|\|)")}, // ||
  {TokenKind::Operator, boost::regex(R"(\|)")}, // | (lambda)
  {TokenKind::Operator, boost::regex(R"(!)")}, // !

  {TokenKind::Punctuation, boost::regex(R"(\()")}, // (
  {TokenKind::Punctuation, boost::regex(R"(\))")}, // )
  {TokenKind::Punctuation, boost::regex(R"(\[)")}, // [
  {TokenKind::Punctuation, boost::regex(R"(\])")}, // ]
  {TokenKind::Punctuation, boost::regex(R"(\{)")}, // {
  {TokenKind::Punctuation, boost::regex(R"(\})")}, // }
  {TokenKind::Punctuation, boost::regex(R"(;)")}, // ;
  {TokenKind::Punctuation, boost::regex(R"(,)")}, // ,
  {TokenKind::Punctuation, boost::regex(R"(\.\.)")}, // ..
  {TokenKind::Punctuation, boost::regex(R"(\.)")}, // .
  {TokenKind::Punctuation, boost::regex(R"(::)")}, // ::
  {TokenKind::Punctuation, boost::regex(R"(:)")}, // :
  {TokenKind::Punctuation, boost::regex(R"(\?)")}, // ?
};


Lexer::Lexer(const std::string &src) : src_(src), pos_(0) {
  currentChar = src_.empty() ? EOF : src_[0];
}

void Lexer::advance() {
  ++pos_;
  currentChar = pos_ < src_.size() ? src_[pos_] : EOF;
}

bool Lexer::match(const boost::regex &re, std::string &matched) {
  boost::smatch m;
  if (boost::regex_search(src_.cbegin() + static_cast<std::ptrdiff_t>(pos_), src_.cend(), m, re,
                          boost::match_continuous)) {
    matched = m.str();
    pos_ += matched.length();
    currentChar = pos_ < src_.size() ? src_[pos_] : EOF;
    return true;
  }
  return false;
}

void Lexer::report(size_t begin, size_t end, const std::string &msg) {
  Diagnostic d;
  d.kind = DiagnosticKind::Lex;
  d.code = DiagnosticCode::LexError;
  d.message = msg;
  d.span = SourceSpan(begin, end);
  diagnostics_.push_back(d);
}

void Lexer::skip_whitespace() {
  while (pos_ < src_.size() && isspace(static_cast<unsigned char>(currentChar))) {
    advance();
  }
}

// 返回 false 表示遇到未闭合的块注释
bool Lexer::skip_comment() {
  if (currentChar == '/' && pos_ + 1 < src_.size()) {
    if (src_[pos_ + 1] == '/') {
      pos_ += 2;
      while (pos_ < src_.size()) {
        if (src_[pos_] == '\n') {
          pos_++;
          break;
        } else if (src_[pos_] == '\r') {
          pos_++;
          if (pos_ < src_.size() && src_[pos_] == '\n') {
            pos_++;
          }
          break;
        } else {
          pos_++;
        }
      }
    } else if (src_[pos_ + 1] == '*') {
      // 支持嵌套
      size_t start = pos_;
      int count = 1;
      pos_ += 2;
      while (count > 0 && pos_ < src_.size()) {
        if (src_[pos_] == '/' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '*') {
          ++count;
          pos_ += 2;
        } else if (src_[pos_] == '*' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '/') {
          --count;
          pos_ += 2;
        } else {
          ++pos_;
        }
      }
      if (count > 0) {
        report(start, src_.size(), "unterminated block comment");
        pos_ = src_.size();
        currentChar = EOF;
        return false;
      }
    }
  }
  currentChar = pos_ < src_.size() ? src_[pos_] : EOF;
  return true;
}

// 至少吞掉当前字节；0xFF 存入 char 后与 EOF 相等，只能按位置判断结尾
void Lexer::recover_to_whitespace() {
  advance();
  while (pos_ < src_.size() && !isspace(static_cast<unsigned char>(currentChar))) {
    advance();
  }
}

Token Lexer::next_token() {
  while (true) {
    skip_whitespace();
    if (currentChar != '/' || pos_ + 1 >= src_.size() ||
        (src_[pos_ + 1] != '/' && src_[pos_ + 1] != '*')) {
      break;
    }
    if (!skip_comment()) {
      break;
    }
  }

  while (pos_ < src_.size()) {
    std::string matched;
    size_t old_pos = pos_;

    if (match(re_bytes, matched)) {
      return Token(TokenKind::Bytes, matched, old_pos);
    }
    if (match(re_identifier, matched)) {
      if (matched == "_") {
        return Token(TokenKind::Punctuation, matched, old_pos);
      }
      if (keywords.count(matched)) {
        return Token(TokenKind::Keyword, matched, old_pos);
      }
      if (intrinsic_names.count(matched)) {
        return Token(TokenKind::Intrinsic, matched, old_pos);
      }
      return Token(TokenKind::Identifier, matched, old_pos);
    }
    for (const auto &rule: lex_rules) {
      if (match(rule.pattern, matched)) {
        return Token(rule.kind, matched, old_pos);
      }
    }

    if (currentChar == '"') {
      report(old_pos, src_.size(), "unterminated string literal");
      pos_ = src_.size();
      currentChar = EOF;
      break;
    }

    // 单个非法字符不终止整个文件：报告后跳到下一个空白处继续
    std::string bad(1, currentChar);
    recover_to_whitespace();
    report(old_pos, pos_, "unexpected character '" + bad + "'");
    skip_whitespace();
    while (currentChar == '/' && pos_ + 1 < src_.size() &&
           (src_[pos_ + 1] == '/' || src_[pos_ + 1] == '*')) {
      if (!skip_comment()) {
        break;
      }
      skip_whitespace();
    }
  }
  return Token(TokenKind::Eof, "", src_.size());
}

std::pair<int, int> Lexer::getLineAndCol(size_t p) const {
  int line = 1, col = 1;
  for (size_t i = 0; i < p && i < src_.size(); ++i) {
    if (src_[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return {line, col};
}

bool Lexer::is_eof() const {
  return pos_ >= src_.size();
}

std::vector<Token> Lexer::tokenize_all() {
  std::vector<Token> tokens;
  while (true) {
    Token t = next_token();
    if (t.kind() == TokenKind::Eof) break;
    tokens.push_back(t);
  }
  tokens.push_back(Token(TokenKind::Eof, "", src_.size()));
  return tokens;
}
