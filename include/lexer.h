#ifndef LEXER_H
#define LEXER_H
#include <boost/regex.hpp>
#include "token.h"
#include "diagnostic.h"
#include <vector>
#include <string>

class Lexer {
public:
  Lexer(const std::string &);

  Token next_token();

  bool is_eof() const;

  // 结果末尾总是带一个 Eof token
  std::vector<Token> tokenize_all();

  std::pair<int, int> getLineAndCol(size_t) const;

  const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }

private:
  void advance();

  bool match(const boost::regex &, std::string &);

  void skip_whitespace();

  bool skip_comment();

  void recover_to_whitespace();

  void report(size_t begin, size_t end, const std::string &msg);

  std::string src_;
  size_t pos_;
  char currentChar;
  std::vector<Diagnostic> diagnostics_;
};
#endif //LEXER_H
