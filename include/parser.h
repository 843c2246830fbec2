#ifndef PARSER_H
#define PARSER_H
#include "token.h"
#include "lexer.h"
#include "ast.h"
#include "diagnostic.h"
#include <stdexcept>
#include <vector>

// 只在语法分析器内部抛出，在语句/声明边界被捕获并转为诊断
class ParseError : public std::runtime_error {
public:
  ParseError(const std::string &msg, size_t begin, size_t end)
    : std::runtime_error(msg), begin_(begin), end_(end) {}

  SourceSpan span() const { return SourceSpan(begin_, end_); }

private:
  size_t begin_;
  size_t end_;
};

class Parser {
  std::vector<Token> tokens;
  size_t pos;
  std::vector<Diagnostic> diagnostics_;
  // if/while/for/match 的条件中不允许裸结构体字面量
  bool no_struct_literal = false;

public:
  explicit Parser(std::vector<Token> tokens_);

  Token &current() { return tokens[pos]; }
  const Token &peek(size_t offset = 1) const {
    size_t i = pos + offset;
    return i < tokens.size() ? tokens[i] : tokens.back();
  }
  void advance() { if (pos < tokens.size() - 1) ++pos; }

  bool match(TokenKind kind, const std::string &text = "") {
    return current().kind() == kind && (text.empty() || current().text() == text);
  }

  void expect(TokenKind kind, const std::string &text = "") {
    if (!match(kind, text)) {
      std::string wanted = text.empty() ? tokenKindName(kind) : "'" + text + "'";
      fail("expected " + wanted + ", found " + describe(current()));
    }
    advance();
  }

  string expect_identifier() {
    if (current().kind() == TokenKind::Identifier) {
      std::string name = current().text();
      advance();
      return name;
    }
    fail("expected identifier, found " + describe(current()));
  }

  [[noreturn]] void fail(const std::string &msg) {
    throw ParseError(msg, current().position(), current().end());
  }

  const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }

  unique_ptr<SourceUnitAST> parse_source_unit();

  unique_ptr<ContractAST> parse_contract();

  void parse_contract_member(ContractAST &contract);

  void parse_state_block(ContractAST &contract);

  unique_ptr<StructDeclAST> parse_struct();

  unique_ptr<EventDeclAST> parse_event();

  unique_ptr<ModifierDeclAST> parse_modifier();

  unique_ptr<ConstDeclAST> parse_const();

  unique_ptr<FnDeclAST> parse_function(bool require_body);

  unique_ptr<InterfaceDeclAST> parse_interface();

  std::vector<ParamAST> parse_fn_params();

  unique_ptr<TypeAST> parse_type();

  unique_ptr<BlockStmtAST> parse_block();

  unique_ptr<StmtAST> parse_stmt();

  unique_ptr<StmtAST> parse_let();

  unique_ptr<StmtAST> parse_if();

  unique_ptr<StmtAST> parse_while();

  unique_ptr<StmtAST> parse_for();

  unique_ptr<StmtAST> parse_match_stmt();

  unique_ptr<StmtAST> parse_require();

  unique_ptr<StmtAST> parse_emit();

  unique_ptr<StmtAST> parse_return();

  unique_ptr<ExprAST> parse_expr();

  unique_ptr<ExprAST> parse_condition();

  unique_ptr<ExprAST> parse_ternary();

  unique_ptr<ExprAST> parse_logical_or();

  unique_ptr<ExprAST> parse_logical_and();

  unique_ptr<ExprAST> parse_equality();

  unique_ptr<ExprAST> parse_comparison();

  unique_ptr<ExprAST> parse_additive();

  unique_ptr<ExprAST> parse_term();

  unique_ptr<ExprAST> parse_cast_expr();

  unique_ptr<ExprAST> parse_unary();

  unique_ptr<ExprAST> parse_postfix();

  unique_ptr<ExprAST> parse_postfix_on(unique_ptr<ExprAST> expr);

  unique_ptr<ExprAST> parse_factor();

  unique_ptr<ExprAST> parse_match_expr();

  unique_ptr<ExprAST> parse_lambda();

  unique_ptr<PatternAST> parse_pattern();

  std::vector<unique_ptr<ExprAST>> parse_call_args();

private:
  void report(const ParseError &err);

  // 跳到下一个 ; （消耗）或本层的 } （不消耗）
  void synchronize_stmt();

  // 跳到下一个成员声明关键字或本层的 }
  void synchronize_member();

  // 跳到下一个顶层声明
  void synchronize_top_level();

  size_t previous_end() const;

  static std::string describe(const Token &tok);
};

// 词法 + 语法分析的便捷入口；有任何 Lex/Parse 错误时 unit 为空
struct ParseResult {
  unique_ptr<SourceUnitAST> unit;
  std::vector<Diagnostic> diagnostics;
};

ParseResult parseSource(const std::string &source);

#endif //PARSER_H
