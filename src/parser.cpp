#include "parser.h"
#include <algorithm>
#include <array>
#include <memory>

namespace {

const std::array<std::string, 11> kIntegerSuffixes = {
  "u128", "u256", "u16", "u32", "u64", "u8", "i128", "i16", "i32", "i64", "i8"
};

BigInt parseIntegerLiteralToken(const std::string &text, std::string &suffix, size_t position) {
  std::string cleaned = text;
  suffix.clear();
  for (const auto &s: kIntegerSuffixes) {
    if (cleaned.size() > s.size() &&
        cleaned.compare(cleaned.size() - s.size(), s.size(), s) == 0) {
      suffix = s;
      cleaned.erase(cleaned.size() - s.size());
      break;
    }
  }

  cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '_'), cleaned.end());
  if (cleaned.empty()) {
    throw ParseError("invalid numeric literal '" + text + "'", position, position + text.size());
  }
  try {
    return BigInt(cleaned.c_str());
  } catch (const std::runtime_error &) {
    throw ParseError("invalid numeric literal '" + text + "'", position, position + text.size());
  }
}

// 去掉引号（以及 bytes 的 b 前缀）并处理转义
std::string unescapeLiteral(const std::string &text, size_t prefix) {
  std::string out;
  for (size_t i = prefix + 1; i + 1 < text.size(); ++i) {
    char c = text[i];
    if (c == '\\' && i + 2 < text.size()) {
      char n = text[++i];
      switch (n) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case '0': out += '\0'; break;
        default: out += n;
      }
    } else {
      out += c;
    }
  }
  return out;
}

bool isMemberKeyword(const Token &tok) {
  if (tok.kind() != TokenKind::Keyword) return false;
  static const std::array<std::string, 8> keys = {
    "state", "struct", "event", "modifier", "const", "fn", "public", "private"
  };
  return std::find(keys.begin(), keys.end(), tok.text()) != keys.end();
}

bool isTopLevelKeyword(const Token &tok) {
  return tok.kind() == TokenKind::Keyword &&
         (tok.text() == "contract" || tok.text() == "struct" || tok.text() == "interface");
}

bool isCompoundAssign(const std::string &op) {
  return op == "+=" || op == "-=" || op == "*=" || op == "/=" || op == "%=";
}

} // namespace

Parser::Parser(std::vector<Token> tokens_) : tokens(std::move(tokens_)), pos(0) {
  if (tokens.empty() || tokens.back().kind() != TokenKind::Eof) {
    size_t end = tokens.empty() ? 0 : tokens.back().end();
    tokens.emplace_back(TokenKind::Eof, "", end);
  }
}

std::string Parser::describe(const Token &tok) {
  if (tok.kind() == TokenKind::Eof) {
    return "end of file";
  }
  return "'" + tok.text() + "'";
}

size_t Parser::previous_end() const {
  return pos == 0 ? tokens[0].position() : tokens[pos - 1].end();
}

void Parser::report(const ParseError &err) {
  Diagnostic d;
  d.kind = DiagnosticKind::Parse;
  d.code = DiagnosticCode::ParseError;
  d.message = err.what();
  d.span = err.span();
  diagnostics_.push_back(d);
}

void Parser::synchronize_stmt() {
  int depth = 0;
  while (!match(TokenKind::Eof)) {
    if (match(TokenKind::Punctuation, "{")) {
      ++depth;
    } else if (match(TokenKind::Punctuation, "}")) {
      if (depth == 0) {
        return;
      }
      --depth;
      if (depth == 0) {
        advance();
        return;
      }
    } else if (depth == 0 && match(TokenKind::Punctuation, ";")) {
      advance();
      return;
    }
    advance();
  }
}

void Parser::synchronize_member() {
  int depth = 0;
  while (!match(TokenKind::Eof)) {
    if (depth == 0 && isMemberKeyword(current())) {
      return;
    }
    if (match(TokenKind::Punctuation, "{")) {
      ++depth;
    } else if (match(TokenKind::Punctuation, "}")) {
      if (depth == 0) {
        return;
      }
      --depth;
    }
    advance();
  }
}

void Parser::synchronize_top_level() {
  int depth = 0;
  while (!match(TokenKind::Eof)) {
    if (depth == 0 && isTopLevelKeyword(current())) {
      return;
    }
    if (match(TokenKind::Punctuation, "{")) {
      ++depth;
    } else if (match(TokenKind::Punctuation, "}") && depth > 0) {
      --depth;
    }
    advance();
  }
}

//===----------------------------------------------------------------------===//
// 声明
//===----------------------------------------------------------------------===//

std::unique_ptr<SourceUnitAST> Parser::parse_source_unit() {
  auto unit = std::make_unique<SourceUnitAST>();
  while (!match(TokenKind::Eof)) {
    size_t start = pos;
    try {
      if (match(TokenKind::Keyword, "contract")) {
        unit->contracts.push_back(parse_contract());
      } else if (match(TokenKind::Keyword, "struct")) {
        unit->structs.push_back(parse_struct());
      } else if (match(TokenKind::Keyword, "interface")) {
        unit->interfaces.push_back(parse_interface());
      } else {
        fail("expected 'contract', 'struct' or 'interface', found " + describe(current()));
      }
    } catch (const ParseError &err) {
      report(err);
      if (pos == start) advance();
      synchronize_top_level();
    }
  }
  return unit;
}

std::unique_ptr<ContractAST> Parser::parse_contract() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "contract");
  std::string name = expect_identifier();
  auto contract = std::make_unique<ContractAST>(name, start);
  expect(TokenKind::Punctuation, "{");

  while (!match(TokenKind::Punctuation, "}") && !match(TokenKind::Eof)) {
    size_t member_start = pos;
    try {
      parse_contract_member(*contract);
    } catch (const ParseError &err) {
      report(err);
      if (pos == member_start) advance();
      synchronize_member();
    }
  }
  expect(TokenKind::Punctuation, "}");
  return contract;
}

void Parser::parse_contract_member(ContractAST &contract) {
  if (match(TokenKind::Keyword, "state")) {
    parse_state_block(contract);
  } else if (match(TokenKind::Keyword, "struct")) {
    contract.structs.push_back(parse_struct());
  } else if (match(TokenKind::Keyword, "event")) {
    contract.events.push_back(parse_event());
  } else if (match(TokenKind::Keyword, "modifier")) {
    contract.modifiers.push_back(parse_modifier());
  } else if (match(TokenKind::Keyword, "const")) {
    contract.consts.push_back(parse_const());
  } else if (match(TokenKind::Keyword, "fn") || match(TokenKind::Keyword, "public") ||
             match(TokenKind::Keyword, "private")) {
    contract.functions.push_back(parse_function(true));
  } else {
    fail("expected contract member, found " + describe(current()));
  }
}

// state { name: T [= expr]; ... }
void Parser::parse_state_block(ContractAST &contract) {
  expect(TokenKind::Keyword, "state");
  expect(TokenKind::Punctuation, "{");
  while (!match(TokenKind::Punctuation, "}") && !match(TokenKind::Eof)) {
    size_t start = pos;
    try {
      size_t var_pos = current().position();
      std::string name = expect_identifier();
      expect(TokenKind::Punctuation, ":");
      auto type = parse_type();
      unique_ptr<ExprAST> init;
      if (match(TokenKind::Operator, "=")) {
        advance();
        init = parse_expr();
      }
      expect(TokenKind::Punctuation, ";");
      contract.state.push_back(std::make_unique<StateVarAST>(name, std::move(type), std::move(init), var_pos));
    } catch (const ParseError &err) {
      report(err);
      synchronize_stmt();
      if (pos == start && !match(TokenKind::Punctuation, "}")) advance();
    }
  }
  expect(TokenKind::Punctuation, "}");
}

// struct Name { a: T, b: T }
std::unique_ptr<StructDeclAST> Parser::parse_struct() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "struct");
  std::string name = expect_identifier();
  expect(TokenKind::Punctuation, "{");
  std::vector<ParamAST> fields;
  while (!match(TokenKind::Punctuation, "}")) {
    ParamAST field;
    field.pos = current().position();
    field.name = expect_identifier();
    expect(TokenKind::Punctuation, ":");
    field.type = parse_type();
    fields.push_back(std::move(field));
    if (match(TokenKind::Punctuation, ",") || match(TokenKind::Punctuation, ";")) {
      advance();
    } else if (!match(TokenKind::Punctuation, "}")) {
      fail("expected ',' or '}' in struct declaration, found " + describe(current()));
    }
  }
  expect(TokenKind::Punctuation, "}");
  return std::make_unique<StructDeclAST>(name, std::move(fields), start);
}

// event Name(a: T, b: T);
std::unique_ptr<EventDeclAST> Parser::parse_event() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "event");
  std::string name = expect_identifier();
  expect(TokenKind::Punctuation, "(");
  auto fields = parse_fn_params();
  if (match(TokenKind::Punctuation, ";")) {
    advance();
  }
  return std::make_unique<EventDeclAST>(name, std::move(fields), start);
}

// modifier name(p: T) { ...; _; ... }
std::unique_ptr<ModifierDeclAST> Parser::parse_modifier() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "modifier");
  std::string name = expect_identifier();
  std::vector<ParamAST> params;
  if (match(TokenKind::Punctuation, "(")) {
    advance();
    params = parse_fn_params();
  }
  auto body = parse_block();
  return std::make_unique<ModifierDeclAST>(name, std::move(params), std::move(body), start);
}

std::unique_ptr<ConstDeclAST> Parser::parse_const() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "const");
  std::string name = expect_identifier();
  expect(TokenKind::Punctuation, ":");
  auto type = parse_type();
  expect(TokenKind::Operator, "=");
  auto value = parse_expr();
  expect(TokenKind::Punctuation, ";");
  return std::make_unique<ConstDeclAST>(name, std::move(type), std::move(value), start);
}

// [public|private] fn name(params) [-> T] [mod1 mod2(args)] { body }
std::unique_ptr<FnDeclAST> Parser::parse_function(bool require_body) {
  size_t start = current().position();
  Visibility visibility = Visibility::Private;
  if (match(TokenKind::Keyword, "public")) {
    visibility = Visibility::Public;
    advance();
  } else if (match(TokenKind::Keyword, "private")) {
    advance();
  }
  expect(TokenKind::Keyword, "fn");
  std::string name = expect_identifier();
  expect(TokenKind::Punctuation, "(");
  auto params = parse_fn_params();

  unique_ptr<TypeAST> ret;
  if (match(TokenKind::Operator, "->")) {
    advance();
    ret = parse_type();
  }

  std::vector<ModifierUseAST> modifiers;
  while (match(TokenKind::Identifier)) {
    ModifierUseAST use;
    use.pos = current().position();
    use.name = expect_identifier();
    if (match(TokenKind::Punctuation, "(")) {
      use.args = parse_call_args();
    }
    modifiers.push_back(std::move(use));
  }

  unique_ptr<BlockStmtAST> body;
  if (require_body) {
    body = parse_block();
  } else {
    expect(TokenKind::Punctuation, ";");
  }
  return std::make_unique<FnDeclAST>(name, visibility, std::move(params), std::move(ret), std::move(modifiers),
                                     std::move(body), start);
}

std::unique_ptr<InterfaceDeclAST> Parser::parse_interface() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "interface");
  std::string name = expect_identifier();
  expect(TokenKind::Punctuation, "{");
  std::vector<unique_ptr<FnDeclAST>> functions;
  while (!match(TokenKind::Punctuation, "}")) {
    functions.push_back(parse_function(false));
  }
  expect(TokenKind::Punctuation, "}");
  return std::make_unique<InterfaceDeclAST>(name, std::move(functions), start);
}

// 调用前已消耗 '('，结束时消耗 ')'
std::vector<ParamAST> Parser::parse_fn_params() {
  std::vector<ParamAST> params;
  while (!match(TokenKind::Punctuation, ")")) {
    ParamAST param;
    param.pos = current().position();
    param.name = expect_identifier();
    expect(TokenKind::Punctuation, ":");
    param.type = parse_type();
    params.push_back(std::move(param));
    if (match(TokenKind::Punctuation, ",")) {
      advance();
    } else if (!match(TokenKind::Punctuation, ")")) {
      fail("unexpected token in parameter list: " + describe(current()));
    }
  }
  expect(TokenKind::Punctuation, ")");
  return params;
}

std::unique_ptr<TypeAST> Parser::parse_type() {
  size_t start = current().position();
  // 元组类型 (u64, bool)
  if (match(TokenKind::Punctuation, "(")) {
    advance();
    std::vector<std::unique_ptr<TypeAST>> elements;
    while (!match(TokenKind::Punctuation, ")")) {
      elements.push_back(parse_type());
      if (match(TokenKind::Punctuation, ",")) {
        advance();
      } else if (!match(TokenKind::Punctuation, ")")) {
        fail("expected ',' or ')' in tuple type, found " + describe(current()));
      }
    }
    expect(TokenKind::Punctuation, ")");
    return std::make_unique<TupleTypeAST>(std::move(elements), start);
  }

  // 数组类型 [u64; 4]
  if (match(TokenKind::Punctuation, "[")) {
    advance();
    auto elem_type = parse_type();
    expect(TokenKind::Punctuation, ";");
    if (!match(TokenKind::Number)) {
      fail("expected array length, found " + describe(current()));
    }
    std::string suffix;
    BigInt length = parseIntegerLiteralToken(current().text(), suffix, current().position());
    if (length > BigInt(1000000)) {
      fail("array length too large");
    }
    advance();
    expect(TokenKind::Punctuation, "]");
    return std::make_unique<ArrayTypeAST>(std::move(elem_type), length.convert_to<int64_t>(), start);
  }

  if (match(TokenKind::Identifier)) {
    std::string type_name = current().text();
    advance();
    if (match(TokenKind::Comparison, "<")) {
      advance();
      std::vector<std::unique_ptr<TypeAST>> args;
      while (true) {
        args.push_back(parse_type());
        if (match(TokenKind::Punctuation, ",")) {
          advance();
          continue;
        }
        break;
      }
      expect(TokenKind::Comparison, ">");
      return std::make_unique<GenericTypeAST>(type_name, std::move(args), start);
    }
    return std::make_unique<NamedTypeAST>(type_name, start);
  }

  fail("expected type, found " + describe(current()));
}

//===----------------------------------------------------------------------===//
// 语句
//===----------------------------------------------------------------------===//

std::unique_ptr<BlockStmtAST> Parser::parse_block() {
  size_t start = current().position();
  expect(TokenKind::Punctuation, "{");
  std::vector<std::unique_ptr<StmtAST>> statements;

  while (!match(TokenKind::Punctuation, "}") && !match(TokenKind::Eof)) {
    size_t stmt_start = pos;
    try {
      auto stmt = parse_stmt();
      if (stmt) {
        statements.push_back(std::move(stmt));
      }
    } catch (const ParseError &err) {
      report(err);
      synchronize_stmt();
      if (pos == stmt_start && !match(TokenKind::Punctuation, "}")) {
        advance();
      }
    }
  }
  expect(TokenKind::Punctuation, "}");
  auto block = std::make_unique<BlockStmtAST>(std::move(statements), start);
  block->end_pos = previous_end();
  return block;
}

std::unique_ptr<StmtAST> Parser::parse_stmt() {
  size_t start = current().position();
  // 空语句
  if (match(TokenKind::Punctuation, ";")) {
    advance();
    return nullptr;
  }
  if (match(TokenKind::Punctuation, "{")) {
    return parse_block();
  }
  if (match(TokenKind::Punctuation, "_")) {
    advance();
    expect(TokenKind::Punctuation, ";");
    auto placeholder = std::make_unique<PlaceholderStmtAST>(start);
    placeholder->end_pos = previous_end();
    return placeholder;
  }
  if (current().kind() == TokenKind::Keyword) {
    const std::string kw = current().text();
    if (kw == "let") return parse_let();
    if (kw == "if") return parse_if();
    if (kw == "while") return parse_while();
    if (kw == "for") return parse_for();
    if (kw == "match") return parse_match_stmt();
    if (kw == "require") return parse_require();
    if (kw == "emit") return parse_emit();
    if (kw == "return") return parse_return();
  }

  auto expr = parse_expr();
  if (match(TokenKind::Operator, "=")) {
    advance();
    auto value = parse_expr();
    expect(TokenKind::Punctuation, ";");
    auto assign = std::make_unique<AssignStmtAST>(std::move(expr), std::move(value), start);
    assign->end_pos = previous_end();
    return assign;
  }
  if (current().kind() == TokenKind::Operator && isCompoundAssign(current().text())) {
    // x op= e  =>  x = x op e
    std::string op = current().text().substr(0, 1);
    size_t op_pos = current().position();
    advance();
    auto rhs = parse_expr();
    auto lhs_copy = expr->clone();
    auto combined = std::make_unique<BinaryExprAST>(op, op_pos, std::move(lhs_copy), std::move(rhs));
    combined->end_pos = previous_end();
    expect(TokenKind::Punctuation, ";");
    auto assign = std::make_unique<AssignStmtAST>(std::move(expr), std::move(combined), start);
    assign->end_pos = previous_end();
    return assign;
  }
  expect(TokenKind::Punctuation, ";");
  auto stmt = std::make_unique<ExprStmtAST>(std::move(expr), start);
  stmt->end_pos = previous_end();
  return stmt;
}

// let [mut] name [: T] = expr;
std::unique_ptr<StmtAST> Parser::parse_let() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "let");
  bool is_mut = false;
  if (match(TokenKind::Keyword, "mut")) {
    is_mut = true;
    advance();
  }
  std::string name = expect_identifier();
  unique_ptr<TypeAST> type;
  if (match(TokenKind::Punctuation, ":")) {
    advance();
    type = parse_type();
  }
  expect(TokenKind::Operator, "=");
  auto value = parse_expr();
  expect(TokenKind::Punctuation, ";");
  auto let = std::make_unique<LetStmtAST>(name, is_mut, std::move(type), std::move(value), start);
  let->end_pos = previous_end();
  return let;
}

std::unique_ptr<StmtAST> Parser::parse_if() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "if");
  auto cond = parse_condition();
  auto then_branch = parse_block();
  unique_ptr<StmtAST> else_branch;
  if (match(TokenKind::Keyword, "else")) {
    advance();
    if (match(TokenKind::Keyword, "if")) {
      else_branch = parse_if();
    } else {
      else_branch = parse_block();
    }
  }
  auto stmt = std::make_unique<IfStmtAST>(std::move(cond), std::move(then_branch), std::move(else_branch), start);
  stmt->end_pos = previous_end();
  return stmt;
}

std::unique_ptr<StmtAST> Parser::parse_while() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "while");
  auto cond = parse_condition();
  auto body = parse_block();
  auto stmt = std::make_unique<WhileStmtAST>(std::move(cond), std::move(body), start);
  stmt->end_pos = previous_end();
  return stmt;
}

// for i in a..b { }  /  for x in v { }
std::unique_ptr<StmtAST> Parser::parse_for() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "for");
  std::string var = expect_identifier();
  expect(TokenKind::Keyword, "in");
  auto iter = parse_condition();
  unique_ptr<ExprAST> range_end;
  if (match(TokenKind::Punctuation, "..")) {
    advance();
    range_end = parse_condition();
  }
  auto body = parse_block();
  auto stmt = std::make_unique<ForStmtAST>(var, std::move(iter), std::move(range_end), std::move(body), start);
  stmt->end_pos = previous_end();
  return stmt;
}

std::unique_ptr<StmtAST> Parser::parse_match_stmt() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "match");
  auto scrutinee = parse_condition();
  expect(TokenKind::Punctuation, "{");
  std::vector<MatchStmtArm> arms;
  while (!match(TokenKind::Punctuation, "}")) {
    MatchStmtArm arm;
    arm.pattern = parse_pattern();
    expect(TokenKind::Operator, "=>");
    if (match(TokenKind::Punctuation, "{")) {
      arm.body = parse_block();
    } else {
      // 单表达式分支包装成语句块
      size_t expr_pos = current().position();
      auto expr = parse_expr();
      std::vector<unique_ptr<StmtAST>> stmts;
      auto es = std::make_unique<ExprStmtAST>(std::move(expr), expr_pos);
      es->end_pos = previous_end();
      stmts.push_back(std::move(es));
      arm.body = std::make_unique<BlockStmtAST>(std::move(stmts), expr_pos);
      arm.body->end_pos = previous_end();
    }
    arms.push_back(std::move(arm));
    if (match(TokenKind::Punctuation, ",")) {
      advance();
    }
  }
  expect(TokenKind::Punctuation, "}");
  auto stmt = std::make_unique<MatchStmtAST>(std::move(scrutinee), std::move(arms), start);
  stmt->end_pos = previous_end();
  return stmt;
}

// require(cond[, "message"]);
std::unique_ptr<StmtAST> Parser::parse_require() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "require");
  expect(TokenKind::Punctuation, "(");
  bool saved = no_struct_literal;
  no_struct_literal = false;
  auto cond = parse_expr();
  no_struct_literal = saved;
  std::string message;
  if (match(TokenKind::Punctuation, ",")) {
    advance();
    if (!match(TokenKind::String)) {
      fail("expected string message in require, found " + describe(current()));
    }
    message = unescapeLiteral(current().text(), 0);
    advance();
  }
  expect(TokenKind::Punctuation, ")");
  expect(TokenKind::Punctuation, ";");
  auto stmt = std::make_unique<RequireStmtAST>(std::move(cond), message, start);
  stmt->end_pos = previous_end();
  return stmt;
}

// emit Name(args);
std::unique_ptr<StmtAST> Parser::parse_emit() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "emit");
  std::string event = expect_identifier();
  if (!match(TokenKind::Punctuation, "(")) {
    fail("expected '(' after event name, found " + describe(current()));
  }
  auto args = parse_call_args();
  expect(TokenKind::Punctuation, ";");
  auto stmt = std::make_unique<EmitStmtAST>(event, std::move(args), start);
  stmt->end_pos = previous_end();
  return stmt;
}

std::unique_ptr<StmtAST> Parser::parse_return() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "return");
  unique_ptr<ExprAST> value;
  if (!match(TokenKind::Punctuation, ";")) {
    value = parse_expr();
  }
  expect(TokenKind::Punctuation, ";");
  auto stmt = std::make_unique<ReturnStmtAST>(start, std::move(value));
  stmt->end_pos = previous_end();
  return stmt;
}

//===----------------------------------------------------------------------===//
// 表达式
//===----------------------------------------------------------------------===//

std::unique_ptr<ExprAST> Parser::parse_expr() {
  return parse_ternary();
}

std::unique_ptr<ExprAST> Parser::parse_condition() {
  bool saved = no_struct_literal;
  no_struct_literal = true;
  auto expr = parse_expr();
  no_struct_literal = saved;
  return expr;
}

// cond ? a : b，右结合
std::unique_ptr<ExprAST> Parser::parse_ternary() {
  auto cond = parse_logical_or();
  if (match(TokenKind::Punctuation, "?")) {
    size_t start = cond->position();
    advance();
    auto then_expr = parse_expr();
    expect(TokenKind::Punctuation, ":");
    auto else_expr = parse_expr();
    auto expr = std::make_unique<TernaryExprAST>(std::move(cond), std::move(then_expr), std::move(else_expr), start);
    expr->end_pos = previous_end();
    return expr;
  }
  return cond;
}

std::unique_ptr<ExprAST> Parser::parse_logical_or() {
  auto lhs = parse_logical_and();
  while (match(TokenKind::Operator, "||")) {
    std::string op = current().text();
    size_t start = lhs->position();
    advance();
    auto rhs = parse_logical_and();
    lhs = std::make_unique<BinaryExprAST>(op, start, std::move(lhs), std::move(rhs));
    lhs->end_pos = previous_end();
  }
  return lhs;
}

std::unique_ptr<ExprAST> Parser::parse_logical_and() {
  auto lhs = parse_equality();
  while (match(TokenKind::Operator, "&&")) {
    std::string op = current().text();
    size_t start = lhs->position();
    advance();
    auto rhs = parse_equality();
    lhs = std::make_unique<BinaryExprAST>(op, start, std::move(lhs), std::move(rhs));
    lhs->end_pos = previous_end();
  }
  return lhs;
}

std::unique_ptr<ExprAST> Parser::parse_equality() {
  auto lhs = parse_comparison();
  while (match(TokenKind::Comparison, "==") || match(TokenKind::Comparison, "!=")) {
    std::string op = current().text();
    size_t start = lhs->position();
    advance();
    auto rhs = parse_comparison();
    lhs = std::make_unique<BinaryExprAST>(op, start, std::move(lhs), std::move(rhs));
    lhs->end_pos = previous_end();
  }
  return lhs;
}

//parse比较表达式
std::unique_ptr<ExprAST> Parser::parse_comparison() {
  auto lhs = parse_additive();
  while (match(TokenKind::Comparison, "<") || match(TokenKind::Comparison, "<=") ||
         match(TokenKind::Comparison, ">") || match(TokenKind::Comparison, ">=")) {
    std::string op = current().text();
    size_t start = lhs->position();
    advance();
    auto rhs = parse_additive();
    lhs = std::make_unique<BinaryExprAST>(op, start, std::move(lhs), std::move(rhs));
    lhs->end_pos = previous_end();
  }
  return lhs;
}

std::unique_ptr<ExprAST> Parser::parse_additive() {
  auto lhs = parse_term();
  while (match(TokenKind::Operator, "+") || match(TokenKind::Operator, "-")) {
    std::string op = current().text();
    size_t start = lhs->position();
    advance();
    auto rhs = parse_term();
    lhs = std::make_unique<BinaryExprAST>(op, start, std::move(lhs), std::move(rhs));
    lhs->end_pos = previous_end();
  }
  return lhs;
}

//parse一个中优先级运算
std::unique_ptr<ExprAST> Parser::parse_term() {
  auto lhs = parse_cast_expr();
  while (match(TokenKind::Operator, "*") || match(TokenKind::Operator, "/") || match(TokenKind::Operator, "%")) {
    std::string op = current().text();
    size_t start = lhs->position();
    advance();
    auto rhs = parse_cast_expr();
    lhs = std::make_unique<BinaryExprAST>(op, start, std::move(lhs), std::move(rhs));
    lhs->end_pos = previous_end();
  }
  return lhs;
}

std::unique_ptr<ExprAST> Parser::parse_cast_expr() {
  auto expr = parse_unary();
  while (match(TokenKind::Keyword, "as")) {
    size_t castPos = expr->position();
    advance();
    auto type_ast = parse_type();
    expr = std::make_unique<CastExprAST>(std::move(expr), std::move(type_ast), castPos);
    expr->end_pos = previous_end();
  }
  return expr;
}

std::unique_ptr<ExprAST> Parser::parse_unary() {
  size_t start = current().position();
  if (match(TokenKind::Operator, "-") && peek().kind() == TokenKind::Number) {
    // 负数字面量直接折进 NumberExprAST，使 -128i8 可以表示
    advance();
    std::string suffix;
    BigInt value = parseIntegerLiteralToken(current().text(), suffix, current().position());
    advance();
    auto number = std::make_unique<NumberExprAST>(-value, suffix, start);
    number->end_pos = previous_end();
    return parse_postfix_on(std::move(number));
  }
  if (match(TokenKind::Operator, "!") || match(TokenKind::Operator, "-")) {
    std::string op = current().text();
    advance();
    auto operand = parse_unary();
    auto expr = std::make_unique<UnaryExprAST>(op, start, std::move(operand));
    expr->end_pos = previous_end();
    return expr;
  }
  return parse_postfix();
}

std::unique_ptr<ExprAST> Parser::parse_postfix() {
  return parse_postfix_on(parse_factor());
}

// 后缀：方法调用、字段访问、索引
std::unique_ptr<ExprAST> Parser::parse_postfix_on(std::unique_ptr<ExprAST> expr) {
  while (true) {
    size_t start = expr->position();
    if (match(TokenKind::Punctuation, ".")) {
      advance();
      std::string member = expect_identifier();
      if (match(TokenKind::Punctuation, "(")) {
        auto args = parse_call_args();
        expr = std::make_unique<CallExprAST>(member, start, std::move(expr), std::move(args));
      } else {
        expr = std::make_unique<MemberAccessExprAST>(start, std::move(expr), member);
      }
      expr->end_pos = previous_end();
    } else if (match(TokenKind::Punctuation, "[")) {
      advance();
      bool saved = no_struct_literal;
      no_struct_literal = false;
      auto index = parse_expr();
      no_struct_literal = saved;
      expect(TokenKind::Punctuation, "]");
      expr = std::make_unique<ArrayIndexExprAST>(start, std::move(expr), std::move(index));
      expr->end_pos = previous_end();
    } else {
      break;
    }
  }
  return expr;
}

// 调用前 current 为 '('，结束时消耗 ')'
std::vector<std::unique_ptr<ExprAST>> Parser::parse_call_args() {
  expect(TokenKind::Punctuation, "(");
  bool saved = no_struct_literal;
  no_struct_literal = false;
  std::vector<std::unique_ptr<ExprAST>> args;
  while (!match(TokenKind::Punctuation, ")")) {
    args.push_back(parse_expr());
    if (match(TokenKind::Punctuation, ",")) {
      advance();
    } else if (!match(TokenKind::Punctuation, ")")) {
      fail("expected ',' or ')' in argument list, found " + describe(current()));
    }
  }
  no_struct_literal = saved;
  expect(TokenKind::Punctuation, ")");
  return args;
}

//parse一个基本运算单元
std::unique_ptr<ExprAST> Parser::parse_factor() {
  size_t start = current().position();
  std::unique_ptr<ExprAST> result;

  if (match(TokenKind::Number)) {
    std::string suffix;
    BigInt value = parseIntegerLiteralToken(current().text(), suffix, start);
    advance();
    result = std::make_unique<NumberExprAST>(value, suffix, start);
  } else if (match(TokenKind::String)) {
    result = std::make_unique<StringExprAST>(unescapeLiteral(current().text(), 0), start);
    advance();
  } else if (match(TokenKind::Bytes)) {
    result = std::make_unique<BytesExprAST>(unescapeLiteral(current().text(), 1), start);
    advance();
  } else if (match(TokenKind::Keyword, "true") || match(TokenKind::Keyword, "false")) {
    result = std::make_unique<BoolExprAST>(current().text() == "true", start);
    advance();
  } else if (match(TokenKind::Intrinsic)) {
    IntrinsicKind kind;
    if (!intrinsicFromName(current().text(), kind)) {
      fail("unknown intrinsic " + describe(current()));
    }
    advance();
    // msg_sender 与 msg_sender() 等价
    if (match(TokenKind::Punctuation, "(") && peek().kind() == TokenKind::Punctuation && peek().text() == ")") {
      advance();
      advance();
    }
    result = std::make_unique<IntrinsicExprAST>(kind, start);
  } else if (match(TokenKind::Keyword, "match")) {
    return parse_match_expr();
  } else if (match(TokenKind::Operator, "|")) {
    return parse_lambda();
  } else if (match(TokenKind::Punctuation, "(")) {
    advance();
    bool saved = no_struct_literal;
    no_struct_literal = false;
    auto inner = parse_expr();
    no_struct_literal = saved;
    if (match(TokenKind::Punctuation, ",")) {
      fail("tuple expressions are not supported");
    }
    expect(TokenKind::Punctuation, ")");
    return inner;
  } else if (match(TokenKind::Identifier)) {
    std::string name = current().text();
    advance();
    if (name == "None") {
      result = std::make_unique<OptionExprAST>(nullptr, start);
    } else if (name == "Some" && match(TokenKind::Punctuation, "(")) {
      auto args = parse_call_args();
      if (args.size() != 1) {
        throw ParseError("Some(...) takes exactly one value", start, previous_end());
      }
      result = std::make_unique<OptionExprAST>(std::move(args[0]), start);
    } else if (match(TokenKind::Punctuation, "(")) {
      auto args = parse_call_args();
      result = std::make_unique<CallExprAST>(name, start, std::move(args));
    } else if (!no_struct_literal && match(TokenKind::Punctuation, "{") &&
               ((peek().kind() == TokenKind::Punctuation && peek().text() == "}") ||
                (peek().kind() == TokenKind::Identifier && peek(2).kind() == TokenKind::Punctuation &&
                 peek(2).text() == ":"))) {
      // Name { field: expr, ... }
      advance();
      std::vector<std::pair<std::string, std::unique_ptr<ExprAST>>> fields;
      while (!match(TokenKind::Punctuation, "}")) {
        std::string field = expect_identifier();
        expect(TokenKind::Punctuation, ":");
        fields.emplace_back(field, parse_expr());
        if (match(TokenKind::Punctuation, ",")) {
          advance();
        } else if (!match(TokenKind::Punctuation, "}")) {
          fail("expected ',' or '}' in struct literal, found " + describe(current()));
        }
      }
      expect(TokenKind::Punctuation, "}");
      result = std::make_unique<StructExprAST>(name, std::move(fields), start);
    } else {
      result = std::make_unique<VariableExprAST>(name, start);
    }
  } else {
    fail("expected expression, found " + describe(current()));
  }

  result->end_pos = previous_end();
  return result;
}

std::unique_ptr<ExprAST> Parser::parse_match_expr() {
  size_t start = current().position();
  expect(TokenKind::Keyword, "match");
  auto scrutinee = parse_condition();
  expect(TokenKind::Punctuation, "{");
  bool saved = no_struct_literal;
  no_struct_literal = false;
  std::vector<MatchExprArm> arms;
  while (!match(TokenKind::Punctuation, "}")) {
    MatchExprArm arm;
    arm.pattern = parse_pattern();
    expect(TokenKind::Operator, "=>");
    arm.value = parse_expr();
    arms.push_back(std::move(arm));
    if (match(TokenKind::Punctuation, ",")) {
      advance();
    } else if (!match(TokenKind::Punctuation, "}")) {
      fail("expected ',' or '}' after match arm, found " + describe(current()));
    }
  }
  no_struct_literal = saved;
  expect(TokenKind::Punctuation, "}");
  auto expr = std::make_unique<MatchExprAST>(std::move(scrutinee), std::move(arms), start);
  expr->end_pos = previous_end();
  return expr;
}

// |a, b| expr
std::unique_ptr<ExprAST> Parser::parse_lambda() {
  size_t start = current().position();
  expect(TokenKind::Operator, "|");
  std::vector<std::string> params;
  while (!match(TokenKind::Operator, "|")) {
    params.push_back(expect_identifier());
    if (match(TokenKind::Punctuation, ",")) {
      advance();
    } else if (!match(TokenKind::Operator, "|")) {
      fail("expected ',' or '|' in lambda parameters, found " + describe(current()));
    }
  }
  expect(TokenKind::Operator, "|");
  auto body = parse_expr();
  auto expr = std::make_unique<LambdaExprAST>(std::move(params), std::move(body), start);
  expr->end_pos = previous_end();
  return expr;
}

// 字面量模式或 _
std::unique_ptr<PatternAST> Parser::parse_pattern() {
  size_t start = current().position();
  if (match(TokenKind::Punctuation, "_")) {
    advance();
    return std::make_unique<PatternAST>(nullptr, start);
  }
  if (match(TokenKind::Number) || match(TokenKind::String) || match(TokenKind::Keyword, "true") ||
      match(TokenKind::Keyword, "false") ||
      (match(TokenKind::Operator, "-") && peek().kind() == TokenKind::Number)) {
    auto literal = parse_unary();
    return std::make_unique<PatternAST>(std::move(literal), start);
  }
  fail("expected literal pattern or '_', found " + describe(current()));
}

ParseResult parseSource(const std::string &source) {
  ParseResult result;
  Lexer lexer(source);
  auto tokens = lexer.tokenize_all();
  if (!lexer.diagnostics().empty()) {
    result.diagnostics = lexer.diagnostics();
    return result;
  }
  Parser parser(std::move(tokens));
  auto unit = parser.parse_source_unit();
  result.diagnostics = parser.diagnostics();
  if (!hasErrors(result.diagnostics)) {
    result.unit = std::move(unit);
  }
  return result;
}
