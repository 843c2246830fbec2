#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "parser.h"

namespace fs = std::filesystem;

#ifndef TEST_CASE_DIR
#define TEST_CASE_DIR "test_case"
#endif

namespace {

int failures = 0;

bool should_run_test(const std::string &name) {
  static const char *filter = std::getenv("TEST_FILTER");
  if (!filter || *filter == '\0') {
    return true;
  }
  return name.find(filter) != std::string::npos;
}

void report(const std::string &name, bool ok) {
  std::cout << (ok ? "✓ " : "✗ ") << name << std::endl;
  if (!ok) {
    ++failures;
  }
}

void run_case(const std::string &name, const std::function<bool()> &body) {
  if (should_run_test(name)) {
    report(name, body());
  }
}

// 查找目录及其子目录中的所有 .ccdsl 文件
std::vector<std::string> find_source_files(const std::string &directory) {
  std::vector<std::string> files;
  if (!fs::exists(directory)) {
    return files;
  }
  for (const auto &entry: fs::recursive_directory_iterator(directory)) {
    if (entry.is_regular_file() && entry.path().extension() == ".ccdsl") {
      files.push_back(entry.path().string());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::string read_from_file(const std::string &filename) {
  std::ifstream fin(filename, std::ios::in);
  if (!fin) {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::ostringstream oss;
  oss << fin.rdbuf();
  return oss.str();
}

void print_diagnostics(const std::vector<Diagnostic> &diagnostics) {
  for (const auto &d: diagnostics) {
    std::cout << "  - " << diagnosticCodeName(d.code) << " @" << d.span.begin << ": " << d.message << std::endl;
  }
}

const FnDeclAST *first_function(const ParseResult &result) {
  if (!result.unit || result.unit->contracts.empty() || result.unit->contracts[0]->functions.empty()) {
    return nullptr;
  }
  return result.unit->contracts[0]->functions[0].get();
}

// 解析 "contract C { fn f() { <body> } }" 并返回函数体第一条语句
const StmtAST *first_statement(const ParseResult &result) {
  const FnDeclAST *fn = first_function(result);
  if (!fn || fn->body->statements.empty()) {
    return nullptr;
  }
  return fn->body->statements[0].get();
}

ParseResult parse_body(const std::string &body) {
  return parseSource("contract C { fn f(a: u64, b: u64, c: u64) { " + body + " } }");
}

const ExprAST *returned(const ParseResult &result) {
  auto *ret = dynamic_cast<const ReturnStmtAST *>(first_statement(result));
  return ret ? ret->value.get() : nullptr;
}

} // namespace

int main() {
  std::cout << "=== 语法分析测试 ===" << std::endl;

  for (const std::string dir: {"pass", "codegen"}) {
    for (const auto &file: find_source_files(std::string(TEST_CASE_DIR) + "/" + dir)) {
      if (!should_run_test(file)) {
        continue;
      }
      ParseResult result = parseSource(read_from_file(file));
      bool ok = result.unit && result.diagnostics.empty();
      if (!ok) {
        print_diagnostics(result.diagnostics);
      }
      report("parse " + fs::path(file).filename().string(), ok);
    }
  }

  run_case("multiplication_binds_tighter_than_addition", [] {
    auto result = parse_body("return a + b * c;");
    auto *sum = dynamic_cast<const BinaryExprAST *>(returned(result));
    if (!sum || sum->op != "+") return false;
    auto *product = dynamic_cast<const BinaryExprAST *>(sum->right_expr.get());
    return product && product->op == "*";
  });

  run_case("cast_binds_tighter_than_multiplication", [] {
    auto result = parse_body("return a * b as u64;");
    auto *product = dynamic_cast<const BinaryExprAST *>(returned(result));
    return product && product->op == "*" && dynamic_cast<const CastExprAST *>(product->right_expr.get());
  });

  run_case("logical_and_binds_tighter_than_or", [] {
    auto result = parse_body("return a > 1 || b > 2 && c > 3;");
    auto *either = dynamic_cast<const BinaryExprAST *>(returned(result));
    if (!either || either->op != "||") return false;
    auto *both = dynamic_cast<const BinaryExprAST *>(either->right_expr.get());
    return both && both->op == "&&";
  });

  run_case("ternary_is_lowest_precedence", [] {
    auto result = parse_body("return a > b ? a + 1 : b;");
    auto *ternary = dynamic_cast<const TernaryExprAST *>(returned(result));
    return ternary && dynamic_cast<const BinaryExprAST *>(ternary->cond.get()) &&
           dynamic_cast<const BinaryExprAST *>(ternary->then_expr.get());
  });

  run_case("compound_assignment_is_desugared", [] {
    auto result = parse_body("let mut x = 1; x += a;");
    const FnDeclAST *fn = first_function(result);
    if (!fn || fn->body->statements.size() != 2) return false;
    auto *assign = dynamic_cast<const AssignStmtAST *>(fn->body->statements[1].get());
    if (!assign) return false;
    auto *value = dynamic_cast<const BinaryExprAST *>(assign->value.get());
    auto *lhs = dynamic_cast<const VariableExprAST *>(value ? value->left_expr.get() : nullptr);
    return value && value->op == "+" && lhs && lhs->name == "x";
  });

  run_case("negative_literal_is_folded", [] {
    auto result = parse_body("return -5;");
    auto *number = dynamic_cast<const NumberExprAST *>(returned(result));
    return number && number->value == -5;
  });

  run_case("condition_rejects_bare_struct_literal", [] {
    auto result = parse_body("if a { return; }");
    auto *stmt = dynamic_cast<const IfStmtAST *>(first_statement(result));
    return stmt && dynamic_cast<const VariableExprAST *>(stmt->cond.get());
  });

  run_case("method_chain_with_lambdas", [] {
    auto result = parse_body("return v.filter(|x| x > 1).map(|x| x * 2);");
    auto *outer = dynamic_cast<const CallExprAST *>(returned(result));
    if (!outer || outer->call != "map" || !outer->object_expr) return false;
    auto *inner = dynamic_cast<const CallExprAST *>(outer->object_expr.get());
    return inner && inner->call == "filter" && dynamic_cast<const LambdaExprAST *>(inner->args[0].get());
  });

  run_case("modifier_and_placeholder", [] {
    auto result = parseSource("contract C { modifier m(x: u64) { require(x > 0); _; } fn f() m(1) { } }");
    if (!result.unit) return false;
    const auto &contract = *result.unit->contracts[0];
    if (contract.modifiers.size() != 1 || contract.functions.size() != 1) return false;
    const auto &body = contract.modifiers[0]->body->statements;
    return body.size() == 2 && dynamic_cast<const PlaceholderStmtAST *>(body[1].get()) &&
           contract.functions[0]->modifiers.size() == 1 && contract.functions[0]->modifiers[0].args.size() == 1;
  });

  run_case("top_level_structs_and_interfaces", [] {
    auto result = parseSource("struct P { a: u64, b: bool } interface I { fn get() -> u64; } contract C { }");
    return result.unit && result.unit->structs.size() == 1 && result.unit->interfaces.size() == 1 &&
           result.unit->contracts.size() == 1 && result.unit->interfaces[0]->functions.size() == 1;
  });

  run_case("malformed_statement_mid_contract", [] {
    std::string before = "contract C {\n"
                         "    fn first() -> u64 { return 1; }\n"
                         "    fn broken() -> u64 {\n";
    std::string bad = "        let x = ;\n";
    std::string after = "        return 2;\n"
                        "    }\n"
                        "    fn last() -> u64 { return 3; }\n"
                        "}\n";
    auto result = parseSource(before + bad + after);
    if (result.unit || result.diagnostics.empty()) return false;
    size_t begin = before.size();
    size_t end = begin + bad.size();
    for (const auto &d: result.diagnostics) {
      if (d.code != DiagnosticCode::ParseError || d.span.begin < begin || d.span.begin >= end) {
        print_diagnostics(result.diagnostics);
        return false;
      }
    }
    return true;
  });

  run_case("several_errors_in_one_parse", [] {
    auto result = parseSource("contract C {\n"
                              "    fn a() { let = 1; }\n"
                              "    fn b() { return 1 +; }\n"
                              "}\n");
    return !result.unit && countCode(result.diagnostics, DiagnosticCode::ParseError) >= 2;
  });

  run_case("lex_errors_stop_before_parsing", [] {
    auto result = parseSource("contract C { fn f() { return 1 # 2; } }");
    return !result.unit && countCode(result.diagnostics, DiagnosticCode::LexError) == 1 &&
           countCode(result.diagnostics, DiagnosticCode::ParseError) == 0;
  });

  std::cout << (failures == 0 ? "全部通过" : "存在失败: " + std::to_string(failures)) << std::endl;
  return failures == 0 ? 0 : 1;
}
