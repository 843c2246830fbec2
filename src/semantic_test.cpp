#include "semantic.h"
#include "ast.h"
#include "parser.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

#ifndef TEST_CASE_DIR
#define TEST_CASE_DIR "test_case"
#endif

namespace {

int failures = 0;

bool should_run_test(const std::string &path) {
  static const char *filter = std::getenv("TEST_FILTER");
  if (!filter || *filter == '\0') {
    return true;
  }
  return path.find(filter) != std::string::npos;
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

// 查找目录中的所有 .ccdsl 文件
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

// 首行形如 "// expect: TypeMismatch"
std::string expected_code(const std::string &source) {
  const std::string marker = "// expect:";
  std::string first = source.substr(0, source.find('\n'));
  size_t at = first.find(marker);
  if (at == std::string::npos) {
    return "";
  }
  std::string code = first.substr(at + marker.size());
  code.erase(0, code.find_first_not_of(" \t"));
  code.erase(code.find_last_not_of(" \t\r") + 1);
  return code;
}

// 语法分析 + 语义分析，返回全部诊断
std::vector<Diagnostic> analyze(const std::string &source) {
  ParseResult parsed = parseSource(source);
  std::vector<Diagnostic> diagnostics = parsed.diagnostics;
  if (parsed.unit) {
    SemanticAnalyzer analyzer(*parsed.unit);
    analyzer.analyze();
    const auto &issues = analyzer.diagnostics();
    diagnostics.insert(diagnostics.end(), issues.begin(), issues.end());
  }
  return diagnostics;
}

void print_diagnostics(const std::vector<Diagnostic> &diagnostics) {
  for (const auto &d: diagnostics) {
    std::cout << "  - " << severityName(d.severity) << "[" << diagnosticCodeName(d.code) << "] @" << d.span.begin
              << ": " << d.message << std::endl;
  }
}

bool has_code(const std::vector<Diagnostic> &diagnostics, DiagnosticCode code) {
  return countCode(diagnostics, code) > 0;
}

// 测试单个文件
void test_file(const std::string &filepath, bool shouldPass) {
  std::string name = fs::path(filepath).stem().string();
  std::string source = read_from_file(filepath);
  std::vector<Diagnostic> diagnostics = analyze(source);

  bool ok;
  if (shouldPass) {
    ok = !hasErrors(diagnostics);
  } else {
    std::string code = expected_code(source);
    ok = false;
    for (const auto &d: diagnostics) {
      if (d.isError() && code == diagnosticCodeName(d.code)) {
        ok = true;
      }
    }
    if (!ok) {
      std::cout << "  expected " << (code.empty() ? "<missing expect line>" : code) << std::endl;
    }
  }
  if (!ok) {
    print_diagnostics(diagnostics);
  }
  report((shouldPass ? "pass/" : "fail/") + name, ok);
}

} // namespace

int main() {
  std::cout << "=== 语义分析测试 ===" << std::endl;

  for (const std::string dir: {"pass", "codegen"}) {
    for (const auto &file: find_source_files(std::string(TEST_CASE_DIR) + "/" + dir)) {
      if (should_run_test(file)) {
        test_file(file, true);
      }
    }
  }
  for (const auto &file: find_source_files(std::string(TEST_CASE_DIR) + "/fail")) {
    if (should_run_test(file)) {
      test_file(file, false);
    }
  }

  run_case("return_type_mismatch_names_both_types", [] {
    std::string prefix = "contract C {\n    public fn name() -> u64 {\n        ";
    std::string ret = "return \"vault\";";
    auto diagnostics = analyze(prefix + ret + "\n    }\n}\n");
    for (const auto &d: diagnostics) {
      if (d.code == DiagnosticCode::TypeMismatch && d.message.find("u64") != std::string::npos &&
          d.message.find("string") != std::string::npos && d.span.begin == prefix.size() &&
          d.span.end == prefix.size() + ret.size()) {
        return countCode(diagnostics, DiagnosticCode::TypeMismatch) == 1;
      }
    }
    print_diagnostics(diagnostics);
    return false;
  });

  run_case("literal_takes_type_from_context", [] {
    auto diagnostics = analyze("contract C { fn f() -> u8 { let x: u8 = 200; return x + 55; } }");
    return !hasErrors(diagnostics);
  });

  run_case("literal_out_of_range_for_context", [] {
    auto diagnostics = analyze("contract C { fn f() -> u8 { return 256; } }");
    return has_code(diagnostics, DiagnosticCode::TypeMismatch);
  });

  run_case("mixed_integer_widths_rejected", [] {
    auto diagnostics = analyze("contract C { fn f(a: u8, b: u64) -> u64 { return a + b; } }");
    return has_code(diagnostics, DiagnosticCode::TypeMismatch);
  });

  run_case("operand_mismatch_reported_once", [] {
    auto direct = analyze("contract C { fn f(a: u8, b: u64) -> u64 { return a + b; } }");
    auto nested = analyze("contract C { fn f(a: u8, b: u64) -> u64 { let x: u64 = (a + b) * 2; return x; } }");
    if (countCode(direct, DiagnosticCode::TypeMismatch) != 1 || countCode(nested, DiagnosticCode::TypeMismatch) != 1) {
      print_diagnostics(direct);
      print_diagnostics(nested);
      return false;
    }
    return true;
  });

  run_case("shadowing_in_inner_scope_is_allowed", [] {
    auto diagnostics = analyze("contract C { fn f(a: u64) -> u64 { let x = a; if (a > 1) { let x = 2; return x; } "
                               "return x; } }");
    return !hasErrors(diagnostics);
  });

  run_case("redeclaration_in_same_scope", [] {
    auto diagnostics = analyze("contract C { fn f() { let x = 1; let x = 2; } }");
    return has_code(diagnostics, DiagnosticCode::DuplicateDeclaration);
  });

  run_case("unused_local_is_a_warning", [] {
    auto diagnostics = analyze("contract C { fn f() { let unused = 1; } }");
    return !hasErrors(diagnostics) && has_code(diagnostics, DiagnosticCode::UnusedVariable);
  });

  run_case("state_default_must_be_constant", [] {
    auto diagnostics = analyze("contract C { state { owner: address = msg_sender; } }");
    return has_code(diagnostics, DiagnosticCode::InvalidConstruct);
  });

  run_case("state_default_may_use_constants", [] {
    auto diagnostics = analyze("contract C { const LIMIT: u64 = 10; state { cap: u64 = LIMIT * 2; } }");
    return !hasErrors(diagnostics);
  });

  run_case("constant_division_by_zero", [] {
    std::string prefix = "contract C { const Z: u64 = ";
    auto diagnostics = analyze(prefix + "1 / 0; }");
    for (const auto &d: diagnostics) {
      if (d.code == DiagnosticCode::InvalidConstruct && d.span.begin == prefix.size() &&
          d.message.find("division by zero") != std::string::npos) {
        return countCode(diagnostics, DiagnosticCode::InvalidConstruct) == 1;
      }
    }
    print_diagnostics(diagnostics);
    return false;
  });

  run_case("constant_overflow_through_other_constant", [] {
    auto diagnostics = analyze("contract C { const A: u8 = 200; const B: u8 = A + 100; }");
    return countCode(diagnostics, DiagnosticCode::InvalidConstruct) == 1 &&
           countCode(diagnostics, DiagnosticCode::TypeMismatch) == 0;
  });

  run_case("state_default_lossy_cast", [] {
    auto diagnostics = analyze("contract C { state { n: u8 = 300 as u8; } }");
    return has_code(diagnostics, DiagnosticCode::InvalidConstruct);
  });

  run_case("constant_evaluation_accepts_valid_values", [] {
    auto diagnostics = analyze("contract C { const A: u64 = 10; const B: u64 = A / 2 + A % 3; "
                               "const F: bool = false && 1 / 0 == 0; state { cap: u64 = B * 4; } }");
    if (hasErrors(diagnostics)) {
      print_diagnostics(diagnostics);
      return false;
    }
    return true;
  });

  run_case("constant_is_immutable", [] {
    auto diagnostics = analyze("contract C { const LIMIT: u64 = 10; fn f() { LIMIT = 3; } }");
    return has_code(diagnostics, DiagnosticCode::ImmutableAssignment);
  });

  run_case("state_is_mutable_from_functions", [] {
    auto diagnostics = analyze("contract C { state { n: u64; } fn f() { n = n + 1; } }");
    return !hasErrors(diagnostics);
  });

  run_case("if_else_both_returning_satisfies_return", [] {
    auto diagnostics = analyze("contract C { fn f(a: bool) -> u64 { if (a) { return 1; } else { return 2; } } }");
    return !hasErrors(diagnostics);
  });

  run_case("if_without_else_is_missing_return", [] {
    auto diagnostics = analyze("contract C { fn f(a: bool) -> u64 { if (a) { return 1; } } }");
    return has_code(diagnostics, DiagnosticCode::MissingReturn);
  });

  run_case("placeholder_outside_modifier", [] {
    auto diagnostics = analyze("contract C { fn f() { _; } }");
    return has_code(diagnostics, DiagnosticCode::InvalidConstruct);
  });

  run_case("modifier_argument_count", [] {
    auto diagnostics = analyze("contract C { modifier m(x: u64) { require(x > 0); _; } fn f() m { } }");
    return has_code(diagnostics, DiagnosticCode::ArityMismatch);
  });

  run_case("unknown_modifier", [] {
    auto diagnostics = analyze("contract C { fn f() missing { } }");
    return has_code(diagnostics, DiagnosticCode::UndefinedSymbol);
  });

  run_case("emit_argument_types", [] {
    auto diagnostics = analyze("contract C { event E(a: u64); fn f() { emit E(true); } }");
    return has_code(diagnostics, DiagnosticCode::TypeMismatch);
  });

  run_case("require_condition_must_be_bool", [] {
    auto diagnostics = analyze("contract C { fn f(a: u64) { require(a, \"no\"); } }");
    return has_code(diagnostics, DiagnosticCode::TypeMismatch);
  });

  run_case("unknown_struct_field", [] {
    auto diagnostics = analyze("struct P { a: u64 } contract C { fn f(p: P) -> u64 { return p.b; } }");
    return has_code(diagnostics, DiagnosticCode::UndefinedSymbol);
  });

  run_case("bindings_are_resolved", [] {
    ParseResult parsed = parseSource("contract C { state { n: u64; } const K: u64 = 1; "
                                     "fn f(p: u64) -> u64 { let x = p; return n + K + x; } }");
    if (!parsed.unit) return false;
    SemanticAnalyzer analyzer(*parsed.unit);
    if (!analyzer.analyze()) return false;
    std::vector<VarBinding> seen;
    visitContract(*parsed.unit->contracts[0], [](const StmtAST *) {}, [&](const ExprAST *e) {
      if (auto *v = dynamic_cast<const VariableExprAST *>(e)) seen.push_back(v->binding);
    });
    auto has = [&](VarBinding b) { return std::find(seen.begin(), seen.end(), b) != seen.end(); };
    return has(VarBinding::State) && has(VarBinding::Constant) && has(VarBinding::Parameter) &&
           has(VarBinding::Local) && !has(VarBinding::Unresolved);
  });

  run_case("expressions_are_typed", [] {
    ParseResult parsed = parseSource("contract C { fn f(a: u32) -> bool { return a * 2 > 3; } }");
    if (!parsed.unit) return false;
    SemanticAnalyzer analyzer(*parsed.unit);
    analyzer.analyze();
    bool allTyped = true;
    visitContract(*parsed.unit->contracts[0], [](const StmtAST *) {}, [&](const ExprAST *e) {
      if (!e->type) allTyped = false;
    });
    return allTyped;
  });

  std::cout << (failures == 0 ? "全部通过" : "存在失败: " + std::to_string(failures)) << std::endl;
  return failures == 0 ? 0 : 1;
}
