#include "codegen.h"
#include "optimizer.h"
#include "parser.h"
#include "semantic.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

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
  if (!should_run_test(name)) {
    return;
  }
  bool ok = false;
  try {
    ok = body();
  } catch (const std::exception &ex) {
    std::cout << "  exception: " << ex.what() << std::endl;
  }
  report(name, ok);
}

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

std::string case_path(const std::string &relative) {
  return std::string(TEST_CASE_DIR) + "/" + relative;
}

void print_diagnostics(const std::vector<Diagnostic> &diagnostics) {
  for (const auto &d: diagnostics) {
    std::cout << "  - " << severityName(d.severity) << "[" << diagnosticCodeName(d.code) << "] @" << d.span.begin
              << ": " << d.message << std::endl;
  }
}

// 前端 + 优化后的源文件
struct Prepared {
  unique_ptr<SourceUnitAST> unit;
  std::vector<unique_ptr<ContractAST>> contracts;
};

Prepared prepare(const std::string &source) {
  ParseResult parsed = parseSource(source);
  if (!parsed.unit) {
    throw std::runtime_error("source does not parse");
  }
  SemanticAnalyzer analyzer(*parsed.unit);
  if (!analyzer.analyze()) {
    throw std::runtime_error("source does not type-check");
  }
  Prepared prepared;
  prepared.unit = std::move(parsed.unit);
  for (const auto &contract: prepared.unit->contracts) {
    prepared.contracts.push_back(optimizeContract(*contract));
  }
  return prepared;
}

CodegenOptions bounded_maps() {
  CodegenOptions options;
  options.mapPolicy = MapPolicy::Bounded;
  options.mapCapacity = 16;
  return options;
}

GeneratedArtifact generate(const Prepared &prepared, Target target, const CodegenOptions &options = {},
                           size_t index = 0) {
  return makeGenerator(target, options)->generate(*prepared.contracts.at(index), *prepared.unit);
}

bool contains_all(const GeneratedArtifact &artifact, const std::vector<std::string> &snippets) {
  bool ok = true;
  for (const auto &snippet: snippets) {
    if (artifact.text.find(snippet) == std::string::npos) {
      std::cout << "  " << targetName(artifact.target) << " output lacks: " << snippet << std::endl;
      ok = false;
    }
  }
  return ok;
}

size_t count_occurrences(const std::string &text, const std::string &needle) {
  size_t count = 0;
  for (size_t at = text.find(needle); at != std::string::npos; at = text.find(needle, at + needle.size())) {
    ++count;
  }
  return count;
}

// 大括号配对，忽略字符串字面量中的字符
bool braces_balanced(const std::string &text) {
  int depth = 0;
  bool inString = false;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (inString) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        inString = false;
      }
      continue;
    }
    if (c == '"') {
      inString = true;
    } else if (c == '{') {
      ++depth;
    } else if (c == '}' && --depth < 0) {
      return false;
    }
  }
  return depth == 0 && !inString;
}

// 只含空格的行（空行应为真正的空行）
size_t whitespace_only_lines(const std::string &text) {
  size_t count = 0;
  std::istringstream in(text);
  std::string row;
  while (std::getline(in, row)) {
    if (!row.empty() && row.find_first_not_of(" \t") == std::string::npos) {
      ++count;
    }
  }
  return count;
}

} // namespace

int main() {
  std::cout << "=== 代码生成测试 ===" << std::endl;

  for (const auto &file: find_source_files(case_path("codegen"))) {
    std::string name = fs::path(file).filename().string();
    for (Target target: allTargets()) {
      run_case("generate " + name + " -> " + targetName(target), [&file, target] {
        Prepared prepared = prepare(read_from_file(file));
        bool ok = true;
        for (size_t i = 0; i < prepared.contracts.size(); ++i) {
          GeneratedArtifact artifact = generate(prepared, target, bounded_maps(), i);
          if (!artifact.ok || artifact.text.empty() || !braces_balanced(artifact.text)) {
            print_diagnostics(artifact.diagnostics);
            ok = false;
          }
        }
        return ok;
      });
    }
  }

  run_case("output_is_byte_identical_across_runs", [] {
    std::string source = read_from_file(case_path("codegen/registry.ccdsl"));
    Prepared first = prepare(source);
    Prepared second = prepare(source);
    for (Target target: allTargets()) {
      GeneratedArtifact a = generate(first, target, bounded_maps());
      GeneratedArtifact b = generate(second, target, bounded_maps());
      GeneratedArtifact c = generate(first, target, bounded_maps());
      if (a.text != b.text || a.text != c.text) {
        std::cout << "  " << targetName(target) << " output differs between runs" << std::endl;
        return false;
      }
    }
    return true;
  });

  run_case("blank_lines_carry_no_indentation", [] {
    Prepared prepared = prepare(read_from_file(case_path("codegen/registry.ccdsl")));
    for (Target target: allTargets()) {
      GeneratedArtifact artifact = generate(prepared, target, bounded_maps());
      size_t bad = whitespace_only_lines(artifact.text);
      if (!artifact.ok || bad != 0 || artifact.text.find("\n\n") == std::string::npos) {
        std::cout << "  " << targetName(target) << ": " << bad << " whitespace-only line(s)" << std::endl;
        return false;
      }
    }
    return true;
  });

  run_case("solana_counter_program", [] {
    Prepared prepared = prepare(read_from_file(case_path("codegen/counter.ccdsl")));
    GeneratedArtifact artifact = generate(prepared, Target::Solana);
    return artifact.ok && artifact.contractName == "Counter" &&
           contains_all(artifact, {"use anchor_lang::prelude::*;", "declare_id!(", "#[program]",
                                   "pub mod counter {", "pub struct CounterState {", "checked_add",
                                   "ErrorCode::ArithmeticOverflow", "CounterLimitReached",
                                   "StepMustBePositive", "emit!(Incremented", "#[error_code]"});
  });

  run_case("aptos_counter_module", [] {
    Prepared prepared = prepare(read_from_file(case_path("codegen/counter.ccdsl")));
    GeneratedArtifact artifact = generate(prepared, Target::Aptos);
    return artifact.ok &&
           contains_all(artifact, {"module cross_chain::counter {", "use aptos_framework::event;",
                                   "const E_COUNTER_LIMIT_REACHED: u64 = 1;",
                                   "const E_STEP_MUST_BE_POSITIVE: u64 = 2;", "struct CounterState has key {",
                                   "fun init_module(account: &signer) {", "acquires CounterState",
                                   "borrow_global_mut<CounterState>(@cross_chain)", "event::emit(Incremented"});
  });

  run_case("sui_counter_module", [] {
    Prepared prepared = prepare(read_from_file(case_path("codegen/counter.ccdsl")));
    GeneratedArtifact artifact = generate(prepared, Target::Sui);
    return artifact.ok && artifact.text.find("acquires") == std::string::npos &&
           artifact.text.find("borrow_global") == std::string::npos &&
           contains_all(artifact, {"module cross_chain::counter {", "use sui::event;",
                                   "public struct CounterState has key {", "id: UID,",
                                   "fun init(ctx: &mut TxContext) {", "transfer::share_object(state);",
                                   "ctx: &mut TxContext"});
  });

  run_case("move_table_for_state_maps", [] {
    Prepared prepared = prepare(read_from_file(case_path("codegen/registry.ccdsl")));
    GeneratedArtifact aptos = generate(prepared, Target::Aptos);
    GeneratedArtifact sui = generate(prepared, Target::Sui);
    return aptos.ok && sui.ok && contains_all(aptos, {"use aptos_std::table;", "table::new()"}) &&
           contains_all(sui, {"use sui::table;", "table::new(ctx)"});
  });

  run_case("require_codes_are_unique", [] {
    Prepared prepared = prepare("contract C { fn f(a: u64) { require(a > 1, \"bad value\"); "
                                "require(a > 2, \"bad value!\"); require(a > 3, \"\"); } }");
    GeneratedArtifact aptos = generate(prepared, Target::Aptos);
    GeneratedArtifact solana = generate(prepared, Target::Solana);
    return aptos.ok && solana.ok &&
           contains_all(aptos, {"const E_BAD_VALUE: u64 = 1;", "const E_BAD_VALUE_2: u64 = 2;",
                                "const E_REQUIREMENT_FAILED: u64 = 3;"}) &&
           contains_all(solana, {"BadValue,", "BadValue2,", "RequirementFailed,"});
  });

  run_case("solana_rejects_map_state_by_default", [] {
    Prepared prepared = prepare(read_from_file(case_path("pass/vault.ccdsl")));
    GeneratedArtifact solana = generate(prepared, Target::Solana);
    GeneratedArtifact aptos = generate(prepared, Target::Aptos);
    bool ok = !solana.ok && solana.text.empty() &&
              countCode(solana.diagnostics, DiagnosticCode::TargetConstraintViolation) == 1 && aptos.ok &&
              !hasErrors(aptos.diagnostics);
    if (!ok) {
      print_diagnostics(solana.diagnostics);
    }
    return ok;
  });

  run_case("solana_bounded_maps", [] {
    Prepared prepared = prepare(read_from_file(case_path("pass/vault.ccdsl")));
    GeneratedArtifact solana = generate(prepared, Target::Solana, bounded_maps());
    return solana.ok && contains_all(solana, {"MapCapacityExceeded", "map_get(", "map_set("});
  });

  run_case("move_rejects_lambdas", [] {
    Prepared prepared = prepare(read_from_file(case_path("pass/collections.ccdsl")));
    GeneratedArtifact aptos = generate(prepared, Target::Aptos);
    GeneratedArtifact solana = generate(prepared, Target::Solana);
    return !aptos.ok && countCode(aptos.diagnostics, DiagnosticCode::UnsupportedConstruct) > 0 && solana.ok;
  });

  run_case("move_omits_interfaces_with_warning", [] {
    Prepared prepared = prepare(read_from_file(case_path("pass/multi_contract.ccdsl")));
    GeneratedArtifact sui = generate(prepared, Target::Sui);
    GeneratedArtifact solana = generate(prepared, Target::Solana);
    return sui.ok && !hasErrors(sui.diagnostics) &&
           countCode(sui.diagnostics, DiagnosticCode::UnsupportedConstruct) == 1 &&
           sui.text.find("IOracle") == std::string::npos && solana.ok &&
           contains_all(solana, {"pub trait IOracle"});
  });

  run_case("one_module_per_contract", [] {
    Prepared prepared = prepare(read_from_file(case_path("pass/multi_contract.ccdsl")));
    GeneratedArtifact feed = generate(prepared, Target::Aptos, {}, 0);
    GeneratedArtifact book = generate(prepared, Target::Aptos, {}, 1);
    return feed.ok && book.ok && count_occurrences(feed.text, "module cross_chain::") == 1 &&
           contains_all(feed, {"module cross_chain::feed {", "struct Quote has copy, drop, store {"}) &&
           contains_all(book, {"module cross_chain::book {"});
  });

  run_case("optimized_tree_reaches_output", [] {
    Prepared prepared = prepare("contract C { state { n: u64; } public fn f(a: u64) { "
                                "if (false) { n = 1; } else { n = a * 1 + 0; } } }");
    GeneratedArtifact aptos = generate(prepared, Target::Aptos);
    return aptos.ok && aptos.text.find("1 + 0") == std::string::npos &&
           aptos.text.find("if (false)") == std::string::npos;
  });

  std::cout << (failures == 0 ? "全部通过" : "存在失败: " + std::to_string(failures)) << std::endl;
  return failures == 0 ? 0 : 1;
}
