#include "compiler.h"
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
  std::cout << (ok ? "✓ " : "✗ ") << name << std::endl;
  if (!ok) {
    ++failures;
  }
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

std::string case_source(const std::string &relative) {
  return read_from_file(std::string(TEST_CASE_DIR) + "/" + relative);
}

const GeneratedArtifact *artifact_for(const CompileResult &result, Target target) {
  for (const auto &contract: result.contracts) {
    for (const auto &artifact: contract.artifacts) {
      if (artifact.target == target) {
        return &artifact;
      }
    }
  }
  return nullptr;
}

} // namespace

int main() {
  std::cout << "=== 编译流程测试 ===" << std::endl;

  run_case("example_compiles_everywhere", [] {
    CompileResult result = compileSource(exampleContract(), CompileOptions());
    if (result.exitCode != kExitSuccess || result.contracts.size() != 1) return false;
    for (const auto &artifact: result.contracts[0].artifacts) {
      if (!artifact.ok || artifact.text.empty()) return false;
    }
    return result.contracts[0].artifacts.size() == allTargets().size();
  });

  run_case("frontend_error_exit_code", [] {
    CompileResult result = compileSource(case_source("fail/return_type_mismatch.ccdsl"), CompileOptions());
    return result.exitCode == kExitFrontend && result.contracts.empty() && hasErrors(result.diagnostics);
  });

  for (const auto &file: find_source_files(std::string(TEST_CASE_DIR) + "/fail")) {
    std::string name = fs::path(file).filename().string();
    run_case("rejected_before_codegen " + name, [&file] {
      CompileResult result = compileSource(read_from_file(file), CompileOptions());
      if (result.exitCode != kExitFrontend || !result.contracts.empty() || !hasErrors(result.diagnostics)) {
        std::cout << "  exit " << result.exitCode << ", contracts " << result.contracts.size() << std::endl;
        return false;
      }
      return true;
    });
  }

  run_case("parse_error_exit_code", [] {
    CompileResult result = compileSource(case_source("fail/parse_error.ccdsl"), CompileOptions());
    return result.exitCode == kExitFrontend && countCode(result.diagnostics, DiagnosticCode::ParseError) >= 1;
  });

  run_case("partial_failure_exit_code", [] {
    CompileOptions options;
    options.targets = {Target::Aptos, Target::Solana};
    CompileResult result = compileSource(case_source("pass/vault.ccdsl"), options);
    const GeneratedArtifact *aptos = artifact_for(result, Target::Aptos);
    const GeneratedArtifact *solana = artifact_for(result, Target::Solana);
    return result.exitCode == kExitPartial && aptos && aptos->ok && solana && !solana->ok &&
           countCode(result.diagnostics, DiagnosticCode::TargetConstraintViolation) == 1;
  });

  run_case("bounded_maps_succeed", [] {
    CompileOptions options;
    options.codegen.mapPolicy = MapPolicy::Bounded;
    options.codegen.mapCapacity = 32;
    CompileResult result = compileSource(case_source("pass/vault.ccdsl"), options);
    return result.exitCode == kExitSuccess;
  });

  run_case("artifacts_follow_target_order", [] {
    CompileOptions options;
    options.targets = {Target::Sui, Target::Aptos};
    CompileResult result = compileSource(case_source("codegen/counter.ccdsl"), options);
    const auto &artifacts = result.contracts.at(0).artifacts;
    return artifacts.size() == 2 && artifacts[0].target == Target::Sui && artifacts[1].target == Target::Aptos;
  });

  run_case("serial_and_parallel_agree", [] {
    std::string source = case_source("pass/multi_contract.ccdsl");
    CompileOptions parallel;
    CompileOptions serial;
    serial.parallel_targets = false;
    CompileResult a = compileSource(source, parallel);
    CompileResult b = compileSource(source, serial);
    if (a.exitCode != b.exitCode || a.contracts.size() != b.contracts.size() ||
        a.diagnostics.size() != b.diagnostics.size()) {
      return false;
    }
    for (size_t i = 0; i < a.contracts.size(); ++i) {
      const auto &left = a.contracts[i].artifacts;
      const auto &right = b.contracts[i].artifacts;
      if (left.size() != right.size()) return false;
      for (size_t j = 0; j < left.size(); ++j) {
        if (left[j].target != right[j].target || left[j].text != right[j].text) return false;
      }
    }
    for (size_t i = 0; i < a.diagnostics.size(); ++i) {
      if (a.diagnostics[i].message != b.diagnostics[i].message) return false;
    }
    return true;
  });

  run_case("diagnostics_carry_line_and_column", [] {
    std::string source = "contract C {\n  fn f() -> u64 {\n    return true;\n  }\n}\n";
    CompileResult result = compileSource(source, CompileOptions());
    if (result.diagnostics.empty()) return false;
    const Diagnostic &d = result.diagnostics[0];
    std::string text = formatDiagnostic(d, "c.ccdsl");
    return d.line == 3 && d.column == 5 && text.rfind("c.ccdsl:3:5: error[TypeMismatch]: ", 0) == 0;
  });

  run_case("optimizer_stats_are_reported", [] {
    CompileResult result = compileSource("contract C { public fn f(a: u64) -> u64 { return a * 1 + 0; } }",
                                         CompileOptions());
    return result.exitCode == kExitSuccess && result.contracts.at(0).stats.algebraicSimplifications >= 2 &&
           result.stats.total() == result.contracts[0].stats.total();
  });

  run_case("type_at_offset", [] {
    std::string source = "contract C { fn f(a: u8) -> bool { return a > 3; } }";
    AnalysisResult analysis = analyzeSource(source);
    if (!analysis.ok()) return false;
    TypeRef operand = analysis.typeAt(source.find("a >"));
    TypeRef comparison = analysis.typeAt(source.find("> 3"));
    TypeRef outside = analysis.typeAt(0);
    return operand && operand->toString() == "u8" && comparison && comparison->isBool() && !outside;
  });

  run_case("analysis_reports_without_generating", [] {
    AnalysisResult analysis = analyzeSource(case_source("fail/undefined_symbol.ccdsl"));
    return !analysis.ok() && countCode(analysis.diagnostics, DiagnosticCode::UndefinedSymbol) >= 1;
  });

  run_case("artifact_path_layout", [] {
    GeneratedArtifact artifact;
    artifact.target = Target::Sui;
    artifact.contractName = "TokenVault";
    GeneratedArtifact rust;
    rust.target = Target::Solana;
    rust.contractName = "Counter";
    return artifactPath("out", artifact) == "out/sui/token_vault.move" &&
           artifactPath("build/", rust) == "build/solana/counter.rs" &&
           artifactPath("", rust) == "./solana/counter.rs";
  });

  run_case("target_names_round_trip", [] {
    for (Target target: allTargets()) {
      Target parsed;
      if (!targetFromName(targetName(target), parsed) || parsed != target) return false;
    }
    Target ignored;
    return !targetFromName("ethereum", ignored);
  });

  std::cout << (failures == 0 ? "全部通过" : "存在失败: " + std::to_string(failures)) << std::endl;
  return failures == 0 ? 0 : 1;
}
