#ifndef COMPILER_H
#define COMPILER_H

#include "ast.h"
#include "codegen.h"
#include "diagnostic.h"
#include "optimizer.h"
#include <memory>
#include <string>
#include <vector>

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFrontend = 2;
constexpr int kExitPartial = 3;
constexpr int kExitInternal = 4;

struct CompileOptions {
  std::vector<Target> targets = allTargets();
  CodegenOptions codegen;
  // 各目标只读优化后的 AST，可以并行生成
  bool parallel_targets = true;
};

struct ContractOutput {
  std::string name;
  OptimizerStats stats;
  std::vector<GeneratedArtifact> artifacts;
};

struct CompileResult {
  // 前端、各目标与内部错误的全部诊断，已回填行列号
  std::vector<Diagnostic> diagnostics;
  std::vector<ContractOutput> contracts;
  OptimizerStats stats;
  int exitCode = kExitSuccess;
};

// 解析与语义分析，不生成代码；供编辑器查询
struct AnalysisResult {
  unique_ptr<SourceUnitAST> unit;
  std::vector<Diagnostic> diagnostics;

  bool ok() const { return unit && !hasErrors(diagnostics); }

  // 覆盖 offset 的最内层表达式的类型，没有则返回 nullptr
  TypeRef typeAt(size_t offset) const;
};

AnalysisResult analyzeSource(const std::string &source);

CompileResult compileSource(const std::string &source, const CompileOptions &options);

// <out>/<target>/<contract_snake_case>.<ext>
std::string artifactPath(const std::string &outDir, const GeneratedArtifact &artifact);

// example 子命令写出的示例合约
const std::string &exampleContract();

#endif // COMPILER_H
