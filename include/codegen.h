#ifndef CODEGEN_H
#define CODEGEN_H

#include "ast.h"
#include "diagnostic.h"
#include "types.h"
#include <memory>
#include <string>
#include <vector>

enum class Target {
  Solana,
  Aptos,
  Sui
};

const char *targetName(Target target);

bool targetFromName(const std::string &name, Target &target);

// 生成文件扩展名，不含点
const char *targetExtension(Target target);

std::vector<Target> allTargets();

// 账户模型下 map 状态字段的处理方式
enum class MapPolicy {
  Reject,
  Bounded
};

struct CodegenOptions {
  MapPolicy mapPolicy = MapPolicy::Reject;
  size_t mapCapacity = 0;
};

struct GeneratedArtifact {
  Target target = Target::Solana;
  std::string contractName;
  std::string text;
  std::vector<Diagnostic> diagnostics;
  bool ok = false;
};

// 每个目标链一个实现；只读输入的 AST，同一输入总是产生相同的文本
class CodeGenerator {
public:
  virtual ~CodeGenerator() = default;

  virtual Target target() const = 0;

  virtual GeneratedArtifact generate(const ContractAST &contract, const SourceUnitAST &unit) const = 0;
};

// Anchor 程序：扁平状态账户 + 指令入口
class SolanaGenerator : public CodeGenerator {
public:
  explicit SolanaGenerator(const CodegenOptions &options) : options_(options) {}

  Target target() const override { return Target::Solana; }

  GeneratedArtifact generate(const ContractAST &contract, const SourceUnitAST &unit) const override;

private:
  CodegenOptions options_;
};

// Aptos 与 Sui 共用，差异在资源模型与标准库路径
class MoveGenerator : public CodeGenerator {
public:
  explicit MoveGenerator(Target target) : target_(target) {}

  Target target() const override { return target_; }

  GeneratedArtifact generate(const ContractAST &contract, const SourceUnitAST &unit) const override;

private:
  Target target_;
};

std::unique_ptr<CodeGenerator> makeGenerator(Target target, const CodegenOptions &options);

//===----------------------------------------------------------------------===//
// 目标链映射表（数据）
//===----------------------------------------------------------------------===//

// 模板中 $0 $1 代表类型参数，$N 代表数组长度；nullptr 表示该目标不支持
struct TypeTable {
  const char *unsignedInt; // 形如 u$W
  const char *signedInt;
  int maxUnsignedBits;
  const char *boolType;
  const char *addressType;
  const char *stringType;
  const char *bytesType;
  const char *mapType;
  const char *vectorType;
  const char *arrayType;
  const char *tupleType; // $* 代表逗号分隔的成员
  const char *optionType;
  const char *resultType;
};

struct IntrinsicTable {
  const char *callerAddress;
  const char *messageValue;
  const char *blockHeight;
  const char *blockTimestamp;
};

const TypeTable &typeTableFor(Target target);

const IntrinsicTable &intrinsicTableFor(Target target);

// 按类型表渲染目标类型；不支持时返回 false 并给出原因
bool renderType(Target target, const TypeRef &type, std::string &out, std::string &reason);

// nullptr 表示不支持
const char *renderIntrinsic(Target target, IntrinsicKind kind);

//===----------------------------------------------------------------------===//
// 生成器共用的辅助函数
//===----------------------------------------------------------------------===//

std::string toSnakeCase(const std::string &name);

std::string toPascalCase(const std::string &name);

std::string toUpperSnake(const std::string &name);

// require 消息按源码中首次出现的顺序编号，空消息记为 ""
std::vector<std::string> collectRequireMessages(const ContractAST &contract);

// 函数（包括其修饰器与间接调用的函数）是否使用某个内建量
bool usesIntrinsic(const ContractAST &contract, const FnDeclAST &fn, IntrinsicKind kind);

// 占位符之后还有语句，或者占位符不在顶层
bool modifierHasPostCode(const ModifierDeclAST &modifier);

bool typeContains(const TypeRef &type, BaseType kind);

// 合约可见的全部结构体：顶层在前，按声明顺序
std::vector<const StructDeclAST *> visibleStructs(const ContractAST &contract, const SourceUnitAST &unit);

class DiagnosticSink {
public:
  void error(SourceSpan span, DiagnosticCode code, const std::string &message);

  void warning(SourceSpan span, DiagnosticCode code, const std::string &message);

  bool hasErrors() const;

  std::vector<Diagnostic> take() { return std::move(items_); }

private:
  void add(SourceSpan span, DiagnosticCode code, Severity severity, const std::string &message);

  std::vector<Diagnostic> items_;
};

#endif // CODEGEN_H
