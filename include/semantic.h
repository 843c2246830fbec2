#ifndef SEMANTIC_H
#define SEMANTIC_H

#include "ast.h"
#include "diagnostic.h"
#include "types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

//===----------------------------------------------------------------------===//

enum class SymbolKind {
  Local,
  Parameter,
  State,
  Constant
};

struct Symbol {
  std::string name;
  SymbolKind kind = SymbolKind::Local;
  TypeRef type;
  bool isMutable = false;
  size_t position = 0;
  bool used = false;
  bool warnUnused = true;
};

using ScopeId = int;

constexpr ScopeId kNoScope = -1;

// 作用域保存在 arena 中，用下标互相引用
struct Scope {
  ScopeId parent = kNoScope;
  std::vector<Symbol> symbols; // 按声明顺序
  std::unordered_map<std::string, size_t> index;
};

class SymbolTable {
public:
  ScopeId enterScope();

  // 返回被关闭的作用域
  ScopeId exitScope();

  ScopeId current() const { return current_; }

  // 同一作用域中重名返回 false；外层同名允许遮蔽
  bool addSymbol(const Symbol &symbol);

  Symbol *lookup(const std::string &name);

  const Symbol *lookupCurrent(const std::string &name) const;

  const Scope &scope(ScopeId id) const { return scopes_[static_cast<size_t>(id)]; }

  size_t scopeCount() const { return scopes_.size(); }

  void clear();

private:
  std::vector<Scope> scopes_;
  ScopeId current_ = kNoScope;
};

//===----------------------------------------------------------------------===//

struct FunctionInfo {
  std::string name;
  std::vector<TypeRef> params;
  TypeRef returnType;
  bool isPublic = false;
  size_t position = 0;
};

struct EventInfo {
  std::string name;
  std::vector<std::string> fieldNames;
  std::vector<TypeRef> fieldTypes;
};

struct ModifierInfo {
  std::string name;
  std::vector<TypeRef> params;
};

struct ConstValue {
  bool isBool = false;
  bool flag = false;
  BigInt number;
};

//===----------------------------------------------------------------------===//

class SemanticAnalyzer {
public:
  explicit SemanticAnalyzer(SourceUnitAST &unit);

  // 分析整个源文件，无错误返回 true
  bool analyze();

  const std::vector<Diagnostic> &diagnostics() const { return issues; }

private:
  // 生命周期管理
  void reset();

  void collectTopLevel();

  void collectTypeDeclarations(ContractAST &contract);

  TypeRef resolveStruct(const std::string &name);

  void collectStateAndConstants(ContractAST &contract);

  void collectEvents(ContractAST &contract);

  void collectModifiers(ContractAST &contract);

  void collectFunctionDeclarations(ContractAST &contract);

  // 分析入口
  void analyzeContract(ContractAST &contract);

  void analyzeModifierBody(ModifierDeclAST &modifier);

  void analyzeFunctionBody(FnDeclAST &fn);

  void analyzeModifierUses(FnDeclAST &fn);

  // 语句/表达式
  void analyzeStatement(StmtAST *stmt);

  void analyzeBlock(BlockStmtAST *block, bool createScope = true);

  void analyzeLet(LetStmtAST *stmt);

  void analyzeAssign(AssignStmtAST *stmt);

  void analyzeIfStmt(IfStmtAST *stmt);

  void analyzeWhileStmt(WhileStmtAST *stmt);

  void analyzeForStmt(ForStmtAST *stmt);

  void analyzeMatchStmt(MatchStmtAST *stmt);

  void analyzeRequire(RequireStmtAST *stmt);

  void analyzeEmit(EmitStmtAST *stmt);

  void analyzeReturn(ReturnStmtAST *stmt);

  TypeRef analyzeExpr(ExprAST *expr, const TypeRef &expected = nullptr);

  TypeRef analyzeNumber(NumberExprAST *expr, const TypeRef &expected);

  TypeRef analyzeVariable(VariableExprAST *expr);

  TypeRef analyzeBinaryExpr(BinaryExprAST *expr, const TypeRef &expected);

  TypeRef analyzeUnaryExpr(UnaryExprAST *expr, const TypeRef &expected);

  TypeRef analyzeTernary(TernaryExprAST *expr, const TypeRef &expected);

  TypeRef analyzeCallExpr(CallExprAST *expr);

  TypeRef analyzeMethodCall(CallExprAST *expr);

  TypeRef analyzeLambda(LambdaExprAST *lambda, const TypeRef &paramType);

  TypeRef analyzeArrayIndex(ArrayIndexExprAST *expr);

  TypeRef analyzeMemberAccess(MemberAccessExprAST *expr);

  TypeRef analyzeStructExpr(StructExprAST *expr);

  TypeRef analyzeCastExpr(CastExprAST *expr);

  TypeRef analyzeOptionExpr(OptionExprAST *expr, const TypeRef &expected);

  TypeRef analyzeMatchExpr(MatchExprAST *expr, const TypeRef &expected);

  void analyzePattern(PatternAST *pattern, const TypeRef &scrutinee);

  // 两个需要相同类型的操作数：未定型的字面量一侧后分析
  std::pair<TypeRef, TypeRef> analyzeOperandPair(ExprAST *lhs, ExprAST *rhs, const TypeRef &expected);

  void checkArguments(const std::string &what, const std::vector<unique_ptr<ExprAST>> &args,
                      const std::vector<TypeRef> &params, SourceSpan span);

  // 辅助
  TypeRef resolveType(const TypeAST *typeAst, bool allowMap = false);

  void reportError(SourceSpan span, DiagnosticCode code, const std::string &msg);

  void reportWarning(SourceSpan span, DiagnosticCode code, const std::string &msg);

  bool ensureAssignable(const TypeRef &from, const TypeRef &to, SourceSpan span, const std::string &context);

  bool blockGuaranteesReturn(const BlockStmtAST *block) const;

  bool statementGuaranteesReturn(const StmtAST *stmt) const;

  bool isContextTyped(const ExprAST *expr) const;

  bool isConstantExpr(const ExprAST *expr) const;

  // 编译期求值整型/布尔常量表达式；无法求值返回 false，会中止时 trap 给出原因
  bool evaluateConstant(const ExprAST *expr, ConstValue &value, std::string &trap) const;

  // 求值失败且确定会中止时报告；求值成功返回 true
  bool checkConstantTraps(const ExprAST *expr, const std::string &what, ConstValue &value);

  // 赋值目标的根变量是否可写；返回根符号（可能为空）
  bool isMutableTarget(ExprAST *expr, std::string &rootName);

  void declareLocal(const std::string &name, const TypeRef &type, bool isMutable, size_t position,
                    bool warnUnused = true);

  void enterScope();

  void exitScope();

  int countPlaceholders(const StmtAST *stmt) const;

  SourceUnitAST &unit;
  ContractAST *currentContract = nullptr;
  SymbolTable symbols;
  std::vector<Diagnostic> issues;
  std::unordered_map<std::string, TypeRef> structs;
  std::unordered_set<std::string> resolvingStructs;
  std::unordered_map<std::string, StructDeclAST *> structDecls;
  // 顶层结构体对所有合约可见，只解析一次
  std::unordered_map<std::string, TypeRef> topStructs;
  std::unordered_map<std::string, StructDeclAST *> topStructDecls;
  std::unordered_map<std::string, FunctionInfo> functions;
  std::unordered_map<std::string, EventInfo> events;
  std::unordered_map<std::string, ModifierInfo> modifiers;
  std::unordered_map<std::string, ConstValue> constValues;
  TypeRef currentReturn;
  bool inModifier = false;
};

#endif // SEMANTIC_H
