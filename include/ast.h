#ifndef AST_H
#define AST_H
#include "diagnostic.h"
#include "types.h"
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
using std::string;
using std::unique_ptr;
using std::make_unique;
constexpr int DumpSpaceNumber = 4;

// 前向声明
class ExprAST;
class StmtAST;
class BlockStmtAST;

//--------------------------------------------------------------
// 类型AST基类
class TypeAST {
public:
  size_t pos = 0;

  TypeAST() = default;
  explicit TypeAST(size_t pos_) : pos(pos_) {}
  virtual ~TypeAST() = default;
  virtual void dump(std::ostream &os, int indent = 0) const = 0;
  virtual string toString() const = 0;
  virtual unique_ptr<TypeAST> clone() const = 0;
};

// 基本类型或结构体名（u64, address, Pool ...）
class NamedTypeAST : public TypeAST {
public:
  string name;

  NamedTypeAST(const string &name, size_t pos_);
  void dump(std::ostream &os, int indent) const override;
  string toString() const override;
  unique_ptr<TypeAST> clone() const override;
};

// map<K,V> / vec<T> / Option<T> / Result<T,E>
class GenericTypeAST : public TypeAST {
public:
  string name;
  std::vector<unique_ptr<TypeAST>> args;

  GenericTypeAST(const string &name, std::vector<unique_ptr<TypeAST>> args, size_t pos_);
  void dump(std::ostream &os, int indent) const override;
  string toString() const override;
  unique_ptr<TypeAST> clone() const override;
};

// [T; N]
class ArrayTypeAST : public TypeAST {
public:
  unique_ptr<TypeAST> element_type;
  int64_t length;

  ArrayTypeAST(unique_ptr<TypeAST> elem, int64_t length, size_t pos_);
  void dump(std::ostream &os, int indent) const override;
  string toString() const override;
  unique_ptr<TypeAST> clone() const override;
};

class TupleTypeAST : public TypeAST {
public:
  std::vector<unique_ptr<TypeAST>> elements;

  TupleTypeAST(std::vector<unique_ptr<TypeAST>> elems, size_t pos_);
  void dump(std::ostream &os, int indent) const override;
  string toString() const override;
  unique_ptr<TypeAST> clone() const override;
};

//--------------------------------------------------------------
enum class IntrinsicKind {
  CallerAddress,
  MessageValue,
  BlockHeight,
  BlockTimestamp
};

const char *intrinsicName(IntrinsicKind kind);

bool intrinsicFromName(const string &name, IntrinsicKind &kind);

// 标识符解析到的符号类别，由语义分析回填
enum class VarBinding {
  Unresolved,
  Local,
  Parameter,
  State,
  Constant
};

// 调用解析结果，由语义分析回填
enum class CallTarget {
  Unresolved,
  Function,
  VecLen,
  VecPush,
  VecMap,
  VecFilter,
  OptionIsSome,
  OptionIsNone,
  OptionUnwrap
};

class ExprAST {
public:
  size_t pos = 0;
  size_t end_pos = 0;
  // 语义分析后的类型
  TypeRef type;

  ExprAST() = default;
  explicit ExprAST(size_t);

  virtual void dump(std::ostream &os, int indent = 0) const = 0;
  virtual unique_ptr<ExprAST> clone() const = 0;
  size_t position() const {
    return pos;
  }
  SourceSpan span() const {
    return SourceSpan(pos, end_pos);
  }
  virtual ~ExprAST() = default;

protected:
  void copyBase(ExprAST &target) const;
  void dumpType(std::ostream &os) const;
};

class NumberExprAST : public ExprAST {
public:
  BigInt value;
  // 字面量后缀，如 u8；为空表示由上下文定型
  string suffix;

  NumberExprAST(const BigInt &, const string &suffix, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

class BoolExprAST : public ExprAST {
public:
  bool value;

  BoolExprAST(bool, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

class StringExprAST : public ExprAST {
public:
  string str; // 已去除引号与转义

  StringExprAST(const string &, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

class BytesExprAST : public ExprAST {
public:
  string bytes;

  BytesExprAST(const string &, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

class VariableExprAST : public ExprAST {
public:
  string name;
  VarBinding binding = VarBinding::Unresolved;

  VariableExprAST(const string &, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

class IntrinsicExprAST : public ExprAST {
public:
  IntrinsicKind kind;

  IntrinsicExprAST(IntrinsicKind, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// 一元运算
class UnaryExprAST : public ExprAST {
public:
  string op;
  unique_ptr<ExprAST> expr;

  UnaryExprAST(const string &, size_t, unique_ptr<ExprAST>);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// 二元运算
class BinaryExprAST : public ExprAST {
public:
  string op;
  unique_ptr<ExprAST> left_expr;
  unique_ptr<ExprAST> right_expr;

  BinaryExprAST(const string &, size_t, unique_ptr<ExprAST>, unique_ptr<ExprAST>);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// cond ? a : b
class TernaryExprAST : public ExprAST {
public:
  unique_ptr<ExprAST> cond;
  unique_ptr<ExprAST> then_expr;
  unique_ptr<ExprAST> else_expr;

  TernaryExprAST(unique_ptr<ExprAST>, unique_ptr<ExprAST>, unique_ptr<ExprAST>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// 函数
class CallExprAST : public ExprAST {
public:
  string call;
  std::vector<unique_ptr<ExprAST> > args;
  // 成员方法调用的对象表达式，如果是普通函数调用则为nullptr
  unique_ptr<ExprAST> object_expr;
  CallTarget target = CallTarget::Unresolved;

  // 普通函数调用构造函数
  CallExprAST(const string &, size_t, std::vector<unique_ptr<ExprAST> >);
  // 成员方法调用构造函数
  CallExprAST(const string &, size_t, unique_ptr<ExprAST>, std::vector<unique_ptr<ExprAST> >);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// 数组 / vec / map 索引
class ArrayIndexExprAST : public ExprAST {
public:
  unique_ptr<ExprAST> array_expr;
  unique_ptr<ExprAST> index_expr;

  ArrayIndexExprAST(size_t, unique_ptr<ExprAST>, unique_ptr<ExprAST>);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// 结构体成员访问
class MemberAccessExprAST : public ExprAST {
public:
  unique_ptr<ExprAST> struct_expr;
  string member_name;

  MemberAccessExprAST(size_t, unique_ptr<ExprAST>, const string&);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// struct
class StructExprAST : public ExprAST {
public:
  std::string name;
  std::vector<std::pair<string, unique_ptr<ExprAST> > > fields;

  StructExprAST(const string &, std::vector<std::pair<std::string, unique_ptr<ExprAST> > >, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// |x| expr
class LambdaExprAST : public ExprAST {
public:
  std::vector<string> params;
  std::vector<TypeRef> param_types; // 语义分析回填
  unique_ptr<ExprAST> body;

  LambdaExprAST(std::vector<string>, unique_ptr<ExprAST>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// 类型转换
class CastExprAST : public ExprAST {
public:
  unique_ptr<ExprAST> expr;
  unique_ptr<TypeAST> target_type;

  CastExprAST(unique_ptr<ExprAST>, unique_ptr<TypeAST>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

// Some(x) / None
class OptionExprAST : public ExprAST {
public:
  unique_ptr<ExprAST> value; // None 时为空

  OptionExprAST(unique_ptr<ExprAST>, size_t);
  bool isNone() const { return !value; }
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

//--------------------------------------------------------------
// match 分支模式：字面量或 _
class PatternAST {
public:
  size_t pos;
  unique_ptr<ExprAST> literal; // 为空表示通配符 _

  PatternAST(unique_ptr<ExprAST>, size_t);
  bool isWildcard() const { return !literal; }
  void dump(std::ostream &os, int indent) const;
  unique_ptr<PatternAST> clone() const;
};

struct MatchExprArm {
  unique_ptr<PatternAST> pattern;
  unique_ptr<ExprAST> value;
};

class MatchExprAST : public ExprAST {
public:
  unique_ptr<ExprAST> scrutinee;
  std::vector<MatchExprArm> arms;

  MatchExprAST(unique_ptr<ExprAST>, std::vector<MatchExprArm>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<ExprAST> clone() const override;
};

//--------------------------------------------------------------
class StmtAST {
public:
  size_t pos = 0;
  size_t end_pos = 0;

  StmtAST() = default;
  explicit StmtAST(size_t);

  virtual void dump(std::ostream &os, int indent = 0) const = 0;
  virtual unique_ptr<StmtAST> clone() const = 0;
  size_t position() const {
    return pos;
  }
  SourceSpan span() const {
    return SourceSpan(pos, end_pos);
  }
  virtual ~StmtAST() = default;
};

class ExprStmtAST : public StmtAST {
public:
  unique_ptr<ExprAST> expr;

  ExprStmtAST(unique_ptr<ExprAST>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

class LetStmtAST : public StmtAST {
public:
  string name;
  bool is_mut;
  unique_ptr<TypeAST> declared_type; // 类型注解，可为空
  unique_ptr<ExprAST> value;
  TypeRef resolved_type;

  LetStmtAST(const string &, bool, unique_ptr<TypeAST>, unique_ptr<ExprAST>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

// 复合赋值在语法分析阶段已展开为 x = x op e
class AssignStmtAST : public StmtAST {
public:
  unique_ptr<ExprAST> lhs_expr;  // 左侧表达式，可以是变量、索引、字段
  unique_ptr<ExprAST> value;

  AssignStmtAST(unique_ptr<ExprAST>, unique_ptr<ExprAST>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

class BlockStmtAST : public StmtAST {
public:
  std::vector<unique_ptr<StmtAST> > statements;

  BlockStmtAST(std::vector<unique_ptr<StmtAST> >, size_t);

  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
  unique_ptr<BlockStmtAST> cloneBlock() const;
};

class IfStmtAST : public StmtAST {
public:
  unique_ptr<ExprAST> cond;
  unique_ptr<BlockStmtAST> then_branch;
  unique_ptr<StmtAST> else_branch; // BlockStmtAST 或 else-if 的 IfStmtAST

  IfStmtAST(unique_ptr<ExprAST>, unique_ptr<BlockStmtAST>, unique_ptr<StmtAST>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

class WhileStmtAST : public StmtAST {
public:
  unique_ptr<ExprAST> cond;
  unique_ptr<BlockStmtAST> body;

  WhileStmtAST(unique_ptr<ExprAST>, unique_ptr<BlockStmtAST>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

// for i in a..b { } 或 for x in v { }
class ForStmtAST : public StmtAST {
public:
  string var_name;
  unique_ptr<ExprAST> iter_expr; // 区间起点，或被遍历的集合
  unique_ptr<ExprAST> range_end; // 为空表示 for-each
  unique_ptr<BlockStmtAST> body;
  TypeRef var_type;

  ForStmtAST(const string &, unique_ptr<ExprAST>, unique_ptr<ExprAST>, unique_ptr<BlockStmtAST>, size_t);
  bool isRange() const { return static_cast<bool>(range_end); }
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

struct MatchStmtArm {
  unique_ptr<PatternAST> pattern;
  unique_ptr<BlockStmtAST> body;
};

class MatchStmtAST : public StmtAST {
public:
  unique_ptr<ExprAST> scrutinee;
  std::vector<MatchStmtArm> arms;

  MatchStmtAST(unique_ptr<ExprAST>, std::vector<MatchStmtArm>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

class RequireStmtAST : public StmtAST {
public:
  unique_ptr<ExprAST> cond;
  string message;

  RequireStmtAST(unique_ptr<ExprAST>, const string &, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

class EmitStmtAST : public StmtAST {
public:
  string event;
  std::vector<unique_ptr<ExprAST>> args;

  EmitStmtAST(const string &, std::vector<unique_ptr<ExprAST>>, size_t);
  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

class ReturnStmtAST : public StmtAST {
public:
  std::unique_ptr<ExprAST> value;

  ReturnStmtAST(size_t, unique_ptr<ExprAST>);

  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

// modifier 体中的 _;
class PlaceholderStmtAST : public StmtAST {
public:
  explicit PlaceholderStmtAST(size_t);

  void dump(std::ostream &os, int indent) const override;
  unique_ptr<StmtAST> clone() const override;
};

//--------------------------------------------------------------
// 声明

enum class Visibility {
  Public,
  Private
};

struct ParamAST {
  string name;
  unique_ptr<TypeAST> type;
  TypeRef resolved;
  size_t pos = 0;

  ParamAST clone() const;
  void dump(std::ostream &os, int indent) const;
};

class StateVarAST {
public:
  string name;
  unique_ptr<TypeAST> type;
  unique_ptr<ExprAST> default_value;
  TypeRef resolved;
  size_t pos;

  StateVarAST(const string &, unique_ptr<TypeAST>, unique_ptr<ExprAST>, size_t);
  void dump(std::ostream &os, int indent) const;
  unique_ptr<StateVarAST> clone() const;
};

class StructDeclAST {
public:
  string name;
  std::vector<ParamAST> fields;
  TypeRef resolved;
  size_t pos;

  StructDeclAST(const string &, std::vector<ParamAST>, size_t);
  void dump(std::ostream &os, int indent) const;
  unique_ptr<StructDeclAST> clone() const;
};

class EventDeclAST {
public:
  string name;
  std::vector<ParamAST> fields;
  size_t pos;

  EventDeclAST(const string &, std::vector<ParamAST>, size_t);
  void dump(std::ostream &os, int indent) const;
  unique_ptr<EventDeclAST> clone() const;
};

class ModifierDeclAST {
public:
  string name;
  std::vector<ParamAST> params;
  unique_ptr<BlockStmtAST> body;
  size_t pos;

  ModifierDeclAST(const string &, std::vector<ParamAST>, unique_ptr<BlockStmtAST>, size_t);
  void dump(std::ostream &os, int indent) const;
  unique_ptr<ModifierDeclAST> clone() const;
};

struct ModifierUseAST {
  string name;
  std::vector<unique_ptr<ExprAST>> args;
  size_t pos = 0;

  ModifierUseAST clone() const;
};

class ConstDeclAST {
public:
  string name;
  unique_ptr<TypeAST> type;
  unique_ptr<ExprAST> value;
  TypeRef resolved;
  size_t pos;

  ConstDeclAST(const string &, unique_ptr<TypeAST>, unique_ptr<ExprAST>, size_t);
  void dump(std::ostream &os, int indent) const;
  unique_ptr<ConstDeclAST> clone() const;
};

class FnDeclAST {
public:
  string name;
  Visibility visibility;
  std::vector<ParamAST> params;
  unique_ptr<TypeAST> return_type; // 为空表示无返回值
  std::vector<ModifierUseAST> modifiers;
  unique_ptr<BlockStmtAST> body; // 接口中的声明为空
  TypeRef resolved_return;
  size_t pos;

  FnDeclAST(const string &, Visibility, std::vector<ParamAST>, unique_ptr<TypeAST>,
            std::vector<ModifierUseAST>, unique_ptr<BlockStmtAST>, size_t);
  bool isPublic() const { return visibility == Visibility::Public; }
  void dump(std::ostream &os, int indent) const;
  unique_ptr<FnDeclAST> clone() const;
};

class InterfaceDeclAST {
public:
  string name;
  std::vector<unique_ptr<FnDeclAST>> functions;
  size_t pos;

  InterfaceDeclAST(const string &, std::vector<unique_ptr<FnDeclAST>>, size_t);
  void dump(std::ostream &os, int indent) const;
};

class ContractAST {
public:
  string name;
  std::vector<unique_ptr<StateVarAST>> state;
  std::vector<unique_ptr<StructDeclAST>> structs;
  std::vector<unique_ptr<EventDeclAST>> events;
  std::vector<unique_ptr<ModifierDeclAST>> modifiers;
  std::vector<unique_ptr<ConstDeclAST>> consts;
  std::vector<unique_ptr<FnDeclAST>> functions;
  size_t pos;

  ContractAST(const string &, size_t);
  void dump(std::ostream &os, int indent = 0) const;
  unique_ptr<ContractAST> clone() const;

  const StateVarAST *findState(const string &) const;
  const FnDeclAST *findFunction(const string &) const;
  const EventDeclAST *findEvent(const string &) const;
  const ModifierDeclAST *findModifier(const string &) const;
  const ConstDeclAST *findConst(const string &) const;
};

// 一个源文件：合约、顶层结构体、接口
class SourceUnitAST {
public:
  std::vector<unique_ptr<ContractAST>> contracts;
  std::vector<unique_ptr<StructDeclAST>> structs;
  std::vector<unique_ptr<InterfaceDeclAST>> interfaces;

  void dump(std::ostream &os, int indent = 0) const;
  const StructDeclAST *findStruct(const string &name, const ContractAST *contract) const;
};

//--------------------------------------------------------------
// 遍历工具

using ExprVisitor = std::function<void(const ExprAST *)>;
using StmtVisitor = std::function<void(const StmtAST *)>;

void visitExpr(const ExprAST *expr, const ExprVisitor &onExpr);

void visitStmt(const StmtAST *stmt, const StmtVisitor &onStmt, const ExprVisitor &onExpr);

void visitContract(const ContractAST &contract, const StmtVisitor &onStmt, const ExprVisitor &onExpr);

// 检查每个节点只出现一次（没有节点是自己的祖先）
bool verifyStrictTree(const ContractAST &contract);

// 与 dump 相同的文本，用于比较两棵树
string dumpToString(const ContractAST &contract);

string dumpToString(const StmtAST &stmt);

string dumpToString(const ExprAST &expr);

bool isLiteral(const ExprAST *expr);

// 是否可能产生副作用（调用、push 等）
bool hasSideEffects(const ExprAST *expr);
#endif //AST_H
