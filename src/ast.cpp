#include "ast.h"

#include <sstream>
#include <unordered_set>

static void dump_space(std::ostream &os, int indent) {
  while (indent-- > 0) os << ' ';
}

namespace {
  unique_ptr<ExprAST> cloneExpr(const unique_ptr<ExprAST> &expr) {
    return expr ? expr->clone() : nullptr;
  }

  unique_ptr<TypeAST> cloneType(const unique_ptr<TypeAST> &type) {
    return type ? type->clone() : nullptr;
  }

  unique_ptr<BlockStmtAST> cloneBlock(const unique_ptr<BlockStmtAST> &block) {
    return block ? block->cloneBlock() : nullptr;
  }

  std::vector<unique_ptr<ExprAST>> cloneExprs(const std::vector<unique_ptr<ExprAST>> &exprs) {
    std::vector<unique_ptr<ExprAST>> result;
    result.reserve(exprs.size());
    for (const auto &e: exprs) {
      result.push_back(cloneExpr(e));
    }
    return result;
  }

  std::vector<ParamAST> cloneParams(const std::vector<ParamAST> &params) {
    std::vector<ParamAST> result;
    result.reserve(params.size());
    for (const auto &p: params) {
      result.push_back(p.clone());
    }
    return result;
  }

  void dumpParams(std::ostream &os, int indent, const char *title, const std::vector<ParamAST> &params) {
    if (params.empty()) return;
    dump_space(os, indent);
    os << title << ":" << std::endl;
    for (const auto &p: params) {
      p.dump(os, indent + DumpSpaceNumber);
    }
  }

  string escapeString(const string &s) {
    string out;
    for (char c: s) {
      switch (c) {
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        default: out += c;
      }
    }
    return out;
  }
} // namespace

//===----------------------------------------------------------------------===//
// TypeAST
//===----------------------------------------------------------------------===//

NamedTypeAST::NamedTypeAST(const string &name, size_t pos_) : TypeAST(pos_), name(name) {}

void NamedTypeAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "NamedType: " << name << std::endl;
}

string NamedTypeAST::toString() const {
  return name;
}

unique_ptr<TypeAST> NamedTypeAST::clone() const {
  return make_unique<NamedTypeAST>(name, pos);
}

GenericTypeAST::GenericTypeAST(const string &name, std::vector<unique_ptr<TypeAST>> args, size_t pos_)
  : TypeAST(pos_), name(name), args(std::move(args)) {}

void GenericTypeAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "GenericType: " << name << std::endl;
  for (const auto &a: args) {
    a->dump(os, indent + DumpSpaceNumber);
  }
}

string GenericTypeAST::toString() const {
  string result = name + "<";
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) result += ", ";
    result += args[i]->toString();
  }
  return result + ">";
}

unique_ptr<TypeAST> GenericTypeAST::clone() const {
  std::vector<unique_ptr<TypeAST>> copied;
  for (const auto &a: args) {
    copied.push_back(a->clone());
  }
  return make_unique<GenericTypeAST>(name, std::move(copied), pos);
}

ArrayTypeAST::ArrayTypeAST(unique_ptr<TypeAST> elem, int64_t length, size_t pos_)
  : TypeAST(pos_), element_type(std::move(elem)), length(length) {}

void ArrayTypeAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "ArrayType: length " << length << std::endl;
  element_type->dump(os, indent + DumpSpaceNumber);
}

string ArrayTypeAST::toString() const {
  return "[" + element_type->toString() + "; " + std::to_string(length) + "]";
}

unique_ptr<TypeAST> ArrayTypeAST::clone() const {
  return make_unique<ArrayTypeAST>(element_type->clone(), length, pos);
}

TupleTypeAST::TupleTypeAST(std::vector<unique_ptr<TypeAST>> elems, size_t pos_)
  : TypeAST(pos_), elements(std::move(elems)) {}

void TupleTypeAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "TupleType:" << std::endl;
  for (const auto &e: elements) {
    e->dump(os, indent + DumpSpaceNumber);
  }
}

string TupleTypeAST::toString() const {
  string result = "(";
  for (size_t i = 0; i < elements.size(); ++i) {
    if (i > 0) result += ", ";
    result += elements[i]->toString();
  }
  return result + ")";
}

unique_ptr<TypeAST> TupleTypeAST::clone() const {
  std::vector<unique_ptr<TypeAST>> copied;
  for (const auto &e: elements) {
    copied.push_back(e->clone());
  }
  return make_unique<TupleTypeAST>(std::move(copied), pos);
}

//===----------------------------------------------------------------------===//
// 表达式
//===----------------------------------------------------------------------===//

const char *intrinsicName(IntrinsicKind kind) {
  switch (kind) {
    case IntrinsicKind::CallerAddress: return "msg_sender";
    case IntrinsicKind::MessageValue: return "msg_value";
    case IntrinsicKind::BlockHeight: return "block_number";
    case IntrinsicKind::BlockTimestamp: return "block_timestamp";
  }
  return "?";
}

bool intrinsicFromName(const string &name, IntrinsicKind &kind) {
  if (name == "msg_sender") kind = IntrinsicKind::CallerAddress;
  else if (name == "msg_value") kind = IntrinsicKind::MessageValue;
  else if (name == "block_number") kind = IntrinsicKind::BlockHeight;
  else if (name == "block_timestamp") kind = IntrinsicKind::BlockTimestamp;
  else return false;
  return true;
}

ExprAST::ExprAST(size_t pos_) : pos(pos_), end_pos(pos_) {}

void ExprAST::copyBase(ExprAST &target) const {
  target.pos = pos;
  target.end_pos = end_pos;
  target.type = type;
}

void ExprAST::dumpType(std::ostream &os) const {
  if (type) {
    os << " : " << type->toString();
  }
  os << std::endl;
}

NumberExprAST::NumberExprAST(const BigInt &value, const string &suffix, size_t pos_)
  : ExprAST(pos_), value(value), suffix(suffix) {}

void NumberExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Number: " << value << suffix;
  dumpType(os);
}

unique_ptr<ExprAST> NumberExprAST::clone() const {
  auto copy = make_unique<NumberExprAST>(value, suffix, pos);
  copyBase(*copy);
  return copy;
}

BoolExprAST::BoolExprAST(bool value, size_t pos_) : ExprAST(pos_), value(value) {}

void BoolExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Bool: " << (value ? "true" : "false");
  dumpType(os);
}

unique_ptr<ExprAST> BoolExprAST::clone() const {
  auto copy = make_unique<BoolExprAST>(value, pos);
  copyBase(*copy);
  return copy;
}

StringExprAST::StringExprAST(const string &s, size_t pos_) : ExprAST(pos_), str(s) {}

void StringExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "String: \"" << escapeString(str) << "\"";
  dumpType(os);
}

unique_ptr<ExprAST> StringExprAST::clone() const {
  auto copy = make_unique<StringExprAST>(str, pos);
  copyBase(*copy);
  return copy;
}

BytesExprAST::BytesExprAST(const string &b, size_t pos_) : ExprAST(pos_), bytes(b) {}

void BytesExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Bytes: b\"" << escapeString(bytes) << "\"";
  dumpType(os);
}

unique_ptr<ExprAST> BytesExprAST::clone() const {
  auto copy = make_unique<BytesExprAST>(bytes, pos);
  copyBase(*copy);
  return copy;
}

VariableExprAST::VariableExprAST(const string &name, size_t pos_) : ExprAST(pos_), name(name) {}

void VariableExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Variable: " << name;
  dumpType(os);
}

unique_ptr<ExprAST> VariableExprAST::clone() const {
  auto copy = make_unique<VariableExprAST>(name, pos);
  copyBase(*copy);
  copy->binding = binding;
  return copy;
}

IntrinsicExprAST::IntrinsicExprAST(IntrinsicKind kind, size_t pos_) : ExprAST(pos_), kind(kind) {}

void IntrinsicExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Intrinsic: " << intrinsicName(kind);
  dumpType(os);
}

unique_ptr<ExprAST> IntrinsicExprAST::clone() const {
  auto copy = make_unique<IntrinsicExprAST>(kind, pos);
  copyBase(*copy);
  return copy;
}

UnaryExprAST::UnaryExprAST(const string &op, size_t pos_, unique_ptr<ExprAST> expr)
  : ExprAST(pos_), op(op), expr(std::move(expr)) {}

void UnaryExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "UnaryOp: " << op;
  dumpType(os);
  expr->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ExprAST> UnaryExprAST::clone() const {
  auto copy = make_unique<UnaryExprAST>(op, pos, expr->clone());
  copyBase(*copy);
  return copy;
}

BinaryExprAST::BinaryExprAST(const string &op, size_t pos_, unique_ptr<ExprAST> lhs, unique_ptr<ExprAST> rhs)
  : ExprAST(pos_), op(op), left_expr(std::move(lhs)), right_expr(std::move(rhs)) {}

void BinaryExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "BinaryOp: " << op;
  dumpType(os);
  left_expr->dump(os, indent + DumpSpaceNumber);
  right_expr->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ExprAST> BinaryExprAST::clone() const {
  auto copy = make_unique<BinaryExprAST>(op, pos, left_expr->clone(), right_expr->clone());
  copyBase(*copy);
  return copy;
}

TernaryExprAST::TernaryExprAST(unique_ptr<ExprAST> c, unique_ptr<ExprAST> t, unique_ptr<ExprAST> e, size_t pos_)
  : ExprAST(pos_), cond(std::move(c)), then_expr(std::move(t)), else_expr(std::move(e)) {}

void TernaryExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Ternary:";
  dumpType(os);
  cond->dump(os, indent + DumpSpaceNumber);
  then_expr->dump(os, indent + DumpSpaceNumber);
  else_expr->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ExprAST> TernaryExprAST::clone() const {
  auto copy = make_unique<TernaryExprAST>(cond->clone(), then_expr->clone(), else_expr->clone(), pos);
  copyBase(*copy);
  return copy;
}

CallExprAST::CallExprAST(const string &call, size_t pos_, std::vector<unique_ptr<ExprAST> > args)
  : ExprAST(pos_), call(call), args(std::move(args)), object_expr(nullptr) {}

CallExprAST::CallExprAST(const string &method, size_t pos_, unique_ptr<ExprAST> obj,
                         std::vector<unique_ptr<ExprAST> > args)
  : ExprAST(pos_), call(method), args(std::move(args)), object_expr(std::move(obj)) {}

void CallExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  if (object_expr) {
    os << "MethodCall: " << call;
    dumpType(os);
    dump_space(os, indent + DumpSpaceNumber);
    os << "Object:" << std::endl;
    object_expr->dump(os, indent + DumpSpaceNumber * 2);
  } else {
    os << "Call: " << call;
    dumpType(os);
  }
  for (const auto &arg: args) {
    arg->dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<ExprAST> CallExprAST::clone() const {
  unique_ptr<CallExprAST> copy;
  if (object_expr) {
    copy = make_unique<CallExprAST>(call, pos, object_expr->clone(), cloneExprs(args));
  } else {
    copy = make_unique<CallExprAST>(call, pos, cloneExprs(args));
  }
  copyBase(*copy);
  copy->target = target;
  return copy;
}

ArrayIndexExprAST::ArrayIndexExprAST(size_t pos_, unique_ptr<ExprAST> arr, unique_ptr<ExprAST> idx)
  : ExprAST(pos_), array_expr(std::move(arr)), index_expr(std::move(idx)) {}

void ArrayIndexExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Index:";
  dumpType(os);
  array_expr->dump(os, indent + DumpSpaceNumber);
  index_expr->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ExprAST> ArrayIndexExprAST::clone() const {
  auto copy = make_unique<ArrayIndexExprAST>(pos, array_expr->clone(), index_expr->clone());
  copyBase(*copy);
  return copy;
}

MemberAccessExprAST::MemberAccessExprAST(size_t pos_, unique_ptr<ExprAST> obj, const string &member)
  : ExprAST(pos_), struct_expr(std::move(obj)), member_name(member) {}

void MemberAccessExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Member: ." << member_name;
  dumpType(os);
  struct_expr->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ExprAST> MemberAccessExprAST::clone() const {
  auto copy = make_unique<MemberAccessExprAST>(pos, struct_expr->clone(), member_name);
  copyBase(*copy);
  return copy;
}

StructExprAST::StructExprAST(const string &name, std::vector<std::pair<std::string, unique_ptr<ExprAST> > > fields,
                             size_t pos_)
  : ExprAST(pos_), name(name), fields(std::move(fields)) {}

void StructExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "StructLiteral: " << name;
  dumpType(os);
  for (const auto &f: fields) {
    dump_space(os, indent + DumpSpaceNumber);
    os << f.first << ":" << std::endl;
    f.second->dump(os, indent + DumpSpaceNumber * 2);
  }
}

unique_ptr<ExprAST> StructExprAST::clone() const {
  std::vector<std::pair<std::string, unique_ptr<ExprAST> > > copied;
  for (const auto &f: fields) {
    copied.emplace_back(f.first, f.second->clone());
  }
  auto copy = make_unique<StructExprAST>(name, std::move(copied), pos);
  copyBase(*copy);
  return copy;
}

LambdaExprAST::LambdaExprAST(std::vector<string> params, unique_ptr<ExprAST> body, size_t pos_)
  : ExprAST(pos_), params(std::move(params)), body(std::move(body)) {}

void LambdaExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Lambda: |";
  for (size_t i = 0; i < params.size(); ++i) {
    if (i > 0) os << ", ";
    os << params[i];
  }
  os << "|";
  dumpType(os);
  body->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ExprAST> LambdaExprAST::clone() const {
  auto copy = make_unique<LambdaExprAST>(params, body->clone(), pos);
  copyBase(*copy);
  copy->param_types = param_types;
  return copy;
}

CastExprAST::CastExprAST(unique_ptr<ExprAST> expr, unique_ptr<TypeAST> target, size_t pos_)
  : ExprAST(pos_), expr(std::move(expr)), target_type(std::move(target)) {}

void CastExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Cast: as " << target_type->toString();
  dumpType(os);
  expr->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ExprAST> CastExprAST::clone() const {
  auto copy = make_unique<CastExprAST>(expr->clone(), target_type->clone(), pos);
  copyBase(*copy);
  return copy;
}

OptionExprAST::OptionExprAST(unique_ptr<ExprAST> value, size_t pos_) : ExprAST(pos_), value(std::move(value)) {}

void OptionExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << (value ? "Some" : "None");
  dumpType(os);
  if (value) {
    value->dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<ExprAST> OptionExprAST::clone() const {
  auto copy = make_unique<OptionExprAST>(cloneExpr(value), pos);
  copyBase(*copy);
  return copy;
}

PatternAST::PatternAST(unique_ptr<ExprAST> literal, size_t pos_) : pos(pos_), literal(std::move(literal)) {}

void PatternAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  if (!literal) {
    os << "Pattern: _" << std::endl;
    return;
  }
  os << "Pattern:" << std::endl;
  literal->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<PatternAST> PatternAST::clone() const {
  return make_unique<PatternAST>(cloneExpr(literal), pos);
}

MatchExprAST::MatchExprAST(unique_ptr<ExprAST> scrutinee, std::vector<MatchExprArm> arms, size_t pos_)
  : ExprAST(pos_), scrutinee(std::move(scrutinee)), arms(std::move(arms)) {}

void MatchExprAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "MatchExpr:";
  dumpType(os);
  scrutinee->dump(os, indent + DumpSpaceNumber);
  for (const auto &arm: arms) {
    arm.pattern->dump(os, indent + DumpSpaceNumber);
    arm.value->dump(os, indent + DumpSpaceNumber * 2);
  }
}

unique_ptr<ExprAST> MatchExprAST::clone() const {
  std::vector<MatchExprArm> copied;
  for (const auto &arm: arms) {
    copied.push_back(MatchExprArm{arm.pattern->clone(), arm.value->clone()});
  }
  auto copy = make_unique<MatchExprAST>(scrutinee->clone(), std::move(copied), pos);
  copyBase(*copy);
  return copy;
}

//===----------------------------------------------------------------------===//
// 语句
//===----------------------------------------------------------------------===//

StmtAST::StmtAST(size_t pos_) : pos(pos_), end_pos(pos_) {}

#define COPY_STMT_SPAN(copy) \
  (copy)->end_pos = end_pos

ExprStmtAST::ExprStmtAST(unique_ptr<ExprAST> expr, size_t pos_) : StmtAST(pos_), expr(std::move(expr)) {}

void ExprStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "ExprStmt:" << std::endl;
  expr->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<StmtAST> ExprStmtAST::clone() const {
  auto copy = make_unique<ExprStmtAST>(expr->clone(), pos);
  COPY_STMT_SPAN(copy);
  return copy;
}

LetStmtAST::LetStmtAST(const string &name, bool is_mut, unique_ptr<TypeAST> type, unique_ptr<ExprAST> value,
                       size_t pos_)
  : StmtAST(pos_), name(name), is_mut(is_mut), declared_type(std::move(type)), value(std::move(value)) {}

void LetStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Let" << (is_mut ? " mut " : " ") << name;
  if (resolved_type) {
    os << " : " << resolved_type->toString();
  } else if (declared_type) {
    os << " : " << declared_type->toString();
  }
  os << std::endl;
  value->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<StmtAST> LetStmtAST::clone() const {
  auto copy = make_unique<LetStmtAST>(name, is_mut, cloneType(declared_type), value->clone(), pos);
  COPY_STMT_SPAN(copy);
  copy->resolved_type = resolved_type;
  return copy;
}

AssignStmtAST::AssignStmtAST(unique_ptr<ExprAST> lhs, unique_ptr<ExprAST> value, size_t pos_)
  : StmtAST(pos_), lhs_expr(std::move(lhs)), value(std::move(value)) {}

void AssignStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Assign:" << std::endl;
  lhs_expr->dump(os, indent + DumpSpaceNumber);
  value->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<StmtAST> AssignStmtAST::clone() const {
  auto copy = make_unique<AssignStmtAST>(lhs_expr->clone(), value->clone(), pos);
  COPY_STMT_SPAN(copy);
  return copy;
}

BlockStmtAST::BlockStmtAST(std::vector<unique_ptr<StmtAST> > stmts, size_t pos_)
  : StmtAST(pos_), statements(std::move(stmts)) {}

void BlockStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Block:" << std::endl;
  for (const auto &stmt: statements) {
    stmt->dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<StmtAST> BlockStmtAST::clone() const {
  return cloneBlock();
}

unique_ptr<BlockStmtAST> BlockStmtAST::cloneBlock() const {
  std::vector<unique_ptr<StmtAST> > copied;
  copied.reserve(statements.size());
  for (const auto &stmt: statements) {
    copied.push_back(stmt->clone());
  }
  auto copy = make_unique<BlockStmtAST>(std::move(copied), pos);
  COPY_STMT_SPAN(copy);
  return copy;
}

IfStmtAST::IfStmtAST(unique_ptr<ExprAST> cond, unique_ptr<BlockStmtAST> then_branch, unique_ptr<StmtAST> else_branch,
                     size_t pos_)
  : StmtAST(pos_), cond(std::move(cond)), then_branch(std::move(then_branch)), else_branch(std::move(else_branch)) {}

void IfStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "If:" << std::endl;
  cond->dump(os, indent + DumpSpaceNumber);
  then_branch->dump(os, indent + DumpSpaceNumber);
  if (else_branch) {
    dump_space(os, indent);
    os << "Else:" << std::endl;
    else_branch->dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<StmtAST> IfStmtAST::clone() const {
  auto copy = make_unique<IfStmtAST>(cond->clone(), then_branch->cloneBlock(),
                                     else_branch ? else_branch->clone() : nullptr, pos);
  COPY_STMT_SPAN(copy);
  return copy;
}

WhileStmtAST::WhileStmtAST(unique_ptr<ExprAST> cond, unique_ptr<BlockStmtAST> body, size_t pos_)
  : StmtAST(pos_), cond(std::move(cond)), body(std::move(body)) {}

void WhileStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "While:" << std::endl;
  cond->dump(os, indent + DumpSpaceNumber);
  body->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<StmtAST> WhileStmtAST::clone() const {
  auto copy = make_unique<WhileStmtAST>(cond->clone(), body->cloneBlock(), pos);
  COPY_STMT_SPAN(copy);
  return copy;
}

ForStmtAST::ForStmtAST(const string &var, unique_ptr<ExprAST> iter, unique_ptr<ExprAST> end,
                       unique_ptr<BlockStmtAST> body, size_t pos_)
  : StmtAST(pos_), var_name(var), iter_expr(std::move(iter)), range_end(std::move(end)), body(std::move(body)) {}

void ForStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << (range_end ? "ForRange: " : "ForEach: ") << var_name;
  if (var_type) {
    os << " : " << var_type->toString();
  }
  os << std::endl;
  iter_expr->dump(os, indent + DumpSpaceNumber);
  if (range_end) {
    range_end->dump(os, indent + DumpSpaceNumber);
  }
  body->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<StmtAST> ForStmtAST::clone() const {
  auto copy = make_unique<ForStmtAST>(var_name, iter_expr->clone(), cloneExpr(range_end), body->cloneBlock(), pos);
  COPY_STMT_SPAN(copy);
  copy->var_type = var_type;
  return copy;
}

MatchStmtAST::MatchStmtAST(unique_ptr<ExprAST> scrutinee, std::vector<MatchStmtArm> arms, size_t pos_)
  : StmtAST(pos_), scrutinee(std::move(scrutinee)), arms(std::move(arms)) {}

void MatchStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Match:" << std::endl;
  scrutinee->dump(os, indent + DumpSpaceNumber);
  for (const auto &arm: arms) {
    arm.pattern->dump(os, indent + DumpSpaceNumber);
    arm.body->dump(os, indent + DumpSpaceNumber * 2);
  }
}

unique_ptr<StmtAST> MatchStmtAST::clone() const {
  std::vector<MatchStmtArm> copied;
  for (const auto &arm: arms) {
    copied.push_back(MatchStmtArm{arm.pattern->clone(), arm.body->cloneBlock()});
  }
  auto copy = make_unique<MatchStmtAST>(scrutinee->clone(), std::move(copied), pos);
  COPY_STMT_SPAN(copy);
  return copy;
}

RequireStmtAST::RequireStmtAST(unique_ptr<ExprAST> cond, const string &message, size_t pos_)
  : StmtAST(pos_), cond(std::move(cond)), message(message) {}

void RequireStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Require";
  if (!message.empty()) {
    os << ": \"" << escapeString(message) << "\"";
  }
  os << std::endl;
  cond->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<StmtAST> RequireStmtAST::clone() const {
  auto copy = make_unique<RequireStmtAST>(cond->clone(), message, pos);
  COPY_STMT_SPAN(copy);
  return copy;
}

EmitStmtAST::EmitStmtAST(const string &event, std::vector<unique_ptr<ExprAST>> args, size_t pos_)
  : StmtAST(pos_), event(event), args(std::move(args)) {}

void EmitStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Emit: " << event << std::endl;
  for (const auto &arg: args) {
    arg->dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<StmtAST> EmitStmtAST::clone() const {
  auto copy = make_unique<EmitStmtAST>(event, cloneExprs(args), pos);
  COPY_STMT_SPAN(copy);
  return copy;
}

ReturnStmtAST::ReturnStmtAST(size_t pos_, unique_ptr<ExprAST> value) : StmtAST(pos_), value(std::move(value)) {}

void ReturnStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Return" << std::endl;
  if (value) {
    value->dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<StmtAST> ReturnStmtAST::clone() const {
  auto copy = make_unique<ReturnStmtAST>(pos, cloneExpr(value));
  COPY_STMT_SPAN(copy);
  return copy;
}

PlaceholderStmtAST::PlaceholderStmtAST(size_t pos_) : StmtAST(pos_) {}

void PlaceholderStmtAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Placeholder" << std::endl;
}

unique_ptr<StmtAST> PlaceholderStmtAST::clone() const {
  auto copy = make_unique<PlaceholderStmtAST>(pos);
  COPY_STMT_SPAN(copy);
  return copy;
}

#undef COPY_STMT_SPAN

//===----------------------------------------------------------------------===//
// 声明
//===----------------------------------------------------------------------===//

ParamAST ParamAST::clone() const {
  ParamAST copy;
  copy.name = name;
  copy.type = cloneType(type);
  copy.resolved = resolved;
  copy.pos = pos;
  return copy;
}

void ParamAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << name << ": " << (resolved ? resolved->toString() : type ? type->toString() : "?") << std::endl;
}

StateVarAST::StateVarAST(const string &name, unique_ptr<TypeAST> type, unique_ptr<ExprAST> init, size_t pos_)
  : name(name), type(std::move(type)), default_value(std::move(init)), pos(pos_) {}

void StateVarAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "StateVar: " << name << " : " << (resolved ? resolved->toString() : type->toString()) << std::endl;
  if (default_value) {
    default_value->dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<StateVarAST> StateVarAST::clone() const {
  auto copy = make_unique<StateVarAST>(name, type->clone(), cloneExpr(default_value), pos);
  copy->resolved = resolved;
  return copy;
}

StructDeclAST::StructDeclAST(const string &name, std::vector<ParamAST> fields, size_t pos_)
  : name(name), fields(std::move(fields)), pos(pos_) {}

void StructDeclAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Struct: " << name << std::endl;
  for (const auto &f: fields) {
    f.dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<StructDeclAST> StructDeclAST::clone() const {
  auto copy = make_unique<StructDeclAST>(name, cloneParams(fields), pos);
  copy->resolved = resolved;
  return copy;
}

EventDeclAST::EventDeclAST(const string &name, std::vector<ParamAST> fields, size_t pos_)
  : name(name), fields(std::move(fields)), pos(pos_) {}

void EventDeclAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Event: " << name << std::endl;
  for (const auto &f: fields) {
    f.dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<EventDeclAST> EventDeclAST::clone() const {
  return make_unique<EventDeclAST>(name, cloneParams(fields), pos);
}

ModifierDeclAST::ModifierDeclAST(const string &name, std::vector<ParamAST> params, unique_ptr<BlockStmtAST> body,
                                 size_t pos_)
  : name(name), params(std::move(params)), body(std::move(body)), pos(pos_) {}

void ModifierDeclAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Modifier: " << name << std::endl;
  dumpParams(os, indent + DumpSpaceNumber, "Params", params);
  body->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ModifierDeclAST> ModifierDeclAST::clone() const {
  return make_unique<ModifierDeclAST>(name, cloneParams(params), body->cloneBlock(), pos);
}

ModifierUseAST ModifierUseAST::clone() const {
  ModifierUseAST copy;
  copy.name = name;
  copy.args = cloneExprs(args);
  copy.pos = pos;
  return copy;
}

ConstDeclAST::ConstDeclAST(const string &name, unique_ptr<TypeAST> type, unique_ptr<ExprAST> value, size_t pos_)
  : name(name), type(std::move(type)), value(std::move(value)), pos(pos_) {}

void ConstDeclAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Const: " << name << " : " << (resolved ? resolved->toString() : type->toString()) << std::endl;
  value->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ConstDeclAST> ConstDeclAST::clone() const {
  auto copy = make_unique<ConstDeclAST>(name, type->clone(), value->clone(), pos);
  copy->resolved = resolved;
  return copy;
}

FnDeclAST::FnDeclAST(const string &name, Visibility visibility, std::vector<ParamAST> params,
                     unique_ptr<TypeAST> ret, std::vector<ModifierUseAST> modifiers, unique_ptr<BlockStmtAST> body,
                     size_t pos_)
  : name(name), visibility(visibility), params(std::move(params)), return_type(std::move(ret)),
    modifiers(std::move(modifiers)), body(std::move(body)), pos(pos_) {}

void FnDeclAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Function: " << (isPublic() ? "public " : "private ") << name;
  if (resolved_return && !resolved_return->isVoid()) {
    os << " -> " << resolved_return->toString();
  } else if (return_type) {
    os << " -> " << return_type->toString();
  }
  os << std::endl;
  dumpParams(os, indent + DumpSpaceNumber, "Params", params);
  for (const auto &m: modifiers) {
    dump_space(os, indent + DumpSpaceNumber);
    os << "Modifier: " << m.name << std::endl;
    for (const auto &arg: m.args) {
      arg->dump(os, indent + DumpSpaceNumber * 2);
    }
  }
  if (body) {
    body->dump(os, indent + DumpSpaceNumber);
  }
}

unique_ptr<FnDeclAST> FnDeclAST::clone() const {
  std::vector<ModifierUseAST> mods;
  for (const auto &m: modifiers) {
    mods.push_back(m.clone());
  }
  auto copy = make_unique<FnDeclAST>(name, visibility, cloneParams(params), cloneType(return_type), std::move(mods),
                                     cloneBlock(body), pos);
  copy->resolved_return = resolved_return;
  return copy;
}

InterfaceDeclAST::InterfaceDeclAST(const string &name, std::vector<unique_ptr<FnDeclAST>> functions, size_t pos_)
  : name(name), functions(std::move(functions)), pos(pos_) {}

void InterfaceDeclAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Interface: " << name << std::endl;
  for (const auto &fn: functions) {
    fn->dump(os, indent + DumpSpaceNumber);
  }
}

ContractAST::ContractAST(const string &name, size_t pos_) : name(name), pos(pos_) {}

void ContractAST::dump(std::ostream &os, int indent) const {
  dump_space(os, indent);
  os << "Contract: " << name << std::endl;
  for (const auto &s: state) s->dump(os, indent + DumpSpaceNumber);
  for (const auto &s: structs) s->dump(os, indent + DumpSpaceNumber);
  for (const auto &e: events) e->dump(os, indent + DumpSpaceNumber);
  for (const auto &c: consts) c->dump(os, indent + DumpSpaceNumber);
  for (const auto &m: modifiers) m->dump(os, indent + DumpSpaceNumber);
  for (const auto &f: functions) f->dump(os, indent + DumpSpaceNumber);
}

unique_ptr<ContractAST> ContractAST::clone() const {
  auto copy = make_unique<ContractAST>(name, pos);
  for (const auto &s: state) copy->state.push_back(s->clone());
  for (const auto &s: structs) copy->structs.push_back(s->clone());
  for (const auto &e: events) copy->events.push_back(e->clone());
  for (const auto &m: modifiers) copy->modifiers.push_back(m->clone());
  for (const auto &c: consts) copy->consts.push_back(c->clone());
  for (const auto &f: functions) copy->functions.push_back(f->clone());
  return copy;
}

const StateVarAST *ContractAST::findState(const string &n) const {
  for (const auto &s: state) {
    if (s->name == n) return s.get();
  }
  return nullptr;
}

const FnDeclAST *ContractAST::findFunction(const string &n) const {
  for (const auto &f: functions) {
    if (f->name == n) return f.get();
  }
  return nullptr;
}

const EventDeclAST *ContractAST::findEvent(const string &n) const {
  for (const auto &e: events) {
    if (e->name == n) return e.get();
  }
  return nullptr;
}

const ModifierDeclAST *ContractAST::findModifier(const string &n) const {
  for (const auto &m: modifiers) {
    if (m->name == n) return m.get();
  }
  return nullptr;
}

const ConstDeclAST *ContractAST::findConst(const string &n) const {
  for (const auto &c: consts) {
    if (c->name == n) return c.get();
  }
  return nullptr;
}

void SourceUnitAST::dump(std::ostream &os, int indent) const {
  for (const auto &s: structs) s->dump(os, indent);
  for (const auto &i: interfaces) i->dump(os, indent);
  for (const auto &c: contracts) c->dump(os, indent);
}

// 合约内的结构体优先于顶层结构体
const StructDeclAST *SourceUnitAST::findStruct(const string &name, const ContractAST *contract) const {
  if (contract) {
    for (const auto &s: contract->structs) {
      if (s->name == name) return s.get();
    }
  }
  for (const auto &s: structs) {
    if (s->name == name) return s.get();
  }
  return nullptr;
}

//===----------------------------------------------------------------------===//
// 遍历
//===----------------------------------------------------------------------===//

void visitExpr(const ExprAST *expr, const ExprVisitor &onExpr) {
  if (!expr) return;
  onExpr(expr);
  if (auto unary = dynamic_cast<const UnaryExprAST *>(expr)) {
    visitExpr(unary->expr.get(), onExpr);
  } else if (auto binary = dynamic_cast<const BinaryExprAST *>(expr)) {
    visitExpr(binary->left_expr.get(), onExpr);
    visitExpr(binary->right_expr.get(), onExpr);
  } else if (auto ternary = dynamic_cast<const TernaryExprAST *>(expr)) {
    visitExpr(ternary->cond.get(), onExpr);
    visitExpr(ternary->then_expr.get(), onExpr);
    visitExpr(ternary->else_expr.get(), onExpr);
  } else if (auto call = dynamic_cast<const CallExprAST *>(expr)) {
    visitExpr(call->object_expr.get(), onExpr);
    for (const auto &arg: call->args) visitExpr(arg.get(), onExpr);
  } else if (auto index = dynamic_cast<const ArrayIndexExprAST *>(expr)) {
    visitExpr(index->array_expr.get(), onExpr);
    visitExpr(index->index_expr.get(), onExpr);
  } else if (auto member = dynamic_cast<const MemberAccessExprAST *>(expr)) {
    visitExpr(member->struct_expr.get(), onExpr);
  } else if (auto lit = dynamic_cast<const StructExprAST *>(expr)) {
    for (const auto &f: lit->fields) visitExpr(f.second.get(), onExpr);
  } else if (auto lambda = dynamic_cast<const LambdaExprAST *>(expr)) {
    visitExpr(lambda->body.get(), onExpr);
  } else if (auto cast = dynamic_cast<const CastExprAST *>(expr)) {
    visitExpr(cast->expr.get(), onExpr);
  } else if (auto option = dynamic_cast<const OptionExprAST *>(expr)) {
    visitExpr(option->value.get(), onExpr);
  } else if (auto match = dynamic_cast<const MatchExprAST *>(expr)) {
    visitExpr(match->scrutinee.get(), onExpr);
    for (const auto &arm: match->arms) {
      visitExpr(arm.pattern->literal.get(), onExpr);
      visitExpr(arm.value.get(), onExpr);
    }
  }
}

void visitStmt(const StmtAST *stmt, const StmtVisitor &onStmt, const ExprVisitor &onExpr) {
  if (!stmt) return;
  onStmt(stmt);
  if (auto block = dynamic_cast<const BlockStmtAST *>(stmt)) {
    for (const auto &s: block->statements) visitStmt(s.get(), onStmt, onExpr);
  } else if (auto let = dynamic_cast<const LetStmtAST *>(stmt)) {
    visitExpr(let->value.get(), onExpr);
  } else if (auto assign = dynamic_cast<const AssignStmtAST *>(stmt)) {
    visitExpr(assign->lhs_expr.get(), onExpr);
    visitExpr(assign->value.get(), onExpr);
  } else if (auto es = dynamic_cast<const ExprStmtAST *>(stmt)) {
    visitExpr(es->expr.get(), onExpr);
  } else if (auto ifs = dynamic_cast<const IfStmtAST *>(stmt)) {
    visitExpr(ifs->cond.get(), onExpr);
    visitStmt(ifs->then_branch.get(), onStmt, onExpr);
    visitStmt(ifs->else_branch.get(), onStmt, onExpr);
  } else if (auto ws = dynamic_cast<const WhileStmtAST *>(stmt)) {
    visitExpr(ws->cond.get(), onExpr);
    visitStmt(ws->body.get(), onStmt, onExpr);
  } else if (auto fs = dynamic_cast<const ForStmtAST *>(stmt)) {
    visitExpr(fs->iter_expr.get(), onExpr);
    visitExpr(fs->range_end.get(), onExpr);
    visitStmt(fs->body.get(), onStmt, onExpr);
  } else if (auto ms = dynamic_cast<const MatchStmtAST *>(stmt)) {
    visitExpr(ms->scrutinee.get(), onExpr);
    for (const auto &arm: ms->arms) {
      visitExpr(arm.pattern->literal.get(), onExpr);
      visitStmt(arm.body.get(), onStmt, onExpr);
    }
  } else if (auto rs = dynamic_cast<const RequireStmtAST *>(stmt)) {
    visitExpr(rs->cond.get(), onExpr);
  } else if (auto em = dynamic_cast<const EmitStmtAST *>(stmt)) {
    for (const auto &arg: em->args) visitExpr(arg.get(), onExpr);
  } else if (auto ret = dynamic_cast<const ReturnStmtAST *>(stmt)) {
    visitExpr(ret->value.get(), onExpr);
  }
}

void visitContract(const ContractAST &contract, const StmtVisitor &onStmt, const ExprVisitor &onExpr) {
  for (const auto &s: contract.state) visitExpr(s->default_value.get(), onExpr);
  for (const auto &c: contract.consts) visitExpr(c->value.get(), onExpr);
  for (const auto &m: contract.modifiers) visitStmt(m->body.get(), onStmt, onExpr);
  for (const auto &f: contract.functions) {
    for (const auto &m: f->modifiers) {
      for (const auto &arg: m.args) visitExpr(arg.get(), onExpr);
    }
    visitStmt(f->body.get(), onStmt, onExpr);
  }
}

bool verifyStrictTree(const ContractAST &contract) {
  std::unordered_set<const void *> seen;
  bool ok = true;
  visitContract(contract,
                [&](const StmtAST *s) {
                  if (!seen.insert(s).second) ok = false;
                },
                [&](const ExprAST *e) {
                  if (!seen.insert(e).second) ok = false;
                });
  return ok;
}

string dumpToString(const ContractAST &contract) {
  std::ostringstream oss;
  contract.dump(oss, 0);
  return oss.str();
}

string dumpToString(const StmtAST &stmt) {
  std::ostringstream oss;
  stmt.dump(oss, 0);
  return oss.str();
}

string dumpToString(const ExprAST &expr) {
  std::ostringstream oss;
  expr.dump(oss, 0);
  return oss.str();
}

bool isLiteral(const ExprAST *expr) {
  return dynamic_cast<const NumberExprAST *>(expr) || dynamic_cast<const BoolExprAST *>(expr) ||
         dynamic_cast<const StringExprAST *>(expr) || dynamic_cast<const BytesExprAST *>(expr);
}

bool hasSideEffects(const ExprAST *expr) {
  bool effects = false;
  visitExpr(expr, [&](const ExprAST *e) {
    // 函数调用可能修改状态或中止；除法可能因除零而中止
    if (dynamic_cast<const CallExprAST *>(e)) {
      effects = true;
    } else if (auto bin = dynamic_cast<const BinaryExprAST *>(e)) {
      if (bin->op == "/" || bin->op == "%" || bin->op == "+" || bin->op == "-" || bin->op == "*") {
        // 算术可能溢出而中止，删除它会改变中止行为
        effects = true;
      }
    } else if (dynamic_cast<const CastExprAST *>(e) || dynamic_cast<const ArrayIndexExprAST *>(e)) {
      effects = true;
    } else if (auto un = dynamic_cast<const UnaryExprAST *>(e)) {
      if (un->op == "-") effects = true;
    }
  });
  return effects;
}
