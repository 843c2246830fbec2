#include "optimizer.h"
#include <utility>

namespace {

const NumberExprAST *asNumber(const ExprAST *expr) {
  return dynamic_cast<const NumberExprAST *>(expr);
}

const BoolExprAST *asBool(const ExprAST *expr) {
  return dynamic_cast<const BoolExprAST *>(expr);
}

bool isNumberValue(const ExprAST *expr, int value) {
  auto *number = asNumber(expr);
  return number && number->value == value;
}

bool isBoolValue(const ExprAST *expr, bool value) {
  auto *b = asBool(expr);
  return b && b->value == value;
}

// 只有数值与布尔字面量参与常量传播
bool isPropagatable(const ExprAST *expr) {
  return asNumber(expr) || asBool(expr);
}

unique_ptr<ExprAST> makeNumber(const BigInt &value, const TypeRef &type, const ExprAST *origin) {
  auto number = make_unique<NumberExprAST>(value, "", origin->pos);
  number->end_pos = origin->end_pos;
  number->type = type;
  return number;
}

unique_ptr<ExprAST> makeBool(bool value, const ExprAST *origin) {
  auto b = make_unique<BoolExprAST>(value, origin->pos);
  b->end_pos = origin->end_pos;
  b->type = TypeFactory::getBool();
  return b;
}

// 两个字面量是否相等；类型不同或不是字面量时返回 false
bool literalEquals(const ExprAST *a, const ExprAST *b) {
  if (asNumber(a) && asNumber(b)) {
    return asNumber(a)->value == asNumber(b)->value;
  }
  if (asBool(a) && asBool(b)) {
    return asBool(a)->value == asBool(b)->value;
  }
  auto *sa = dynamic_cast<const StringExprAST *>(a);
  auto *sb = dynamic_cast<const StringExprAST *>(b);
  if (sa && sb) {
    return sa->str == sb->str;
  }
  auto *ba = dynamic_cast<const BytesExprAST *>(a);
  auto *bb = dynamic_cast<const BytesExprAST *>(b);
  return ba && bb && ba->bytes == bb->bytes;
}

bool guaranteesReturn(const StmtAST *stmt);

bool blockReturns(const BlockStmtAST *block) {
  if (!block) {
    return false;
  }
  for (const auto &s: block->statements) {
    if (guaranteesReturn(s.get())) {
      return true;
    }
  }
  return false;
}

bool guaranteesReturn(const StmtAST *stmt) {
  if (dynamic_cast<const ReturnStmtAST *>(stmt)) {
    return true;
  }
  if (auto *block = dynamic_cast<const BlockStmtAST *>(stmt)) {
    return blockReturns(block);
  }
  if (auto *ifStmt = dynamic_cast<const IfStmtAST *>(stmt)) {
    return ifStmt->else_branch && blockReturns(ifStmt->then_branch.get()) &&
           guaranteesReturn(ifStmt->else_branch.get());
  }
  if (auto *matchStmt = dynamic_cast<const MatchStmtAST *>(stmt)) {
    if (matchStmt->arms.empty() || !matchStmt->arms.back().pattern->isWildcard()) {
      return false;
    }
    for (const auto &arm: matchStmt->arms) {
      if (!blockReturns(arm.body.get())) {
        return false;
      }
    }
    return true;
  }
  return false;
}

bool declaresLocals(const BlockStmtAST *block) {
  for (const auto &s: block->statements) {
    if (dynamic_cast<const LetStmtAST *>(s.get())) {
      return true;
    }
  }
  return false;
}

const VariableExprAST *assignmentRoot(const ExprAST *lhs) {
  const ExprAST *cursor = lhs;
  while (true) {
    if (auto *member = dynamic_cast<const MemberAccessExprAST *>(cursor)) {
      cursor = member->struct_expr.get();
    } else if (auto *index = dynamic_cast<const ArrayIndexExprAST *>(cursor)) {
      cursor = index->array_expr.get();
    } else {
      break;
    }
  }
  return dynamic_cast<const VariableExprAST *>(cursor);
}

bool mentions(const StmtAST *stmt, const std::string &name) {
  bool found = false;
  visitStmt(stmt, [](const StmtAST *) {}, [&](const ExprAST *e) {
    auto *var = dynamic_cast<const VariableExprAST *>(e);
    if (var && var->name == name) {
      found = true;
    }
  });
  return found;
}

} // namespace

void OptimizerStats::merge(const OptimizerStats &other) {
  constantFolds += other.constantFolds;
  algebraicSimplifications += other.algebraicSimplifications;
  deadCodeEliminations += other.deadCodeEliminations;
  constantPropagations += other.constantPropagations;
  iterations += other.iterations;
}

//===----------------------------------------------------------------------===//
// 驱动
//===----------------------------------------------------------------------===//

unique_ptr<ContractAST> Optimizer::optimize(const ContractAST &contract) {
  stats_ = OptimizerStats();
  auto result = contract.clone();
  int iteration = 0;
  while (true) {
    ++iteration;
    stats_.iterations = iteration;
    if (!runPass(*result)) {
      break;
    }
    if (iteration >= kMaxOptimizerIterations) {
      throw InternalCompilerError("optimizer did not reach a fixed point after " +
                                  std::to_string(kMaxOptimizerIterations) + " iterations in contract '" +
                                  contract.name + "'", SourceSpan(contract.pos, contract.pos));
    }
  }
  if (!verifyStrictTree(*result)) {
    throw InternalCompilerError("optimized tree of contract '" + contract.name + "' shares nodes",
                                SourceSpan(contract.pos, contract.pos));
  }
  return result;
}

bool Optimizer::runPass(ContractAST &contract) {
  changed_ = false;
  contractConsts_.clear();
  scopes_.clear();
  assigned_.clear();

  // 常量按声明顺序处理，后面的常量可以引用前面已经折叠好的常量
  for (auto &c: contract.consts) {
    rewriteExpr(c->value);
    if (isPropagatable(c->value.get())) {
      contractConsts_[c->name] = c->value->clone();
    }
  }
  for (auto &s: contract.state) {
    if (s->default_value) {
      rewriteExpr(s->default_value);
    }
  }
  for (auto &m: contract.modifiers) {
    optimizeBody(m->body.get(), m->params);
  }
  for (auto &fn: contract.functions) {
    scopes_.emplace_back();
    for (const auto &param: fn->params) {
      bind(param.name, nullptr);
    }
    for (auto &use: fn->modifiers) {
      for (auto &arg: use.args) {
        rewriteExpr(arg);
      }
    }
    scopes_.pop_back();
    optimizeBody(fn->body.get(), fn->params);
  }
  return changed_;
}

void Optimizer::optimizeBody(BlockStmtAST *body, const std::vector<ParamAST> &params) {
  if (!body) {
    return;
  }
  assigned_.clear();
  visitStmt(body, [this](const StmtAST *s) {
    if (auto *assign = dynamic_cast<const AssignStmtAST *>(s)) {
      auto *root = assignmentRoot(assign->lhs_expr.get());
      if (root && root->binding == VarBinding::Local) {
        assigned_.insert(root->name);
      }
    }
  }, [](const ExprAST *) {});

  scopes_.emplace_back();
  for (const auto &param: params) {
    bind(param.name, nullptr);
  }
  optimizeBlock(body);
  scopes_.pop_back();
}

void Optimizer::bind(const std::string &name, const ExprAST *literal) {
  if (scopes_.empty()) {
    return;
  }
  scopes_.back()[name] = literal ? literal->clone() : nullptr;
}

//===----------------------------------------------------------------------===//
// 语句
//===----------------------------------------------------------------------===//

void Optimizer::optimizeBlock(BlockStmtAST *block) {
  scopes_.emplace_back();
  std::vector<unique_ptr<StmtAST>> kept;
  bool terminated = false;
  for (auto &stmt: block->statements) {
    if (terminated) {
      // return 之后不可达
      ++stats_.deadCodeEliminations;
      changed_ = true;
      continue;
    }
    if (!optimizeStatement(stmt)) {
      continue;
    }
    auto *nested = dynamic_cast<BlockStmtAST *>(stmt.get());
    if (nested && !declaresLocals(nested)) {
      // 不声明变量的嵌套块可以直接展开
      ++stats_.deadCodeEliminations;
      changed_ = true;
      for (auto &inner: nested->statements) {
        terminated = terminated || guaranteesReturn(inner.get());
        kept.push_back(std::move(inner));
      }
      continue;
    }
    terminated = guaranteesReturn(stmt.get());
    kept.push_back(std::move(stmt));
  }
  block->statements = std::move(kept);
  scopes_.pop_back();
  removeUnusedLiteralLets(block);
}

bool Optimizer::optimizeStatement(unique_ptr<StmtAST> &stmt) {
  if (auto *let = dynamic_cast<LetStmtAST *>(stmt.get())) {
    rewriteExpr(let->value);
    bool propagatable = isPropagatable(let->value.get()) && !(let->is_mut && assigned_.count(let->name));
    bind(let->name, propagatable ? let->value.get() : nullptr);
    return true;
  }
  if (auto *assign = dynamic_cast<AssignStmtAST *>(stmt.get())) {
    rewriteLValue(assign->lhs_expr.get());
    rewriteExpr(assign->value);
    return true;
  }
  if (auto *exprStmt = dynamic_cast<ExprStmtAST *>(stmt.get())) {
    rewriteExpr(exprStmt->expr);
    return true;
  }
  if (auto *block = dynamic_cast<BlockStmtAST *>(stmt.get())) {
    optimizeBlock(block);
    if (block->statements.empty()) {
      ++stats_.deadCodeEliminations;
      changed_ = true;
      return false;
    }
    return true;
  }
  if (auto *ifStmt = dynamic_cast<IfStmtAST *>(stmt.get())) {
    rewriteExpr(ifStmt->cond);
    if (auto *cond = asBool(ifStmt->cond.get())) {
      ++stats_.deadCodeEliminations;
      changed_ = true;
      if (cond->value) {
        stmt = std::move(ifStmt->then_branch);
      } else if (ifStmt->else_branch) {
        stmt = std::move(ifStmt->else_branch);
      } else {
        return false;
      }
      return optimizeStatement(stmt);
    }
    optimizeBlock(ifStmt->then_branch.get());
    if (ifStmt->else_branch && !optimizeStatement(ifStmt->else_branch)) {
      ifStmt->else_branch.reset();
    }
    return true;
  }
  if (auto *whileStmt = dynamic_cast<WhileStmtAST *>(stmt.get())) {
    rewriteExpr(whileStmt->cond);
    if (isBoolValue(whileStmt->cond.get(), false)) {
      ++stats_.deadCodeEliminations;
      changed_ = true;
      return false;
    }
    optimizeBlock(whileStmt->body.get());
    return true;
  }
  if (auto *forStmt = dynamic_cast<ForStmtAST *>(stmt.get())) {
    rewriteExpr(forStmt->iter_expr);
    if (forStmt->range_end) {
      rewriteExpr(forStmt->range_end);
    }
    scopes_.emplace_back();
    bind(forStmt->var_name, nullptr);
    optimizeBlock(forStmt->body.get());
    scopes_.pop_back();
    return true;
  }
  if (auto *matchStmt = dynamic_cast<MatchStmtAST *>(stmt.get())) {
    rewriteExpr(matchStmt->scrutinee);
    if (isLiteral(matchStmt->scrutinee.get())) {
      for (auto &arm: matchStmt->arms) {
        if (arm.pattern->isWildcard() || literalEquals(arm.pattern->literal.get(), matchStmt->scrutinee.get())) {
          ++stats_.deadCodeEliminations;
          changed_ = true;
          stmt = std::move(arm.body);
          return optimizeStatement(stmt);
        }
      }
      // 没有匹配的分支，整个 match 不执行
      ++stats_.deadCodeEliminations;
      changed_ = true;
      return false;
    }
    for (auto &arm: matchStmt->arms) {
      optimizeBlock(arm.body.get());
    }
    return true;
  }
  if (auto *require = dynamic_cast<RequireStmtAST *>(stmt.get())) {
    rewriteExpr(require->cond);
    if (isBoolValue(require->cond.get(), true)) {
      ++stats_.deadCodeEliminations;
      changed_ = true;
      return false;
    }
    return true;
  }
  if (auto *emit = dynamic_cast<EmitStmtAST *>(stmt.get())) {
    for (auto &arg: emit->args) {
      rewriteExpr(arg);
    }
    return true;
  }
  if (auto *ret = dynamic_cast<ReturnStmtAST *>(stmt.get())) {
    if (ret->value) {
      rewriteExpr(ret->value);
    }
    return true;
  }
  return true;
}

// 传播之后不再被引用的字面量 let 可以删除
void Optimizer::removeUnusedLiteralLets(BlockStmtAST *block) {
  auto &stmts = block->statements;
  for (size_t i = 0; i < stmts.size();) {
    auto *let = dynamic_cast<LetStmtAST *>(stmts[i].get());
    if (!let || !isPropagatable(let->value.get())) {
      ++i;
      continue;
    }
    bool referenced = false;
    for (size_t j = i + 1; j < stmts.size() && !referenced; ++j) {
      referenced = mentions(stmts[j].get(), let->name);
    }
    if (referenced) {
      ++i;
      continue;
    }
    ++stats_.deadCodeEliminations;
    changed_ = true;
    stmts.erase(stmts.begin() + static_cast<std::ptrdiff_t>(i));
  }
}

//===----------------------------------------------------------------------===//
// 表达式
//===----------------------------------------------------------------------===//

void Optimizer::replace(unique_ptr<ExprAST> &slot, unique_ptr<ExprAST> replacement, int &counter) {
  if (slot->type && replacement->type && !slot->type->equals(replacement->type)) {
    throw InternalCompilerError("optimizer rewrite changed the type of an expression from " +
                                slot->type->toString() + " to " + replacement->type->toString(),
                                slot->span());
  }
  slot = std::move(replacement);
  ++counter;
  changed_ = true;
}

void Optimizer::rewriteLValue(ExprAST *lhs) {
  if (auto *index = dynamic_cast<ArrayIndexExprAST *>(lhs)) {
    rewriteLValue(index->array_expr.get());
    rewriteExpr(index->index_expr);
  } else if (auto *member = dynamic_cast<MemberAccessExprAST *>(lhs)) {
    rewriteLValue(member->struct_expr.get());
  }
}

void Optimizer::rewriteChildren(ExprAST *expr) {
  if (auto *unary = dynamic_cast<UnaryExprAST *>(expr)) {
    rewriteExpr(unary->expr);
  } else if (auto *binary = dynamic_cast<BinaryExprAST *>(expr)) {
    rewriteExpr(binary->left_expr);
    rewriteExpr(binary->right_expr);
  } else if (auto *ternary = dynamic_cast<TernaryExprAST *>(expr)) {
    rewriteExpr(ternary->cond);
    rewriteExpr(ternary->then_expr);
    rewriteExpr(ternary->else_expr);
  } else if (auto *call = dynamic_cast<CallExprAST *>(expr)) {
    if (call->object_expr) {
      // push 的接收者是左值
      if (call->target == CallTarget::VecPush) {
        rewriteLValue(call->object_expr.get());
      } else {
        rewriteExpr(call->object_expr);
      }
    }
    for (auto &arg: call->args) {
      rewriteExpr(arg);
    }
  } else if (auto *index = dynamic_cast<ArrayIndexExprAST *>(expr)) {
    rewriteExpr(index->array_expr);
    rewriteExpr(index->index_expr);
  } else if (auto *member = dynamic_cast<MemberAccessExprAST *>(expr)) {
    rewriteExpr(member->struct_expr);
  } else if (auto *literal = dynamic_cast<StructExprAST *>(expr)) {
    for (auto &field: literal->fields) {
      rewriteExpr(field.second);
    }
  } else if (auto *lambda = dynamic_cast<LambdaExprAST *>(expr)) {
    scopes_.emplace_back();
    for (const auto &param: lambda->params) {
      bind(param, nullptr);
    }
    rewriteExpr(lambda->body);
    scopes_.pop_back();
  } else if (auto *cast = dynamic_cast<CastExprAST *>(expr)) {
    rewriteExpr(cast->expr);
  } else if (auto *option = dynamic_cast<OptionExprAST *>(expr)) {
    if (option->value) {
      rewriteExpr(option->value);
    }
  } else if (auto *match = dynamic_cast<MatchExprAST *>(expr)) {
    rewriteExpr(match->scrutinee);
    for (auto &arm: match->arms) {
      rewriteExpr(arm.value);
    }
  }
}

// 自底向上：先处理子节点，再依次尝试传播、折叠、化简、死分支
void Optimizer::rewriteExpr(unique_ptr<ExprAST> &slot) {
  if (!slot) {
    return;
  }
  rewriteChildren(slot.get());

  if (auto *var = dynamic_cast<VariableExprAST *>(slot.get())) {
    if (auto literal = propagate(var)) {
      replace(slot, std::move(literal), stats_.constantPropagations);
    }
    return;
  }
  if (auto *unary = dynamic_cast<UnaryExprAST *>(slot.get())) {
    if (auto folded = foldUnary(unary)) {
      replace(slot, std::move(folded), stats_.constantFolds);
    } else if (auto simplified = simplifyUnary(unary)) {
      replace(slot, std::move(simplified), stats_.algebraicSimplifications);
    }
    return;
  }
  if (auto *binary = dynamic_cast<BinaryExprAST *>(slot.get())) {
    if (auto folded = foldBinary(binary)) {
      replace(slot, std::move(folded), stats_.constantFolds);
    } else if (auto simplified = simplifyBinary(binary)) {
      replace(slot, std::move(simplified), stats_.algebraicSimplifications);
    }
    return;
  }
  if (auto *cast = dynamic_cast<CastExprAST *>(slot.get())) {
    if (auto folded = foldCast(cast)) {
      replace(slot, std::move(folded), stats_.constantFolds);
    }
    return;
  }
  if (auto *ternary = dynamic_cast<TernaryExprAST *>(slot.get())) {
    if (auto *cond = asBool(ternary->cond.get())) {
      unique_ptr<ExprAST> taken = std::move(cond->value ? ternary->then_expr : ternary->else_expr);
      replace(slot, std::move(taken), stats_.deadCodeEliminations);
    }
    return;
  }
  if (auto *match = dynamic_cast<MatchExprAST *>(slot.get())) {
    if (!isLiteral(match->scrutinee.get())) {
      return;
    }
    for (auto &arm: match->arms) {
      if (arm.pattern->isWildcard() || literalEquals(arm.pattern->literal.get(), match->scrutinee.get())) {
        unique_ptr<ExprAST> taken = std::move(arm.value);
        replace(slot, std::move(taken), stats_.deadCodeEliminations);
        return;
      }
    }
  }
}

unique_ptr<ExprAST> Optimizer::propagate(const VariableExprAST *expr) const {
  const ExprAST *literal = nullptr;
  if (expr->binding == VarBinding::Constant) {
    auto it = contractConsts_.find(expr->name);
    if (it != contractConsts_.end()) {
      literal = it->second.get();
    }
  } else if (expr->binding == VarBinding::Local) {
    for (auto scope = scopes_.rbegin(); scope != scopes_.rend(); ++scope) {
      auto it = scope->find(expr->name);
      if (it != scope->end()) {
        literal = it->second.get();
        break;
      }
    }
  }
  if (!literal) {
    return nullptr;
  }
  auto copy = literal->clone();
  copy->pos = expr->pos;
  copy->end_pos = expr->end_pos;
  return copy;
}

// 陷阱策略：结果超出操作数宽度、除零、有损转换都不折叠，留给目标链在运行时中止
unique_ptr<ExprAST> Optimizer::foldBinary(const BinaryExprAST *expr) const {
  const ExprAST *lhs = expr->left_expr.get();
  const ExprAST *rhs = expr->right_expr.get();
  const std::string &op = expr->op;

  auto *ln = asNumber(lhs);
  auto *rn = asNumber(rhs);
  if (ln && rn) {
    const BigInt &a = ln->value;
    const BigInt &b = rn->value;
    if (op == "<") return makeBool(a < b, expr);
    if (op == "<=") return makeBool(a <= b, expr);
    if (op == ">") return makeBool(a > b, expr);
    if (op == ">=") return makeBool(a >= b, expr);
    if (op == "==") return makeBool(a == b, expr);
    if (op == "!=") return makeBool(a != b, expr);

    if (!expr->type || !expr->type->isInteger()) {
      return nullptr;
    }
    BigInt result;
    if (op == "+") {
      result = a + b;
    } else if (op == "-") {
      result = a - b;
    } else if (op == "*") {
      result = a * b;
    } else if (op == "/" || op == "%") {
      if (b == 0) {
        return nullptr;
      }
      // cpp_int 的除法向零截断，余数与被除数同号，与目标语言一致
      if (op == "/") {
        result = a / b;
      } else {
        result = a % b;
      }
    } else {
      return nullptr;
    }
    if (!integerFits(result, *expr->type)) {
      return nullptr;
    }
    return makeNumber(result, expr->type, expr);
  }

  auto *lb = asBool(lhs);
  auto *rb = asBool(rhs);
  if (lb && rb) {
    if (op == "&&") return makeBool(lb->value && rb->value, expr);
    if (op == "||") return makeBool(lb->value || rb->value, expr);
    if (op == "==") return makeBool(lb->value == rb->value, expr);
    if (op == "!=") return makeBool(lb->value != rb->value, expr);
    return nullptr;
  }

  if ((op == "==" || op == "!=") && isLiteral(lhs) && isLiteral(rhs)) {
    bool equal = literalEquals(lhs, rhs);
    return makeBool(op == "==" ? equal : !equal, expr);
  }
  return nullptr;
}

unique_ptr<ExprAST> Optimizer::foldUnary(const UnaryExprAST *expr) const {
  if (expr->op == "!") {
    if (auto *b = asBool(expr->expr.get())) {
      return makeBool(!b->value, expr);
    }
    return nullptr;
  }
  auto *number = asNumber(expr->expr.get());
  if (!number || !expr->type || !expr->type->isInteger()) {
    return nullptr;
  }
  BigInt result = -number->value;
  if (!integerFits(result, *expr->type)) {
    return nullptr;
  }
  return makeNumber(result, expr->type, expr);
}

unique_ptr<ExprAST> Optimizer::foldCast(const CastExprAST *expr) const {
  auto *number = asNumber(expr->expr.get());
  if (!number || !expr->type || !expr->type->isInteger()) {
    return nullptr;
  }
  if (!integerFits(number->value, *expr->type)) {
    return nullptr;
  }
  return makeNumber(number->value, expr->type, expr);
}

unique_ptr<ExprAST> Optimizer::simplifyBinary(BinaryExprAST *expr) const {
  const std::string &op = expr->op;
  ExprAST *lhs = expr->left_expr.get();
  ExprAST *rhs = expr->right_expr.get();

  if (op == "+") {
    if (isNumberValue(rhs, 0)) return std::move(expr->left_expr);
    if (isNumberValue(lhs, 0)) return std::move(expr->right_expr);
  } else if (op == "-") {
    if (isNumberValue(rhs, 0)) return std::move(expr->left_expr);
  } else if (op == "*") {
    if (isNumberValue(rhs, 1)) return std::move(expr->left_expr);
    if (isNumberValue(lhs, 1)) return std::move(expr->right_expr);
    // 被丢弃的一侧不能有副作用，也不能可能中止
    if (isNumberValue(rhs, 0) && !hasSideEffects(lhs)) return makeNumber(0, expr->type, expr);
    if (isNumberValue(lhs, 0) && !hasSideEffects(rhs)) return makeNumber(0, expr->type, expr);
  } else if (op == "/") {
    if (isNumberValue(rhs, 1)) return std::move(expr->left_expr);
  } else if (op == "&&") {
    if (isBoolValue(lhs, true)) return std::move(expr->right_expr);
    if (isBoolValue(rhs, true)) return std::move(expr->left_expr);
    if (isBoolValue(lhs, false)) return makeBool(false, expr);
  } else if (op == "||") {
    if (isBoolValue(lhs, false)) return std::move(expr->right_expr);
    if (isBoolValue(rhs, false)) return std::move(expr->left_expr);
    if (isBoolValue(lhs, true)) return makeBool(true, expr);
  }
  return nullptr;
}

unique_ptr<ExprAST> Optimizer::simplifyUnary(UnaryExprAST *expr) const {
  auto *inner = dynamic_cast<UnaryExprAST *>(expr->expr.get());
  if (!inner || inner->op != expr->op) {
    return nullptr;
  }
  // -(-x) 不化简：x 为最小值时内层取负会中止
  if (expr->op == "!") {
    return std::move(inner->expr);
  }
  return nullptr;
}

unique_ptr<ContractAST> optimizeContract(const ContractAST &contract, OptimizerStats *stats) {
  Optimizer optimizer;
  auto result = optimizer.optimize(contract);
  if (stats) {
    *stats = optimizer.stats();
  }
  return result;
}
