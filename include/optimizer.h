#ifndef OPTIMIZER_H
#define OPTIMIZER_H

#include "ast.h"
#include "diagnostic.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// 超过这个轮数仍有规则触发视为编译器缺陷
constexpr int kMaxOptimizerIterations = 16;

struct OptimizerStats {
  int constantFolds = 0;
  int algebraicSimplifications = 0;
  int deadCodeEliminations = 0;
  int constantPropagations = 0;
  int iterations = 0;

  int total() const {
    return constantFolds + algebraicSimplifications + deadCodeEliminations + constantPropagations;
  }

  void merge(const OptimizerStats &other);
};

// 不修改输入，返回一棵新树。规则按固定顺序自底向上执行直到不再触发；
// 不收敛或改写改变了节点类型时抛出 InternalCompilerError
class Optimizer {
public:
  unique_ptr<ContractAST> optimize(const ContractAST &contract);

  const OptimizerStats &stats() const { return stats_; }

private:
  // 名字 -> 可传播的字面量；nullptr 表示遮蔽外层或不可传播
  using ConstScope = std::unordered_map<std::string, unique_ptr<ExprAST>>;

  bool runPass(ContractAST &contract);

  void optimizeBody(BlockStmtAST *body, const std::vector<ParamAST> &params);

  void optimizeBlock(BlockStmtAST *block);

  // 返回 false 表示语句应从块中删除
  bool optimizeStatement(unique_ptr<StmtAST> &stmt);

  void rewriteExpr(unique_ptr<ExprAST> &slot);

  void rewriteChildren(ExprAST *expr);

  // 赋值左侧：只改写索引子表达式，不替换根变量
  void rewriteLValue(ExprAST *lhs);

  unique_ptr<ExprAST> foldUnary(const UnaryExprAST *expr) const;

  unique_ptr<ExprAST> foldBinary(const BinaryExprAST *expr) const;

  unique_ptr<ExprAST> foldCast(const CastExprAST *expr) const;

  unique_ptr<ExprAST> simplifyBinary(BinaryExprAST *expr) const;

  unique_ptr<ExprAST> simplifyUnary(UnaryExprAST *expr) const;

  unique_ptr<ExprAST> propagate(const VariableExprAST *expr) const;

  void removeUnusedLiteralLets(BlockStmtAST *block);

  void replace(unique_ptr<ExprAST> &slot, unique_ptr<ExprAST> replacement, int &counter);

  void bind(const std::string &name, const ExprAST *literal);

  OptimizerStats stats_;
  bool changed_ = false;
  std::unordered_map<std::string, unique_ptr<ExprAST>> contractConsts_;
  std::vector<ConstScope> scopes_;
  // 当前函数中作为赋值目标出现过的局部变量名
  std::unordered_set<std::string> assigned_;
};

unique_ptr<ContractAST> optimizeContract(const ContractAST &contract, OptimizerStats *stats = nullptr);

#endif // OPTIMIZER_H
