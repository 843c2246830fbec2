#include "optimizer.h"
#include "parser.h"
#include "semantic.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
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

// 解析并完成语义分析；有错误时抛出
unique_ptr<SourceUnitAST> analyzed(const std::string &source) {
  ParseResult parsed = parseSource(source);
  if (!parsed.unit) {
    throw std::runtime_error("source does not parse");
  }
  SemanticAnalyzer analyzer(*parsed.unit);
  if (!analyzer.analyze()) {
    std::string first = analyzer.diagnostics().empty() ? "" : analyzer.diagnostics()[0].message;
    throw std::runtime_error("source does not type-check: " + first);
  }
  return std::move(parsed.unit);
}

const BlockStmtAST &body_of(const ContractAST &contract, const std::string &fn) {
  const FnDeclAST *decl = contract.findFunction(fn);
  if (!decl || !decl->body) {
    throw std::runtime_error("no function " + fn);
  }
  return *decl->body;
}

const ExprAST *returned_value(const BlockStmtAST &body) {
  if (body.statements.size() != 1) {
    return nullptr;
  }
  auto *ret = dynamic_cast<const ReturnStmtAST *>(body.statements[0].get());
  return ret ? ret->value.get() : nullptr;
}

//===----------------------------------------------------------------------===//
// 参考解释器：只覆盖整数、布尔与标量状态，用来比较优化前后的行为
//===----------------------------------------------------------------------===//

struct Value {
  bool is_bool = false;
  bool flag = false;
  BigInt number;

  bool operator==(const Value &other) const {
    return is_bool == other.is_bool && flag == other.flag && number == other.number;
  }
  bool operator!=(const Value &other) const { return !(*this == other); }
};

Value number(const BigInt &n) {
  Value v;
  v.number = n;
  return v;
}

Value boolean(bool b) {
  Value v;
  v.is_bool = true;
  v.flag = b;
  return v;
}

std::string show(const Value &v) {
  return v.is_bool ? (v.flag ? "true" : "false") : v.number.str();
}

// 合约执行中止（require 失败、溢出、除零）
class Abort : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Outcome {
  bool aborted = false;
  std::string reason;
  Value result;
  std::map<std::string, Value> state;
  std::vector<std::string> events;
};

class Interpreter {
public:
  explicit Interpreter(const ContractAST &contract) : contract_(contract) {
    for (const auto &var: contract.state) {
      if (var->default_value) {
        state_[var->name] = eval(var->default_value.get());
      } else {
        state_[var->name] = var->resolved && var->resolved->isBool() ? boolean(false) : number(0);
      }
    }
  }

  // 中止时状态与事件回滚到调用之前
  Outcome call(const std::string &name, const std::vector<Value> &args) {
    Outcome out;
    auto savedState = state_;
    auto savedEvents = events_;
    frames_.clear();
    depth_ = 0;
    try {
      out.result = invoke(name, args);
    } catch (const Abort &abort) {
      out.aborted = true;
      out.reason = abort.what();
      state_ = savedState;
      events_ = savedEvents;
    }
    out.state = state_;
    out.events = events_;
    return out;
  }

private:
  using Frame = std::vector<std::map<std::string, Value>>;

  Value invoke(const std::string &name, const std::vector<Value> &args) {
    const FnDeclAST *fn = contract_.findFunction(name);
    if (!fn || !fn->modifiers.empty()) {
      throw std::runtime_error("cannot interpret function " + name);
    }
    if (++depth_ > 64) {
      throw std::runtime_error("call depth exceeded");
    }
    Frame saved = std::move(frames_);
    frames_.clear();
    frames_.emplace_back();
    for (size_t i = 0; i < fn->params.size() && i < args.size(); ++i) {
      frames_.back()[fn->params[i].name] = args[i];
    }
    Value result;
    execBlock(fn->body.get(), result);
    frames_ = std::move(saved);
    --depth_;
    return result;
  }

  BigInt checked(const BigInt &value, const TypeRef &type) const {
    if (!type || !type->isInteger()) {
      throw std::runtime_error("arithmetic on an untyped expression");
    }
    if (!integerFits(value, *type)) {
      throw Abort("arithmetic overflow");
    }
    return value;
  }

  Value load(const VariableExprAST *var) {
    switch (var->binding) {
      case VarBinding::Local:
      case VarBinding::Parameter:
        for (auto scope = frames_.rbegin(); scope != frames_.rend(); ++scope) {
          auto it = scope->find(var->name);
          if (it != scope->end()) {
            return it->second;
          }
        }
        break;
      case VarBinding::State:
        return state_.at(var->name);
      case VarBinding::Constant:
        return eval(contract_.findConst(var->name)->value.get());
      case VarBinding::Unresolved:
        break;
    }
    throw std::runtime_error("unbound variable " + var->name);
  }

  void store(const ExprAST *target, const Value &value) {
    auto *var = dynamic_cast<const VariableExprAST *>(target);
    if (!var) {
      throw std::runtime_error("only scalar assignment is interpreted");
    }
    if (var->binding == VarBinding::State) {
      state_[var->name] = value;
      return;
    }
    for (auto scope = frames_.rbegin(); scope != frames_.rend(); ++scope) {
      auto it = scope->find(var->name);
      if (it != scope->end()) {
        it->second = value;
        return;
      }
    }
    throw std::runtime_error("assignment to unbound variable " + var->name);
  }

  Value eval(const ExprAST *e) {
    if (auto *n = dynamic_cast<const NumberExprAST *>(e)) {
      return number(n->value);
    }
    if (auto *b = dynamic_cast<const BoolExprAST *>(e)) {
      return boolean(b->value);
    }
    if (auto *var = dynamic_cast<const VariableExprAST *>(e)) {
      return load(var);
    }
    if (auto *unary = dynamic_cast<const UnaryExprAST *>(e)) {
      Value operand = eval(unary->expr.get());
      if (unary->op == "!") {
        return boolean(!operand.flag);
      }
      return number(checked(-operand.number, unary->type));
    }
    if (auto *bin = dynamic_cast<const BinaryExprAST *>(e)) {
      return evalBinary(bin);
    }
    if (auto *ternary = dynamic_cast<const TernaryExprAST *>(e)) {
      return eval(ternary->cond.get()).flag ? eval(ternary->then_expr.get()) : eval(ternary->else_expr.get());
    }
    if (auto *cast = dynamic_cast<const CastExprAST *>(e)) {
      return number(checked(eval(cast->expr.get()).number, cast->type));
    }
    if (auto *call = dynamic_cast<const CallExprAST *>(e)) {
      if (call->target != CallTarget::Function) {
        throw std::runtime_error("method calls are not interpreted");
      }
      std::vector<Value> args;
      for (const auto &arg: call->args) {
        args.push_back(eval(arg.get()));
      }
      return invoke(call->call, args);
    }
    if (auto *match = dynamic_cast<const MatchExprAST *>(e)) {
      Value scrutinee = eval(match->scrutinee.get());
      for (const auto &arm: match->arms) {
        if (arm.pattern->isWildcard() || eval(arm.pattern->literal.get()) == scrutinee) {
          return eval(arm.value.get());
        }
      }
      throw std::runtime_error("no match arm");
    }
    throw std::runtime_error("expression is not interpreted");
  }

  Value evalBinary(const BinaryExprAST *bin) {
    const std::string &op = bin->op;
    if (op == "&&") {
      return boolean(eval(bin->left_expr.get()).flag && eval(bin->right_expr.get()).flag);
    }
    if (op == "||") {
      return boolean(eval(bin->left_expr.get()).flag || eval(bin->right_expr.get()).flag);
    }
    Value l = eval(bin->left_expr.get());
    Value r = eval(bin->right_expr.get());
    if (op == "==") return boolean(l == r);
    if (op == "!=") return boolean(l != r);
    if (op == "<") return boolean(l.number < r.number);
    if (op == "<=") return boolean(l.number <= r.number);
    if (op == ">") return boolean(l.number > r.number);
    if (op == ">=") return boolean(l.number >= r.number);
    if (op == "+") return number(checked(l.number + r.number, bin->type));
    if (op == "-") return number(checked(l.number - r.number, bin->type));
    if (op == "*") return number(checked(l.number * r.number, bin->type));
    if (op == "/" || op == "%") {
      if (r.number == 0) {
        throw Abort("division by zero");
      }
      BigInt quotient = l.number / r.number;
      BigInt remainder = l.number % r.number;
      return number(checked(op == "/" ? quotient : remainder, bin->type));
    }
    throw std::runtime_error("operator " + op + " is not interpreted");
  }

  bool execBlock(const BlockStmtAST *block, Value &result) {
    frames_.emplace_back();
    for (const auto &stmt: block->statements) {
      if (exec(stmt.get(), result)) {
        frames_.pop_back();
        return true;
      }
    }
    frames_.pop_back();
    return false;
  }

  // 返回 true 表示执行了 return
  bool exec(const StmtAST *s, Value &result) {
    if (auto *let = dynamic_cast<const LetStmtAST *>(s)) {
      Value v = eval(let->value.get());
      frames_.back()[let->name] = v;
      return false;
    }
    if (auto *assign = dynamic_cast<const AssignStmtAST *>(s)) {
      store(assign->lhs_expr.get(), eval(assign->value.get()));
      return false;
    }
    if (auto *exprStmt = dynamic_cast<const ExprStmtAST *>(s)) {
      eval(exprStmt->expr.get());
      return false;
    }
    if (auto *block = dynamic_cast<const BlockStmtAST *>(s)) {
      return execBlock(block, result);
    }
    if (auto *ifStmt = dynamic_cast<const IfStmtAST *>(s)) {
      if (eval(ifStmt->cond.get()).flag) {
        return execBlock(ifStmt->then_branch.get(), result);
      }
      return ifStmt->else_branch && exec(ifStmt->else_branch.get(), result);
    }
    if (auto *whileStmt = dynamic_cast<const WhileStmtAST *>(s)) {
      int guard = 0;
      while (eval(whileStmt->cond.get()).flag) {
        if (++guard > 10000) {
          throw std::runtime_error("loop did not terminate");
        }
        if (execBlock(whileStmt->body.get(), result)) {
          return true;
        }
      }
      return false;
    }
    if (auto *forStmt = dynamic_cast<const ForStmtAST *>(s)) {
      if (!forStmt->isRange()) {
        throw std::runtime_error("for-each is not interpreted");
      }
      BigInt end = eval(forStmt->range_end.get()).number;
      for (BigInt i = eval(forStmt->iter_expr.get()).number; i < end; ++i) {
        frames_.emplace_back();
        frames_.back()[forStmt->var_name] = number(i);
        bool returned = execBlock(forStmt->body.get(), result);
        frames_.pop_back();
        if (returned) {
          return true;
        }
      }
      return false;
    }
    if (auto *match = dynamic_cast<const MatchStmtAST *>(s)) {
      Value scrutinee = eval(match->scrutinee.get());
      for (const auto &arm: match->arms) {
        if (arm.pattern->isWildcard() || eval(arm.pattern->literal.get()) == scrutinee) {
          return execBlock(arm.body.get(), result);
        }
      }
      return false;
    }
    if (auto *require = dynamic_cast<const RequireStmtAST *>(s)) {
      if (!eval(require->cond.get()).flag) {
        throw Abort("require: " + require->message);
      }
      return false;
    }
    if (auto *emit = dynamic_cast<const EmitStmtAST *>(s)) {
      std::string record = emit->event + "(";
      for (size_t i = 0; i < emit->args.size(); ++i) {
        record += (i ? ", " : "") + show(eval(emit->args[i].get()));
      }
      events_.push_back(record + ")");
      return false;
    }
    if (auto *ret = dynamic_cast<const ReturnStmtAST *>(s)) {
      if (ret->value) {
        result = eval(ret->value.get());
      }
      return true;
    }
    throw std::runtime_error("statement is not interpreted");
  }

  const ContractAST &contract_;
  std::map<std::string, Value> state_;
  std::vector<std::string> events_;
  Frame frames_;
  int depth_ = 0;
};

bool same_outcome(const Outcome &a, const Outcome &b, const std::string &what) {
  bool ok = a.aborted == b.aborted && a.reason == b.reason && (a.aborted || a.result == b.result) &&
            a.state == b.state && a.events == b.events;
  if (!ok) {
    std::cout << "  " << what << ": before " << (a.aborted ? "abort(" + a.reason + ")" : show(a.result))
              << ", after " << (b.aborted ? "abort(" + b.reason + ")" : show(b.result)) << std::endl;
  }
  return ok;
}

const char *kOracleContract = R"(
contract Oracle {
    state {
        total: u64 = 10;
        flag: bool = true;
        count: u32;
    }

    const FACTOR: u64 = 3;
    const LIMIT: u64 = FACTOR * 100;

    event Step(v: u64);

    fn scale(x: u64) -> u64 {
        return x * FACTOR + 0;
    }

    public fn arith(a: u64, b: u64) -> u64 {
        let zero = 0;
        let one = 1;
        let c = a * one + zero;
        if (b == 0) {
            return c * 0;
        }
        return c / b + a % b - zero;
    }

    public fn logic(a: u64, b: u64) -> bool {
        let yes = true;
        let no = false;
        return (yes && a > b) || (no || a == b) && !!(b < LIMIT);
    }

    public fn loops(a: u64, b: u64) -> u64 {
        let mut acc: u64 = 0;
        for i in 0..a % 5 {
            acc = acc + i * 2;
            if (false) {
                acc = 1000;
            } else {
                acc = acc + 1;
            }
        }
        let mut n = b % 4;
        while (n > 0) {
            acc = acc + scale(n);
            n = n - 1;
        }
        return acc;
    }

    public fn mutate(a: u64, b: u64) {
        require(true, "never");
        require(a != 7, "seven");
        total = total + a * 1;
        if (flag && true) {
            count = count + 1;
        }
        flag = !flag;
        emit Step(total - 0);
        let small = (a as u8) + 0u8;
        total = total + small as u64 + b * 0;
    }

    public fn narrow(a: u64, b: u64) -> u8 {
        let base: u8 = 250;
        return base + (a % 10) as u8;
    }

    public fn choose(a: u64, b: u64) -> u64 {
        let k = 2;
        match k {
            1 => { return 100; }
            2 => { return a > b ? a - b : b - a; }
            _ => { return 0; }
        }
    }

    public fn folded(a: u64, b: u64) -> u64 {
        let x = 6 * 7 - 2;
        let y = x / 4 % 3;
        return a < b ? x + y : (x - 40) * a;
    }
}
)";

} // namespace

int main() {
  std::cout << "=== 优化器测试 ===" << std::endl;

  run_case("oracle_preserves_behaviour", [] {
    auto unit = analyzed(kOracleContract);
    const ContractAST &before = *unit->contracts[0];
    auto after = optimizeContract(before);
    const BigInt max64 = integerMax(*TypeFactory::getUnsigned(64));
    const std::vector<BigInt> samples = {0, 1, 2, 3, 5, 7, 9, 10, 255, 256, 300, max64 - 1, max64};
    bool ok = true;
    for (const auto &fn: before.functions) {
      if (!fn->isPublic()) {
        continue;
      }
      for (const auto &a: samples) {
        for (const auto &b: samples) {
          Interpreter original(before);
          Interpreter optimized(*after);
          std::vector<Value> args = {number(a), number(b)};
          ok = same_outcome(original.call(fn->name, args), optimized.call(fn->name, args),
                            fn->name + "(" + a.str() + ", " + b.str() + ")") && ok;
        }
      }
    }
    // 连续调用，状态跨调用累积
    Interpreter original(before);
    Interpreter optimized(*after);
    for (const auto &a: samples) {
      std::vector<Value> args = {number(a), number(1)};
      ok = same_outcome(original.call("mutate", args), optimized.call("mutate", args), "sequence " + a.str()) && ok;
    }
    return ok;
  });

  run_case("optimization_is_idempotent", [] {
    auto unit = analyzed(kOracleContract);
    auto once = optimizeContract(*unit->contracts[0]);
    OptimizerStats second;
    auto twice = optimizeContract(*once, &second);
    return dumpToString(*once) == dumpToString(*twice) && second.total() == 0 && second.iterations == 1;
  });

  for (const std::string dir: {"pass", "codegen"}) {
    for (const auto &file: find_source_files(std::string(TEST_CASE_DIR) + "/" + dir)) {
      run_case("idempotent_and_strict " + fs::path(file).filename().string(), [&file] {
        auto unit = analyzed(read_from_file(file));
        for (const auto &contract: unit->contracts) {
          std::string input = dumpToString(*contract);
          auto once = optimizeContract(*contract);
          auto twice = optimizeContract(*once);
          if (dumpToString(*contract) != input) {
            std::cout << "  input tree of " << contract->name << " was modified" << std::endl;
            return false;
          }
          if (!verifyStrictTree(*once) || dumpToString(*once) != dumpToString(*twice)) {
            return false;
          }
        }
        return true;
      });
    }
  }

  run_case("multiply_by_zero", [] {
    auto unit = analyzed("contract C { fn f(amount: u64) -> u64 { return amount * 0; } }");
    OptimizerStats stats;
    auto out = optimizeContract(*unit->contracts[0], &stats);
    auto *n = dynamic_cast<const NumberExprAST *>(returned_value(body_of(*out, "f")));
    return n && n->value == 0 && n->type && n->type->toString() == "u64" && stats.algebraicSimplifications >= 1;
  });

  run_case("multiply_by_zero_keeps_calls", [] {
    auto unit = analyzed("contract C { fn g() -> u64 { return 3; } fn f() -> u64 { return g() * 0; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    return dynamic_cast<const BinaryExprAST *>(returned_value(body_of(*out, "f"))) != nullptr;
  });

  run_case("propagated_true_and", [] {
    auto unit = analyzed("contract C { fn f(x: bool) -> bool { let flag = true; return flag && x; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    auto *var = dynamic_cast<const VariableExprAST *>(returned_value(body_of(*out, "f")));
    return var && var->name == "x";
  });

  run_case("false_branch_selected", [] {
    auto unit = analyzed("contract C { fn a() { } fn b() { } "
                         "fn run() { if (false) { a(); } else { b(); } } }");
    auto out = optimizeContract(*unit->contracts[0]);
    const BlockStmtAST &body = body_of(*out, "run");
    if (body.statements.size() != 1) return false;
    auto *stmt = dynamic_cast<const ExprStmtAST *>(body.statements[0].get());
    auto *call = stmt ? dynamic_cast<const CallExprAST *>(stmt->expr.get()) : nullptr;
    return call && call->call == "b" && call->args.empty() && !call->object_expr;
  });

  run_case("fold_at_type_boundary", [] {
    auto unit = analyzed("contract C { fn f() -> u8 { return 255u8 + 0u8; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    auto *n = dynamic_cast<const NumberExprAST *>(returned_value(body_of(*out, "f")));
    return n && n->value == 255;
  });

  run_case("no_fold_past_type_boundary", [] {
    auto unit = analyzed("contract C { fn f() -> u8 { return 255u8 + 1u8; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    auto *bin = dynamic_cast<const BinaryExprAST *>(returned_value(body_of(*out, "f")));
    return bin && bin->op == "+";
  });

  run_case("no_fold_of_division_by_zero", [] {
    auto unit = analyzed("contract C { fn f() -> u64 { return 10 / 0; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    return dynamic_cast<const BinaryExprAST *>(returned_value(body_of(*out, "f"))) != nullptr;
  });

  run_case("lossy_cast_not_folded", [] {
    auto unit = analyzed("contract C { fn f() -> u8 { return 300 as u8; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    return dynamic_cast<const CastExprAST *>(returned_value(body_of(*out, "f"))) != nullptr;
  });

  run_case("code_after_return_removed", [] {
    auto unit = analyzed("contract C { state { n: u64; } fn f() -> u64 { return 1; n = 2; } }");
    OptimizerStats stats;
    auto out = optimizeContract(*unit->contracts[0], &stats);
    return body_of(*out, "f").statements.size() == 1 && stats.deadCodeEliminations >= 1;
  });

  run_case("while_false_removed", [] {
    auto unit = analyzed("contract C { state { n: u64; } fn f() { while (false) { n = n + 1; } n = 3; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    const BlockStmtAST &body = body_of(*out, "f");
    return body.statements.size() == 1 && dynamic_cast<const AssignStmtAST *>(body.statements[0].get());
  });

  run_case("reassigned_local_not_propagated", [] {
    auto unit = analyzed("contract C { fn f(a: u64) -> u64 { let mut x = 1; if (a > 0) { x = a; } return x; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    const BlockStmtAST &body = body_of(*out, "f");
    auto *ret = dynamic_cast<const ReturnStmtAST *>(body.statements.back().get());
    return ret && dynamic_cast<const VariableExprAST *>(ret->value.get());
  });

  run_case("constants_propagate_across_declarations", [] {
    auto unit = analyzed("contract C { const A: u64 = 2; const B: u64 = A * 21; fn f() -> u64 { return B; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    auto *n = dynamic_cast<const NumberExprAST *>(returned_value(body_of(*out, "f")));
    return n && n->value == 42;
  });

  run_case("double_not_removed", [] {
    auto unit = analyzed("contract C { fn f(x: bool) -> bool { return !!x; } }");
    auto out = optimizeContract(*unit->contracts[0]);
    return dynamic_cast<const VariableExprAST *>(returned_value(body_of(*out, "f"))) != nullptr;
  });

  run_case("literal_match_selects_arm", [] {
    auto unit = analyzed("contract C { fn f() -> u64 { match 3 { 1 => { return 10; } 3 => { return 30; } "
                         "_ => { return 0; } } } }");
    auto out = optimizeContract(*unit->contracts[0]);
    auto *n = dynamic_cast<const NumberExprAST *>(returned_value(body_of(*out, "f")));
    return n && n->value == 30;
  });

  std::cout << (failures == 0 ? "全部通过" : "存在失败: " + std::to_string(failures)) << std::endl;
  return failures == 0 ? 0 : 1;
}
