#include "codegen.h"
#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>
#include <unordered_set>

namespace {

// 动态长度字段（String / Vec）在账户空间计算中使用的上限
constexpr size_t kDefaultMaxLen = 64;

const std::unordered_set<std::string> kRustReserved = {
  "as", "async", "await", "box", "break", "const", "continue", "crate", "do", "dyn", "else", "enum", "extern",
  "false", "final", "fn", "for", "if", "impl", "in", "let", "loop", "macro", "match", "mod", "move", "mut",
  "override", "priv", "pub", "ref", "return", "self", "Self", "static", "struct", "super", "trait", "true",
  "try", "type", "typeof", "union", "unsafe", "unsized", "use", "virtual", "where", "while", "yield",
  // 生成代码自己使用的名字
  "state", "env", "ctx"
};

std::string rustIdent(const std::string &name) {
  return kRustReserved.count(name) ? name + "_" : name;
}

std::string rustString(const std::string &text) {
  std::ostringstream oss;
  oss << '"';
  for (unsigned char c: text) {
    switch (c) {
      case '"': oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n"; break;
      case '\t': oss << "\\t"; break;
      case '\r': oss << "\\r"; break;
      case '\0': oss << "\\0"; break;
      default:
        if (c < 0x20 || c == 0x7f) {
          oss << "\\u{" << std::hex << static_cast<int>(c) << std::dec << "}";
        } else {
          oss << c;
        }
    }
  }
  oss << '"';
  return oss.str();
}

std::string rustBytes(const std::string &bytes) {
  std::ostringstream oss;
  oss << "b\"";
  for (unsigned char c: bytes) {
    if (c == '"' || c == '\\') {
      oss << '\\' << c;
    } else if (c < 0x20 || c >= 0x7f) {
      oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c) << std::dec;
    } else {
      oss << c;
    }
  }
  oss << '"';
  return oss.str();
}

bool isCopy(const TypeRef &type) {
  if (!type) {
    return true;
  }
  switch (type->kind) {
    case BaseType::Int:
    case BaseType::Bool:
    case BaseType::Address:
    case BaseType::Void:
    case BaseType::Unknown:
      return true;
    case BaseType::Array:
    case BaseType::Option:
      return isCopy(type->elementType);
    case BaseType::Tuple:
      for (const auto &p: type->parameters) {
        if (!isCopy(p)) return false;
      }
      return true;
    default:
      return false;
  }
}

const char *checkedMethod(const std::string &op) {
  if (op == "+") return "checked_add";
  if (op == "-") return "checked_sub";
  if (op == "*") return "checked_mul";
  if (op == "/") return "checked_div";
  if (op == "%") return "checked_rem";
  return nullptr;
}

// 消息 -> 错误枚举变体名
std::string variantFromMessage(const std::string &message) {
  std::string words;
  bool boundary = true;
  int count = 0;
  for (unsigned char c: message) {
    if (std::isalnum(c)) {
      if (boundary) {
        if (++count > 6) break;
        words += static_cast<char>(std::toupper(c));
        boundary = false;
      } else {
        words += static_cast<char>(c);
      }
    } else {
      boundary = true;
    }
  }
  if (words.empty()) {
    return "RequirementFailed";
  }
  if (std::isdigit(static_cast<unsigned char>(words[0]))) {
    words = "E" + words;
  }
  return words;
}

class SolanaEmitter {
public:
  SolanaEmitter(const ContractAST &contract, const SourceUnitAST &unit, const CodegenOptions &options,
                DiagnosticSink &sink)
    : contract(contract), unit(unit), options(options), sink(sink) {}

  std::string run();

private:
  // 声明
  void emitConstants();
  void emitProgram();
  void emitEntry(const FnDeclAST &fn);
  void emitInitializer();
  void emitLogicFunction(const FnDeclAST &fn);
  void emitBodyFunction(const FnDeclAST &fn);
  void emitAccounts();
  void emitState();
  void emitStructs();
  void emitEvents();
  void emitErrors();
  void emitInterfaces();
  void emitMapHelpers();

  // 函数体
  void emitModifierChain(const FnDeclAST &fn, size_t index);
  void emitBlockBody(const BlockStmtAST *block);
  void emitStatement(const StmtAST *stmt);
  void emitIf(const IfStmtAST *stmt, bool elseIf);
  void emitAssign(const AssignStmtAST *stmt);
  void emitMatchStmt(const MatchStmtAST *stmt);

  // 表达式
  std::string expr(const ExprAST *e);
  std::string place(const ExprAST *e);
  std::string primary(const ExprAST *e);
  std::string operand(const ExprAST *e);
  std::string borrowOperand(const ExprAST *e);
  std::string binary(const BinaryExprAST *e);
  std::string call(const CallExprAST *e);
  std::string collect(const CallExprAST *e);
  std::string matchExpr(const MatchExprAST *e);
  std::string literal(const NumberExprAST *e);
  std::string pattern(const PatternAST *p);
  std::string scrutinee(const ExprAST *e);
  std::string cast(const CastExprAST *e);
  std::string variable(const VariableExprAST *e);

  // 辅助
  std::string type(const TypeRef &t, SourceSpan span);
  std::string zeroValue(const TypeRef &t, SourceSpan span);
  std::string maxLenAttr(const TypeRef &t) const;
  void maxLenLevels(const TypeRef &t, std::vector<size_t> &levels) const;
  std::string localName(const std::string &name) const;
  std::string fnName(const std::string &name) const;
  std::string logicName(const std::string &name) const;
  std::string paramList(const FnDeclAST &fn);
  std::string argList(const FnDeclAST &fn, bool cloneNonCopy);
  std::string returnType(const FnDeclAST &fn);
  std::string errorVariant(const std::string &message) const;
  std::string fresh(const std::string &prefix);
  bool isPlace(const ExprAST *e) const;
  bool isStateMapIndex(const ExprAST *e) const;
  bool containsMapIndex(const ExprAST *e) const;
  bool usesBoundedMaps() const;
  void checkType(const ExprAST *e);
  void line(const std::string &text);
  void open(const std::string &text);
  void close(const std::string &text = "}");

  const ContractAST &contract;
  const SourceUnitAST &unit;
  const CodegenOptions &options;
  DiagnosticSink &sink;

  std::ostringstream out;
  int indent = 0;
  int tempId = 0;
  std::string stateType;
  std::string initializerName;
  std::map<std::string, std::string> errorVariants;
  std::vector<std::string> errorOrder;

  // 当前函数
  std::string modifierPrefix;
  bool bodyAsFunction = false;
  bool constContext = false;
};

//===----------------------------------------------------------------------===//
// 输出
//===----------------------------------------------------------------------===//

void SolanaEmitter::line(const std::string &text) {
  if (text.empty()) {
    out << "\n";
    return;
  }
  out << std::string(static_cast<size_t>(indent) * 4, ' ') << text << "\n";
}

void SolanaEmitter::open(const std::string &text) {
  line(text);
  ++indent;
}

void SolanaEmitter::close(const std::string &text) {
  --indent;
  line(text);
}

std::string SolanaEmitter::fresh(const std::string &prefix) {
  return prefix + "_" + std::to_string(++tempId);
}

std::string SolanaEmitter::localName(const std::string &name) const {
  return rustIdent(modifierPrefix + name);
}

std::string SolanaEmitter::fnName(const std::string &name) const {
  std::string snake = toSnakeCase(name);
  if (snake == initializerName) {
    return snake + "_entry";
  }
  return rustIdent(snake);
}

std::string SolanaEmitter::logicName(const std::string &name) const {
  return toSnakeCase(name) + "_impl";
}

std::string SolanaEmitter::errorVariant(const std::string &message) const {
  auto it = errorVariants.find(message);
  return it == errorVariants.end() ? "RequirementFailed" : it->second;
}

std::string SolanaEmitter::type(const TypeRef &t, SourceSpan span) {
  std::string text;
  std::string reason;
  if (!renderType(Target::Solana, t, text, reason)) {
    sink.error(span, DiagnosticCode::UnsupportedConstruct, reason);
    return "()";
  }
  return text;
}

void SolanaEmitter::checkType(const ExprAST *e) {
  if (!e->type || e->type->kind == BaseType::Function || e->type->isVoid() || e->type->isUnknown()) {
    return;
  }
  if (e->type->kind == BaseType::Map) {
    return;
  }
  type(e->type, e->span());
}

bool SolanaEmitter::usesBoundedMaps() const {
  if (options.mapPolicy != MapPolicy::Bounded) {
    return false;
  }
  for (const auto &s: contract.state) {
    if (s->resolved && s->resolved->kind == BaseType::Map) {
      return true;
    }
  }
  return false;
}

void SolanaEmitter::maxLenLevels(const TypeRef &t, std::vector<size_t> &levels) const {
  switch (t->kind) {
    case BaseType::String:
    case BaseType::Bytes:
      levels.push_back(kDefaultMaxLen);
      break;
    case BaseType::Vector:
      levels.push_back(kDefaultMaxLen);
      maxLenLevels(t->elementType, levels);
      break;
    case BaseType::Map:
      levels.push_back(options.mapCapacity);
      maxLenLevels(t->parameters[0], levels);
      maxLenLevels(t->parameters[1], levels);
      break;
    case BaseType::Option:
    case BaseType::Array:
      maxLenLevels(t->elementType, levels);
      break;
    default:
      break;
  }
}

std::string SolanaEmitter::maxLenAttr(const TypeRef &t) const {
  std::vector<size_t> levels;
  maxLenLevels(t, levels);
  if (levels.empty()) {
    return "";
  }
  std::string attr = "#[max_len(";
  for (size_t i = 0; i < levels.size(); ++i) {
    if (i > 0) attr += ", ";
    attr += std::to_string(levels[i]);
  }
  return attr + ")]";
}

std::string SolanaEmitter::zeroValue(const TypeRef &t, SourceSpan span) {
  switch (t->kind) {
    case BaseType::Int:
      return "0" + type(t, span);
    case BaseType::Bool:
      return "false";
    case BaseType::Address:
      return "Pubkey::default()";
    case BaseType::String:
      return "String::new()";
    case BaseType::Bytes:
    case BaseType::Vector:
    case BaseType::Map:
      return "Vec::new()";
    case BaseType::Option:
      return "None";
    case BaseType::Array:
      return "std::array::from_fn(|_| " + zeroValue(t->elementType, span) + ")";
    default:
      return "Default::default()";
  }
}

//===----------------------------------------------------------------------===//
// 声明
//===----------------------------------------------------------------------===//

std::string SolanaEmitter::run() {
  stateType = contract.name + "State";
  initializerName = "initialize";

  auto messages = collectRequireMessages(contract);
  std::unordered_set<std::string> used = {"ArithmeticOverflow", "MapCapacityExceeded"};
  for (const auto &message: messages) {
    std::string base = variantFromMessage(message);
    std::string name = base;
    for (int n = 2; used.count(name); ++n) {
      name = base + std::to_string(n);
    }
    used.insert(name);
    errorVariants[message] = name;
    errorOrder.push_back(message);
  }

  line("use anchor_lang::prelude::*;");
  line("");
  line("declare_id!(\"11111111111111111111111111111111\");");
  line("");
  emitConstants();
  emitProgram();

  open("pub struct Env {");
  line("pub caller: Pubkey,");
  line("pub value: u64,");
  close();
  line("");

  for (const auto &fn: contract.functions) {
    emitLogicFunction(*fn);
  }
  emitAccounts();
  emitState();
  emitStructs();
  emitEvents();
  emitErrors();
  emitInterfaces();
  if (usesBoundedMaps()) {
    emitMapHelpers();
  }
  return out.str();
}

void SolanaEmitter::emitConstants() {
  if (contract.consts.empty()) {
    return;
  }
  constContext = true;
  for (const auto &c: contract.consts) {
    SourceSpan span(c->pos, c->pos + c->name.size());
    std::string name = toUpperSnake(c->name);
    if (c->resolved->kind == BaseType::String) {
      auto *literal = dynamic_cast<const StringExprAST *>(c->value.get());
      if (literal) {
        line("pub const " + name + ": &str = " + rustString(literal->str) + ";");
        continue;
      }
    } else if (c->resolved->kind == BaseType::Bytes) {
      auto *literal = dynamic_cast<const BytesExprAST *>(c->value.get());
      if (literal) {
        line("pub const " + name + ": &[u8] = " + rustBytes(literal->bytes) + ";");
        continue;
      }
    } else if (!typeContains(c->resolved, BaseType::String) && !typeContains(c->resolved, BaseType::Bytes) &&
               !typeContains(c->resolved, BaseType::Vector)) {
      line("pub const " + name + ": " + type(c->resolved, span) + " = " + expr(c->value.get()) + ";");
      continue;
    }
    sink.error(span, DiagnosticCode::UnsupportedConstruct,
               "constant '" + c->name + "' of type " + c->resolved->toString() +
               " cannot be expressed as a Rust constant");
  }
  constContext = false;
  line("");
}

void SolanaEmitter::emitProgram() {
  open("#[program]");
  --indent;
  open("pub mod " + toSnakeCase(contract.name) + " {");
  line("use super::*;");
  line("");
  emitInitializer();
  for (const auto &fn: contract.functions) {
    if (fn->isPublic()) {
      emitEntry(*fn);
    }
  }
  close();
  line("");
}

void SolanaEmitter::emitInitializer() {
  open("pub fn " + initializerName + "(ctx: Context<Initialize>) -> Result<()> {");
  line("let env = &Env { caller: ctx.accounts.signer.key(), value: 0 };");
  line("let state = &mut ctx.accounts.state;");
  for (const auto &s: contract.state) {
    SourceSpan span(s->pos, s->pos + s->name.size());
    std::string value = s->default_value ? expr(s->default_value.get()) : zeroValue(s->resolved, span);
    line("state." + rustIdent(s->name) + " = " + value + ";");
  }
  line("Ok(())");
  close();
  line("");
}

void SolanaEmitter::emitEntry(const FnDeclAST &fn) {
  bool usesValue = usesIntrinsic(contract, fn, IntrinsicKind::MessageValue);
  std::string params = "ctx: Context<" + toPascalCase(toSnakeCase(fn.name)) + "Accounts>";
  for (const auto &p: fn.params) {
    params += ", " + rustIdent(p.name) + ": " + type(p.resolved, SourceSpan(p.pos, p.pos + p.name.size()));
  }
  if (usesValue) {
    params += ", value: u64";
  }
  open("pub fn " + fnName(fn.name) + "(" + params + ") -> " + returnType(fn) + " {");
  line(std::string("let env = Env { caller: ctx.accounts.signer.key(), value: ") + (usesValue ? "value" : "0") +
       " };");
  std::string args = "&mut ctx.accounts.state, &env";
  for (const auto &p: fn.params) {
    args += ", " + rustIdent(p.name);
  }
  line(logicName(fn.name) + "(" + args + ")");
  close();
  line("");
}

std::string SolanaEmitter::returnType(const FnDeclAST &fn) {
  if (!fn.resolved_return || fn.resolved_return->isVoid()) {
    return "Result<()>";
  }
  return "Result<" + type(fn.resolved_return, SourceSpan(fn.pos, fn.pos + fn.name.size())) + ">";
}

std::string SolanaEmitter::paramList(const FnDeclAST &fn) {
  std::string params = "state: &mut " + stateType + ", env: &Env";
  for (const auto &p: fn.params) {
    params += ", " + rustIdent(p.name) + ": " + type(p.resolved, SourceSpan(p.pos, p.pos + p.name.size()));
  }
  return params;
}

std::string SolanaEmitter::argList(const FnDeclAST &fn, bool cloneNonCopy) {
  std::string args = "state, env";
  for (const auto &p: fn.params) {
    args += ", " + rustIdent(p.name);
    if (cloneNonCopy && !isCopy(p.resolved)) {
      args += ".clone()";
    }
  }
  return args;
}

void SolanaEmitter::emitLogicFunction(const FnDeclAST &fn) {
  modifierPrefix.clear();
  bodyAsFunction = false;
  for (const auto &use: fn.modifiers) {
    const ModifierDeclAST *modifier = contract.findModifier(use.name);
    if (modifier && modifierHasPostCode(*modifier)) {
      bodyAsFunction = true;
    }
  }
  bool isVoid = !fn.resolved_return || fn.resolved_return->isVoid();

  std::string visibility = fn.isPublic() ? "pub " : "";
  open(visibility + "fn " + logicName(fn.name) + "(" + paramList(fn) + ") -> " + returnType(fn) + " {");
  if (fn.modifiers.empty()) {
    emitBlockBody(fn.body.get());
    if (isVoid && !fn.body->statements.empty() &&
        !dynamic_cast<const ReturnStmtAST *>(fn.body->statements.back().get())) {
      line("Ok(())");
    } else if (isVoid && fn.body->statements.empty()) {
      line("Ok(())");
    }
  } else {
    if (bodyAsFunction && !isVoid) {
      line("let mut body_result: Option<" + type(fn.resolved_return, fn.body->span()) + "> = None;");
    }
    emitModifierChain(fn, 0);
    if (bodyAsFunction && !isVoid) {
      line("Ok(body_result.unwrap_or_default())");
    } else if (isVoid) {
      line("Ok(())");
    }
  }
  close();
  line("");

  if (bodyAsFunction) {
    emitBodyFunction(fn);
  }
}

// 修饰器在占位符之后还有代码时，函数体单独生成，return 只离开函数体
void SolanaEmitter::emitBodyFunction(const FnDeclAST &fn) {
  modifierPrefix.clear();
  bool isVoid = !fn.resolved_return || fn.resolved_return->isVoid();
  open("fn " + toSnakeCase(fn.name) + "_body(" + paramList(fn) + ") -> " + returnType(fn) + " {");
  emitBlockBody(fn.body.get());
  if (isVoid) {
    line("Ok(())");
  }
  close();
  line("");
}

void SolanaEmitter::emitModifierChain(const FnDeclAST &fn, size_t index) {
  if (index == fn.modifiers.size()) {
    std::string saved = modifierPrefix;
    modifierPrefix.clear();
    if (bodyAsFunction) {
      std::string callText = toSnakeCase(fn.name) + "_body(" + argList(fn, true) + ")?";
      if (!fn.resolved_return || fn.resolved_return->isVoid()) {
        line(callText + ";");
      } else {
        line("body_result = Some(" + callText + ");");
      }
    } else {
      emitBlockBody(fn.body.get());
    }
    modifierPrefix = saved;
    return;
  }

  const ModifierUseAST &use = fn.modifiers[index];
  const ModifierDeclAST *modifier = contract.findModifier(use.name);
  if (!modifier) {
    throw InternalCompilerError("modifier '" + use.name + "' reached code generation unresolved",
                                SourceSpan(use.pos, use.pos + use.name.size()));
  }
  std::string prefix = toSnakeCase(modifier->name) + "_";
  line("// modifier " + modifier->name);
  open("{");
  for (size_t i = 0; i < modifier->params.size() && i < use.args.size(); ++i) {
    const ParamAST &p = modifier->params[i];
    std::string value = expr(use.args[i].get());
    line("let " + rustIdent(prefix + p.name) + ": " + type(p.resolved, SourceSpan(p.pos, p.pos)) + " = " + value + ";");
  }
  std::string saved = modifierPrefix;
  modifierPrefix = prefix;
  for (const auto &stmt: modifier->body->statements) {
    if (dynamic_cast<const PlaceholderStmtAST *>(stmt.get())) {
      emitModifierChain(fn, index + 1);
    } else {
      emitStatement(stmt.get());
    }
  }
  modifierPrefix = saved;
  close();
}

void SolanaEmitter::emitAccounts() {
  line("#[derive(Accounts)]");
  open("pub struct Initialize<'info> {");
  line("#[account(init, payer = signer, space = 8 + " + stateType + "::INIT_SPACE, seeds = [b\"state\"], bump)]");
  line("pub state: Account<'info, " + stateType + ">,");
  line("#[account(mut)]");
  line("pub signer: Signer<'info>,");
  line("pub system_program: Program<'info, System>,");
  close();
  line("");

  for (const auto &fn: contract.functions) {
    if (!fn->isPublic()) {
      continue;
    }
    line("#[derive(Accounts)]");
    open("pub struct " + toPascalCase(toSnakeCase(fn->name)) + "Accounts<'info> {");
    line("#[account(mut, seeds = [b\"state\"], bump)]");
    line("pub state: Account<'info, " + stateType + ">,");
    line("pub signer: Signer<'info>,");
    close();
    line("");
  }
}

void SolanaEmitter::emitState() {
  line("#[account]");
  line("#[derive(InitSpace)]");
  open("pub struct " + stateType + " {");
  for (const auto &s: contract.state) {
    SourceSpan span(s->pos, s->pos + s->name.size());
    if (typeContains(s->resolved, BaseType::Map)) {
      if (options.mapPolicy == MapPolicy::Reject) {
        sink.error(span, DiagnosticCode::TargetConstraintViolation,
                   "map state field '" + s->name + "' has no fixed-size layout in a solana account; "
                   "use --map-capacity N to store it as a bounded vector");
      } else if (s->resolved->kind != BaseType::Map || typeContains(s->resolved->parameters[0], BaseType::Map) ||
                 typeContains(s->resolved->parameters[1], BaseType::Map)) {
        sink.error(span, DiagnosticCode::UnsupportedConstruct,
                   "nested map state field '" + s->name + "' cannot be stored as a bounded vector");
      }
    }
    std::string attr = maxLenAttr(s->resolved);
    if (!attr.empty()) {
      line(attr);
    }
    line("pub " + rustIdent(s->name) + ": " + type(s->resolved, span) + ",");
  }
  close();
  line("");
}

void SolanaEmitter::emitStructs() {
  for (const StructDeclAST *decl: visibleStructs(contract, unit)) {
    line("#[derive(AnchorSerialize, AnchorDeserialize, Clone, Debug, Default, PartialEq, Eq, InitSpace)]");
    open("pub struct " + decl->name + " {");
    for (const auto &field: decl->fields) {
      std::string attr = maxLenAttr(field.resolved);
      if (!attr.empty()) {
        line(attr);
      }
      line("pub " + rustIdent(field.name) + ": " +
           type(field.resolved, SourceSpan(field.pos, field.pos + field.name.size())) + ",");
    }
    close();
    line("");
  }
}

void SolanaEmitter::emitEvents() {
  for (const auto &event: contract.events) {
    line("#[event]");
    open("pub struct " + event->name + " {");
    for (const auto &field: event->fields) {
      line("pub " + rustIdent(field.name) + ": " +
           type(field.resolved, SourceSpan(field.pos, field.pos + field.name.size())) + ",");
    }
    close();
    line("");
  }
}

void SolanaEmitter::emitErrors() {
  line("#[error_code]");
  open("pub enum ErrorCode {");
  line("#[msg(\"arithmetic overflow\")]");
  line("ArithmeticOverflow,");
  if (usesBoundedMaps()) {
    line("#[msg(\"map capacity exceeded\")]");
    line("MapCapacityExceeded,");
  }
  for (const auto &message: errorOrder) {
    line("#[msg(" + rustString(message.empty() ? "requirement failed" : message) + ")]");
    line(errorVariants[message] + ",");
  }
  close();
}

void SolanaEmitter::emitInterfaces() {
  for (const auto &iface: unit.interfaces) {
    line("");
    open("pub trait " + iface->name + " {");
    for (const auto &fn: iface->functions) {
      std::string params = "&mut self";
      for (const auto &p: fn->params) {
        params += ", " + rustIdent(p.name) + ": " + type(p.resolved, SourceSpan(p.pos, p.pos + p.name.size()));
      }
      line("fn " + rustIdent(toSnakeCase(fn->name)) + "(" + params + ") -> " + returnType(*fn) + ";");
    }
    close();
  }
}

void SolanaEmitter::emitMapHelpers() {
  line("");
  open("fn map_get<K: PartialEq, V: Clone + Default>(entries: &[(K, V)], key: &K) -> V {");
  line("entries.iter().find(|(k, _)| k == key).map(|(_, v)| v.clone()).unwrap_or_default()");
  close();
  line("");
  open("fn map_set<K: PartialEq, V>(entries: &mut Vec<(K, V)>, key: K, value: V) -> Result<()> {");
  open("if let Some(entry) = entries.iter_mut().find(|(k, _)| *k == key) {");
  line("entry.1 = value;");
  line("return Ok(());");
  close();
  line("require!(entries.len() < " + std::to_string(options.mapCapacity) + ", ErrorCode::MapCapacityExceeded);");
  line("entries.push((key, value));");
  line("Ok(())");
  close();
}

//===----------------------------------------------------------------------===//
// 语句
//===----------------------------------------------------------------------===//

void SolanaEmitter::emitBlockBody(const BlockStmtAST *block) {
  for (const auto &stmt: block->statements) {
    emitStatement(stmt.get());
  }
}

void SolanaEmitter::emitStatement(const StmtAST *stmt) {
  if (auto *let = dynamic_cast<const LetStmtAST *>(stmt)) {
    std::string value = expr(let->value.get());
    if (typeContains(let->resolved_type, BaseType::Map)) {
      sink.error(let->span(), DiagnosticCode::UnsupportedConstruct, "a map cannot be bound to a local variable");
    }
    line(std::string("let ") + (let->is_mut ? "mut " : "") + localName(let->name) + ": " +
         type(let->resolved_type, let->span()) + " = " + value + ";");
  } else if (auto *assign = dynamic_cast<const AssignStmtAST *>(stmt)) {
    emitAssign(assign);
  } else if (auto *exprStmt = dynamic_cast<const ExprStmtAST *>(stmt)) {
    line(expr(exprStmt->expr.get()) + ";");
  } else if (auto *block = dynamic_cast<const BlockStmtAST *>(stmt)) {
    open("{");
    emitBlockBody(block);
    close();
  } else if (auto *ifStmt = dynamic_cast<const IfStmtAST *>(stmt)) {
    emitIf(ifStmt, false);
  } else if (auto *whileStmt = dynamic_cast<const WhileStmtAST *>(stmt)) {
    open("while " + expr(whileStmt->cond.get()) + " {");
    emitBlockBody(whileStmt->body.get());
    close();
  } else if (auto *forStmt = dynamic_cast<const ForStmtAST *>(stmt)) {
    std::string header;
    if (forStmt->isRange()) {
      header = operand(forStmt->iter_expr.get()) + ".." + operand(forStmt->range_end.get());
    } else {
      header = expr(forStmt->iter_expr.get());
    }
    open("for " + localName(forStmt->var_name) + " in " + header + " {");
    emitBlockBody(forStmt->body.get());
    close();
  } else if (auto *matchStmt = dynamic_cast<const MatchStmtAST *>(stmt)) {
    emitMatchStmt(matchStmt);
  } else if (auto *require = dynamic_cast<const RequireStmtAST *>(stmt)) {
    line("require!(" + expr(require->cond.get()) + ", ErrorCode::" + errorVariant(require->message) + ");");
  } else if (auto *emit = dynamic_cast<const EmitStmtAST *>(stmt)) {
    const EventDeclAST *event = contract.findEvent(emit->event);
    std::string fields;
    for (size_t i = 0; event && i < event->fields.size() && i < emit->args.size(); ++i) {
      if (i > 0) fields += ", ";
      fields += rustIdent(event->fields[i].name) + ": " + expr(emit->args[i].get());
    }
    line("emit!(" + emit->event + " { " + fields + " });");
  } else if (auto *ret = dynamic_cast<const ReturnStmtAST *>(stmt)) {
    line(ret->value ? "return Ok(" + expr(ret->value.get()) + ");" : "return Ok(());");
  } else if (dynamic_cast<const PlaceholderStmtAST *>(stmt)) {
    throw InternalCompilerError("placeholder outside of a modifier expansion", stmt->span());
  }
}

void SolanaEmitter::emitIf(const IfStmtAST *stmt, bool elseIf) {
  std::string head = (elseIf ? "} else if " : "if ") + expr(stmt->cond.get()) + " {";
  if (elseIf) {
    --indent;
  }
  open(head);
  emitBlockBody(stmt->then_branch.get());
  if (auto *next = dynamic_cast<const IfStmtAST *>(stmt->else_branch.get())) {
    emitIf(next, true);
    return;
  }
  if (auto *block = dynamic_cast<const BlockStmtAST *>(stmt->else_branch.get())) {
    close("} else {");
    ++indent;
    emitBlockBody(block);
  }
  close();
}

void SolanaEmitter::emitAssign(const AssignStmtAST *stmt) {
  const ExprAST *lhs = stmt->lhs_expr.get();
  if (isStateMapIndex(lhs)) {
    auto *index = static_cast<const ArrayIndexExprAST *>(lhs);
    std::string key = fresh("map_key");
    std::string value = fresh("map_value");
    open("{");
    line("let " + key + " = " + expr(index->index_expr.get()) + ";");
    line("let " + value + " = " + expr(stmt->value.get()) + ";");
    line("map_set(&mut " + place(index->array_expr.get()) + ", " + key + ", " + value + ")?;");
    close();
    return;
  }
  if (containsMapIndex(lhs)) {
    sink.error(lhs->span(), DiagnosticCode::UnsupportedConstruct,
               "only whole entries of a bounded map can be assigned on solana");
  }
  line(place(lhs) + " = " + expr(stmt->value.get()) + ";");
}

void SolanaEmitter::emitMatchStmt(const MatchStmtAST *stmt) {
  open("match " + scrutinee(stmt->scrutinee.get()) + " {");
  bool sawWildcard = false;
  bool sawTrue = false;
  bool sawFalse = false;
  for (const auto &arm: stmt->arms) {
    if (arm.pattern->isWildcard()) {
      sawWildcard = true;
    } else if (auto *b = dynamic_cast<const BoolExprAST *>(arm.pattern->literal.get())) {
      (b->value ? sawTrue : sawFalse) = true;
    }
    open(pattern(arm.pattern.get()) + " => {");
    emitBlockBody(arm.body.get());
    close();
  }
  if (!sawWildcard && !(sawTrue && sawFalse)) {
    line("_ => {}");
  }
  close();
}

//===----------------------------------------------------------------------===//
// 表达式
//===----------------------------------------------------------------------===//

bool SolanaEmitter::isPlace(const ExprAST *e) const {
  if (auto *var = dynamic_cast<const VariableExprAST *>(e)) {
    return var->binding != VarBinding::Constant;
  }
  if (auto *member = dynamic_cast<const MemberAccessExprAST *>(e)) {
    return isPlace(member->struct_expr.get());
  }
  if (auto *index = dynamic_cast<const ArrayIndexExprAST *>(e)) {
    return index->array_expr->type && index->array_expr->type->kind != BaseType::Map &&
           isPlace(index->array_expr.get());
  }
  return false;
}

bool SolanaEmitter::isStateMapIndex(const ExprAST *e) const {
  auto *index = dynamic_cast<const ArrayIndexExprAST *>(e);
  if (!index || !index->array_expr->type || index->array_expr->type->kind != BaseType::Map) {
    return false;
  }
  auto *var = dynamic_cast<const VariableExprAST *>(index->array_expr.get());
  return var && var->binding == VarBinding::State;
}

bool SolanaEmitter::containsMapIndex(const ExprAST *e) const {
  if (auto *member = dynamic_cast<const MemberAccessExprAST *>(e)) {
    return containsMapIndex(member->struct_expr.get());
  }
  if (auto *index = dynamic_cast<const ArrayIndexExprAST *>(e)) {
    return (index->array_expr->type && index->array_expr->type->kind == BaseType::Map) ||
           containsMapIndex(index->array_expr.get());
  }
  return false;
}

std::string SolanaEmitter::variable(const VariableExprAST *e) {
  switch (e->binding) {
    case VarBinding::State:
      return "state." + rustIdent(e->name);
    case VarBinding::Constant: {
      std::string name = toUpperSnake(e->name);
      if (e->type && e->type->kind == BaseType::String) return "String::from(" + name + ")";
      if (e->type && e->type->kind == BaseType::Bytes) return name + ".to_vec()";
      return name;
    }
    default:
      return localName(e->name);
  }
}

// 不复制的访问路径：用于赋值左侧、方法接收者与比较
std::string SolanaEmitter::place(const ExprAST *e) {
  if (auto *var = dynamic_cast<const VariableExprAST *>(e)) {
    if (var->type && var->type->kind == BaseType::Map && var->binding != VarBinding::State) {
      sink.error(e->span(), DiagnosticCode::UnsupportedConstruct, "map values can only be accessed by index");
    }
    return variable(var);
  }
  if (auto *member = dynamic_cast<const MemberAccessExprAST *>(e)) {
    std::string base = isPlace(member->struct_expr.get()) ? place(member->struct_expr.get())
                                                         : primary(member->struct_expr.get());
    return base + "." + rustIdent(member->member_name);
  }
  if (auto *index = dynamic_cast<const ArrayIndexExprAST *>(e)) {
    if (index->array_expr->type && index->array_expr->type->kind == BaseType::Map) {
      return expr(e);
    }
    std::string base = isPlace(index->array_expr.get()) ? place(index->array_expr.get())
                                                       : primary(index->array_expr.get());
    return base + "[" + operand(index->index_expr.get()) + " as usize]";
  }
  return expr(e);
}

// 方法调用接收者
std::string SolanaEmitter::primary(const ExprAST *e) {
  std::string text = expr(e);
  bool needsParens = false;
  if (auto *number = dynamic_cast<const NumberExprAST *>(e)) {
    needsParens = number->value < 0;
  } else if (auto *binary = dynamic_cast<const BinaryExprAST *>(e)) {
    needsParens = !checkedMethod(binary->op) || constContext;
  } else if (dynamic_cast<const UnaryExprAST *>(e) || dynamic_cast<const TernaryExprAST *>(e) ||
             dynamic_cast<const MatchExprAST *>(e)) {
    needsParens = true;
  } else if (dynamic_cast<const CastExprAST *>(e)) {
    needsParens = constContext;
  }
  return needsParens ? "(" + text + ")" : text;
}

// 二元运算的操作数
std::string SolanaEmitter::operand(const ExprAST *e) {
  return primary(e);
}

std::string SolanaEmitter::borrowOperand(const ExprAST *e) {
  if (isPlace(e)) {
    return place(e);
  }
  return operand(e);
}

std::string SolanaEmitter::literal(const NumberExprAST *e) {
  std::string suffix = e->type ? type(e->type, e->span()) : "u64";
  return e->value.str() + suffix;
}

std::string SolanaEmitter::expr(const ExprAST *e) {
  checkType(e);
  if (auto *number = dynamic_cast<const NumberExprAST *>(e)) {
    return literal(number);
  }
  if (auto *b = dynamic_cast<const BoolExprAST *>(e)) {
    return b->value ? "true" : "false";
  }
  if (auto *s = dynamic_cast<const StringExprAST *>(e)) {
    return "String::from(" + rustString(s->str) + ")";
  }
  if (auto *bytes = dynamic_cast<const BytesExprAST *>(e)) {
    return rustBytes(bytes->bytes) + ".to_vec()";
  }
  if (auto *intrinsic = dynamic_cast<const IntrinsicExprAST *>(e)) {
    const char *text = renderIntrinsic(Target::Solana, intrinsic->kind);
    if (!text) {
      sink.error(e->span(), DiagnosticCode::UnsupportedConstruct,
                 std::string(intrinsicName(intrinsic->kind)) + " is not available on solana");
      return "0";
    }
    return text;
  }
  if (isPlace(e)) {
    std::string text = place(e);
    return isCopy(e->type) ? text : text + ".clone()";
  }
  if (auto *var = dynamic_cast<const VariableExprAST *>(e)) {
    return variable(var);
  }
  if (auto *unary = dynamic_cast<const UnaryExprAST *>(e)) {
    if (unary->op == "!") {
      return "!" + operand(unary->expr.get());
    }
    if (constContext) {
      return "-" + operand(unary->expr.get());
    }
    return primary(unary->expr.get()) + ".checked_neg().ok_or(ErrorCode::ArithmeticOverflow)?";
  }
  if (auto *bin = dynamic_cast<const BinaryExprAST *>(e)) {
    return binary(bin);
  }
  if (auto *ternary = dynamic_cast<const TernaryExprAST *>(e)) {
    return "if " + expr(ternary->cond.get()) + " { " + expr(ternary->then_expr.get()) + " } else { " +
           expr(ternary->else_expr.get()) + " }";
  }
  if (auto *c = dynamic_cast<const CallExprAST *>(e)) {
    return call(c);
  }
  if (auto *index = dynamic_cast<const ArrayIndexExprAST *>(e)) {
    // map 读取；vec / 数组索引已经作为访问路径处理
    if (!isStateMapIndex(e)) {
      sink.error(e->span(), DiagnosticCode::UnsupportedConstruct,
                 "only contract state maps can be indexed on solana");
    }
    return "map_get(&" + place(index->array_expr.get()) + ", &" + operand(index->index_expr.get()) + ")";
  }
  if (auto *member = dynamic_cast<const MemberAccessExprAST *>(e)) {
    return primary(member->struct_expr.get()) + "." + rustIdent(member->member_name);
  }
  if (auto *literal = dynamic_cast<const StructExprAST *>(e)) {
    std::string fields;
    for (size_t i = 0; i < literal->fields.size(); ++i) {
      if (i > 0) fields += ", ";
      fields += rustIdent(literal->fields[i].first) + ": " + expr(literal->fields[i].second.get());
    }
    return literal->name + " { " + fields + " }";
  }
  if (auto *c = dynamic_cast<const CastExprAST *>(e)) {
    return cast(c);
  }
  if (auto *option = dynamic_cast<const OptionExprAST *>(e)) {
    return option->isNone() ? "None" : "Some(" + expr(option->value.get()) + ")";
  }
  if (auto *match = dynamic_cast<const MatchExprAST *>(e)) {
    return matchExpr(match);
  }
  if (dynamic_cast<const LambdaExprAST *>(e)) {
    sink.error(e->span(), DiagnosticCode::UnsupportedConstruct, "lambda outside of map or filter");
    return "()";
  }
  throw InternalCompilerError("unhandled expression in solana code generation", e->span());
}

std::string SolanaEmitter::binary(const BinaryExprAST *e) {
  const char *method = checkedMethod(e->op);
  if (method && !constContext) {
    return primary(e->left_expr.get()) + "." + method + "(" + expr(e->right_expr.get()) +
           ").ok_or(ErrorCode::ArithmeticOverflow)?";
  }
  if (e->op == "==" || e->op == "!=") {
    return borrowOperand(e->left_expr.get()) + " " + e->op + " " + borrowOperand(e->right_expr.get());
  }
  return operand(e->left_expr.get()) + " " + e->op + " " + operand(e->right_expr.get());
}

std::string SolanaEmitter::cast(const CastExprAST *e) {
  std::string inner = expr(e->expr.get());
  if (e->expr->type && e->expr->type->equals(e->type)) {
    return inner;
  }
  std::string target = type(e->type, e->span());
  if (constContext) {
    return operand(e->expr.get()) + " as " + target;
  }
  // 有损转换在运行时中止，与 Move 的 as 一致
  return target + "::try_from(" + inner + ").map_err(|_| ErrorCode::ArithmeticOverflow)?";
}

std::string SolanaEmitter::call(const CallExprAST *e) {
  switch (e->target) {
    case CallTarget::Function: {
      std::string args = "state, env";
      for (const auto &arg: e->args) {
        args += ", " + expr(arg.get());
      }
      return logicName(e->call) + "(" + args + ")?";
    }
    case CallTarget::VecLen:
      return "(" + borrowOperand(e->object_expr.get()) + ".len() as u64)";
    case CallTarget::VecPush:
      if (containsMapIndex(e->object_expr.get())) {
        sink.error(e->span(), DiagnosticCode::UnsupportedConstruct,
                   "cannot push into a vector stored inside a bounded map on solana");
      }
      return place(e->object_expr.get()) + ".push(" + expr(e->args[0].get()) + ")";
    case CallTarget::VecMap:
    case CallTarget::VecFilter:
      return collect(e);
    case CallTarget::OptionIsSome:
      return borrowOperand(e->object_expr.get()) + ".is_some()";
    case CallTarget::OptionIsNone:
      return borrowOperand(e->object_expr.get()) + ".is_none()";
    case CallTarget::OptionUnwrap:
      return primary(e->object_expr.get()) + ".unwrap()";
    case CallTarget::Unresolved:
      break;
  }
  throw InternalCompilerError("call '" + e->call + "' reached code generation unresolved", e->span());
}

// map / filter 展开为块表达式中的循环，闭包里无法使用 ?
std::string SolanaEmitter::collect(const CallExprAST *e) {
  auto *lambda = dynamic_cast<const LambdaExprAST *>(e->args[0].get());
  if (!lambda) {
    throw InternalCompilerError("map/filter without a lambda reached code generation", e->span());
  }
  std::string result = fresh(e->target == CallTarget::VecMap ? "mapped" : "filtered");
  std::string var = localName(lambda->params[0]);
  std::string text = "{ let mut " + result + ": " + type(e->type, e->span()) + " = Vec::new(); for " + var +
                     " in " + expr(e->object_expr.get()) + " { ";
  if (e->target == CallTarget::VecMap) {
    text += result + ".push(" + expr(lambda->body.get()) + ");";
  } else {
    text += "if " + expr(lambda->body.get()) + " { " + result + ".push(" + var + "); }";
  }
  return text + " } " + result + " }";
}

std::string SolanaEmitter::scrutinee(const ExprAST *e) {
  if (e->type && e->type->kind == BaseType::String) {
    return borrowOperand(e) + ".as_str()";
  }
  return expr(e);
}

std::string SolanaEmitter::pattern(const PatternAST *p) {
  if (p->isWildcard()) {
    return "_";
  }
  if (auto *s = dynamic_cast<const StringExprAST *>(p->literal.get())) {
    return rustString(s->str);
  }
  return expr(p->literal.get());
}

std::string SolanaEmitter::matchExpr(const MatchExprAST *e) {
  std::string text = "match " + scrutinee(e->scrutinee.get()) + " { ";
  for (const auto &arm: e->arms) {
    text += pattern(arm.pattern.get()) + " => " + expr(arm.value.get()) + ", ";
  }
  return text + "}";
}

} // namespace

GeneratedArtifact SolanaGenerator::generate(const ContractAST &contract, const SourceUnitAST &unit) const {
  GeneratedArtifact artifact;
  artifact.target = Target::Solana;
  artifact.contractName = contract.name;
  DiagnosticSink sink;
  SolanaEmitter emitter(contract, unit, options_, sink);
  std::string text = emitter.run();
  artifact.ok = !sink.hasErrors();
  artifact.diagnostics = sink.take();
  if (artifact.ok) {
    artifact.text = std::move(text);
  }
  return artifact;
}
