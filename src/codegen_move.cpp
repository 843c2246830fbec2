#include "codegen.h"
#include <cctype>
#include <functional>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <unordered_set>

namespace {

const std::unordered_set<std::string> kMoveReserved = {
  "abort", "acquires", "as", "break", "const", "continue", "copy", "else", "entry", "enum", "false", "for",
  "friend", "fun", "has", "if", "invariant", "let", "loop", "match", "module", "move", "mut", "native",
  "phantom", "public", "return", "script", "spec", "struct", "true", "type", "use", "while", "Self",
  // 生成代码自己使用的名字
  "state", "caller", "ctx", "account", "id"
};

std::string moveIdent(const std::string &name) {
  std::string out = name;
  if (!out.empty() && std::isupper(static_cast<unsigned char>(out[0]))) {
    out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
  }
  return kMoveReserved.count(out) ? out + "_" : out;
}

std::string moveStructName(const std::string &name) {
  std::string out = name;
  if (!out.empty()) {
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  }
  return out;
}

// Move 字节串字面量 b"..."
std::string moveByteString(const std::string &text) {
  std::ostringstream oss;
  oss << "b\"";
  for (unsigned char c: text) {
    switch (c) {
      case '"': oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n"; break;
      case '\t': oss << "\\t"; break;
      case '\r': oss << "\\r"; break;
      case '\0': oss << "\\0"; break;
      default:
        if (c < 0x20 || c >= 0x7f) {
          oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c) << std::dec;
        } else {
          oss << c;
        }
    }
  }
  oss << '"';
  return oss.str();
}

std::string moveHexBytes(const std::string &bytes) {
  std::ostringstream oss;
  oss << "x\"";
  for (unsigned char c: bytes) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  oss << '"';
  return oss.str();
}

std::string abortConstName(const std::string &message) {
  std::string words;
  bool boundary = false;
  int count = 0;
  for (unsigned char c: message) {
    if (std::isalnum(c)) {
      if (boundary || words.empty()) {
        if (++count > 6) break;
        if (!words.empty()) words += '_';
      }
      words += static_cast<char>(std::toupper(c));
      boundary = false;
    } else {
      boundary = true;
    }
  }
  return words.empty() ? "E_REQUIREMENT_FAILED" : "E_" + words;
}

// 语句是否能作为块的结尾值而不加分号
bool isBlockLike(const StmtAST *stmt) {
  return dynamic_cast<const IfStmtAST *>(stmt) || dynamic_cast<const WhileStmtAST *>(stmt) ||
         dynamic_cast<const ForStmtAST *>(stmt) || dynamic_cast<const BlockStmtAST *>(stmt) ||
         dynamic_cast<const MatchStmtAST *>(stmt) || dynamic_cast<const ReturnStmtAST *>(stmt);
}

// 可以直接作为实参、不需要先存入临时变量的表达式
bool isSimpleOperand(const ExprAST *e) {
  if (isLiteral(e)) {
    return true;
  }
  auto *var = dynamic_cast<const VariableExprAST *>(e);
  return var && var->binding != VarBinding::State;
}

// 可寻址表达式：Move 中的局部变量、字段或 vector 元素
struct Path {
  std::string text;
  bool isRef = false;
};

class MoveEmitter {
public:
  MoveEmitter(Target target, const ContractAST &contract, const SourceUnitAST &unit, DiagnosticSink &sink)
    : target(target), isSui(target == Target::Sui), contract(contract), unit(unit), sink(sink) {}

  std::string run();

private:
  void emitAbortCodes();
  void emitConstants();
  void emitStructs();
  void emitEvents();
  void emitState();
  void emitInitializer();
  void emitEntry(const FnDeclAST &fn);
  void emitLogicFunction(const FnDeclAST &fn);
  void emitBodyFunction(const FnDeclAST &fn);
  void emitHelpers();

  void emitModifierChain(const FnDeclAST &fn, size_t index, bool last);
  void emitBlockBody(const BlockStmtAST *block, bool tail);
  void emitStatement(const StmtAST *stmt, bool last);
  void emitIf(const IfStmtAST *stmt, bool elseIf, const std::string &end);
  void emitAssign(const AssignStmtAST *stmt);
  void emitFor(const ForStmtAST *stmt, const std::string &end);
  void emitMatchStmt(const MatchStmtAST *stmt, const std::string &end);

  std::string expr(const ExprAST *e);
  std::string operand(const ExprAST *e);
  std::string call(const CallExprAST *e);
  std::string literal(const NumberExprAST *e);
  std::string matchExpr(const MatchExprAST *e);
  std::string patternTest(const std::string &subject, const PatternAST *p);
  std::string index(const ExprAST *e);

  bool isPlace(const ExprAST *e, bool forWrite) const;
  bool isStateMapIndex(const ExprAST *e) const;
  Path path(const ExprAST *e, bool mut);
  std::string refOf(const Path &p, bool mut) const;
  std::string valueOf(const Path &p) const;
  std::string withRef(const ExprAST *e, bool mut, const std::function<std::string(const std::string &)> &use);

  std::string type(const TypeRef &t, SourceSpan span);
  std::string zeroValue(const TypeRef &t, SourceSpan span);
  void checkType(const ExprAST *e);
  std::string localName(const std::string &name) const;
  std::string entryName(const std::string &name) const;
  std::string logicName(const std::string &name) const;
  std::string letKeyword(bool mutated) const;
  std::string paramList(const FnDeclAST &fn);
  std::string argList(const FnDeclAST &fn);
  std::string callArgs(const std::vector<std::string> &args) const;
  std::string returnSuffix(const FnDeclAST &fn);
  std::string fresh(const std::string &prefix);
  void use(const std::string &module);

  void line(const std::string &text);
  void open(const std::string &text);
  void close(const std::string &text = "}");

  Target target;
  bool isSui;
  const ContractAST &contract;
  const SourceUnitAST &unit;
  DiagnosticSink &sink;

  std::ostringstream out;
  int indent = 1;
  int tempId = 0;
  std::string stateType;
  std::set<std::string> uses;
  std::map<std::string, std::string> abortCodes;
  bool needTableGet = false;
  bool needTableSet = false;
  bool needTableEntry = false;

  std::string modifierPrefix;
  bool bodyAsFunction = false;
  bool inInitializer = false;
};

//===----------------------------------------------------------------------===//
// 输出
//===----------------------------------------------------------------------===//

void MoveEmitter::line(const std::string &text) {
  if (text.empty()) {
    out << "\n";
    return;
  }
  out << std::string(static_cast<size_t>(indent) * 4, ' ') << text << "\n";
}

void MoveEmitter::open(const std::string &text) {
  line(text);
  ++indent;
}

void MoveEmitter::close(const std::string &text) {
  --indent;
  line(text);
}

std::string MoveEmitter::fresh(const std::string &prefix) {
  return prefix + "_" + std::to_string(++tempId);
}

void MoveEmitter::use(const std::string &module) {
  uses.insert(module);
}

std::string MoveEmitter::localName(const std::string &name) const {
  return moveIdent(modifierPrefix + name);
}

std::string MoveEmitter::entryName(const std::string &name) const {
  static const std::unordered_set<std::string> reserved = {
    "init", "init_module", "table_get", "table_set", "table_entry"
  };
  std::string snake = toSnakeCase(name);
  return reserved.count(snake) || kMoveReserved.count(snake) ? snake + "_entry" : snake;
}

std::string MoveEmitter::logicName(const std::string &name) const {
  return toSnakeCase(name) + "_impl";
}

// Sui 的 Move 2024 要求可变局部变量写 let mut；Aptos 没有这个关键字
std::string MoveEmitter::letKeyword(bool mutated) const {
  return isSui && mutated ? "let mut " : "let ";
}

std::string MoveEmitter::type(const TypeRef &t, SourceSpan span) {
  std::string text;
  std::string reason;
  if (!renderType(target, t, text, reason)) {
    sink.error(span, DiagnosticCode::UnsupportedConstruct, reason);
    return "u64";
  }
  return text;
}

void MoveEmitter::checkType(const ExprAST *e) {
  if (!e->type || e->type->kind == BaseType::Function || e->type->isVoid() || e->type->isUnknown() ||
      e->type->containsUnknown()) {
    return;
  }
  type(e->type, e->span());
}

std::string MoveEmitter::zeroValue(const TypeRef &t, SourceSpan span) {
  switch (t->kind) {
    case BaseType::Int:
      return "0" + type(t, span);
    case BaseType::Bool:
      return "false";
    case BaseType::Address:
      return "@0x0";
    case BaseType::String:
      use("std::string");
      return "string::utf8(b\"\")";
    case BaseType::Bytes:
      return "b\"\"";
    case BaseType::Vector:
      return "vector<" + type(t->elementType, span) + ">[]";
    case BaseType::Array: {
      std::string zero = zeroValue(t->elementType, span);
      std::string text = "vector<" + type(t->elementType, span) + ">[";
      for (int64_t i = 0; i < t->arrayLength; ++i) {
        if (i > 0) text += ", ";
        text += zero;
      }
      return text + "]";
    }
    case BaseType::Option:
      use("std::option");
      return "option::none<" + type(t->elementType, span) + ">()";
    case BaseType::Map:
      use(isSui ? "sui::table" : "aptos_std::table");
      return isSui ? "table::new(ctx)" : "table::new()";
    case BaseType::Struct: {
      std::string fields;
      for (size_t i = 0; i < t->parameters.size(); ++i) {
        if (i > 0) fields += ", ";
        fields += moveIdent(t->fieldNames[i]) + ": " + zeroValue(t->parameters[i], span);
      }
      return moveStructName(t->name) + " { " + fields + " }";
    }
    default:
      sink.error(span, DiagnosticCode::UnsupportedConstruct,
                 "type " + t->toString() + " has no default value on " + targetName(target));
      return "0";
  }
}

//===----------------------------------------------------------------------===//
// 声明
//===----------------------------------------------------------------------===//

std::string MoveEmitter::run() {
  stateType = moveStructName(contract.name) + "State";
  if (!isSui) {
    use("std::signer");
  }

  emitAbortCodes();
  emitConstants();
  emitStructs();
  emitEvents();
  emitState();
  emitInitializer();
  for (const auto &fn: contract.functions) {
    if (fn->isPublic()) {
      emitEntry(*fn);
    }
  }
  for (const auto &fn: contract.functions) {
    emitLogicFunction(*fn);
  }
  emitHelpers();

  for (const auto &iface: unit.interfaces) {
    sink.warning(SourceSpan(iface->pos, iface->pos + iface->name.size()), DiagnosticCode::UnsupportedConstruct,
                 "interface '" + iface->name + "' has no counterpart on " + std::string(targetName(target)) +
                 " and is omitted");
  }

  std::ostringstream module;
  module << "module cross_chain::" << toSnakeCase(contract.name) << " {\n";
  for (const auto &m: uses) {
    module << "    use " << m << ";\n";
  }
  if (!uses.empty()) {
    module << "\n";
  }
  std::string body = out.str();
  // 去掉最后一个声明后的空行
  while (body.size() >= 2 && body[body.size() - 1] == '\n' && body[body.size() - 2] == '\n') {
    body.pop_back();
  }
  module << body << "}\n";
  return module.str();
}

void MoveEmitter::emitAbortCodes() {
  auto messages = collectRequireMessages(contract);
  if (messages.empty()) {
    return;
  }
  std::unordered_set<std::string> used;
  int code = 0;
  for (const auto &message: messages) {
    std::string base = abortConstName(message);
    std::string name = base;
    for (int n = 2; used.count(name); ++n) {
      name = base + "_" + std::to_string(n);
    }
    used.insert(name);
    abortCodes[message] = name;
    line("const " + name + ": u64 = " + std::to_string(++code) + ";");
  }
  line("");
}

void MoveEmitter::emitConstants() {
  if (contract.consts.empty()) {
    return;
  }
  for (const auto &c: contract.consts) {
    SourceSpan span(c->pos, c->pos + c->name.size());
    std::string name = toUpperSnake(c->name);
    switch (c->resolved->kind) {
      case BaseType::String:
        if (auto *s = dynamic_cast<const StringExprAST *>(c->value.get())) {
          line("const " + name + ": vector<u8> = " + moveByteString(s->str) + ";");
          continue;
        }
        break;
      case BaseType::Bytes:
        if (auto *b = dynamic_cast<const BytesExprAST *>(c->value.get())) {
          line("const " + name + ": vector<u8> = " + moveHexBytes(b->bytes) + ";");
          continue;
        }
        break;
      case BaseType::Int:
      case BaseType::Bool:
        line("const " + name + ": " + type(c->resolved, span) + " = " + expr(c->value.get()) + ";");
        continue;
      default:
        break;
    }
    sink.error(span, DiagnosticCode::UnsupportedConstruct,
               "constant '" + c->name + "' of type " + c->resolved->toString() +
               " cannot be expressed as a Move constant");
  }
  line("");
}

void MoveEmitter::emitStructs() {
  std::string keyword = isSui ? "public struct " : "struct ";
  for (const StructDeclAST *decl: visibleStructs(contract, unit)) {
    open(keyword + moveStructName(decl->name) + " has copy, drop, store {");
    for (const auto &field: decl->fields) {
      line(moveIdent(field.name) + ": " + type(field.resolved, SourceSpan(field.pos, field.pos + field.name.size())) +
           ",");
    }
    close();
    line("");
  }
}

void MoveEmitter::emitEvents() {
  if (contract.events.empty()) {
    return;
  }
  for (const auto &event: contract.events) {
    if (isSui) {
      open("public struct " + moveStructName(event->name) + " has copy, drop {");
    } else {
      line("#[event]");
      open("struct " + moveStructName(event->name) + " has drop, store {");
    }
    for (const auto &field: event->fields) {
      line(moveIdent(field.name) + ": " + type(field.resolved, SourceSpan(field.pos, field.pos + field.name.size())) +
           ",");
    }
    close();
    line("");
  }
}

void MoveEmitter::emitState() {
  open((isSui ? "public struct " : "struct ") + stateType + " has key {");
  if (isSui) {
    line("id: UID,");
  }
  for (const auto &s: contract.state) {
    SourceSpan span(s->pos, s->pos + s->name.size());
    if (s->resolved->kind == BaseType::Map && (typeContains(s->resolved->parameters[0], BaseType::Map) ||
                                               typeContains(s->resolved->parameters[1], BaseType::Map))) {
      sink.error(span, DiagnosticCode::UnsupportedConstruct,
                 "nested map state field '" + s->name + "' is not supported on " + targetName(target));
    } else if (s->resolved->kind != BaseType::Map && typeContains(s->resolved, BaseType::Map)) {
      sink.error(span, DiagnosticCode::UnsupportedConstruct,
                 "state field '" + s->name + "' nests a map inside another type");
    }
    line(moveIdent(s->name) + ": " + type(s->resolved, span) + ",");
  }
  close();
  line("");
}

void MoveEmitter::emitInitializer() {
  inInitializer = true;
  if (isSui) {
    open("fun init(ctx: &mut TxContext) {");
    open("let state = " + stateType + " {");
    line("id: object::new(ctx),");
  } else {
    open("fun init_module(account: &signer) {");
    open("move_to(account, " + stateType + " {");
  }
  for (const auto &s: contract.state) {
    SourceSpan span(s->pos, s->pos + s->name.size());
    std::string value = s->default_value ? expr(s->default_value.get()) : zeroValue(s->resolved, span);
    line(moveIdent(s->name) + ": " + value + ",");
  }
  if (isSui) {
    close("};");
    line("transfer::share_object(state);");
  } else {
    close("});");
  }
  close();
  line("");
  inInitializer = false;
}

std::string MoveEmitter::returnSuffix(const FnDeclAST &fn) {
  if (!fn.resolved_return || fn.resolved_return->isVoid()) {
    return "";
  }
  return ": " + type(fn.resolved_return, SourceSpan(fn.pos, fn.pos + fn.name.size()));
}

std::string MoveEmitter::callArgs(const std::vector<std::string> &args) const {
  std::string text = "state";
  if (!isSui) {
    text += ", caller";
  }
  for (const auto &arg: args) {
    text += ", " + arg;
  }
  if (isSui) {
    text += ", ctx";
  }
  return text;
}

std::string MoveEmitter::paramList(const FnDeclAST &fn) {
  std::string params = "state: &mut " + stateType;
  if (!isSui) {
    params += ", caller: address";
  }
  for (const auto &p: fn.params) {
    params += ", " + moveIdent(p.name) + ": " + type(p.resolved, SourceSpan(p.pos, p.pos + p.name.size()));
  }
  if (isSui) {
    params += ", ctx: &mut TxContext";
  }
  return params;
}

std::string MoveEmitter::argList(const FnDeclAST &fn) {
  std::vector<std::string> args;
  for (const auto &p: fn.params) {
    args.push_back(moveIdent(p.name));
  }
  return callArgs(args);
}

// 有返回值或参数含结构体的公共函数不能作为 entry，生成普通的 public fun
void MoveEmitter::emitEntry(const FnDeclAST &fn) {
  bool isVoid = !fn.resolved_return || fn.resolved_return->isVoid();
  bool entry = isVoid;
  for (const auto &p: fn.params) {
    if (typeContains(p.resolved, BaseType::Struct)) {
      entry = false;
    }
  }
  std::string head = entry ? "public entry fun " : "public fun ";
  std::string params;
  if (isSui) {
    params = "state: &mut " + stateType;
  } else {
    params = "account: &signer";
  }
  for (const auto &p: fn.params) {
    params += ", " + moveIdent(p.name) + ": " + type(p.resolved, SourceSpan(p.pos, p.pos + p.name.size()));
  }
  if (isSui) {
    params += ", ctx: &mut TxContext";
  }
  std::string acquires = isSui ? "" : " acquires " + stateType;
  open(head + entryName(fn.name) + "(" + params + ")" + returnSuffix(fn) + acquires + " {");
  std::vector<std::string> args;
  for (const auto &p: fn.params) {
    args.push_back(moveIdent(p.name));
  }
  if (isSui) {
    line(logicName(fn.name) + "(" + callArgs(args) + ")" + (isVoid ? ";" : ""));
  } else {
    line("let state = borrow_global_mut<" + stateType + ">(@cross_chain);");
    std::string text = "state, signer::address_of(account)";
    for (const auto &arg: args) {
      text += ", " + arg;
    }
    line(logicName(fn.name) + "(" + text + ")" + (isVoid ? ";" : ""));
  }
  close();
  line("");
}

void MoveEmitter::emitLogicFunction(const FnDeclAST &fn) {
  modifierPrefix.clear();
  bodyAsFunction = false;
  for (const auto &m: fn.modifiers) {
    const ModifierDeclAST *modifier = contract.findModifier(m.name);
    if (modifier && modifierHasPostCode(*modifier)) {
      bodyAsFunction = true;
    }
  }
  bool isVoid = !fn.resolved_return || fn.resolved_return->isVoid();
  SourceSpan span(fn.pos, fn.pos + fn.name.size());

  open("fun " + logicName(fn.name) + "(" + paramList(fn) + ")" + returnSuffix(fn) + " {");
  if (fn.modifiers.empty()) {
    emitBlockBody(fn.body.get(), true);
  } else if (bodyAsFunction && !isVoid) {
    line(letKeyword(true) + "body_result: " + type(fn.resolved_return, span) + " = " +
         zeroValue(fn.resolved_return, span) + ";");
    emitModifierChain(fn, 0, false);
    line("body_result");
  } else {
    emitModifierChain(fn, 0, true);
  }
  close();
  line("");

  if (bodyAsFunction) {
    emitBodyFunction(fn);
  }
}

void MoveEmitter::emitBodyFunction(const FnDeclAST &fn) {
  modifierPrefix.clear();
  open("fun " + toSnakeCase(fn.name) + "_body(" + paramList(fn) + ")" + returnSuffix(fn) + " {");
  emitBlockBody(fn.body.get(), true);
  close();
  line("");
}

void MoveEmitter::emitModifierChain(const FnDeclAST &fn, size_t index, bool last) {
  if (index == fn.modifiers.size()) {
    std::string saved = modifierPrefix;
    modifierPrefix.clear();
    if (bodyAsFunction) {
      std::string callText = toSnakeCase(fn.name) + "_body(" + argList(fn) + ")";
      if (!fn.resolved_return || fn.resolved_return->isVoid()) {
        line(callText + ";");
      } else {
        line("body_result = " + callText + ";");
      }
    } else {
      emitBlockBody(fn.body.get(), last);
    }
    modifierPrefix = saved;
    return;
  }

  const ModifierUseAST &m = fn.modifiers[index];
  const ModifierDeclAST *modifier = contract.findModifier(m.name);
  if (!modifier) {
    throw InternalCompilerError("modifier '" + m.name + "' reached code generation unresolved",
                                SourceSpan(m.pos, m.pos + m.name.size()));
  }
  std::string prefix = toSnakeCase(modifier->name) + "_";
  open("{");
  for (size_t i = 0; i < modifier->params.size() && i < m.args.size(); ++i) {
    const ParamAST &p = modifier->params[i];
    line("let " + moveIdent(prefix + p.name) + ": " + type(p.resolved, SourceSpan(p.pos, p.pos)) + " = " +
         expr(m.args[i].get()) + ";");
  }
  std::string saved = modifierPrefix;
  modifierPrefix = prefix;
  const auto &statements = modifier->body->statements;
  for (size_t i = 0; i < statements.size(); ++i) {
    bool isLast = last && i + 1 == statements.size();
    if (dynamic_cast<const PlaceholderStmtAST *>(statements[i].get())) {
      emitModifierChain(fn, index + 1, isLast);
    } else {
      emitStatement(statements[i].get(), isLast);
    }
  }
  modifierPrefix = saved;
  close(last ? "}" : "};");
}

void MoveEmitter::emitHelpers() {
  std::string table = isSui ? "sui::table::Table" : "aptos_std::table::Table";
  std::string keyBound = isSui ? "copy + drop + store" : "copy + drop";
  if (needTableGet) {
    std::string valueBound = isSui ? "copy + drop + store" : "copy + drop";
    open("fun table_get<K: " + keyBound + ", V: " + valueBound + ">(t: &" + table +
         "<K, V>, key: K, default: V): V {");
    line("if (table::contains(t, key)) *table::borrow(t, key) else default");
    close();
    line("");
  }
  if (needTableSet) {
    open("fun table_set<K: " + keyBound + ", V: drop + store>(t: &mut " + table + "<K, V>, key: K, value: V) {");
    open("if (table::contains(t, key)) {");
    line("*table::borrow_mut(t, key) = value;");
    close("} else {");
    ++indent;
    line("table::add(t, key, value);");
    close();
    close();
    line("");
  }
  if (needTableEntry) {
    open("fun table_entry<K: " + keyBound + ", V: drop + store>(t: &mut " + table +
         "<K, V>, key: K, default: V): &mut V {");
    open("if (!table::contains(t, key)) {");
    line("table::add(t, key, default);");
    close("};");
    line("table::borrow_mut(t, key)");
    close();
    line("");
  }
}

//===----------------------------------------------------------------------===//
// 语句
//===----------------------------------------------------------------------===//

// tail 为 true 时最后一条语句的值就是块的值
void MoveEmitter::emitBlockBody(const BlockStmtAST *block, bool tail) {
  for (size_t i = 0; i < block->statements.size(); ++i) {
    emitStatement(block->statements[i].get(), tail && i + 1 == block->statements.size());
  }
}

void MoveEmitter::emitStatement(const StmtAST *stmt, bool last) {
  std::string end = last && isBlockLike(stmt) ? "}" : "};";
  if (auto *let = dynamic_cast<const LetStmtAST *>(stmt)) {
    if (typeContains(let->resolved_type, BaseType::Map)) {
      sink.error(let->span(), DiagnosticCode::UnsupportedConstruct, "a map cannot be bound to a local variable");
    }
    line(letKeyword(let->is_mut) + localName(let->name) + ": " + type(let->resolved_type, let->span()) + " = " +
         expr(let->value.get()) + ";");
  } else if (auto *assign = dynamic_cast<const AssignStmtAST *>(stmt)) {
    emitAssign(assign);
  } else if (auto *exprStmt = dynamic_cast<const ExprStmtAST *>(stmt)) {
    const ExprAST *e = exprStmt->expr.get();
    bool discard = e->type && !e->type->isVoid() && !e->type->isUnknown();
    line((discard ? "let _ = " : "") + expr(e) + ";");
  } else if (auto *block = dynamic_cast<const BlockStmtAST *>(stmt)) {
    open("{");
    emitBlockBody(block, last);
    close(end);
  } else if (auto *ifStmt = dynamic_cast<const IfStmtAST *>(stmt)) {
    emitIf(ifStmt, false, end);
  } else if (auto *whileStmt = dynamic_cast<const WhileStmtAST *>(stmt)) {
    open("while (" + expr(whileStmt->cond.get()) + ") {");
    emitBlockBody(whileStmt->body.get(), false);
    close(end);
  } else if (auto *forStmt = dynamic_cast<const ForStmtAST *>(stmt)) {
    emitFor(forStmt, end);
  } else if (auto *matchStmt = dynamic_cast<const MatchStmtAST *>(stmt)) {
    emitMatchStmt(matchStmt, end);
  } else if (auto *require = dynamic_cast<const RequireStmtAST *>(stmt)) {
    auto it = abortCodes.find(require->message);
    std::string code = it == abortCodes.end() ? "0" : it->second;
    line("assert!(" + expr(require->cond.get()) + ", " + code + ");");
  } else if (auto *emit = dynamic_cast<const EmitStmtAST *>(stmt)) {
    use(isSui ? "sui::event" : "aptos_framework::event");
    const EventDeclAST *event = contract.findEvent(emit->event);
    std::string fields;
    for (size_t i = 0; event && i < event->fields.size() && i < emit->args.size(); ++i) {
      if (i > 0) fields += ", ";
      fields += moveIdent(event->fields[i].name) + ": " + expr(emit->args[i].get());
    }
    line("event::emit(" + moveStructName(emit->event) + " { " + fields + " });");
  } else if (auto *ret = dynamic_cast<const ReturnStmtAST *>(stmt)) {
    std::string text = ret->value ? "return " + expr(ret->value.get()) : "return";
    line(last ? text : text + ";");
  } else if (dynamic_cast<const PlaceholderStmtAST *>(stmt)) {
    throw InternalCompilerError("placeholder outside of a modifier expansion", stmt->span());
  }
}

void MoveEmitter::emitIf(const IfStmtAST *stmt, bool elseIf, const std::string &end) {
  std::string head = (elseIf ? "} else if (" : "if (") + expr(stmt->cond.get()) + ") {";
  if (elseIf) {
    --indent;
  }
  open(head);
  bool tail = end == "}";
  emitBlockBody(stmt->then_branch.get(), tail);
  if (auto *next = dynamic_cast<const IfStmtAST *>(stmt->else_branch.get())) {
    emitIf(next, true, end);
    return;
  }
  if (auto *block = dynamic_cast<const BlockStmtAST *>(stmt->else_branch.get())) {
    close("} else {");
    ++indent;
    emitBlockBody(block, tail);
  }
  close(end);
}

void MoveEmitter::emitAssign(const AssignStmtAST *stmt) {
  const ExprAST *lhs = stmt->lhs_expr.get();
  auto *var = dynamic_cast<const VariableExprAST *>(lhs);
  if (var && var->binding != VarBinding::State) {
    line(localName(var->name) + " = " + expr(stmt->value.get()) + ";");
    return;
  }
  // 先求值右侧，避免与左侧的可变借用重叠
  std::string value = expr(stmt->value.get());
  if (!isSimpleOperand(stmt->value.get())) {
    std::string temp = fresh("assign");
    line("let " + temp + " = " + value + ";");
    value = temp;
  }
  if (isStateMapIndex(lhs)) {
    auto *idx = static_cast<const ArrayIndexExprAST *>(lhs);
    use(isSui ? "sui::table" : "aptos_std::table");
    Path table = path(idx->array_expr.get(), true);
    std::string key = expr(idx->index_expr.get());
    if (isSui) {
      needTableSet = true;
      line("table_set(" + refOf(table, true) + ", " + key + ", " + value + ");");
    } else {
      line("table::upsert(" + refOf(table, true) + ", " + key + ", " + value + ");");
    }
    return;
  }
  if (!isPlace(lhs, true)) {
    throw InternalCompilerError("assignment target is not addressable", lhs->span());
  }
  Path p = path(lhs, true);
  line((p.isRef ? "*" + p.text : p.text) + " = " + value + ";");
}

void MoveEmitter::emitFor(const ForStmtAST *stmt, const std::string &end) {
  std::string var = localName(stmt->var_name);
  open("{");
  if (stmt->isRange()) {
    std::string limit = fresh("loop_end");
    line(letKeyword(true) + var + " = " + expr(stmt->iter_expr.get()) + ";");
    line("let " + limit + " = " + expr(stmt->range_end.get()) + ";");
    open("while (" + var + " < " + limit + ") {");
    emitBlockBody(stmt->body.get(), false);
    line(var + " = " + var + " + 1;");
    close();
  } else {
    std::string items = fresh("items");
    std::string len = fresh("len");
    std::string idx = fresh("idx");
    line("let " + items + " = " + expr(stmt->iter_expr.get()) + ";");
    line("let " + len + " = vector::length(&" + items + ");");
    line(letKeyword(true) + idx + " = 0;");
    open("while (" + idx + " < " + len + ") {");
    line("let " + var + " = *vector::borrow(&" + items + ", " + idx + ");");
    emitBlockBody(stmt->body.get(), false);
    line(idx + " = " + idx + " + 1;");
    close();
    if (!isSui) use("std::vector");
  }
  close(end);
}

void MoveEmitter::emitMatchStmt(const MatchStmtAST *stmt, const std::string &end) {
  std::string subject = fresh("match");
  open("{");
  line("let " + subject + " = " + expr(stmt->scrutinee.get()) + ";");
  bool tail = end == "}";
  for (size_t i = 0; i < stmt->arms.size(); ++i) {
    const auto &arm = stmt->arms[i];
    bool lastArm = i + 1 == stmt->arms.size();
    std::string head;
    if (arm.pattern->isWildcard() || (lastArm && i > 0 && stmt->scrutinee->type && stmt->scrutinee->type->isBool())) {
      head = i == 0 ? "{" : "} else {";
    } else {
      head = (i == 0 ? "if (" : "} else if (") + patternTest(subject, arm.pattern.get()) + ") {";
    }
    if (i > 0) --indent;
    open(head);
    emitBlockBody(arm.body.get(), tail);
    if (arm.pattern->isWildcard()) {
      break;
    }
  }
  close(tail ? "}" : "};");
  close(end);
}

//===----------------------------------------------------------------------===//
// 表达式
//===----------------------------------------------------------------------===//

bool MoveEmitter::isStateMapIndex(const ExprAST *e) const {
  auto *idx = dynamic_cast<const ArrayIndexExprAST *>(e);
  if (!idx || !idx->array_expr->type || idx->array_expr->type->kind != BaseType::Map) {
    return false;
  }
  auto *var = dynamic_cast<const VariableExprAST *>(idx->array_expr.get());
  return var && var->binding == VarBinding::State;
}

// 读取时 map 条目不是可寻址的（缺省值语义），写入时通过带默认值的可变借用取得
bool MoveEmitter::isPlace(const ExprAST *e, bool forWrite) const {
  if (auto *var = dynamic_cast<const VariableExprAST *>(e)) {
    return var->binding != VarBinding::Constant;
  }
  if (auto *member = dynamic_cast<const MemberAccessExprAST *>(e)) {
    return isPlace(member->struct_expr.get(), forWrite);
  }
  if (auto *idx = dynamic_cast<const ArrayIndexExprAST *>(e)) {
    if (idx->array_expr->type && idx->array_expr->type->kind == BaseType::Map) {
      return forWrite && isStateMapIndex(e);
    }
    return isPlace(idx->array_expr.get(), forWrite);
  }
  return false;
}

std::string MoveEmitter::index(const ExprAST *e) {
  std::string text = expr(e);
  if (e->type && e->type->isInteger() && e->type->bitWidth != 64) {
    return "(" + text + " as u64)";
  }
  return text;
}

Path MoveEmitter::path(const ExprAST *e, bool mut) {
  if (auto *var = dynamic_cast<const VariableExprAST *>(e)) {
    if (var->binding == VarBinding::State) {
      return {"state." + moveIdent(var->name), false};
    }
    return {localName(var->name), false};
  }
  if (auto *member = dynamic_cast<const MemberAccessExprAST *>(e)) {
    Path base = path(member->struct_expr.get(), mut);
    return {base.text + "." + moveIdent(member->member_name), false};
  }
  auto *idx = dynamic_cast<const ArrayIndexExprAST *>(e);
  if (!idx) {
    throw InternalCompilerError("expression is not addressable", e->span());
  }
  Path base = path(idx->array_expr.get(), mut);
  if (idx->array_expr->type && idx->array_expr->type->kind == BaseType::Map) {
    use(isSui ? "sui::table" : "aptos_std::table");
    std::string key = expr(idx->index_expr.get());
    std::string zero = zeroValue(idx->type, idx->span());
    if (isSui) {
      needTableEntry = true;
      return {"table_entry(" + refOf(base, true) + ", " + key + ", " + zero + ")", true};
    }
    return {"table::borrow_mut_with_default(" + refOf(base, true) + ", " + key + ", " + zero + ")", true};
  }
  if (!isSui) use("std::vector");
  std::string fn = mut ? "vector::borrow_mut(" : "vector::borrow(";
  return {fn + refOf(base, mut) + ", " + index(idx->index_expr.get()) + ")", true};
}

std::string MoveEmitter::refOf(const Path &p, bool mut) const {
  if (p.isRef) {
    return p.text;
  }
  return (mut ? "&mut " : "&") + p.text;
}

std::string MoveEmitter::valueOf(const Path &p) const {
  return p.isRef ? "*" + p.text : p.text;
}

// 对非可寻址的值先放进临时变量再借用
std::string MoveEmitter::withRef(const ExprAST *e, bool mut,
                                 const std::function<std::string(const std::string &)> &useRef) {
  if (isPlace(e, mut)) {
    return useRef(refOf(path(e, mut), mut));
  }
  std::string temp = fresh("tmp");
  return "{ " + letKeyword(mut) + temp + " = " + expr(e) + "; " + useRef((mut ? "&mut " : "&") + temp) + " }";
}

std::string MoveEmitter::operand(const ExprAST *e) {
  std::string text = expr(e);
  if (dynamic_cast<const BinaryExprAST *>(e) || dynamic_cast<const UnaryExprAST *>(e) ||
      dynamic_cast<const CastExprAST *>(e)) {
    return "(" + text + ")";
  }
  return text;
}

std::string MoveEmitter::literal(const NumberExprAST *e) {
  if (e->value < 0) {
    sink.error(e->span(), DiagnosticCode::UnsupportedConstruct,
               std::string("negative integers are not supported on ") + targetName(target));
    return "0";
  }
  std::string suffix = e->type ? type(e->type, e->span()) : "u64";
  return e->value.str() + suffix;
}

std::string MoveEmitter::expr(const ExprAST *e) {
  checkType(e);
  if (auto *number = dynamic_cast<const NumberExprAST *>(e)) {
    return literal(number);
  }
  if (auto *b = dynamic_cast<const BoolExprAST *>(e)) {
    return b->value ? "true" : "false";
  }
  if (auto *s = dynamic_cast<const StringExprAST *>(e)) {
    use("std::string");
    return "string::utf8(" + moveByteString(s->str) + ")";
  }
  if (auto *bytes = dynamic_cast<const BytesExprAST *>(e)) {
    return moveHexBytes(bytes->bytes);
  }
  if (auto *intrinsic = dynamic_cast<const IntrinsicExprAST *>(e)) {
    if (inInitializer && !isSui && intrinsic->kind == IntrinsicKind::CallerAddress) {
      return "signer::address_of(account)";
    }
    const char *text = renderIntrinsic(target, intrinsic->kind);
    if (!text) {
      sink.error(e->span(), DiagnosticCode::UnsupportedConstruct,
                 std::string(intrinsicName(intrinsic->kind)) + " is not available on " + targetName(target));
      return "0";
    }
    if (intrinsic->kind == IntrinsicKind::BlockTimestamp && !isSui) use("aptos_framework::timestamp");
    if (intrinsic->kind == IntrinsicKind::BlockHeight && !isSui) use("aptos_framework::block");
    return text;
  }
  if (auto *var = dynamic_cast<const VariableExprAST *>(e)) {
    if (var->type && var->type->kind == BaseType::Map) {
      sink.error(e->span(), DiagnosticCode::UnsupportedConstruct, "map values can only be accessed by index");
      return "0";
    }
    if (var->binding == VarBinding::Constant) {
      std::string name = toUpperSnake(var->name);
      if (var->type && var->type->kind == BaseType::String) {
        use("std::string");
        return "string::utf8(" + name + ")";
      }
      return name;
    }
    return valueOf(path(e, false));
  }
  if (auto *unary = dynamic_cast<const UnaryExprAST *>(e)) {
    if (unary->op == "!") {
      return "!" + operand(unary->expr.get());
    }
    sink.error(e->span(), DiagnosticCode::UnsupportedConstruct,
               std::string("negation is not supported on ") + targetName(target));
    return "0";
  }
  if (auto *bin = dynamic_cast<const BinaryExprAST *>(e)) {
    return operand(bin->left_expr.get()) + " " + bin->op + " " + operand(bin->right_expr.get());
  }
  if (auto *ternary = dynamic_cast<const TernaryExprAST *>(e)) {
    return "(if (" + expr(ternary->cond.get()) + ") " + expr(ternary->then_expr.get()) + " else " +
           expr(ternary->else_expr.get()) + ")";
  }
  if (auto *c = dynamic_cast<const CallExprAST *>(e)) {
    return call(c);
  }
  if (auto *idx = dynamic_cast<const ArrayIndexExprAST *>(e)) {
    if (idx->array_expr->type && idx->array_expr->type->kind == BaseType::Map) {
      if (!isStateMapIndex(e)) {
        sink.error(e->span(), DiagnosticCode::UnsupportedConstruct, "only contract state maps can be indexed");
        return "0";
      }
      use(isSui ? "sui::table" : "aptos_std::table");
      needTableGet = true;
      Path table = path(idx->array_expr.get(), false);
      return "table_get(" + refOf(table, false) + ", " + expr(idx->index_expr.get()) + ", " +
             zeroValue(idx->type, idx->span()) + ")";
    }
    if (isPlace(e, false)) {
      return valueOf(path(e, false));
    }
    if (!isSui) use("std::vector");
    std::string i = index(idx->index_expr.get());
    return withRef(idx->array_expr.get(), false, [&](const std::string &ref) {
      return "*vector::borrow(" + ref + ", " + i + ")";
    });
  }
  if (auto *member = dynamic_cast<const MemberAccessExprAST *>(e)) {
    if (isPlace(e, false)) {
      return valueOf(path(e, false));
    }
    std::string temp = fresh("tmp");
    return "{ let " + temp + " = " + expr(member->struct_expr.get()) + "; " + temp + "." +
           moveIdent(member->member_name) + " }";
  }
  if (auto *s = dynamic_cast<const StructExprAST *>(e)) {
    std::string fields;
    for (size_t i = 0; i < s->fields.size(); ++i) {
      if (i > 0) fields += ", ";
      fields += moveIdent(s->fields[i].first) + ": " + expr(s->fields[i].second.get());
    }
    return moveStructName(s->name) + " { " + fields + " }";
  }
  if (auto *c = dynamic_cast<const CastExprAST *>(e)) {
    std::string inner = expr(c->expr.get());
    if (c->expr->type && c->expr->type->equals(c->type)) {
      return inner;
    }
    return "(" + inner + " as " + type(c->type, c->span()) + ")";
  }
  if (auto *option = dynamic_cast<const OptionExprAST *>(e)) {
    use("std::option");
    if (option->isNone()) {
      if (e->type && e->type->elementType && !e->type->elementType->containsUnknown()) {
        return "option::none<" + type(e->type->elementType, e->span()) + ">()";
      }
      return "option::none()";
    }
    return "option::some(" + expr(option->value.get()) + ")";
  }
  if (auto *match = dynamic_cast<const MatchExprAST *>(e)) {
    return matchExpr(match);
  }
  if (dynamic_cast<const LambdaExprAST *>(e)) {
    sink.error(e->span(), DiagnosticCode::UnsupportedConstruct,
               std::string("lambdas are not supported on ") + targetName(target));
    return "0";
  }
  throw InternalCompilerError("unhandled expression in move code generation", e->span());
}

std::string MoveEmitter::call(const CallExprAST *e) {
  switch (e->target) {
    case CallTarget::Function: {
      if (inInitializer) {
        sink.error(e->span(), DiagnosticCode::UnsupportedConstruct,
                   "state defaults cannot call contract functions on " + std::string(targetName(target)));
        return "0";
      }
      // 实参先求值，状态的可变借用传入之后不能再读取状态
      std::vector<std::string> args;
      std::string prelude;
      for (const auto &arg: e->args) {
        std::string value = expr(arg.get());
        if (isSimpleOperand(arg.get())) {
          args.push_back(value);
        } else {
          std::string temp = fresh("arg");
          prelude += "let " + temp + " = " + value + "; ";
          args.push_back(temp);
        }
      }
      std::string text = logicName(e->call) + "(" + callArgs(args) + ")";
      return prelude.empty() ? text : "{ " + prelude + text + " }";
    }
    case CallTarget::VecLen: {
      const ExprAST *object = e->object_expr.get();
      if (object->type && object->type->kind == BaseType::String) {
        use("std::string");
        return withRef(object, false, [](const std::string &ref) { return "string::length(" + ref + ")"; });
      }
      if (!isSui) use("std::vector");
      return withRef(object, false, [](const std::string &ref) { return "vector::length(" + ref + ")"; });
    }
    case CallTarget::VecPush: {
      if (!isPlace(e->object_expr.get(), true)) {
        sink.error(e->span(), DiagnosticCode::UnsupportedConstruct, "push target is not addressable");
        return "0";
      }
      if (!isSui) use("std::vector");
      std::string value = expr(e->args[0].get());
      std::string ref = refOf(path(e->object_expr.get(), true), true);
      if (isSimpleOperand(e->args[0].get())) {
        return "vector::push_back(" + ref + ", " + value + ")";
      }
      std::string temp = fresh("push");
      return "{ let " + temp + " = " + value + "; vector::push_back(" + ref + ", " + temp + ") }";
    }
    case CallTarget::VecMap:
    case CallTarget::VecFilter:
      sink.error(e->span(), DiagnosticCode::UnsupportedConstruct,
                 "'" + e->call + "' with a lambda is not supported on " + targetName(target));
      return "0";
    case CallTarget::OptionIsSome:
      use("std::option");
      return withRef(e->object_expr.get(), false, [](const std::string &ref) { return "option::is_some(" + ref + ")"; });
    case CallTarget::OptionIsNone:
      use("std::option");
      return withRef(e->object_expr.get(), false, [](const std::string &ref) { return "option::is_none(" + ref + ")"; });
    case CallTarget::OptionUnwrap:
      use("std::option");
      return withRef(e->object_expr.get(), false, [](const std::string &ref) { return "*option::borrow(" + ref + ")"; });
    case CallTarget::Unresolved:
      break;
  }
  throw InternalCompilerError("call '" + e->call + "' reached code generation unresolved", e->span());
}

std::string MoveEmitter::patternTest(const std::string &subject, const PatternAST *p) {
  return subject + " == " + expr(p->literal.get());
}

std::string MoveEmitter::matchExpr(const MatchExprAST *e) {
  std::string subject = fresh("match");
  std::string text = "{ let " + subject + " = " + expr(e->scrutinee.get()) + "; ";
  for (size_t i = 0; i < e->arms.size(); ++i) {
    const auto &arm = e->arms[i];
    bool lastArm = i + 1 == e->arms.size();
    if (arm.pattern->isWildcard() || lastArm) {
      text += expr(arm.value.get());
      break;
    }
    text += "if (" + patternTest(subject, arm.pattern.get()) + ") " + expr(arm.value.get()) + " else ";
  }
  return text + " }";
}

} // namespace

GeneratedArtifact MoveGenerator::generate(const ContractAST &contract, const SourceUnitAST &unit) const {
  GeneratedArtifact artifact;
  artifact.target = target_;
  artifact.contractName = contract.name;
  DiagnosticSink sink;
  MoveEmitter emitter(target_, contract, unit, sink);
  std::string text = emitter.run();
  artifact.ok = !sink.hasErrors();
  artifact.diagnostics = sink.take();
  if (artifact.ok) {
    artifact.text = std::move(text);
  }
  return artifact;
}
