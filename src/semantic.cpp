#include "semantic.h"

#include <algorithm>

//===----------------------------------------------------------------------===//
// SymbolTable
//===----------------------------------------------------------------------===//

ScopeId SymbolTable::enterScope() {
  Scope scope;
  scope.parent = current_;
  scopes_.push_back(std::move(scope));
  current_ = static_cast<ScopeId>(scopes_.size() - 1);
  return current_;
}

ScopeId SymbolTable::exitScope() {
  ScopeId closed = current_;
  if (current_ != kNoScope) {
    current_ = scopes_[static_cast<size_t>(current_)].parent;
  }
  return closed;
}

bool SymbolTable::addSymbol(const Symbol &symbol) {
  if (current_ == kNoScope) {
    enterScope();
  }
  auto &scope = scopes_[static_cast<size_t>(current_)];
  if (scope.index.count(symbol.name)) {
    return false;
  }
  scope.index[symbol.name] = scope.symbols.size();
  scope.symbols.push_back(symbol);
  return true;
}

Symbol *SymbolTable::lookup(const std::string &name) {
  for (ScopeId id = current_; id != kNoScope; id = scopes_[static_cast<size_t>(id)].parent) {
    auto &scope = scopes_[static_cast<size_t>(id)];
    auto found = scope.index.find(name);
    if (found != scope.index.end()) {
      return &scope.symbols[found->second];
    }
  }
  return nullptr;
}

const Symbol *SymbolTable::lookupCurrent(const std::string &name) const {
  if (current_ == kNoScope) {
    return nullptr;
  }
  const auto &scope = scopes_[static_cast<size_t>(current_)];
  auto it = scope.index.find(name);
  if (it == scope.index.end()) {
    return nullptr;
  }
  return &scope.symbols[it->second];
}

void SymbolTable::clear() {
  scopes_.clear();
  current_ = kNoScope;
}

//===----------------------------------------------------------------------===//
// SemanticAnalyzer
//===----------------------------------------------------------------------===//

namespace {
  SourceSpan typeSpan(const TypeAST *type) {
    return SourceSpan(type->pos, type->pos + type->toString().size());
  }

  bool isArithmeticOp(const std::string &op) {
    return op == "+" || op == "-" || op == "*" || op == "/" || op == "%";
  }

  bool isRelationalOp(const std::string &op) {
    return op == "<" || op == "<=" || op == ">" || op == ">=";
  }

  bool isPrimitiveKey(const TypeRef &type) {
    switch (type->kind) {
      case BaseType::Int:
      case BaseType::Bool:
      case BaseType::Address:
      case BaseType::String:
      case BaseType::Bytes:
      case BaseType::Unknown:
        return true;
      default:
        return false;
    }
  }

  VarBinding bindingFor(SymbolKind kind) {
    switch (kind) {
      case SymbolKind::Local: return VarBinding::Local;
      case SymbolKind::Parameter: return VarBinding::Parameter;
      case SymbolKind::State: return VarBinding::State;
      case SymbolKind::Constant: return VarBinding::Constant;
    }
    return VarBinding::Unresolved;
  }
} // namespace

SemanticAnalyzer::SemanticAnalyzer(SourceUnitAST &unit) : unit(unit) {}

bool SemanticAnalyzer::analyze() {
  collectTopLevel();
  std::unordered_set<std::string> contractNames;
  for (auto &contract: unit.contracts) {
    if (!contractNames.insert(contract->name).second) {
      reportError(SourceSpan(contract->pos, contract->pos + 8), DiagnosticCode::DuplicateDeclaration,
                  "contract '" + contract->name + "' is declared more than once");
    }
    analyzeContract(*contract);
  }
  return !hasErrors(issues);
}

void SemanticAnalyzer::reset() {
  symbols.clear();
  structs = topStructs;
  structDecls = topStructDecls;
  resolvingStructs.clear();
  functions.clear();
  events.clear();
  modifiers.clear();
  currentReturn = nullptr;
  inModifier = false;
}

void SemanticAnalyzer::collectTopLevel() {
  for (auto &decl: unit.structs) {
    if (topStructDecls.count(decl->name)) {
      reportError(SourceSpan(decl->pos, decl->pos + 6), DiagnosticCode::DuplicateDeclaration,
                  "struct '" + decl->name + "' is declared more than once");
      continue;
    }
    topStructDecls[decl->name] = decl.get();
  }
  structDecls = topStructDecls;
  structs.clear();
  for (auto &decl: unit.structs) {
    resolveStruct(decl->name);
  }
  topStructs = structs;

  std::unordered_set<std::string> interfaceNames;
  for (auto &iface: unit.interfaces) {
    if (!interfaceNames.insert(iface->name).second) {
      reportError(SourceSpan(iface->pos, iface->pos + 9), DiagnosticCode::DuplicateDeclaration,
                  "interface '" + iface->name + "' is declared more than once");
    }
    std::unordered_set<std::string> fnNames;
    for (auto &fn: iface->functions) {
      if (!fnNames.insert(fn->name).second) {
        reportError(SourceSpan(fn->pos, fn->pos + 2), DiagnosticCode::DuplicateDeclaration,
                    "function '" + fn->name + "' is declared more than once in interface '" + iface->name + "'");
      }
      for (auto &param: fn->params) {
        param.resolved = resolveType(param.type.get());
      }
      fn->resolved_return = fn->return_type ? resolveType(fn->return_type.get()) : TypeFactory::getVoid();
    }
  }
}

TypeRef SemanticAnalyzer::resolveStruct(const std::string &name) {
  auto known = structs.find(name);
  if (known != structs.end()) {
    return known->second;
  }
  auto declIt = structDecls.find(name);
  if (declIt == structDecls.end()) {
    return nullptr;
  }
  StructDeclAST *decl = declIt->second;
  if (resolvingStructs.count(name)) {
    reportError(SourceSpan(decl->pos, decl->pos + 6), DiagnosticCode::InvalidConstruct,
                "struct '" + name + "' contains itself");
    return TypeFactory::getUnknown();
  }
  resolvingStructs.insert(name);

  std::vector<std::string> fieldNames;
  std::vector<TypeRef> fieldTypes;
  for (auto &field: decl->fields) {
    if (std::find(fieldNames.begin(), fieldNames.end(), field.name) != fieldNames.end()) {
      reportError(SourceSpan(field.pos, field.pos + field.name.size()), DiagnosticCode::DuplicateDeclaration,
                  "field '" + field.name + "' is declared more than once in struct '" + name + "'");
      continue;
    }
    field.resolved = resolveType(field.type.get());
    fieldNames.push_back(field.name);
    fieldTypes.push_back(field.resolved);
  }
  auto type = TypeFactory::makeStruct(name, fieldNames, fieldTypes);
  decl->resolved = type;
  structs[name] = type;
  resolvingStructs.erase(name);
  return type;
}

void SemanticAnalyzer::collectTypeDeclarations(ContractAST &contract) {
  for (auto &decl: contract.structs) {
    if (structDecls.count(decl->name)) {
      reportError(SourceSpan(decl->pos, decl->pos + 6), DiagnosticCode::DuplicateDeclaration,
                  "struct '" + decl->name + "' is declared more than once");
      continue;
    }
    structDecls[decl->name] = decl.get();
  }
  for (auto &decl: contract.structs) {
    resolveStruct(decl->name);
  }
}

void SemanticAnalyzer::collectEvents(ContractAST &contract) {
  for (auto &event: contract.events) {
    if (events.count(event->name)) {
      reportError(SourceSpan(event->pos, event->pos + 5), DiagnosticCode::DuplicateDeclaration,
                  "event '" + event->name + "' is declared more than once");
      continue;
    }
    EventInfo info;
    info.name = event->name;
    for (auto &field: event->fields) {
      if (std::find(info.fieldNames.begin(), info.fieldNames.end(), field.name) != info.fieldNames.end()) {
        reportError(SourceSpan(field.pos, field.pos + field.name.size()), DiagnosticCode::DuplicateDeclaration,
                    "field '" + field.name + "' is declared more than once in event '" + event->name + "'");
      }
      field.resolved = resolveType(field.type.get());
      info.fieldNames.push_back(field.name);
      info.fieldTypes.push_back(field.resolved);
    }
    events[event->name] = info;
  }
}

// 常量先于状态变量处理，状态默认值可以引用常量
void SemanticAnalyzer::collectStateAndConstants(ContractAST &contract) {
  constValues.clear();
  for (auto &c: contract.consts) {
    TypeRef type = resolveType(c->type.get());
    c->resolved = type;
    if (type->kind != BaseType::Int && type->kind != BaseType::Bool && type->kind != BaseType::String &&
        type->kind != BaseType::Bytes && !type->isUnknown()) {
      reportError(typeSpan(c->type.get()), DiagnosticCode::InvalidConstruct,
                  "constant '" + c->name + "' must have an integer, bool, string or bytes type");
    }
    TypeRef valueType = analyzeExpr(c->value.get(), type);
    bool assignable = ensureAssignable(valueType, type, c->value->span(), "constant '" + c->name + "'");
    if (!isConstantExpr(c->value.get())) {
      reportError(c->value->span(), DiagnosticCode::InvalidConstruct,
                  "value of constant '" + c->name + "' is not a compile-time constant");
    } else if (assignable) {
      ConstValue value;
      if (checkConstantTraps(c->value.get(), "value of constant '" + c->name + "'", value)) {
        constValues[c->name] = value;
      }
    }
    Symbol sym;
    sym.name = c->name;
    sym.kind = SymbolKind::Constant;
    sym.type = type;
    sym.position = c->pos;
    if (!symbols.addSymbol(sym)) {
      reportError(SourceSpan(c->pos, c->pos + 5), DiagnosticCode::DuplicateDeclaration,
                  "'" + c->name + "' is already declared in this contract");
    }
  }

  for (auto &var: contract.state) {
    TypeRef type = resolveType(var->type.get(), true);
    var->resolved = type;
    if (var->default_value) {
      if (type->kind == BaseType::Map) {
        reportError(var->default_value->span(), DiagnosticCode::InvalidConstruct,
                    "map state variable '" + var->name + "' cannot have a default value");
      }
      TypeRef valueType = analyzeExpr(var->default_value.get(), type);
      bool assignable =
        ensureAssignable(valueType, type, var->default_value->span(), "default value of '" + var->name + "'");
      if (!isConstantExpr(var->default_value.get())) {
        reportError(var->default_value->span(), DiagnosticCode::InvalidConstruct,
                    "default value of state variable '" + var->name + "' must be a constant expression");
      } else if (assignable) {
        ConstValue value;
        checkConstantTraps(var->default_value.get(), "default value of '" + var->name + "'", value);
      }
    }
    Symbol sym;
    sym.name = var->name;
    sym.kind = SymbolKind::State;
    sym.type = type;
    sym.isMutable = true;
    sym.position = var->pos;
    if (!symbols.addSymbol(sym)) {
      reportError(SourceSpan(var->pos, var->pos + var->name.size()), DiagnosticCode::DuplicateDeclaration,
                  "'" + var->name + "' is already declared in this contract");
    }
  }
}

void SemanticAnalyzer::collectModifiers(ContractAST &contract) {
  for (auto &modifier: contract.modifiers) {
    if (modifiers.count(modifier->name)) {
      reportError(SourceSpan(modifier->pos, modifier->pos + 8), DiagnosticCode::DuplicateDeclaration,
                  "modifier '" + modifier->name + "' is declared more than once");
      continue;
    }
    ModifierInfo info;
    info.name = modifier->name;
    for (auto &param: modifier->params) {
      param.resolved = resolveType(param.type.get());
      info.params.push_back(param.resolved);
    }
    int placeholders = countPlaceholders(modifier->body.get());
    if (placeholders != 1) {
      reportError(SourceSpan(modifier->pos, modifier->pos + 8), DiagnosticCode::InvalidConstruct,
                  "modifier '" + modifier->name + "' must contain exactly one '_;' placeholder, found " +
                  std::to_string(placeholders));
    }
    modifiers[modifier->name] = info;
  }
}

void SemanticAnalyzer::collectFunctionDeclarations(ContractAST &contract) {
  for (auto &fn: contract.functions) {
    FunctionInfo info;
    info.name = fn->name;
    info.isPublic = fn->isPublic();
    info.position = fn->pos;
    std::unordered_set<std::string> paramNames;
    for (auto &param: fn->params) {
      if (!paramNames.insert(param.name).second) {
        reportError(SourceSpan(param.pos, param.pos + param.name.size()), DiagnosticCode::DuplicateDeclaration,
                    "parameter '" + param.name + "' is declared more than once in '" + fn->name + "'");
      }
      param.resolved = resolveType(param.type.get());
      info.params.push_back(param.resolved);
    }
    info.returnType = fn->return_type ? resolveType(fn->return_type.get()) : TypeFactory::getVoid();
    fn->resolved_return = info.returnType;

    if (functions.count(fn->name)) {
      reportError(SourceSpan(fn->pos, fn->pos + 2), DiagnosticCode::DuplicateDeclaration,
                  "function '" + fn->name + "' is declared more than once");
      continue;
    }
    functions[fn->name] = info;
  }
}

void SemanticAnalyzer::analyzeContract(ContractAST &contract) {
  reset();
  currentContract = &contract;
  symbols.enterScope();

  collectTypeDeclarations(contract);
  collectEvents(contract);
  collectStateAndConstants(contract);
  collectModifiers(contract);
  collectFunctionDeclarations(contract);

  for (auto &modifier: contract.modifiers) {
    analyzeModifierBody(*modifier);
  }
  for (auto &fn: contract.functions) {
    analyzeFunctionBody(*fn);
  }

  symbols.exitScope();
  currentContract = nullptr;
}

void SemanticAnalyzer::analyzeModifierBody(ModifierDeclAST &modifier) {
  symbols.enterScope();
  for (auto &param: modifier.params) {
    Symbol sym;
    sym.name = param.name;
    sym.kind = SymbolKind::Parameter;
    sym.type = param.resolved;
    sym.position = param.pos;
    if (!symbols.addSymbol(sym)) {
      reportError(SourceSpan(param.pos, param.pos + param.name.size()), DiagnosticCode::DuplicateDeclaration,
                  "parameter '" + param.name + "' is declared more than once in '" + modifier.name + "'");
    }
  }
  inModifier = true;
  currentReturn = TypeFactory::getVoid();
  analyzeBlock(modifier.body.get(), true);
  inModifier = false;
  symbols.exitScope();
}

void SemanticAnalyzer::analyzeModifierUses(FnDeclAST &fn) {
  std::unordered_set<std::string> seen;
  for (auto &use: fn.modifiers) {
    SourceSpan span(use.pos, use.pos + use.name.size());
    auto it = modifiers.find(use.name);
    if (it == modifiers.end()) {
      for (auto &arg: use.args) {
        analyzeExpr(arg.get());
      }
      reportError(span, DiagnosticCode::UndefinedSymbol, "undefined modifier '" + use.name + "'");
      continue;
    }
    if (!seen.insert(use.name).second) {
      reportError(span, DiagnosticCode::DuplicateDeclaration,
                  "modifier '" + use.name + "' is applied more than once to '" + fn.name + "'");
    }
    checkArguments("modifier '" + use.name + "'", use.args, it->second.params, span);
  }
}

void SemanticAnalyzer::analyzeFunctionBody(FnDeclAST &fn) {
  symbols.enterScope();
  for (auto &param: fn.params) {
    Symbol sym;
    sym.name = param.name;
    sym.kind = SymbolKind::Parameter;
    sym.type = param.resolved;
    sym.position = param.pos;
    symbols.addSymbol(sym);
  }
  analyzeModifierUses(fn);

  currentReturn = fn.resolved_return;
  inModifier = false;
  analyzeBlock(fn.body.get(), true);

  if (!currentReturn->isVoid() && !blockGuaranteesReturn(fn.body.get())) {
    reportError(SourceSpan(fn.pos, fn.body->pos), DiagnosticCode::MissingReturn,
                "function '" + fn.name + "' must return a value of type " + currentReturn->toString() +
                " on every path");
  }
  symbols.exitScope();
}

//===----------------------------------------------------------------------===//
// 语句
//===----------------------------------------------------------------------===//

void SemanticAnalyzer::enterScope() {
  symbols.enterScope();
}

void SemanticAnalyzer::exitScope() {
  ScopeId closed = symbols.exitScope();
  if (closed == kNoScope) {
    return;
  }
  for (const auto &sym: symbols.scope(closed).symbols) {
    if (sym.kind == SymbolKind::Local && sym.warnUnused && !sym.used && sym.name[0] != '_') {
      reportWarning(SourceSpan(sym.position, sym.position + 3), DiagnosticCode::UnusedVariable,
                    "unused variable '" + sym.name + "'");
    }
  }
}

void SemanticAnalyzer::declareLocal(const std::string &name, const TypeRef &type, bool isMutable, size_t position,
                                    bool warnUnused) {
  Symbol sym;
  sym.name = name;
  sym.kind = SymbolKind::Local;
  sym.type = type;
  sym.isMutable = isMutable;
  sym.position = position;
  sym.warnUnused = warnUnused;
  if (!symbols.addSymbol(sym)) {
    reportError(SourceSpan(position, position + name.size()), DiagnosticCode::DuplicateDeclaration,
                "'" + name + "' is already declared in this scope");
  }
}

void SemanticAnalyzer::analyzeBlock(BlockStmtAST *block, bool createScope) {
  if (!block) {
    return;
  }
  if (createScope) {
    enterScope();
  }
  for (auto &stmt: block->statements) {
    analyzeStatement(stmt.get());
  }
  if (createScope) {
    exitScope();
  }
}

void SemanticAnalyzer::analyzeStatement(StmtAST *stmt) {
  if (auto *let = dynamic_cast<LetStmtAST *>(stmt)) {
    analyzeLet(let);
  } else if (auto *assign = dynamic_cast<AssignStmtAST *>(stmt)) {
    analyzeAssign(assign);
  } else if (auto *block = dynamic_cast<BlockStmtAST *>(stmt)) {
    analyzeBlock(block, true);
  } else if (auto *ifStmt = dynamic_cast<IfStmtAST *>(stmt)) {
    analyzeIfStmt(ifStmt);
  } else if (auto *whileStmt = dynamic_cast<WhileStmtAST *>(stmt)) {
    analyzeWhileStmt(whileStmt);
  } else if (auto *forStmt = dynamic_cast<ForStmtAST *>(stmt)) {
    analyzeForStmt(forStmt);
  } else if (auto *matchStmt = dynamic_cast<MatchStmtAST *>(stmt)) {
    analyzeMatchStmt(matchStmt);
  } else if (auto *require = dynamic_cast<RequireStmtAST *>(stmt)) {
    analyzeRequire(require);
  } else if (auto *emit = dynamic_cast<EmitStmtAST *>(stmt)) {
    analyzeEmit(emit);
  } else if (auto *ret = dynamic_cast<ReturnStmtAST *>(stmt)) {
    analyzeReturn(ret);
  } else if (dynamic_cast<PlaceholderStmtAST *>(stmt)) {
    if (!inModifier) {
      reportError(stmt->span(), DiagnosticCode::InvalidConstruct, "'_' placeholder is only allowed inside a modifier");
    }
  } else if (auto *exprStmt = dynamic_cast<ExprStmtAST *>(stmt)) {
    analyzeExpr(exprStmt->expr.get());
    if (!dynamic_cast<CallExprAST *>(exprStmt->expr.get())) {
      reportError(stmt->span(), DiagnosticCode::InvalidConstruct, "expression result is unused");
    }
  }
}

void SemanticAnalyzer::analyzeLet(LetStmtAST *stmt) {
  TypeRef declared;
  if (stmt->declared_type) {
    declared = resolveType(stmt->declared_type.get());
  }
  TypeRef valueType = analyzeExpr(stmt->value.get(), declared);
  if (valueType->isVoid()) {
    reportError(stmt->value->span(), DiagnosticCode::TypeMismatch,
                "cannot bind '" + stmt->name + "' to an expression of type void");
    valueType = TypeFactory::getUnknown();
  }
  if (declared) {
    ensureAssignable(valueType, declared, stmt->value->span(), "initializer of '" + stmt->name + "'");
  }
  stmt->resolved_type = declared ? declared : valueType;
  // 先分析初始值再声明，let x = x + 1 引用外层的 x
  declareLocal(stmt->name, stmt->resolved_type, stmt->is_mut, stmt->pos + 4);
}

void SemanticAnalyzer::analyzeAssign(AssignStmtAST *stmt) {
  std::string root;
  bool writable = isMutableTarget(stmt->lhs_expr.get(), root);
  TypeRef target = analyzeExpr(stmt->lhs_expr.get());
  if (!writable) {
    if (root.empty()) {
      reportError(stmt->lhs_expr->span(), DiagnosticCode::ImmutableAssignment, "invalid assignment target");
    } else {
      reportError(stmt->lhs_expr->span(), DiagnosticCode::ImmutableAssignment,
                  "cannot assign to immutable '" + root + "'");
    }
  }
  TypeRef valueType = analyzeExpr(stmt->value.get(), target);
  ensureAssignable(valueType, target, stmt->value->span(), "assignment");
}

bool SemanticAnalyzer::isMutableTarget(ExprAST *expr, std::string &rootName) {
  ExprAST *cursor = expr;
  while (true) {
    if (auto *member = dynamic_cast<MemberAccessExprAST *>(cursor)) {
      cursor = member->struct_expr.get();
    } else if (auto *index = dynamic_cast<ArrayIndexExprAST *>(cursor)) {
      cursor = index->array_expr.get();
    } else {
      break;
    }
  }
  auto *var = dynamic_cast<VariableExprAST *>(cursor);
  if (!var) {
    rootName.clear();
    return false;
  }
  rootName = var->name;
  const Symbol *sym = symbols.lookup(var->name);
  if (!sym) {
    // 未定义标识符由 analyzeExpr 报告
    return true;
  }
  return sym->kind == SymbolKind::State || (sym->kind == SymbolKind::Local && sym->isMutable);
}

void SemanticAnalyzer::analyzeIfStmt(IfStmtAST *stmt) {
  TypeRef cond = analyzeExpr(stmt->cond.get(), TypeFactory::getBool());
  if (!cond->isBool() && !cond->isUnknown()) {
    reportError(stmt->cond->span(), DiagnosticCode::TypeMismatch,
                "if condition must be bool, found " + cond->toString());
  }
  analyzeBlock(stmt->then_branch.get(), true);
  if (stmt->else_branch) {
    analyzeStatement(stmt->else_branch.get());
  }
}

void SemanticAnalyzer::analyzeWhileStmt(WhileStmtAST *stmt) {
  TypeRef cond = analyzeExpr(stmt->cond.get(), TypeFactory::getBool());
  if (!cond->isBool() && !cond->isUnknown()) {
    reportError(stmt->cond->span(), DiagnosticCode::TypeMismatch,
                "while condition must be bool, found " + cond->toString());
  }
  analyzeBlock(stmt->body.get(), true);
}

void SemanticAnalyzer::analyzeForStmt(ForStmtAST *stmt) {
  TypeRef varType;
  if (stmt->isRange()) {
    auto types = analyzeOperandPair(stmt->iter_expr.get(), stmt->range_end.get(), nullptr);
    varType = types.first;
    if ((!types.first->isInteger() && !types.first->isUnknown()) ||
        (!types.second->isInteger() && !types.second->isUnknown())) {
      reportError(stmt->iter_expr->span(), DiagnosticCode::TypeMismatch,
                  "range bounds must be integers, found " + types.first->toString() + " and " +
                  types.second->toString());
    } else if (!types.first->equals(types.second)) {
      reportError(stmt->range_end->span(), DiagnosticCode::TypeMismatch,
                  "range bounds have different types: " + types.first->toString() + " and " +
                  types.second->toString());
    }
  } else {
    TypeRef iterType = analyzeExpr(stmt->iter_expr.get());
    if (iterType->kind == BaseType::Vector || iterType->kind == BaseType::Array) {
      varType = iterType->elementType;
    } else if (iterType->kind == BaseType::Bytes) {
      varType = TypeFactory::getUnsigned(8);
    } else {
      if (!iterType->isUnknown()) {
        reportError(stmt->iter_expr->span(), DiagnosticCode::TypeMismatch,
                    "cannot iterate over a value of type " + iterType->toString());
      }
      varType = TypeFactory::getUnknown();
    }
  }
  stmt->var_type = varType;

  enterScope();
  declareLocal(stmt->var_name, varType, false, stmt->pos + 4, false);
  analyzeBlock(stmt->body.get(), true);
  exitScope();
}

void SemanticAnalyzer::analyzeMatchStmt(MatchStmtAST *stmt) {
  TypeRef scrutinee = analyzeExpr(stmt->scrutinee.get());
  for (size_t i = 0; i < stmt->arms.size(); ++i) {
    auto &arm = stmt->arms[i];
    if (arm.pattern->isWildcard()) {
      if (i + 1 != stmt->arms.size()) {
        reportError(SourceSpan(arm.pattern->pos, arm.pattern->pos + 1), DiagnosticCode::InvalidConstruct,
                    "'_' arm must be the last arm of a match");
      }
    } else {
      analyzePattern(arm.pattern.get(), scrutinee);
    }
    analyzeBlock(arm.body.get(), true);
  }
}

void SemanticAnalyzer::analyzeRequire(RequireStmtAST *stmt) {
  TypeRef cond = analyzeExpr(stmt->cond.get(), TypeFactory::getBool());
  if (!cond->isBool() && !cond->isUnknown()) {
    reportError(stmt->cond->span(), DiagnosticCode::TypeMismatch,
                "require condition must be bool, found " + cond->toString());
  }
  if (auto *literal = dynamic_cast<BoolExprAST *>(stmt->cond.get())) {
    if (literal->value) {
      reportWarning(stmt->span(), DiagnosticCode::InvalidConstruct, "require(true) never fails");
    }
  }
}

void SemanticAnalyzer::analyzeEmit(EmitStmtAST *stmt) {
  auto it = events.find(stmt->event);
  if (it == events.end()) {
    for (auto &arg: stmt->args) {
      analyzeExpr(arg.get());
    }
    reportError(stmt->span(), DiagnosticCode::UndefinedSymbol, "undefined event '" + stmt->event + "'");
    return;
  }
  checkArguments("event '" + stmt->event + "'", stmt->args, it->second.fieldTypes, stmt->span());
}

void SemanticAnalyzer::analyzeReturn(ReturnStmtAST *stmt) {
  if (inModifier) {
    reportError(stmt->span(), DiagnosticCode::InvalidConstruct, "return is not allowed inside a modifier");
    if (stmt->value) {
      analyzeExpr(stmt->value.get());
    }
    return;
  }
  if (!stmt->value) {
    if (!currentReturn->isVoid()) {
      reportError(stmt->span(), DiagnosticCode::TypeMismatch,
                  "return type mismatch: expected " + currentReturn->toString() + ", found no value");
    }
    return;
  }
  TypeRef valueType = analyzeExpr(stmt->value.get(), currentReturn->isVoid() ? nullptr : currentReturn);
  if (currentReturn->isVoid()) {
    reportError(stmt->span(), DiagnosticCode::TypeMismatch,
                "return type mismatch: function returns no value, found " + valueType->toString());
    return;
  }
  if (!valueType->equals(currentReturn)) {
    reportError(stmt->span(), DiagnosticCode::TypeMismatch,
                "return type mismatch: expected " + currentReturn->toString() + ", found " + valueType->toString());
  }
}

bool SemanticAnalyzer::blockGuaranteesReturn(const BlockStmtAST *block) const {
  if (!block) {
    return false;
  }
  for (const auto &stmt: block->statements) {
    if (statementGuaranteesReturn(stmt.get())) {
      return true;
    }
  }
  return false;
}

bool SemanticAnalyzer::statementGuaranteesReturn(const StmtAST *stmt) const {
  if (!stmt) {
    return false;
  }
  if (dynamic_cast<const ReturnStmtAST *>(stmt)) {
    return true;
  }
  if (auto *block = dynamic_cast<const BlockStmtAST *>(stmt)) {
    return blockGuaranteesReturn(block);
  }
  if (auto *ifStmt = dynamic_cast<const IfStmtAST *>(stmt)) {
    if (!ifStmt->else_branch) {
      return false;
    }
    return blockGuaranteesReturn(ifStmt->then_branch.get()) &&
           statementGuaranteesReturn(ifStmt->else_branch.get());
  }
  if (auto *matchStmt = dynamic_cast<const MatchStmtAST *>(stmt)) {
    if (matchStmt->arms.empty() || !matchStmt->arms.back().pattern->isWildcard()) {
      return false;
    }
    for (const auto &arm: matchStmt->arms) {
      if (!blockGuaranteesReturn(arm.body.get())) {
        return false;
      }
    }
    return true;
  }
  return false;
}

int SemanticAnalyzer::countPlaceholders(const StmtAST *stmt) const {
  int count = 0;
  visitStmt(stmt, [&count](const StmtAST *s) {
    if (dynamic_cast<const PlaceholderStmtAST *>(s)) {
      ++count;
    }
  }, [](const ExprAST *) {});
  return count;
}

//===----------------------------------------------------------------------===//
// 表达式
//===----------------------------------------------------------------------===//

TypeRef SemanticAnalyzer::analyzeExpr(ExprAST *expr, const TypeRef &expected) {
  TypeRef result;
  if (auto *number = dynamic_cast<NumberExprAST *>(expr)) {
    result = analyzeNumber(number, expected);
  } else if (dynamic_cast<BoolExprAST *>(expr)) {
    result = TypeFactory::getBool();
  } else if (dynamic_cast<StringExprAST *>(expr)) {
    result = TypeFactory::getString();
  } else if (dynamic_cast<BytesExprAST *>(expr)) {
    result = TypeFactory::getBytes();
  } else if (auto *var = dynamic_cast<VariableExprAST *>(expr)) {
    result = analyzeVariable(var);
  } else if (auto *intrinsic = dynamic_cast<IntrinsicExprAST *>(expr)) {
    result = intrinsic->kind == IntrinsicKind::CallerAddress ? TypeFactory::getAddress()
                                                             : TypeFactory::getUnsigned(64);
  } else if (auto *unary = dynamic_cast<UnaryExprAST *>(expr)) {
    result = analyzeUnaryExpr(unary, expected);
  } else if (auto *binary = dynamic_cast<BinaryExprAST *>(expr)) {
    result = analyzeBinaryExpr(binary, expected);
  } else if (auto *ternary = dynamic_cast<TernaryExprAST *>(expr)) {
    result = analyzeTernary(ternary, expected);
  } else if (auto *call = dynamic_cast<CallExprAST *>(expr)) {
    result = call->object_expr ? analyzeMethodCall(call) : analyzeCallExpr(call);
  } else if (auto *index = dynamic_cast<ArrayIndexExprAST *>(expr)) {
    result = analyzeArrayIndex(index);
  } else if (auto *member = dynamic_cast<MemberAccessExprAST *>(expr)) {
    result = analyzeMemberAccess(member);
  } else if (auto *literal = dynamic_cast<StructExprAST *>(expr)) {
    result = analyzeStructExpr(literal);
  } else if (auto *lambda = dynamic_cast<LambdaExprAST *>(expr)) {
    reportError(lambda->span(), DiagnosticCode::InvalidConstruct,
                "lambda expressions are only allowed as the argument of map or filter");
    result = TypeFactory::getUnknown();
  } else if (auto *cast = dynamic_cast<CastExprAST *>(expr)) {
    result = analyzeCastExpr(cast);
  } else if (auto *option = dynamic_cast<OptionExprAST *>(expr)) {
    result = analyzeOptionExpr(option, expected);
  } else if (auto *match = dynamic_cast<MatchExprAST *>(expr)) {
    result = analyzeMatchExpr(match, expected);
  }
  if (!result) {
    result = TypeFactory::getUnknown();
  }
  expr->type = result;
  return result;
}

// 无后缀字面量采用上下文要求的整数类型，缺省 u64
TypeRef SemanticAnalyzer::analyzeNumber(NumberExprAST *expr, const TypeRef &expected) {
  TypeRef type;
  if (!expr->suffix.empty()) {
    type = TypeFactory::fromIntegerName(expr->suffix);
  } else if (expected && expected->isInteger()) {
    type = expected;
  } else {
    type = TypeFactory::getUnsigned(64);
  }
  if (!integerFits(expr->value, *type)) {
    reportError(expr->span(), DiagnosticCode::TypeMismatch,
                "literal " + expr->value.str() + " does not fit in " + type->toString());
  }
  return type;
}

TypeRef SemanticAnalyzer::analyzeVariable(VariableExprAST *expr) {
  Symbol *sym = symbols.lookup(expr->name);
  if (!sym) {
    if (functions.count(expr->name)) {
      reportError(expr->span(), DiagnosticCode::InvalidConstruct,
                  "function '" + expr->name + "' cannot be used as a value");
    } else {
      reportError(expr->span(), DiagnosticCode::UndefinedSymbol, "undefined identifier '" + expr->name + "'");
    }
    return TypeFactory::getUnknown();
  }
  sym->used = true;
  expr->binding = bindingFor(sym->kind);
  return sym->type;
}

bool SemanticAnalyzer::isContextTyped(const ExprAST *expr) const {
  if (auto *number = dynamic_cast<const NumberExprAST *>(expr)) {
    return number->suffix.empty();
  }
  if (auto *option = dynamic_cast<const OptionExprAST *>(expr)) {
    return option->isNone();
  }
  if (auto *unary = dynamic_cast<const UnaryExprAST *>(expr)) {
    return unary->op == "-" && isContextTyped(unary->expr.get());
  }
  if (auto *binary = dynamic_cast<const BinaryExprAST *>(expr)) {
    return isArithmeticOp(binary->op) && isContextTyped(binary->left_expr.get()) &&
           isContextTyped(binary->right_expr.get());
  }
  if (auto *ternary = dynamic_cast<const TernaryExprAST *>(expr)) {
    return isContextTyped(ternary->then_expr.get()) && isContextTyped(ternary->else_expr.get());
  }
  return false;
}

std::pair<TypeRef, TypeRef> SemanticAnalyzer::analyzeOperandPair(ExprAST *lhs, ExprAST *rhs,
                                                                 const TypeRef &expected) {
  if (isContextTyped(lhs) && !isContextTyped(rhs)) {
    TypeRef r = analyzeExpr(rhs, expected);
    TypeRef l = analyzeExpr(lhs, r);
    return {l, r};
  }
  TypeRef l = analyzeExpr(lhs, expected);
  TypeRef r = analyzeExpr(rhs, l);
  return {l, r};
}

TypeRef SemanticAnalyzer::analyzeBinaryExpr(BinaryExprAST *expr, const TypeRef &expected) {
  const std::string &op = expr->op;
  if (op == "&&" || op == "||") {
    TypeRef l = analyzeExpr(expr->left_expr.get(), TypeFactory::getBool());
    TypeRef r = analyzeExpr(expr->right_expr.get(), TypeFactory::getBool());
    if ((!l->isBool() && !l->isUnknown()) || (!r->isBool() && !r->isUnknown())) {
      reportError(expr->span(), DiagnosticCode::TypeMismatch,
                  "operator '" + op + "' requires bool operands, found " + l->toString() + " and " + r->toString());
    }
    return TypeFactory::getBool();
  }

  bool arithmetic = isArithmeticOp(op);
  TypeRef operandExpected = arithmetic && expected && expected->isInteger() ? expected : nullptr;
  auto types = analyzeOperandPair(expr->left_expr.get(), expr->right_expr.get(), operandExpected);
  TypeRef l = types.first;
  TypeRef r = types.second;

  if (l->isUnknown() || r->isUnknown()) {
    if (arithmetic) {
      return l->isUnknown() ? r : l;
    }
    return TypeFactory::getBool();
  }

  if (arithmetic || isRelationalOp(op)) {
    bool valid = true;
    if (!l->isInteger() || !r->isInteger()) {
      reportError(expr->span(), DiagnosticCode::TypeMismatch,
                  "operator '" + op + "' requires integer operands, found " + l->toString() + " and " +
                  r->toString());
      valid = false;
    } else if (!l->equals(r)) {
      reportError(expr->span(), DiagnosticCode::TypeMismatch,
                  "mismatched operand types for '" + op + "': " + l->toString() + " and " + r->toString());
      valid = false;
    }
    if (!arithmetic) {
      return TypeFactory::getBool();
    }
    // 已报错的算术表达式定型为 Unknown，外层不再重复报错
    return valid ? l : TypeFactory::getUnknown();
  }

  // == / !=
  if (!l->equals(r)) {
    reportError(expr->span(), DiagnosticCode::TypeMismatch,
                "mismatched operand types for '" + op + "': " + l->toString() + " and " + r->toString());
  } else if (l->kind == BaseType::Map || l->kind == BaseType::Void || l->kind == BaseType::Function) {
    reportError(expr->span(), DiagnosticCode::TypeMismatch, "values of type " + l->toString() + " cannot be compared");
  }
  return TypeFactory::getBool();
}

TypeRef SemanticAnalyzer::analyzeUnaryExpr(UnaryExprAST *expr, const TypeRef &expected) {
  if (expr->op == "!") {
    TypeRef t = analyzeExpr(expr->expr.get(), TypeFactory::getBool());
    if (!t->isBool() && !t->isUnknown()) {
      reportError(expr->span(), DiagnosticCode::TypeMismatch, "operator '!' requires bool, found " + t->toString());
    }
    return TypeFactory::getBool();
  }
  TypeRef t = analyzeExpr(expr->expr.get(), expected && expected->isInteger() ? expected : nullptr);
  if (t->isUnknown()) {
    return t;
  }
  if (!t->isInteger() || t->isUnsigned) {
    reportError(expr->span(), DiagnosticCode::TypeMismatch,
                "operator '-' requires a signed integer, found " + t->toString());
  }
  return t;
}

TypeRef SemanticAnalyzer::analyzeTernary(TernaryExprAST *expr, const TypeRef &expected) {
  TypeRef cond = analyzeExpr(expr->cond.get(), TypeFactory::getBool());
  if (!cond->isBool() && !cond->isUnknown()) {
    reportError(expr->cond->span(), DiagnosticCode::TypeMismatch,
                "ternary condition must be bool, found " + cond->toString());
  }
  auto types = analyzeOperandPair(expr->then_expr.get(), expr->else_expr.get(), expected);
  if (!types.first->equals(types.second)) {
    reportError(expr->span(), DiagnosticCode::TypeMismatch,
                "ternary branches have different types: " + types.first->toString() + " and " +
                types.second->toString());
  }
  return types.first->isUnknown() ? types.second : types.first;
}

void SemanticAnalyzer::checkArguments(const std::string &what, const std::vector<unique_ptr<ExprAST>> &args,
                                      const std::vector<TypeRef> &params, SourceSpan span) {
  if (args.size() != params.size()) {
    reportError(span, DiagnosticCode::ArityMismatch,
                what + " expects " + std::to_string(params.size()) + " argument(s), found " +
                std::to_string(args.size()));
  }
  for (size_t i = 0; i < args.size(); ++i) {
    TypeRef param = i < params.size() ? params[i] : nullptr;
    TypeRef argType = analyzeExpr(args[i].get(), param);
    if (param) {
      ensureAssignable(argType, param, args[i]->span(), "argument " + std::to_string(i + 1) + " of " + what);
    }
  }
}

TypeRef SemanticAnalyzer::analyzeCallExpr(CallExprAST *expr) {
  auto it = functions.find(expr->call);
  if (it == functions.end()) {
    for (auto &arg: expr->args) {
      analyzeExpr(arg.get());
    }
    reportError(expr->span(), DiagnosticCode::UndefinedSymbol, "undefined function '" + expr->call + "'");
    return TypeFactory::getUnknown();
  }
  expr->target = CallTarget::Function;
  checkArguments("function '" + expr->call + "'", expr->args, it->second.params, expr->span());
  return it->second.returnType;
}

TypeRef SemanticAnalyzer::analyzeMethodCall(CallExprAST *expr) {
  TypeRef objType = analyzeExpr(expr->object_expr.get());
  const std::string &method = expr->call;
  auto arity = [&](size_t n) {
    if (expr->args.size() != n) {
      reportError(expr->span(), DiagnosticCode::ArityMismatch,
                  "method '" + method + "' expects " + std::to_string(n) + " argument(s), found " +
                  std::to_string(expr->args.size()));
      return false;
    }
    return true;
  };

  if (objType->isUnknown()) {
    for (auto &arg: expr->args) {
      if (!dynamic_cast<LambdaExprAST *>(arg.get())) {
        analyzeExpr(arg.get());
      }
    }
    return TypeFactory::getUnknown();
  }

  BaseType kind = objType->kind;
  if (method == "len" && (kind == BaseType::Vector || kind == BaseType::Array || kind == BaseType::Bytes ||
                          kind == BaseType::String)) {
    arity(0);
    expr->target = CallTarget::VecLen;
    return TypeFactory::getUnsigned(64);
  }
  if (method == "push" && kind == BaseType::Vector) {
    expr->target = CallTarget::VecPush;
    if (arity(1)) {
      TypeRef argType = analyzeExpr(expr->args[0].get(), objType->elementType);
      ensureAssignable(argType, objType->elementType, expr->args[0]->span(), "argument of push");
    }
    std::string root;
    if (!isMutableTarget(expr->object_expr.get(), root)) {
      reportError(expr->span(), DiagnosticCode::ImmutableAssignment,
                  root.empty() ? "cannot push to a temporary value" : "cannot push to immutable '" + root + "'");
    }
    return TypeFactory::getVoid();
  }
  if ((method == "map" || method == "filter") && (kind == BaseType::Vector || kind == BaseType::Array)) {
    expr->target = method == "map" ? CallTarget::VecMap : CallTarget::VecFilter;
    if (!arity(1)) {
      return TypeFactory::getUnknown();
    }
    auto *lambda = dynamic_cast<LambdaExprAST *>(expr->args[0].get());
    if (!lambda || lambda->params.size() != 1) {
      reportError(expr->args[0]->span(), DiagnosticCode::InvalidConstruct,
                  "'" + method + "' expects a lambda with exactly one parameter");
      if (!lambda) {
        analyzeExpr(expr->args[0].get());
      }
      return TypeFactory::getUnknown();
    }
    TypeRef bodyType = analyzeLambda(lambda, objType->elementType);
    if (method == "filter") {
      if (!bodyType->isBool() && !bodyType->isUnknown()) {
        reportError(lambda->body->span(), DiagnosticCode::TypeMismatch,
                    "filter predicate must return bool, found " + bodyType->toString());
      }
      return TypeFactory::makeVector(objType->elementType);
    }
    if (bodyType->isVoid()) {
      reportError(lambda->body->span(), DiagnosticCode::TypeMismatch, "map function must return a value");
    }
    return TypeFactory::makeVector(bodyType);
  }
  if (kind == BaseType::Option && (method == "is_some" || method == "is_none")) {
    arity(0);
    expr->target = method == "is_some" ? CallTarget::OptionIsSome : CallTarget::OptionIsNone;
    return TypeFactory::getBool();
  }
  if (kind == BaseType::Option && method == "unwrap") {
    arity(0);
    expr->target = CallTarget::OptionUnwrap;
    return objType->elementType;
  }

  for (auto &arg: expr->args) {
    if (!dynamic_cast<LambdaExprAST *>(arg.get())) {
      analyzeExpr(arg.get());
    }
  }
  reportError(expr->span(), DiagnosticCode::UndefinedSymbol,
              "no method '" + method + "' on type " + objType->toString());
  return TypeFactory::getUnknown();
}

TypeRef SemanticAnalyzer::analyzeLambda(LambdaExprAST *lambda, const TypeRef &paramType) {
  enterScope();
  declareLocal(lambda->params[0], paramType, false, lambda->pos + 1, false);
  lambda->param_types = {paramType};
  TypeRef bodyType = analyzeExpr(lambda->body.get());
  exitScope();
  lambda->type = TypeFactory::makeFunction({paramType}, bodyType);
  return bodyType;
}

TypeRef SemanticAnalyzer::analyzeArrayIndex(ArrayIndexExprAST *expr) {
  TypeRef base = analyzeExpr(expr->array_expr.get());
  if (base->kind == BaseType::Map) {
    TypeRef key = analyzeExpr(expr->index_expr.get(), base->parameters[0]);
    ensureAssignable(key, base->parameters[0], expr->index_expr->span(), "map key");
    return base->parameters[1];
  }
  if (base->kind == BaseType::Vector || base->kind == BaseType::Array || base->kind == BaseType::Bytes) {
    TypeRef index = analyzeExpr(expr->index_expr.get(), TypeFactory::getUnsigned(64));
    if (!index->isUnknown() && (!index->isInteger() || !index->isUnsigned)) {
      reportError(expr->index_expr->span(), DiagnosticCode::TypeMismatch,
                  "index must be an unsigned integer, found " + index->toString());
    }
    return base->kind == BaseType::Bytes ? TypeFactory::getUnsigned(8) : base->elementType;
  }
  analyzeExpr(expr->index_expr.get());
  if (!base->isUnknown()) {
    reportError(expr->span(), DiagnosticCode::TypeMismatch, "values of type " + base->toString() + " cannot be indexed");
  }
  return TypeFactory::getUnknown();
}

TypeRef SemanticAnalyzer::analyzeMemberAccess(MemberAccessExprAST *expr) {
  TypeRef base = analyzeExpr(expr->struct_expr.get());
  if (base->isUnknown()) {
    return base;
  }
  if (base->kind != BaseType::Struct) {
    reportError(expr->span(), DiagnosticCode::TypeMismatch, "type " + base->toString() + " has no fields");
    return TypeFactory::getUnknown();
  }
  TypeRef field = base->fieldType(expr->member_name);
  if (!field) {
    reportError(expr->span(), DiagnosticCode::UndefinedSymbol,
                "struct '" + base->name + "' has no field '" + expr->member_name + "'");
    return TypeFactory::getUnknown();
  }
  return field;
}

TypeRef SemanticAnalyzer::analyzeStructExpr(StructExprAST *expr) {
  TypeRef type = resolveStruct(expr->name);
  if (!type || type->isUnknown()) {
    for (auto &field: expr->fields) {
      analyzeExpr(field.second.get());
    }
    if (!type) {
      reportError(expr->span(), DiagnosticCode::UndefinedSymbol, "undefined struct '" + expr->name + "'");
    }
    return TypeFactory::getUnknown();
  }
  std::unordered_set<std::string> seen;
  for (auto &field: expr->fields) {
    TypeRef fieldType = type->fieldType(field.first);
    if (!seen.insert(field.first).second) {
      reportError(field.second->span(), DiagnosticCode::DuplicateDeclaration,
                  "field '" + field.first + "' is given more than once");
    }
    if (!fieldType) {
      analyzeExpr(field.second.get());
      reportError(field.second->span(), DiagnosticCode::UndefinedSymbol,
                  "struct '" + expr->name + "' has no field '" + field.first + "'");
      continue;
    }
    TypeRef valueType = analyzeExpr(field.second.get(), fieldType);
    ensureAssignable(valueType, fieldType, field.second->span(), "field '" + field.first + "'");
  }
  for (const auto &name: type->fieldNames) {
    if (!seen.count(name)) {
      reportError(expr->span(), DiagnosticCode::InvalidConstruct,
                  "missing field '" + name + "' in '" + expr->name + "' literal");
    }
  }
  return type;
}

TypeRef SemanticAnalyzer::analyzeCastExpr(CastExprAST *expr) {
  TypeRef target = resolveType(expr->target_type.get());
  TypeRef source = analyzeExpr(expr->expr.get());
  if (source->isUnknown() || target->isUnknown()) {
    return target;
  }
  if (!source->isInteger() || !target->isInteger()) {
    reportError(expr->span(), DiagnosticCode::TypeMismatch,
                "cannot cast " + source->toString() + " to " + target->toString());
  }
  return target;
}

TypeRef SemanticAnalyzer::analyzeOptionExpr(OptionExprAST *expr, const TypeRef &expected) {
  TypeRef elementExpected = expected && expected->kind == BaseType::Option ? expected->elementType : nullptr;
  if (expr->value) {
    TypeRef element = analyzeExpr(expr->value.get(), elementExpected);
    return TypeFactory::makeOption(element);
  }
  if (elementExpected) {
    return expected;
  }
  reportError(expr->span(), DiagnosticCode::TypeMismatch, "cannot infer the type of None here; add a type annotation");
  return TypeFactory::makeOption(TypeFactory::getUnknown());
}

void SemanticAnalyzer::analyzePattern(PatternAST *pattern, const TypeRef &scrutinee) {
  if (!scrutinee->isUnknown() && !scrutinee->isInteger() && !scrutinee->isBool() &&
      scrutinee->kind != BaseType::String) {
    reportError(pattern->literal->span(), DiagnosticCode::TypeMismatch,
                "cannot match literal patterns against type " + scrutinee->toString());
    analyzeExpr(pattern->literal.get());
    return;
  }
  TypeRef type = analyzeExpr(pattern->literal.get(), scrutinee);
  ensureAssignable(type, scrutinee, pattern->literal->span(), "match pattern");
}

TypeRef SemanticAnalyzer::analyzeMatchExpr(MatchExprAST *expr, const TypeRef &expected) {
  TypeRef scrutinee = analyzeExpr(expr->scrutinee.get());
  TypeRef result = expected;
  bool exhaustive = false;
  bool sawTrue = false;
  bool sawFalse = false;
  for (size_t i = 0; i < expr->arms.size(); ++i) {
    auto &arm = expr->arms[i];
    if (arm.pattern->isWildcard()) {
      exhaustive = true;
      if (i + 1 != expr->arms.size()) {
        reportError(SourceSpan(arm.pattern->pos, arm.pattern->pos + 1), DiagnosticCode::InvalidConstruct,
                    "'_' arm must be the last arm of a match");
      }
    } else {
      analyzePattern(arm.pattern.get(), scrutinee);
      if (auto *b = dynamic_cast<BoolExprAST *>(arm.pattern->literal.get())) {
        (b->value ? sawTrue : sawFalse) = true;
      }
    }
    TypeRef armType = analyzeExpr(arm.value.get(), result);
    if (!result || result->isUnknown()) {
      result = armType;
    } else {
      ensureAssignable(armType, result, arm.value->span(), "match arm");
    }
  }
  if (scrutinee->isBool() && sawTrue && sawFalse) {
    exhaustive = true;
  }
  if (!exhaustive) {
    reportError(expr->span(), DiagnosticCode::InvalidConstruct, "match expression must end with a '_' arm");
  }
  return result ? result : TypeFactory::getUnknown();
}

//===----------------------------------------------------------------------===//
// 辅助
//===----------------------------------------------------------------------===//

TypeRef SemanticAnalyzer::resolveType(const TypeAST *typeAst, bool allowMap) {
  if (!typeAst) {
    return TypeFactory::getVoid();
  }
  if (auto *named = dynamic_cast<const NamedTypeAST *>(typeAst)) {
    const std::string &name = named->name;
    if (auto integer = TypeFactory::fromIntegerName(name)) return integer;
    if (name == "bool") return TypeFactory::getBool();
    if (name == "address") return TypeFactory::getAddress();
    if (name == "string") return TypeFactory::getString();
    if (name == "bytes") return TypeFactory::getBytes();
    if (auto structType = resolveStruct(name)) return structType;
    reportError(typeSpan(typeAst), DiagnosticCode::UndefinedSymbol, "unknown type '" + name + "'");
    return TypeFactory::getUnknown();
  }
  if (auto *generic = dynamic_cast<const GenericTypeAST *>(typeAst)) {
    const std::string &name = generic->name;
    size_t wanted = (name == "map" || name == "Result") ? 2 : 1;
    if (name != "map" && name != "vec" && name != "Option" && name != "Result") {
      reportError(typeSpan(typeAst), DiagnosticCode::UndefinedSymbol, "unknown generic type '" + name + "'");
      return TypeFactory::getUnknown();
    }
    if (generic->args.size() != wanted) {
      reportError(typeSpan(typeAst), DiagnosticCode::ArityMismatch,
                  name + " expects " + std::to_string(wanted) + " type argument(s), found " +
                  std::to_string(generic->args.size()));
      return TypeFactory::getUnknown();
    }
    if (name == "map") {
      if (!allowMap) {
        reportError(typeSpan(typeAst), DiagnosticCode::InvalidConstruct,
                    "map types are only allowed for contract state variables");
      }
      TypeRef key = resolveType(generic->args[0].get());
      if (!isPrimitiveKey(key)) {
        reportError(typeSpan(generic->args[0].get()), DiagnosticCode::TypeMismatch,
                    "map key must be an integer, bool, address, string or bytes, found " + key->toString());
      }
      TypeRef value = resolveType(generic->args[1].get(), allowMap);
      return TypeFactory::makeMap(key, value);
    }
    if (name == "vec") {
      return TypeFactory::makeVector(resolveType(generic->args[0].get()));
    }
    if (name == "Option") {
      return TypeFactory::makeOption(resolveType(generic->args[0].get()));
    }
    return TypeFactory::makeResult(resolveType(generic->args[0].get()), resolveType(generic->args[1].get()));
  }
  if (auto *array = dynamic_cast<const ArrayTypeAST *>(typeAst)) {
    if (array->length <= 0) {
      reportError(typeSpan(typeAst), DiagnosticCode::InvalidConstruct, "array length must be positive");
    }
    return TypeFactory::makeArray(resolveType(array->element_type.get()), array->length);
  }
  if (auto *tuple = dynamic_cast<const TupleTypeAST *>(typeAst)) {
    if (tuple->elements.empty()) {
      reportError(typeSpan(typeAst), DiagnosticCode::InvalidConstruct, "empty tuple type");
      return TypeFactory::getUnknown();
    }
    std::vector<TypeRef> elements;
    for (const auto &e: tuple->elements) {
      elements.push_back(resolveType(e.get()));
    }
    return TypeFactory::makeTuple(elements);
  }
  return TypeFactory::getUnknown();
}

bool SemanticAnalyzer::isConstantExpr(const ExprAST *expr) const {
  if (!expr) {
    return true;
  }
  if (isLiteral(expr)) {
    return true;
  }
  if (auto *var = dynamic_cast<const VariableExprAST *>(expr)) {
    return var->binding == VarBinding::Constant;
  }
  if (auto *unary = dynamic_cast<const UnaryExprAST *>(expr)) {
    return isConstantExpr(unary->expr.get());
  }
  if (auto *binary = dynamic_cast<const BinaryExprAST *>(expr)) {
    return isConstantExpr(binary->left_expr.get()) && isConstantExpr(binary->right_expr.get());
  }
  if (auto *ternary = dynamic_cast<const TernaryExprAST *>(expr)) {
    return isConstantExpr(ternary->cond.get()) && isConstantExpr(ternary->then_expr.get()) &&
           isConstantExpr(ternary->else_expr.get());
  }
  if (auto *cast = dynamic_cast<const CastExprAST *>(expr)) {
    return isConstantExpr(cast->expr.get());
  }
  if (auto *option = dynamic_cast<const OptionExprAST *>(expr)) {
    return isConstantExpr(option->value.get());
  }
  if (auto *literal = dynamic_cast<const StructExprAST *>(expr)) {
    for (const auto &field: literal->fields) {
      if (!isConstantExpr(field.second.get())) {
        return false;
      }
    }
    return true;
  }
  return false;
}

// 与优化器相同的陷阱规则：越界、除零、有损转换
bool SemanticAnalyzer::evaluateConstant(const ExprAST *expr, ConstValue &value, std::string &trap) const {
  if (!expr || !expr->type) {
    return false;
  }
  if (auto *number = dynamic_cast<const NumberExprAST *>(expr)) {
    // 越界字面量已在定型时报告
    if (expr->type->isInteger() && !integerFits(number->value, *expr->type)) {
      return false;
    }
    value.isBool = false;
    value.number = number->value;
    return true;
  }
  if (auto *boolean = dynamic_cast<const BoolExprAST *>(expr)) {
    value.isBool = true;
    value.flag = boolean->value;
    return true;
  }
  if (auto *var = dynamic_cast<const VariableExprAST *>(expr)) {
    auto it = constValues.find(var->name);
    if (var->binding != VarBinding::Constant || it == constValues.end()) {
      return false;
    }
    value = it->second;
    return true;
  }
  if (auto *unary = dynamic_cast<const UnaryExprAST *>(expr)) {
    ConstValue inner;
    if (!evaluateConstant(unary->expr.get(), inner, trap)) {
      return false;
    }
    if (unary->op == "!") {
      value.isBool = true;
      value.flag = !inner.flag;
      return true;
    }
    value.isBool = false;
    value.number = -inner.number;
    if (expr->type->isInteger() && !integerFits(value.number, *expr->type)) {
      trap = "negation overflows " + expr->type->toString();
      return false;
    }
    return true;
  }
  if (auto *cast = dynamic_cast<const CastExprAST *>(expr)) {
    if (!evaluateConstant(cast->expr.get(), value, trap)) {
      return false;
    }
    if (expr->type->isInteger() && !value.isBool && !integerFits(value.number, *expr->type)) {
      trap = "cast of " + value.number.str() + " to " + expr->type->toString() + " loses data";
      return false;
    }
    return true;
  }
  if (auto *ternary = dynamic_cast<const TernaryExprAST *>(expr)) {
    ConstValue cond;
    if (!evaluateConstant(ternary->cond.get(), cond, trap)) {
      return false;
    }
    return evaluateConstant(cond.flag ? ternary->then_expr.get() : ternary->else_expr.get(), value, trap);
  }
  auto *binary = dynamic_cast<const BinaryExprAST *>(expr);
  if (!binary) {
    return false;
  }
  ConstValue l;
  ConstValue r;
  const std::string &op = binary->op;
  if (!evaluateConstant(binary->left_expr.get(), l, trap)) {
    return false;
  }
  // 短路：右侧不会执行
  if ((op == "&&" && !l.flag) || (op == "||" && l.flag)) {
    value.isBool = true;
    value.flag = l.flag;
    return true;
  }
  if (!evaluateConstant(binary->right_expr.get(), r, trap)) {
    return false;
  }
  value.isBool = true;
  if (op == "&&" || op == "||") {
    value.flag = r.flag;
    return true;
  }
  if (op == "==" || op == "!=") {
    bool equal = l.isBool ? l.flag == r.flag : l.number == r.number;
    value.flag = op == "==" ? equal : !equal;
    return true;
  }
  if (isRelationalOp(op)) {
    if (op == "<") {
      value.flag = l.number < r.number;
    } else if (op == "<=") {
      value.flag = l.number <= r.number;
    } else if (op == ">") {
      value.flag = l.number > r.number;
    } else {
      value.flag = l.number >= r.number;
    }
    return true;
  }

  value.isBool = false;
  if (op == "+") {
    value.number = l.number + r.number;
  } else if (op == "-") {
    value.number = l.number - r.number;
  } else if (op == "*") {
    value.number = l.number * r.number;
  } else if (op == "/" || op == "%") {
    if (r.number == 0) {
      trap = op == "/" ? "division by zero" : "remainder by zero";
      return false;
    }
    if (op == "/") {
      value.number = l.number / r.number;
    } else {
      value.number = l.number % r.number;
    }
  } else {
    return false;
  }
  if (!expr->type->isInteger()) {
    return false;
  }
  if (!integerFits(value.number, *expr->type)) {
    trap = "'" + op + "' overflows " + expr->type->toString();
    return false;
  }
  return true;
}

bool SemanticAnalyzer::checkConstantTraps(const ExprAST *expr, const std::string &what, ConstValue &value) {
  std::string trap;
  if (evaluateConstant(expr, value, trap)) {
    return true;
  }
  if (!trap.empty()) {
    reportError(expr->span(), DiagnosticCode::InvalidConstruct, what + " cannot be evaluated: " + trap);
  }
  return false;
}

bool SemanticAnalyzer::ensureAssignable(const TypeRef &from, const TypeRef &to, SourceSpan span,
                                        const std::string &context) {
  if (!from || !to) {
    return true;
  }
  if (from->equals(to)) {
    return true;
  }
  reportError(span, DiagnosticCode::TypeMismatch,
              context + ": expected " + to->toString() + ", found " + from->toString());
  return false;
}

void SemanticAnalyzer::reportError(SourceSpan span, DiagnosticCode code, const std::string &msg) {
  Diagnostic d;
  d.kind = DiagnosticKind::Semantic;
  d.code = code;
  d.severity = Severity::Error;
  d.message = msg;
  d.span = span;
  issues.push_back(d);
}

void SemanticAnalyzer::reportWarning(SourceSpan span, DiagnosticCode code, const std::string &msg) {
  Diagnostic d;
  d.kind = DiagnosticKind::Semantic;
  d.code = code;
  d.severity = Severity::Warning;
  d.message = msg;
  d.span = span;
  issues.push_back(d);
}
