#include "codegen.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <unordered_set>

namespace {

const TypeTable kSolanaTypes = {
  "u$W", "i$W", 128,
  "bool", "Pubkey", "String", "Vec<u8>",
  "Vec<($0, $1)>", "Vec<$0>", "[$0; $N]", "($*)",
  "Option<$0>", "std::result::Result<$0, $1>"
};

const TypeTable kAptosTypes = {
  "u$W", nullptr, 256,
  "bool", "address", "std::string::String", "vector<u8>",
  "aptos_std::table::Table<$0, $1>", "vector<$0>", "vector<$0>", nullptr,
  "std::option::Option<$0>", nullptr
};

const TypeTable kSuiTypes = {
  "u$W", nullptr, 256,
  "bool", "address", "std::string::String", "vector<u8>",
  "sui::table::Table<$0, $1>", "vector<$0>", "vector<$0>", nullptr,
  "std::option::Option<$0>", nullptr
};

const IntrinsicTable kSolanaIntrinsics = {
  "env.caller",
  "env.value",
  "Clock::get()?.slot",
  "(Clock::get()?.unix_timestamp as u64)"
};

const IntrinsicTable kAptosIntrinsics = {
  "caller",
  nullptr,
  "block::get_current_block_height()",
  "timestamp::now_seconds()"
};

const IntrinsicTable kSuiIntrinsics = {
  "tx_context::sender(ctx)",
  nullptr,
  "tx_context::epoch(ctx)",
  "(tx_context::epoch_timestamp_ms(ctx) / 1000)"
};

std::string substitute(const std::string &pattern, const std::vector<std::string> &args, int64_t length) {
  std::string out;
  for (size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] != '$' || i + 1 >= pattern.size()) {
      out += pattern[i];
      continue;
    }
    char c = pattern[++i];
    if (c == 'N') {
      out += std::to_string(length);
    } else if (c == '*') {
      for (size_t j = 0; j < args.size(); ++j) {
        if (j > 0) out += ", ";
        out += args[j];
      }
    } else if (c >= '0' && c <= '9') {
      size_t index = static_cast<size_t>(c - '0');
      if (index < args.size()) out += args[index];
    } else {
      out += '$';
      out += c;
    }
  }
  return out;
}

bool isMoveTarget(Target target) {
  return target == Target::Aptos || target == Target::Sui;
}

} // namespace

const char *targetName(Target target) {
  switch (target) {
    case Target::Solana: return "solana";
    case Target::Aptos: return "aptos";
    case Target::Sui: return "sui";
  }
  return "unknown";
}

bool targetFromName(const std::string &name, Target &target) {
  for (Target t: allTargets()) {
    if (name == targetName(t)) {
      target = t;
      return true;
    }
  }
  return false;
}

const char *targetExtension(Target target) {
  return target == Target::Solana ? "rs" : "move";
}

std::vector<Target> allTargets() {
  return {Target::Solana, Target::Aptos, Target::Sui};
}

std::unique_ptr<CodeGenerator> makeGenerator(Target target, const CodegenOptions &options) {
  if (target == Target::Solana) {
    return std::make_unique<SolanaGenerator>(options);
  }
  return std::make_unique<MoveGenerator>(target);
}

const TypeTable &typeTableFor(Target target) {
  switch (target) {
    case Target::Solana: return kSolanaTypes;
    case Target::Aptos: return kAptosTypes;
    case Target::Sui: return kSuiTypes;
  }
  return kSolanaTypes;
}

const IntrinsicTable &intrinsicTableFor(Target target) {
  switch (target) {
    case Target::Solana: return kSolanaIntrinsics;
    case Target::Aptos: return kAptosIntrinsics;
    case Target::Sui: return kSuiIntrinsics;
  }
  return kSolanaIntrinsics;
}

const char *renderIntrinsic(Target target, IntrinsicKind kind) {
  const IntrinsicTable &table = intrinsicTableFor(target);
  switch (kind) {
    case IntrinsicKind::CallerAddress: return table.callerAddress;
    case IntrinsicKind::MessageValue: return table.messageValue;
    case IntrinsicKind::BlockHeight: return table.blockHeight;
    case IntrinsicKind::BlockTimestamp: return table.blockTimestamp;
  }
  return nullptr;
}

bool renderType(Target target, const TypeRef &type, std::string &out, std::string &reason) {
  const TypeTable &table = typeTableFor(target);
  const char *pattern = nullptr;
  std::vector<TypeRef> args;
  int64_t length = 0;

  switch (type->kind) {
    case BaseType::Int:
      if (type->isUnsigned && type->bitWidth > table.maxUnsignedBits) {
        reason = "integer type " + type->toString() + " is not supported on " + targetName(target);
        return false;
      }
      pattern = type->isUnsigned ? table.unsignedInt : table.signedInt;
      if (!pattern) {
        reason = "signed integer type " + type->toString() + " is not supported on " + targetName(target);
        return false;
      }
      out = pattern;
      for (size_t pos = out.find("$W"); pos != std::string::npos; pos = out.find("$W")) {
        out.replace(pos, 2, std::to_string(type->bitWidth));
      }
      return true;
    case BaseType::Bool: out = table.boolType; return true;
    case BaseType::Address: out = table.addressType; return true;
    case BaseType::String: out = table.stringType; return true;
    case BaseType::Bytes: out = table.bytesType; return true;
    case BaseType::Struct:
      out = type->name;
      if (isMoveTarget(target) && !out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
      }
      return true;
    case BaseType::Map:
      pattern = table.mapType;
      args = type->parameters;
      break;
    case BaseType::Vector:
      pattern = table.vectorType;
      args = {type->elementType};
      break;
    case BaseType::Array:
      pattern = table.arrayType;
      args = {type->elementType};
      length = type->arrayLength;
      break;
    case BaseType::Tuple:
      pattern = table.tupleType;
      args = type->parameters;
      break;
    case BaseType::Option:
      pattern = table.optionType;
      args = {type->elementType};
      break;
    case BaseType::Result:
      pattern = table.resultType;
      args = type->parameters;
      break;
    default:
      reason = "type " + type->toString() + " has no representation on " + targetName(target);
      return false;
  }
  if (!pattern) {
    reason = "type " + type->toString() + " is not supported on " + targetName(target);
    return false;
  }
  std::vector<std::string> rendered;
  for (const auto &arg: args) {
    std::string text;
    if (!renderType(target, arg, text, reason)) {
      return false;
    }
    rendered.push_back(text);
  }
  out = substitute(pattern, rendered, length);
  return true;
}

//===----------------------------------------------------------------------===//
// 命名
//===----------------------------------------------------------------------===//

std::string toSnakeCase(const std::string &name) {
  std::string out;
  for (size_t i = 0; i < name.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(name[i]);
    if (std::isupper(c)) {
      bool prevLower = i > 0 && (std::islower(static_cast<unsigned char>(name[i - 1])) ||
                                 std::isdigit(static_cast<unsigned char>(name[i - 1])));
      bool acronymEnd = i > 0 && std::isupper(static_cast<unsigned char>(name[i - 1])) && i + 1 < name.size() &&
                        std::islower(static_cast<unsigned char>(name[i + 1]));
      if ((prevLower || acronymEnd) && !out.empty() && out.back() != '_') {
        out += '_';
      }
      out += static_cast<char>(std::tolower(c));
    } else {
      out += static_cast<char>(c);
    }
  }
  return out;
}

std::string toPascalCase(const std::string &name) {
  std::string out;
  bool upper = true;
  for (char ch: name) {
    if (ch == '_') {
      upper = true;
      continue;
    }
    if (upper) {
      out += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
      upper = false;
    } else {
      out += ch;
    }
  }
  return out;
}

std::string toUpperSnake(const std::string &name) {
  std::string out = toSnakeCase(name);
  for (auto &ch: out) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return out;
}

//===----------------------------------------------------------------------===//
// 分析
//===----------------------------------------------------------------------===//

std::vector<std::string> collectRequireMessages(const ContractAST &contract) {
  std::vector<std::pair<size_t, std::string>> found;
  visitContract(contract, [&found](const StmtAST *s) {
    if (auto *require = dynamic_cast<const RequireStmtAST *>(s)) {
      found.emplace_back(require->pos, require->message);
    }
  }, [](const ExprAST *) {});
  std::stable_sort(found.begin(), found.end(),
                   [](const std::pair<size_t, std::string> &a, const std::pair<size_t, std::string> &b) {
                     return a.first < b.first;
                   });
  std::vector<std::string> messages;
  for (const auto &entry: found) {
    if (std::find(messages.begin(), messages.end(), entry.second) == messages.end()) {
      messages.push_back(entry.second);
    }
  }
  return messages;
}

bool usesIntrinsic(const ContractAST &contract, const FnDeclAST &fn, IntrinsicKind kind) {
  std::unordered_set<std::string> visited;
  std::function<bool(const FnDeclAST &)> search = [&](const FnDeclAST &f) -> bool {
    if (!visited.insert(f.name).second) {
      return false;
    }
    bool direct = false;
    std::vector<std::string> callees;
    auto onExpr = [&](const ExprAST *e) {
      if (auto *intrinsic = dynamic_cast<const IntrinsicExprAST *>(e)) {
        direct = direct || intrinsic->kind == kind;
      } else if (auto *call = dynamic_cast<const CallExprAST *>(e)) {
        if (call->target == CallTarget::Function) {
          callees.push_back(call->call);
        }
      }
    };
    auto onStmt = [](const StmtAST *) {};
    visitStmt(f.body.get(), onStmt, onExpr);
    for (const auto &use: f.modifiers) {
      for (const auto &arg: use.args) {
        visitExpr(arg.get(), onExpr);
      }
      if (const ModifierDeclAST *modifier = contract.findModifier(use.name)) {
        visitStmt(modifier->body.get(), onStmt, onExpr);
      }
    }
    if (direct) {
      return true;
    }
    for (const auto &name: callees) {
      const FnDeclAST *callee = contract.findFunction(name);
      if (callee && search(*callee)) {
        return true;
      }
    }
    return false;
  };
  return search(fn);
}

bool modifierHasPostCode(const ModifierDeclAST &modifier) {
  const auto &stmts = modifier.body->statements;
  for (size_t i = 0; i < stmts.size(); ++i) {
    if (dynamic_cast<const PlaceholderStmtAST *>(stmts[i].get())) {
      return i + 1 != stmts.size();
    }
  }
  // 占位符嵌套在条件或循环中
  bool nested = false;
  visitStmt(modifier.body.get(), [&nested](const StmtAST *s) {
    nested = nested || dynamic_cast<const PlaceholderStmtAST *>(s) != nullptr;
  }, [](const ExprAST *) {});
  return nested;
}

bool typeContains(const TypeRef &type, BaseType kind) {
  if (!type) {
    return false;
  }
  if (type->kind == kind) {
    return true;
  }
  if (typeContains(type->elementType, kind) || typeContains(type->returnType, kind)) {
    return true;
  }
  for (const auto &p: type->parameters) {
    if (typeContains(p, kind)) {
      return true;
    }
  }
  return false;
}

std::vector<const StructDeclAST *> visibleStructs(const ContractAST &contract, const SourceUnitAST &unit) {
  std::vector<const StructDeclAST *> out;
  for (const auto &s: unit.structs) {
    out.push_back(s.get());
  }
  for (const auto &s: contract.structs) {
    out.push_back(s.get());
  }
  return out;
}

//===----------------------------------------------------------------------===//

void DiagnosticSink::add(SourceSpan span, DiagnosticCode code, Severity severity, const std::string &message) {
  for (const auto &d: items_) {
    if (d.span.begin == span.begin && d.code == code && d.message == message) {
      return;
    }
  }
  Diagnostic d;
  d.kind = DiagnosticKind::Codegen;
  d.code = code;
  d.severity = severity;
  d.message = message;
  d.span = span;
  items_.push_back(d);
}

void DiagnosticSink::error(SourceSpan span, DiagnosticCode code, const std::string &message) {
  add(span, code, Severity::Error, message);
}

void DiagnosticSink::warning(SourceSpan span, DiagnosticCode code, const std::string &message) {
  add(span, code, Severity::Warning, message);
}

bool DiagnosticSink::hasErrors() const {
  return ::hasErrors(items_);
}
