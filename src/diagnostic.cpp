#include "diagnostic.h"

#include <algorithm>
#include <sstream>

const char *diagnosticKindName(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::Lex: return "lex";
    case DiagnosticKind::Parse: return "parse";
    case DiagnosticKind::Semantic: return "semantic";
    case DiagnosticKind::Codegen: return "codegen";
    case DiagnosticKind::Internal: return "internal";
  }
  return "unknown";
}

const char *diagnosticCodeName(DiagnosticCode code) {
  switch (code) {
    case DiagnosticCode::LexError: return "LexError";
    case DiagnosticCode::ParseError: return "ParseError";
    case DiagnosticCode::UndefinedSymbol: return "UndefinedSymbol";
    case DiagnosticCode::DuplicateDeclaration: return "DuplicateDeclaration";
    case DiagnosticCode::TypeMismatch: return "TypeMismatch";
    case DiagnosticCode::MissingReturn: return "MissingReturn";
    case DiagnosticCode::ImmutableAssignment: return "ImmutableAssignment";
    case DiagnosticCode::ArityMismatch: return "ArityMismatch";
    case DiagnosticCode::InvalidConstruct: return "InvalidConstruct";
    case DiagnosticCode::UnusedVariable: return "UnusedVariable";
    case DiagnosticCode::UnsupportedConstruct: return "UnsupportedConstruct";
    case DiagnosticCode::TargetConstraintViolation: return "TargetConstraintViolation";
    case DiagnosticCode::InternalInvariantViolation: return "InternalInvariantViolation";
  }
  return "Unknown";
}

const char *severityName(Severity severity) {
  return severity == Severity::Error ? "error" : "warning";
}

bool hasErrors(const std::vector<Diagnostic> &diagnostics) {
  return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic &d) {
    return d.isError();
  });
}

size_t countCode(const std::vector<Diagnostic> &diagnostics, DiagnosticCode code) {
  return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(), [code](const Diagnostic &d) {
    return d.code == code;
  }));
}

LineMap::LineMap(const std::string &source) {
  lineStarts_.push_back(0);
  for (size_t i = 0; i < source.size(); ++i) {
    if (source[i] == '\n') {
      lineStarts_.push_back(i + 1);
    }
  }
}

std::pair<int, int> LineMap::lineAndColumn(size_t offset) const {
  auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
  size_t line = static_cast<size_t>(it - lineStarts_.begin());
  size_t start = lineStarts_[line - 1];
  return {static_cast<int>(line), static_cast<int>(offset - start + 1)};
}

void LineMap::annotate(std::vector<Diagnostic> &diagnostics) const {
  for (auto &d: diagnostics) {
    auto [line, col] = lineAndColumn(d.span.begin);
    d.line = line;
    d.column = col;
  }
}

std::string formatDiagnostic(const Diagnostic &diagnostic, const std::string &fileName) {
  std::ostringstream oss;
  oss << fileName << ":" << diagnostic.line << ":" << diagnostic.column << ": "
      << severityName(diagnostic.severity) << "[" << diagnosticCodeName(diagnostic.code) << "]: "
      << diagnostic.message;
  return oss.str();
}
