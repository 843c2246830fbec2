#ifndef DIAGNOSTIC_H
#define DIAGNOSTIC_H
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

struct SourceSpan {
  size_t begin = 0;
  size_t end = 0;

  SourceSpan() = default;
  SourceSpan(size_t b, size_t e) : begin(b), end(e < b ? b : e) {}
};

enum class DiagnosticKind {
  Lex,
  Parse,
  Semantic,
  Codegen,
  Internal
};

enum class DiagnosticCode {
  LexError,
  ParseError,
  UndefinedSymbol,
  DuplicateDeclaration,
  TypeMismatch,
  MissingReturn,
  ImmutableAssignment,
  ArityMismatch,
  InvalidConstruct,
  UnusedVariable,
  UnsupportedConstruct,
  TargetConstraintViolation,
  InternalInvariantViolation
};

enum class Severity {
  Error,
  Warning
};

struct Diagnostic {
  DiagnosticKind kind = DiagnosticKind::Semantic;
  DiagnosticCode code = DiagnosticCode::InvalidConstruct;
  Severity severity = Severity::Error;
  std::string message;
  SourceSpan span;
  // 1-based，由 LineMap 回填
  int line = 0;
  int column = 0;

  bool isError() const { return severity == Severity::Error; }
};

const char *diagnosticKindName(DiagnosticKind kind);

const char *diagnosticCodeName(DiagnosticCode code);

const char *severityName(Severity severity);

bool hasErrors(const std::vector<Diagnostic> &diagnostics);

size_t countCode(const std::vector<Diagnostic> &diagnostics, DiagnosticCode code);

// Offset -> line/column translation for one source buffer.
class LineMap {
public:
  explicit LineMap(const std::string &source);

  std::pair<int, int> lineAndColumn(size_t offset) const;

  void annotate(std::vector<Diagnostic> &diagnostics) const;

private:
  std::vector<size_t> lineStarts_;
};

std::string formatDiagnostic(const Diagnostic &diagnostic, const std::string &fileName);

// 编译器自身缺陷（优化器不收敛、改写改变类型），不是用户错误
class InternalCompilerError : public std::logic_error {
public:
  InternalCompilerError(const std::string &message, SourceSpan span = {})
    : std::logic_error(message), span_(span) {}

  SourceSpan span() const { return span_; }

private:
  SourceSpan span_;
};
#endif //DIAGNOSTIC_H
