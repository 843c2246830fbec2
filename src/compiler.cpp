#include "compiler.h"
#include "parser.h"
#include "semantic.h"
#include <functional>
#include <future>

namespace {

// 一个合约在一个目标上的生成任务
struct GenerationJob {
  size_t contract;
  Target target;
};

GeneratedArtifact runGenerator(const ContractAST &contract, const SourceUnitAST &unit, Target target,
                               const CodegenOptions &options) {
  auto generator = makeGenerator(target, options);
  return generator->generate(contract, unit);
}

Diagnostic internalDiagnostic(const InternalCompilerError &err) {
  Diagnostic d;
  d.kind = DiagnosticKind::Internal;
  d.code = DiagnosticCode::InternalInvariantViolation;
  d.severity = Severity::Error;
  d.message = std::string("internal compiler error: ") + err.what();
  d.span = err.span();
  return d;
}

} // namespace

TypeRef AnalysisResult::typeAt(size_t offset) const {
  if (!unit) {
    return nullptr;
  }
  const ExprAST *best = nullptr;
  auto consider = [&](const ExprAST *e) {
    if (!e->type || e->pos > offset || offset >= e->end_pos) {
      return;
    }
    if (!best || e->end_pos - e->pos <= best->end_pos - best->pos) {
      best = e;
    }
  };
  for (const auto &contract: unit->contracts) {
    visitContract(*contract, [](const StmtAST *) {}, consider);
  }
  return best ? best->type : nullptr;
}

AnalysisResult analyzeSource(const std::string &source) {
  AnalysisResult result;
  LineMap lines(source);
  ParseResult parsed = parseSource(source);
  result.diagnostics = std::move(parsed.diagnostics);
  result.unit = std::move(parsed.unit);
  if (result.unit && !hasErrors(result.diagnostics)) {
    SemanticAnalyzer analyzer(*result.unit);
    analyzer.analyze();
    const auto &issues = analyzer.diagnostics();
    result.diagnostics.insert(result.diagnostics.end(), issues.begin(), issues.end());
  }
  lines.annotate(result.diagnostics);
  return result;
}

CompileResult compileSource(const std::string &source, const CompileOptions &options) {
  CompileResult result;
  LineMap lines(source);
  AnalysisResult analysis = analyzeSource(source);
  bool frontendOk = analysis.ok();
  result.diagnostics = std::move(analysis.diagnostics);
  if (!frontendOk) {
    result.exitCode = kExitFrontend;
    return result;
  }
  const SourceUnitAST &unit = *analysis.unit;

  std::vector<unique_ptr<ContractAST>> optimized;
  try {
    for (const auto &contract: unit.contracts) {
      ContractOutput output;
      output.name = contract->name;
      optimized.push_back(optimizeContract(*contract, &output.stats));
      result.stats.merge(output.stats);
      result.contracts.push_back(std::move(output));
    }
  } catch (const InternalCompilerError &err) {
    result.diagnostics.push_back(internalDiagnostic(err));
    lines.annotate(result.diagnostics);
    result.exitCode = kExitInternal;
    return result;
  }

  std::vector<GenerationJob> jobs;
  for (size_t i = 0; i < optimized.size(); ++i) {
    for (Target target: options.targets) {
      jobs.push_back({i, target});
    }
  }

  // 结果按任务顺序收集，与是否并行无关
  std::vector<GeneratedArtifact> artifacts(jobs.size());
  bool internalError = false;
  if (options.parallel_targets && jobs.size() > 1) {
    std::vector<std::future<GeneratedArtifact>> futures;
    for (const auto &job: jobs) {
      const ContractAST *contract = optimized[job.contract].get();
      futures.push_back(std::async(std::launch::async, runGenerator, std::cref(*contract), std::cref(unit),
                                   job.target, std::cref(options.codegen)));
    }
    for (size_t i = 0; i < futures.size(); ++i) {
      try {
        artifacts[i] = futures[i].get();
      } catch (const InternalCompilerError &err) {
        artifacts[i].target = jobs[i].target;
        artifacts[i].contractName = optimized[jobs[i].contract]->name;
        artifacts[i].diagnostics.push_back(internalDiagnostic(err));
        internalError = true;
      }
    }
  } else {
    for (size_t i = 0; i < jobs.size(); ++i) {
      try {
        artifacts[i] = runGenerator(*optimized[jobs[i].contract], unit, jobs[i].target, options.codegen);
      } catch (const InternalCompilerError &err) {
        artifacts[i].target = jobs[i].target;
        artifacts[i].contractName = optimized[jobs[i].contract]->name;
        artifacts[i].diagnostics.push_back(internalDiagnostic(err));
        internalError = true;
      }
    }
  }

  bool anyFailed = false;
  for (size_t i = 0; i < jobs.size(); ++i) {
    GeneratedArtifact &artifact = artifacts[i];
    lines.annotate(artifact.diagnostics);
    result.diagnostics.insert(result.diagnostics.end(), artifact.diagnostics.begin(), artifact.diagnostics.end());
    if (!artifact.ok) {
      anyFailed = true;
    }
    result.contracts[jobs[i].contract].artifacts.push_back(std::move(artifact));
  }

  if (internalError) {
    result.exitCode = kExitInternal;
  } else if (anyFailed) {
    result.exitCode = kExitPartial;
  }
  return result;
}

std::string artifactPath(const std::string &outDir, const GeneratedArtifact &artifact) {
  std::string dir = outDir.empty() ? "." : outDir;
  if (dir.back() == '/') {
    dir.pop_back();
  }
  return dir + "/" + targetName(artifact.target) + "/" + toSnakeCase(artifact.contractName) + "." +
         targetExtension(artifact.target);
}

const std::string &exampleContract() {
  static const std::string text = R"(// A minimal vault: deposits are counted and can be paused.
contract TokenVault {
    state {
        total: u64 = 0;
        deposits: u64 = 0;
        paused: bool = false;
        lastDepositor: address;
    }

    const MAX_DEPOSIT: u64 = 1_000_000;

    event Deposited(who: address, amount: u64);

    modifier whenActive {
        require(!paused, "vault is paused");
        _;
    }

    public fn deposit(amount: u64) whenActive {
        require(amount > 0 && amount <= MAX_DEPOSIT, "invalid amount");
        total += amount;
        deposits += 1;
        lastDepositor = msg_sender;
        emit Deposited(msg_sender, amount);
    }

    public fn setPaused(value: bool) {
        paused = value;
    }

    public fn average() -> u64 {
        if (deposits == 0) {
            return 0;
        }
        return total / deposits;
    }
}
)";
  return text;
}
