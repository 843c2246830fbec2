#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "compiler.h"

namespace fs = std::filesystem;

namespace {

struct CliOptions {
  std::string command;
  std::string input;
  std::string output;
  std::vector<Target> targets;
  size_t mapCapacity = 0;
  bool serial = false;
  bool verbose = false;
};

void print_usage(std::ostream &os) {
  os << "usage:\n"
     << "  ccdsl compile -i <file> [-t solana|aptos|sui|all[,..]] [-o <dir>] [--map-capacity N] [--serial] [--verbose]\n"
     << "  ccdsl check -i <file>        (alias: validate)\n"
     << "  ccdsl example [-o <file>]\n";
}

bool read_from_file(std::string &input, const std::string &filename) {
  std::ifstream fin(filename, std::ios::in | std::ios::binary);
  if (!fin) {
    std::cerr << "Cannot open file: " << filename << std::endl;
    return false;
  }
  std::ostringstream oss;
  oss << fin.rdbuf();
  input = oss.str();
  return true;
}

bool write_to_file(const std::string &path, const std::string &text) {
  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      std::cerr << "Cannot create directory " << parent.string() << ": " << ec.message() << std::endl;
      return false;
    }
  }
  std::ofstream fout(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!fout) {
    std::cerr << "Cannot write file: " << path << std::endl;
    return false;
  }
  fout << text;
  return static_cast<bool>(fout);
}

bool parse_targets(const std::string &list, std::vector<Target> &targets) {
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (item == "all") {
      for (Target t: allTargets()) targets.push_back(t);
      continue;
    }
    Target target;
    if (!targetFromName(item, target)) {
      std::cerr << "Unknown target: " << item << std::endl;
      return false;
    }
    targets.push_back(target);
  }
  return !targets.empty();
}

bool parse_args(int argc, char **argv, CliOptions &options) {
  if (argc < 2) {
    return false;
  }
  options.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&](std::string &out) {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return false;
      }
      out = argv[++i];
      return true;
    };
    std::string text;
    if (arg == "-i" || arg == "--input") {
      if (!value(options.input)) return false;
    } else if (arg == "-o" || arg == "--output") {
      if (!value(options.output)) return false;
    } else if (arg == "-t" || arg == "--target") {
      if (!value(text) || !parse_targets(text, options.targets)) return false;
    } else if (arg == "--map-capacity") {
      if (!value(text)) return false;
      try {
        size_t used = 0;
        unsigned long n = std::stoul(text, &used);
        if (used != text.size() || n == 0) {
          std::cerr << "--map-capacity needs a positive integer" << std::endl;
          return false;
        }
        options.mapCapacity = n;
      } catch (const std::exception &) {
        std::cerr << "--map-capacity needs a positive integer" << std::endl;
        return false;
      }
    } else if (arg == "--serial") {
      options.serial = true;
    } else if (arg == "--verbose" || arg == "-v") {
      options.verbose = true;
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    }
  }
  return true;
}

void print_diagnostics(const std::vector<Diagnostic> &diagnostics, const std::string &file) {
  for (const auto &d: diagnostics) {
    std::cerr << formatDiagnostic(d, file) << std::endl;
  }
}

void print_stats(const CompileResult &result) {
  for (const auto &contract: result.contracts) {
    const OptimizerStats &s = contract.stats;
    std::cout << "[optimizer] " << contract.name << ": " << s.iterations << " iteration(s), "
              << s.constantFolds << " fold(s), " << s.algebraicSimplifications << " simplification(s), "
              << s.deadCodeEliminations << " dead-code removal(s), " << s.constantPropagations
              << " propagation(s)" << std::endl;
  }
}

int run_check(const CliOptions &options) {
  std::string source;
  if (!read_from_file(source, options.input)) {
    return kExitUsage;
  }
  AnalysisResult analysis = analyzeSource(source);
  print_diagnostics(analysis.diagnostics, options.input);
  if (!analysis.ok()) {
    return kExitFrontend;
  }
  size_t contracts = analysis.unit->contracts.size();
  std::cout << options.input << ": ok (" << contracts << " contract" << (contracts == 1 ? "" : "s") << ")"
            << std::endl;
  return kExitSuccess;
}

int run_compile(const CliOptions &options) {
  std::string source;
  if (!read_from_file(source, options.input)) {
    return kExitUsage;
  }
  CompileOptions compile;
  if (!options.targets.empty()) {
    compile.targets = options.targets;
  }
  if (options.mapCapacity > 0) {
    compile.codegen.mapPolicy = MapPolicy::Bounded;
    compile.codegen.mapCapacity = options.mapCapacity;
  }
  compile.parallel_targets = !options.serial;

  if (options.verbose) {
    std::cout << "[compile] " << options.input << " -> " << compile.targets.size() << " target(s)"
              << (compile.parallel_targets ? "" : ", serial") << std::endl;
  }
  CompileResult result = compileSource(source, compile);
  print_diagnostics(result.diagnostics, options.input);
  if (options.verbose) {
    print_stats(result);
  }

  std::string outDir = options.output.empty() ? "out" : options.output;
  bool ioFailed = false;
  for (const auto &contract: result.contracts) {
    for (const auto &artifact: contract.artifacts) {
      if (!artifact.ok) {
        std::cout << "✗ " << targetName(artifact.target) << ": " << contract.name << " failed" << std::endl;
        continue;
      }
      std::string path = artifactPath(outDir, artifact);
      if (!write_to_file(path, artifact.text)) {
        ioFailed = true;
        continue;
      }
      std::cout << "✓ " << targetName(artifact.target) << ": " << path << std::endl;
    }
  }
  if (result.exitCode == kExitSuccess && ioFailed) {
    return kExitUsage;
  }
  return result.exitCode;
}

int run_example(const CliOptions &options) {
  if (options.output.empty()) {
    std::cout << exampleContract();
    return kExitSuccess;
  }
  if (!write_to_file(options.output, exampleContract())) {
    return kExitUsage;
  }
  std::cout << "example written to " << options.output << std::endl;
  return kExitSuccess;
}

} // namespace

int main(int argc, char **argv) {
  CliOptions options;
  if (!parse_args(argc, argv, options)) {
    print_usage(std::cerr);
    return kExitUsage;
  }
  try {
    if (options.command == "compile" || options.command == "check" || options.command == "validate") {
      if (options.input.empty()) {
        std::cerr << "Missing input file (-i)" << std::endl;
        print_usage(std::cerr);
        return kExitUsage;
      }
      return options.command == "compile" ? run_compile(options) : run_check(options);
    }
    if (options.command == "example") {
      return run_example(options);
    }
    if (options.command == "help" || options.command == "--help" || options.command == "-h") {
      print_usage(std::cout);
      return kExitSuccess;
    }
    std::cerr << "Unknown command: " << options.command << std::endl;
    print_usage(std::cerr);
    return kExitUsage;
  } catch (const InternalCompilerError &ex) {
    std::cerr << options.input << ": error[" << diagnosticCodeName(DiagnosticCode::InternalInvariantViolation)
              << "]: internal compiler error: " << ex.what() << std::endl;
    return kExitInternal;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return kExitUsage;
  }
}
