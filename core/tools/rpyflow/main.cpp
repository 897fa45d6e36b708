// rpyflow - Articy flow to Ren'Py script compiler
//
// Usage:
//   rpyflow [settings.yaml] [--check] [-v|--verbose]
//
#include <filesystem>
#include <iostream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "rpyflow/basic/diagnostic_printer.hpp"
#include "rpyflow/driver/compiler.hpp"
#include "rpyflow/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "rpyflow v0.1.0\n\n"
            << "Usage: " << program_name << " [settings.yaml] [options]\n\n"
            << "Compiles an Articy JSON export into Ren'Py scripts.\n"
            << "Without a settings file, rpyflow.yaml is searched for from the\n"
            << "current directory upward.\n\n"
            << "Options:\n"
            << "  --check                  Compile without writing the target directory\n"
            << "  -v, --verbose            Verbose output (progress, warnings and notes)\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const rpyflow::DiagnosticBag & diagnostics, bool verbose)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  rpyflow::DiagnosticPrinter printer(std::cerr, use_color);

  if (verbose) {
    printer.print_all(diagnostics);
    return;
  }

  // Warnings and notes end up in the log file
  for (const auto & diag : diagnostics) {
    if (diag.severity == rpyflow::Severity::Error) {
      printer.print(diag);
    }
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string settings_file;
  bool check = false;
  bool verbose = false;
  bool show_help = false;
  std::string unknown_option;
  std::string extra_argument;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--check") {
      args.check = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      if (args.unknown_option.empty()) {
        args.unknown_option = arg;
      }
    } else if (args.settings_file.empty()) {
      args.settings_file = arg;
    } else if (args.extra_argument.empty()) {
      args.extra_argument = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_compile(const CommandArgs & args)
{
  fs::path config_path;
  if (args.settings_file.empty()) {
    auto found = rpyflow::find_project_config(fs::current_path());
    if (!found) {
      std::cerr << "error: no " << rpyflow::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }
    config_path = *found;
  } else {
    config_path = fs::absolute(args.settings_file);
    if (!fs::exists(config_path)) {
      std::cerr << "error: file not found: " << config_path.string() << "\n";
      return 1;
    }
  }

  const auto config_result = rpyflow::load_project_config(config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }

  if (args.verbose) {
    std::cerr << (args.check ? "Checking" : "Building") << " project: " << config_path.string()
              << "\n";
  }

  rpyflow::CompileOptions options;
  options.mode = args.check ? rpyflow::CompileMode::Check : rpyflow::CompileMode::Build;
  options.verbose = args.verbose;

  const rpyflow::CompileResult result =
    rpyflow::Compiler::compile_project(config_result.config, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, args.verbose);
  }

  if (!result.success) {
    return 1;
  }

  if (args.check) {
    std::cout << config_path.filename().string() << ": OK\n";
    return 0;
  }

  if (args.verbose) {
    for (const auto & file : result.generated_files) {
      std::cerr << "Generated: " << file.string() << "\n";
    }
  }

  std::cout << "Generated " << result.generated_files.size() << " files in "
            << config_result.config.paths.target_dir.string() << " ("
            << result.diagnostics.count(rpyflow::Severity::Warning) << " warnings)\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.unknown_option.empty()) {
    std::cerr << "error: unknown option '" << args.unknown_option << "'\n";
    print_usage(argv[0]);
    return 1;
  }

  if (!args.extra_argument.empty()) {
    std::cerr << "error: unexpected argument '" << args.extra_argument << "'\n";
    print_usage(argv[0]);
    return 1;
  }

  return cmd_compile(args);
}
