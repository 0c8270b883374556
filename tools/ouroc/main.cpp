// ouroc - OuroLang Compiler Command Line Interface
//
// Usage:
//   ouroc check [file.ouro ... | --project]
//   ouroc build [file.ouro ... | --project] [-o dir] [-O]
//   ouroc tokens <file.ouro>
//   ouroc dump-ast <file.ouro> [-O]
//   ouroc init <project-name>
//
#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <rang.hpp>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "ouro/ast/json_visitor.hpp"
#include "ouro/basic/diagnostic_printer.hpp"
#include "ouro/driver/compiler.hpp"
#include "ouro/project/project_config.hpp"
#include "ouro/syntax/lexer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  fmt::print(
    stderr,
    "OuroLang Compiler v0.1.0\n\n"
    "Usage: {} <command> [options]\n\n"
    "Commands:\n"
    "  check [file.ouro...]     Check syntax and semantics\n"
    "  build [file.ouro...]     Check and write <stem>.ast.json\n"
    "  tokens <file.ouro>       Print the token stream\n"
    "  dump-ast <file.ouro>     Print the checked AST as JSON\n"
    "  init <project-name>      Initialize a new project\n\n"
    "Options:\n"
    "  -o, --output <dir>       Output directory (build)\n"
    "  -O, --optimize           Run the optimizer\n"
    "  --project                Use ouro.yaml from the current directory or parents\n"
    "  -j, --jobs <N>           Compile up to N files concurrently\n"
    "  -v, --verbose            Verbose output\n"
    "  --no-color               Disable colored diagnostics\n"
    "  -h, --help               Show this help message\n",
    program_name);
}

void print_error(bool use_color, const std::string & message)
{
  if (use_color) {
    std::cerr << rang::style::bold << rang::fg::red << "error" << rang::fg::reset << ": "
              << rang::style::reset;
  } else {
    std::cerr << "error: ";
  }
  std::cerr << message << "\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::string output_path;
  unsigned jobs = 0;
  bool use_project = false;
  bool optimize = false;
  bool verbose = false;
  bool use_color = true;
  bool show_help = false;
  std::optional<std::string> error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;
  args.use_color = isatty(fileno(stderr)) != 0;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        break;
      }
      args.output_path = argv[++i];
    } else if (arg == "-j" || arg == "--jobs") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        break;
      }
      const std::string value = argv[++i];
      char * end = nullptr;
      const long n = std::strtol(value.c_str(), &end, 10);
      if (end == value.c_str() || *end != '\0' || n < 1) {
        args.error = "invalid job count '" + value + "'";
        break;
      }
      args.jobs = static_cast<unsigned>(n);
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-O" || arg == "--optimize") {
      args.optimize = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "--no-color") {
      args.use_color = false;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
      break;
    } else {
      args.inputs.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Shared Helpers
// ============================================================================

/// Print every result's diagnostics against its own source; returns the error count.
size_t report_results(const std::vector<ouro::CompileResult> & results, bool use_color)
{
  ouro::DiagnosticPrinter printer(std::cerr, use_color);
  ouro::DiagnosticBag totals;

  for (const auto & result : results) {
    if (result.diagnostics.empty()) continue;
    if (result.source) {
      printer.print_all(result.diagnostics, *result.source);
    } else {
      printer.print_all(result.diagnostics, ouro::SourceFile(result.path, ""));
    }
    for (const auto & d : result.diagnostics) {
      totals.add(d);
    }
  }

  printer.print_summary(totals);
  return totals.error_count();
}

std::optional<ouro::ProjectConfig> load_project(const CommandArgs & args)
{
  const auto config_path = ouro::find_project_config(fs::current_path());
  if (!config_path) {
    print_error(args.use_color, "no ouro.yaml found in current directory or parents");
    return std::nullopt;
  }

  auto loaded = ouro::load_project_config(*config_path);
  if (!loaded.success) {
    print_error(args.use_color, config_path->string() + ": " + loaded.error);
    return std::nullopt;
  }
  return std::move(loaded.config);
}

// ============================================================================
// Commands
// ============================================================================

/// check and build differ only in mode and what they print on success.
int cmd_compile(const CommandArgs & args, ouro::CompileMode mode)
{
  ouro::CompileOptions options;
  options.mode = mode;
  options.optimize = args.optimize;
  options.jobs = args.jobs;
  if (!args.output_path.empty()) {
    options.output_dir = fs::absolute(args.output_path);
  }

  const char * verb = mode == ouro::CompileMode::Build ? "Building" : "Checking";
  std::vector<ouro::CompileResult> results;

  if (args.use_project || args.inputs.empty()) {
    const auto config = load_project(args);
    if (!config) return 1;

    if (args.verbose) {
      fmt::print(
        stderr, "{} project: {} ({} entry point{})\n", verb, config->package.name,
        config->compiler.entry_points.size(), config->compiler.entry_points.size() == 1 ? "" : "s");
    }
    results = ouro::Compiler::compile_project(*config, options);
  } else {
    std::vector<fs::path> files;
    files.reserve(args.inputs.size());
    for (const auto & input : args.inputs) {
      files.push_back(fs::absolute(input));
    }

    if (args.verbose) {
      fmt::print(
        stderr, "{} {} file{} with {} job{}\n", verb, files.size(), files.size() == 1 ? "" : "s",
        ouro::Compiler::job_count(options), ouro::Compiler::job_count(options) == 1 ? "" : "s");
    }
    results = ouro::Compiler::compile_files(files, options);
  }

  const size_t errors = report_results(results, args.use_color);

  bool ok = errors == 0;
  for (const auto & result : results) {
    if (!result.success()) {
      ok = false;
      continue;
    }
    if (args.verbose && result.unit && args.optimize) {
      const auto & stats = result.unit->optimization;
      fmt::print(
        stderr, "{}: folded {} expression(s), removed {} statement(s)\n", result.path.string(),
        stats.folded_expressions,
        stats.removed_statements + stats.removed_loops + stats.simplified_branches);
    }
    if (mode == ouro::CompileMode::Build) {
      for (const auto & file : result.generated_files) {
        fmt::print(stderr, "Generated: {}\n", file.string());
      }
    } else {
      fmt::print("{}: OK\n", result.path.string());
    }
  }

  return ok ? 0 : 1;
}

std::optional<std::string> read_file(const CommandArgs & args, const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    print_error(args.use_color, "unable to read '" + path.string() + "'");
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

int cmd_tokens(const CommandArgs & args)
{
  if (args.inputs.size() != 1) {
    print_error(args.use_color, "expected exactly one input file");
    fmt::print(stderr, "usage: ouroc tokens <file.ouro>\n");
    return 1;
  }

  const fs::path path = fs::absolute(args.inputs.front());
  const auto text = read_file(args, path);
  if (!text) return 1;

  const ouro::SourceFile source(path, *text);
  auto tokens = ouro::syntax::scan_tokens(source.content());
  if (!tokens) {
    ouro::DiagnosticPrinter printer(std::cerr, args.use_color);
    printer.print(tokens.error().to_diagnostic(), source);
    return 1;
  }

  for (const auto & tok : tokens.value()) {
    fmt::print(
      "{}:{}\t{}\t{}\n", tok.line, tok.column, ouro::syntax::to_string(tok.kind), tok.lexeme);
  }
  return 0;
}

int cmd_dump_ast(const CommandArgs & args)
{
  if (args.inputs.size() != 1) {
    print_error(args.use_color, "expected exactly one input file");
    fmt::print(stderr, "usage: ouroc dump-ast <file.ouro> [-O]\n");
    return 1;
  }

  ouro::CompileOptions options;
  options.optimize = args.optimize;

  std::vector<ouro::CompileResult> results;
  results.push_back(ouro::Compiler::compile_file(fs::absolute(args.inputs.front()), options));
  if (report_results(results, args.use_color) != 0 || !results.front().success()) {
    return 1;
  }

  fmt::print("{}\n", ouro::to_json(results.front().unit->program).dump(2));
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.inputs.size() != 1) {
    print_error(args.use_color, "project name required");
    fmt::print(stderr, "usage: ouroc init <project-name>\n");
    return 1;
  }

  const std::string & name = args.inputs.front();
  const fs::path project_dir = fs::current_path() / name;

  std::error_code ec;
  if (fs::exists(project_dir, ec)) {
    print_error(args.use_color, "directory already exists: " + project_dir.string());
    return 1;
  }

  fs::create_directories(project_dir / "src", ec);
  if (ec) {
    print_error(args.use_color, "unable to create " + project_dir.string() + ": " + ec.message());
    return 1;
  }

  std::ofstream config(project_dir / ouro::k_project_config_file_name);
  config << ouro::default_project_config(name);

  std::ofstream main(project_dir / "src" / "main.ouro");
  main << "// Entry point\n"
       << "func main() {\n"
       << "    var greeting = \"Hello, Ouro\";\n"
       << "}\n";

  if (!config || !main) {
    print_error(args.use_color, "unable to write project files in " + project_dir.string());
    return 1;
  }

  fmt::print("Initialized new OuroLang project in {}\n", project_dir.string());
  fmt::print("\nNext steps:\n  cd {}\n  ouroc build\n", name);
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (!args.use_color) {
    rang::setControlMode(rang::control::Off);
  }

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.error) {
    print_error(args.use_color, *args.error);
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "check") {
    return cmd_compile(args, ouro::CompileMode::Check);
  }
  if (args.command == "build") {
    return cmd_compile(args, ouro::CompileMode::Build);
  }
  if (args.command == "tokens") {
    return cmd_tokens(args);
  }
  if (args.command == "dump-ast") {
    return cmd_dump_ast(args);
  }
  if (args.command == "init") {
    return cmd_init(args);
  }

  print_error(args.use_color, "unknown command '" + args.command + "'");
  print_usage(argv[0]);
  return 1;
}
