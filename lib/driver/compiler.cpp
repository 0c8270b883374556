// ouro/driver/compiler.cpp - Compiler driver implementation
//
#include "ouro/driver/compiler.hpp"

#include <deque>
#include <fstream>
#include <future>
#include <map>
#include <sstream>
#include <thread>
#include <utility>

#include "ouro/ast/json_visitor.hpp"
#include "ouro/syntax/lexer.hpp"
#include "ouro/syntax/parser.hpp"

namespace ouro
{

namespace
{

CompileResult cancelled(const std::filesystem::path & path)
{
  CompileResult result;
  result.status = CompileStatus::Cancelled;
  result.path = path;
  return result;
}

std::filesystem::path artifact_path(
  const std::filesystem::path & source_path, const CompileOptions & options)
{
  std::string stem = source_path.stem().string();
  if (stem.empty()) stem = "unit";
  const std::filesystem::path dir = options.output_dir ? *options.output_dir
                                                       : source_path.parent_path();
  return dir / (stem + ".ast.json");
}

}  // namespace

std::string_view to_string(CompileStatus status) noexcept
{
  switch (status) {
    case CompileStatus::Success:
      return "success";
    case CompileStatus::Failed:
      return "failed";
    case CompileStatus::Cancelled:
      return "cancelled";
  }
  return "";
}

unsigned Compiler::job_count(const CompileOptions & options) noexcept
{
  if (options.jobs != 0) return options.jobs;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw != 0 ? hw : 1;
}

CompileResult Compiler::compile_source(
  std::string source, const std::filesystem::path & path, const CompileOptions & options,
  const CancellationToken & cancel)
{
  if (cancel.is_cancelled()) return cancelled(path);

  CompileResult result;
  result.path = path;
  result.source = std::make_shared<const SourceFile>(path, std::move(source));
  auto unit = std::make_unique<CompilationUnit>(result.source);

  // Lexing
  auto tokens = syntax::scan_tokens(unit->source->content());
  if (!tokens) {
    result.diagnostics.add(tokens.error().to_diagnostic());
    return result;
  }

  // Parsing (parser errors are mirrored into the bag)
  if (cancel.is_cancelled()) return cancelled(path);
  syntax::Parser parser(unit->ast, result.diagnostics, std::move(tokens).value());
  unit->program = parser.parse_program();
  if (parser.has_errors() || unit->program == nullptr) {
    return result;
  }

  // Semantic analysis and type checking
  if (cancel.is_cancelled()) return cancelled(path);
  const std::vector<SymbolError> errors = check(*unit->program, unit->model);
  for (const SymbolError & err : errors) {
    result.diagnostics.add(err.to_diagnostic());
  }
  if (!errors.empty()) {
    return result;
  }

  // Optimization
  if (options.optimize) {
    if (cancel.is_cancelled()) return cancelled(path);
    Optimizer optimizer(unit->ast);
    optimizer.optimize(*unit->program);
    unit->optimization = optimizer.stats();
  }

  // Build artifacts
  if (options.mode == CompileMode::Build) {
    if (cancel.is_cancelled()) return cancelled(path);
    const std::filesystem::path out = artifact_path(path, options);
    if (!write_ast_json(*unit, out, result.diagnostics)) {
      return result;
    }
    result.generated_files.push_back(out);
  }

  result.status = CompileStatus::Success;
  result.unit = std::move(unit);
  return result;
}

CompileResult Compiler::compile_file(
  const std::filesystem::path & file, const CompileOptions & options,
  const CancellationToken & cancel)
{
  if (cancel.is_cancelled()) return cancelled(file);

  std::ifstream in(file, std::ios::binary);
  if (!in) {
    CompileResult result;
    result.path = file;
    result.diagnostics.report_error(SourceRange{}, "unable to read '" + file.string() + "'")
      .with_code("D0001");
    return result;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return compile_source(buffer.str(), file, options, cancel);
}

std::vector<CompileResult> Compiler::compile_files(
  const std::vector<std::filesystem::path> & files, const CompileOptions & options,
  const CancellationToken & cancel)
{
  std::vector<CompileResult> results(files.size());
  const size_t limit = job_count(options);

  auto run = [&files, &options, cancel](size_t index) {
    try {
      return compile_file(files[index], options, cancel);
    } catch (const std::exception & e) {
      // Filesystem and allocation failures become a diagnostic for this unit.
      CompileResult failed;
      failed.path = files[index];
      failed.diagnostics.report_error(SourceRange{}, std::string("internal error: ") + e.what())
        .with_code("D0002");
      return failed;
    }
  };

  // Two inputs writing one artifact would race; the later input fails instead.
  std::vector<bool> blocked(files.size(), false);
  if (options.mode == CompileMode::Build) {
    std::map<std::filesystem::path, size_t> owners;
    for (size_t i = 0; i < files.size(); ++i) {
      const auto out = artifact_path(files[i], options).lexically_normal();
      const auto [it, inserted] = owners.emplace(out, i);
      if (inserted) continue;
      blocked[i] = true;
      results[i].path = files[i];
      results[i].diagnostics.report_error(
        SourceRange{}, "'" + files[i].string() + "' would overwrite the artifact '" +
                         out.string() + "' of '" + files[it->second].string() + "'")
        .with_code("D0004");
    }
  }

  std::deque<std::pair<size_t, std::future<CompileResult>>> in_flight;
  for (size_t i = 0; i < files.size(); ++i) {
    if (blocked[i]) continue;
    if (in_flight.size() >= limit) {
      auto & [index, future] = in_flight.front();
      results[index] = future.get();
      in_flight.pop_front();
    }
    in_flight.emplace_back(i, std::async(std::launch::async, run, i));
  }
  while (!in_flight.empty()) {
    auto & [index, future] = in_flight.front();
    results[index] = future.get();
    in_flight.pop_front();
  }

  return results;
}

std::vector<CompileResult> Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options, const CancellationToken & cancel)
{
  if (config.compiler.entry_points.empty()) {
    CompileResult result;
    result.path = config.project_root / k_project_config_file_name;
    result.diagnostics.report_error(
      SourceRange{}, "no entry points defined in project configuration");
    std::vector<CompileResult> out;
    out.push_back(std::move(result));
    return out;
  }

  CompileOptions effective = options;
  if (!effective.output_dir) effective.output_dir = config.output_path();
  effective.optimize = options.optimize || config.compiler.optimize;
  if (effective.jobs == 0 && config.compiler.jobs) effective.jobs = *config.compiler.jobs;

  return compile_files(config.entry_point_paths(), effective, cancel);
}

bool Compiler::write_ast_json(
  const CompilationUnit & unit, const std::filesystem::path & output_path, DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (output_path.has_parent_path()) {
    fs::create_directories(output_path.parent_path(), ec);
    if (ec) {
      diags.report_error(
        SourceRange{}, "unable to create output directory '" +
                         output_path.parent_path().string() + "': " + ec.message())
        .with_code("D0003");
      return false;
    }
  }

  std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    diags.report_error(SourceRange{}, "unable to write '" + output_path.string() + "'")
      .with_code("D0003");
    return false;
  }
  out << to_json(unit.program).dump(2) << '\n';
  if (!out) {
    diags.report_error(SourceRange{}, "failed writing '" + output_path.string() + "'")
      .with_code("D0003");
    return false;
  }
  return true;
}

}  // namespace ouro
