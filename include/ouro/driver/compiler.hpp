// ouro/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline. Used by the CLI and by
// tests; every unit owns its own arena and semantic model, so independent
// units can be compiled on separate threads.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ouro/ast/ast.hpp"
#include "ouro/ast/ast_context.hpp"
#include "ouro/basic/cancellation.hpp"
#include "ouro/basic/diagnostic.hpp"
#include "ouro/basic/source_manager.hpp"
#include "ouro/opt/optimizer.hpp"
#include "ouro/project/project_config.hpp"
#include "ouro/sema/sema.hpp"

namespace ouro
{

// ============================================================================
// Compile Mode / Status
// ============================================================================

enum class CompileMode : uint8_t {
  Check,  ///< Lex, parse and check only
  Build,  ///< Also write `<stem>.ast.json`
};

enum class CompileStatus : uint8_t {
  Success,
  Failed,
  Cancelled,
};

[[nodiscard]] std::string_view to_string(CompileStatus status) noexcept;

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Check;

  /// Run the optimizer on units that checked cleanly
  bool optimize = false;

  /// Output directory for build artifacts (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  /// Units compiled concurrently; 0 means hardware concurrency
  unsigned jobs = 0;
};

// ============================================================================
// Compile Result
// ============================================================================

/**
 * Everything one successfully compiled source file owns.
 *
 * `program` and every annotation in it point into `ast` and `model`.
 */
struct CompilationUnit
{
  std::shared_ptr<const SourceFile> source;
  AstContext ast;
  SemanticModel model;
  Program * program = nullptr;
  OptimizationStats optimization;

  explicit CompilationUnit(std::shared_ptr<const SourceFile> src) : source(std::move(src)) {}
};

struct CompileResult
{
  CompileStatus status = CompileStatus::Failed;

  /// Path the unit was compiled from (may be empty for in-memory sources)
  std::filesystem::path path;

  /// Source the diagnostics refer to (null when the file could not be read)
  std::shared_ptr<const SourceFile> source;

  DiagnosticBag diagnostics;

  /// Only set on Success
  std::unique_ptr<CompilationUnit> unit;

  /// Artifacts written in Build mode
  std::vector<std::filesystem::path> generated_files;

  [[nodiscard]] bool success() const noexcept { return status == CompileStatus::Success; }
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the pipeline.
 *
 * The pipeline consists of:
 * 1. Lexing
 * 2. Parsing
 * 3. Semantic analysis and type checking
 * 4. Optimization (optional)
 * 5. Writing the JSON AST (Build mode only)
 *
 * The cancellation token is polled before every stage. A cancelled unit
 * reports CompileStatus::Cancelled and carries no partial result.
 */
class Compiler
{
public:
  [[nodiscard]] static CompileResult compile_source(
    std::string source, const std::filesystem::path & path, const CompileOptions & options,
    const CancellationToken & cancel = {});

  /// Read `file` and compile it; an unreadable file is a Failed result.
  [[nodiscard]] static CompileResult compile_file(
    const std::filesystem::path & file, const CompileOptions & options,
    const CancellationToken & cancel = {});

  /**
   * Compile independent files concurrently.
   *
   * At most `options.jobs` units are in flight. Results are in input order
   * and identical to compiling the files one by one.
   *
   * In Build mode an input whose artifact path is already claimed by an
   * earlier input is not compiled; its result fails with D0004.
   */
  [[nodiscard]] static std::vector<CompileResult> compile_files(
    const std::vector<std::filesystem::path> & files, const CompileOptions & options,
    const CancellationToken & cancel = {});

  /**
   * Compile every entry point of a project.
   *
   * Config values apply where `options` leaves them unset: output
   * directory, optimization and job count.
   */
  [[nodiscard]] static std::vector<CompileResult> compile_project(
    const ProjectConfig & config, const CompileOptions & options,
    const CancellationToken & cancel = {});

  /// Effective job count for `options` (never 0).
  [[nodiscard]] static unsigned job_count(const CompileOptions & options) noexcept;

private:
  static bool write_ast_json(
    const CompilationUnit & unit, const std::filesystem::path & output_path,
    DiagnosticBag & diags);
};

}  // namespace ouro
