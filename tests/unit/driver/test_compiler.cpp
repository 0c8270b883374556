// tests/unit/driver/test_compiler.cpp - Unit tests for the compile pipeline driver
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "ouro/ast/json_visitor.hpp"
#include "ouro/driver/compiler.hpp"

using namespace ouro;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

/// Directory unique to the running test.
std::filesystem::path test_dir()
{
  const auto * info = ::testing::UnitTest::GetInstance()->current_test_info();
  return std::filesystem::temp_directory_path() /
         (std::string("ouro_driver_") + info->test_suite_name() + "_" + info->name());
}

void write_file(const std::filesystem::path & p, const std::string & content)
{
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  ASSERT_TRUE(out.is_open()) << p;
  out << content;
}

std::string read_file(const std::filesystem::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::vector<std::string> codes(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const Diagnostic & d : diags) out.push_back(d.code);
  return out;
}

std::vector<std::string> messages(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const Diagnostic & d : diags) out.push_back(d.message);
  return out;
}

}  // namespace

// ============================================================================
// Single units
// ============================================================================

TEST(CompilerTest, CleanSourceSucceeds)
{
  CompileOptions options;
  auto result = Compiler::compile_source(
    "func add(a: Int, b: Int) -> Int { return a + b; }\nvar x = add(1, 2);\n", "add.ouro",
    options);

  EXPECT_TRUE(result.success());
  EXPECT_EQ(result.status, CompileStatus::Success);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_NE(result.unit, nullptr);
  ASSERT_NE(result.unit->program, nullptr);
  EXPECT_EQ(result.unit->program->decls.size(), 2u);
  EXPECT_TRUE(result.generated_files.empty());
  ASSERT_NE(result.source, nullptr);
  EXPECT_EQ(result.source->path(), "add.ouro");
}

TEST(CompilerTest, LexerErrorStopsThePipeline)
{
  auto result = Compiler::compile_source("var s = \"unterminated;\n", "bad.ouro", {});

  EXPECT_EQ(result.status, CompileStatus::Failed);
  EXPECT_EQ(result.unit, nullptr);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics.all()[0].code.front(), 'L');
}

TEST(CompilerTest, ParserErrorsAreAllReported)
{
  auto result = Compiler::compile_source("var a = ;\nvar b = 1\nvar c = 2;\n", "bad.ouro", {});

  EXPECT_EQ(result.status, CompileStatus::Failed);
  EXPECT_GE(result.diagnostics.size(), 2u);
  for (const std::string & code : codes(result.diagnostics)) {
    EXPECT_EQ(code.front(), 'P');
  }
}

TEST(CompilerTest, SemanticErrorsFailTheUnit)
{
  auto result = Compiler::compile_source(
    "var x: String = 42;\nvar y = missing;\n", "sema.ouro", {});

  EXPECT_EQ(result.status, CompileStatus::Failed);
  EXPECT_EQ(result.unit, nullptr);
  ASSERT_EQ(result.diagnostics.size(), 2u);
  for (const std::string & code : codes(result.diagnostics)) {
    EXPECT_EQ(code.front(), 'S');
  }
}

TEST(CompilerTest, CancelledBeforeStartProducesNothing)
{
  CancellationToken token;
  token.cancel();

  auto result = Compiler::compile_source("var x = 1;\n", "c.ouro", {}, token);
  EXPECT_EQ(result.status, CompileStatus::Cancelled);
  EXPECT_EQ(result.unit, nullptr);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(to_string(result.status), "cancelled");
}

TEST(CompilerTest, CancellationIsSharedByCopies)
{
  CancellationToken token;
  const CancellationToken copy = token;
  EXPECT_FALSE(copy.is_cancelled());
  token.cancel();
  EXPECT_TRUE(copy.is_cancelled());
}

TEST(CompilerTest, UnreadableFileIsADriverDiagnostic)
{
  const TempDir dir(test_dir());
  auto result = Compiler::compile_file(dir.path / "does_not_exist.ouro", {});

  EXPECT_EQ(result.status, CompileStatus::Failed);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics.all()[0].code, "D0001");
  EXPECT_EQ(result.source, nullptr);
}

TEST(CompilerTest, OptimizeOptionRunsTheOptimizer)
{
  CompileOptions options;
  options.optimize = true;
  auto result = Compiler::compile_source("var x = 2 * 21;\n", "opt.ouro", options);

  ASSERT_TRUE(result.success());
  EXPECT_TRUE(result.unit->optimization.changed());
  EXPECT_EQ(result.unit->optimization.folded_expressions, 1u);
}

TEST(CompilerTest, JobCountIsNeverZero)
{
  CompileOptions options;
  EXPECT_GE(Compiler::job_count(options), 1u);
  options.jobs = 3;
  EXPECT_EQ(Compiler::job_count(options), 3u);
}

// ============================================================================
// Build artifacts
// ============================================================================

TEST(CompilerTest, BuildModeWritesAstJson)
{
  const TempDir dir(test_dir());
  const auto src = dir.path / "src" / "main.ouro";
  write_file(src, "var greeting = \"hi\";\nfunc main() { }\n");

  CompileOptions options;
  options.mode = CompileMode::Build;
  options.output_dir = dir.path / "out";
  auto result = Compiler::compile_file(src, options);

  ASSERT_TRUE(result.success());
  ASSERT_EQ(result.generated_files.size(), 1u);
  const auto expected = dir.path / "out" / "main.ast.json";
  EXPECT_EQ(result.generated_files[0], expected);
  ASSERT_TRUE(std::filesystem::exists(expected));

  const auto j = nlohmann::json::parse(read_file(expected));
  EXPECT_EQ(j["type"], "Program");
  ASSERT_EQ(j["decls"].size(), 2u);
  EXPECT_EQ(j["decls"][0]["type"], "VarDecl");
  EXPECT_EQ(j["decls"][0]["name"], "greeting");
  EXPECT_EQ(j["decls"][0]["resolvedType"], "String");
  EXPECT_EQ(j["decls"][1]["type"], "FunctionDecl");
}

TEST(CompilerTest, CheckModeWritesNothing)
{
  const TempDir dir(test_dir());
  const auto src = dir.path / "main.ouro";
  write_file(src, "var x = 1;\n");

  CompileOptions options;
  options.output_dir = dir.path / "out";
  auto result = Compiler::compile_file(src, options);

  ASSERT_TRUE(result.success());
  EXPECT_TRUE(result.generated_files.empty());
  EXPECT_FALSE(std::filesystem::exists(dir.path / "out"));
}

TEST(CompilerTest, JsonHasProgramShape)
{
  auto result = Compiler::compile_source("var x = 1 + 2;\nx = 3;\n", "shape.ouro", {});
  ASSERT_TRUE(result.success());

  const auto j = to_json(result.unit->program);
  EXPECT_EQ(j["type"], "Program");
  ASSERT_TRUE(j["decls"].is_array());
  ASSERT_TRUE(j["statements"].is_array());
  EXPECT_EQ(j["statements"].size(), 1u);

  const auto & init = j["decls"][0]["initializer"];
  EXPECT_EQ(init["type"], "BinaryExpr");
  EXPECT_EQ(init["resolvedType"], "Int");
  EXPECT_EQ(init["line"], 1);
  EXPECT_TRUE(init["range"].contains("start"));

  EXPECT_EQ(to_json(static_cast<const Program *>(nullptr))["decls"].size(), 0u);
}

// ============================================================================
// Concurrent units
// ============================================================================

TEST(CompilerTest, ConcurrentResultsMatchSequentialOrder)
{
  const TempDir dir(test_dir());

  std::vector<std::filesystem::path> files;
  for (int i = 0; i < 12; ++i) {
    const auto p = dir.path / ("unit" + std::to_string(i) + ".ouro");
    if (i % 3 == 0) {
      write_file(p, "var v" + std::to_string(i) + ": String = " + std::to_string(i) + ";\n");
    } else if (i % 3 == 1) {
      write_file(p, "func f" + std::to_string(i) + "() -> Int { return " + std::to_string(i) + "; }\n");
    } else {
      write_file(p, "var a = undefined" + std::to_string(i) + ";\n");
    }
    files.push_back(p);
  }
  files.push_back(dir.path / "missing.ouro");

  CompileOptions options;
  options.jobs = 4;
  const auto concurrent = Compiler::compile_files(files, options);

  ASSERT_EQ(concurrent.size(), files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    const auto sequential = Compiler::compile_file(files[i], options);
    EXPECT_EQ(concurrent[i].path, files[i]);
    EXPECT_EQ(concurrent[i].status, sequential.status) << files[i];
    EXPECT_EQ(codes(concurrent[i].diagnostics), codes(sequential.diagnostics)) << files[i];
    EXPECT_EQ(messages(concurrent[i].diagnostics), messages(sequential.diagnostics)) << files[i];
  }

  EXPECT_TRUE(concurrent[1].success());
  EXPECT_FALSE(concurrent[0].success());
  EXPECT_FALSE(concurrent[2].success());
  EXPECT_EQ(concurrent.back().diagnostics.all()[0].code, "D0001");
}

TEST(CompilerTest, CancelledBatchReportsEveryUnitCancelled)
{
  const TempDir dir(test_dir());
  std::vector<std::filesystem::path> files;
  for (int i = 0; i < 5; ++i) {
    const auto p = dir.path / ("u" + std::to_string(i) + ".ouro");
    write_file(p, "var x = 1;\n");
    files.push_back(p);
  }

  CancellationToken token;
  token.cancel();
  const auto results = Compiler::compile_files(files, {}, token);
  ASSERT_EQ(results.size(), files.size());
  for (const auto & r : results) {
    EXPECT_EQ(r.status, CompileStatus::Cancelled);
    EXPECT_EQ(r.unit, nullptr);
  }
}

// ============================================================================
// Projects
// ============================================================================

TEST(CompilerTest, ProjectWithoutEntryPointsFails)
{
  ProjectConfig config;
  config.project_root = "/tmp/ouro_empty_project";

  const auto results = Compiler::compile_project(config, {});
  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(results[0].success());
  EXPECT_TRUE(results[0].diagnostics.has_errors());
}

TEST(CompilerTest, ProjectBuildUsesConfiguredOutputDir)
{
  const TempDir dir(test_dir());
  write_file(dir.path / "src" / "app.ouro", "var answer = 6 * 7;\n");

  ProjectConfig config;
  config.project_root = dir.path;
  config.compiler.entry_points = {"src/app.ouro"};
  config.compiler.output_dir = "dist";
  config.compiler.optimize = true;

  CompileOptions options;
  options.mode = CompileMode::Build;
  const auto results = Compiler::compile_project(config, options);

  ASSERT_EQ(results.size(), 1u);
  ASSERT_TRUE(results[0].success());
  EXPECT_TRUE(results[0].unit->optimization.changed());
  EXPECT_TRUE(std::filesystem::exists(dir.path / "dist" / "app.ast.json"));

  const auto j = nlohmann::json::parse(read_file(dir.path / "dist" / "app.ast.json"));
  EXPECT_EQ(j["decls"][0]["initializer"]["type"], "LiteralExpr");
  EXPECT_EQ(j["decls"][0]["initializer"]["value"], 42);
}

TEST(CompilerTest, SameStemInputsDoNotShareAnArtifact)
{
  const TempDir dir(test_dir());
  const auto first = dir.path / "a" / "main.ouro";
  const auto second = dir.path / "b" / "main.ouro";
  write_file(first, "var from_a = 1;\n");
  write_file(second, "var from_b = 2;\n");

  CompileOptions options;
  options.mode = CompileMode::Build;
  options.output_dir = dir.path / "out";
  options.jobs = 2;
  const auto results = Compiler::compile_files({first, second}, options);

  ASSERT_EQ(results.size(), 2u);
  ASSERT_TRUE(results[0].success());
  EXPECT_FALSE(results[1].success());
  EXPECT_EQ(results[1].path, second);
  EXPECT_EQ(codes(results[1].diagnostics), std::vector<std::string>{"D0004"});
  EXPECT_NE(messages(results[1].diagnostics)[0].find("would overwrite"), std::string::npos);
  EXPECT_TRUE(results[1].generated_files.empty());

  const auto j = nlohmann::json::parse(read_file(dir.path / "out" / "main.ast.json"));
  EXPECT_EQ(j["decls"][0]["name"], "from_a");
}

TEST(CompilerTest, SameStemInputsAreFineInCheckMode)
{
  const TempDir dir(test_dir());
  const auto first = dir.path / "a" / "main.ouro";
  const auto second = dir.path / "b" / "main.ouro";
  write_file(first, "var x = 1;\n");
  write_file(second, "var y = 2;\n");

  const auto results = Compiler::compile_files({first, second}, CompileOptions{});
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].success());
  EXPECT_TRUE(results[1].success());
}
