// tests/unit/project/test_project_config.cpp - Unit tests for ouro.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "ouro/project/project_config.hpp"

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

std::filesystem::path test_dir()
{
  const auto * info = ::testing::UnitTest::GetInstance()->current_test_info();
  return std::filesystem::temp_directory_path() /
         (std::string("ouro_project_") + info->test_suite_name() + "_" + info->name());
}

}  // namespace

TEST(ProjectConfigTest, ParsesEverySection)
{
  const auto loaded = parse_project_config(
    R"(
package:
  name: demo
  version: 1.2.0
compiler:
  entry_points:
    - src/main.ouro
    - src/extra.ouro
  output_dir: out
  optimize: true
  jobs: 4
)",
    "/work/demo");

  ASSERT_TRUE(loaded.success) << loaded.error;
  const ProjectConfig & cfg = loaded.config;
  EXPECT_EQ(cfg.package.name, "demo");
  EXPECT_EQ(cfg.package.version, "1.2.0");
  ASSERT_EQ(cfg.compiler.entry_points.size(), 2u);
  EXPECT_EQ(cfg.compiler.entry_points[1], "src/extra.ouro");
  EXPECT_EQ(cfg.compiler.output_dir, "out");
  EXPECT_TRUE(cfg.compiler.optimize);
  ASSERT_TRUE(cfg.compiler.jobs.has_value());
  EXPECT_EQ(*cfg.compiler.jobs, 4u);
  EXPECT_EQ(cfg.project_root, "/work/demo");
}

TEST(ProjectConfigTest, EmptyDocumentUsesDefaults)
{
  const auto loaded = parse_project_config("", "/work/empty");
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_TRUE(loaded.config.compiler.entry_points.empty());
  EXPECT_EQ(loaded.config.compiler.output_dir, "build");
  EXPECT_FALSE(loaded.config.compiler.optimize);
  EXPECT_FALSE(loaded.config.compiler.jobs.has_value());
}

TEST(ProjectConfigTest, RejectsMalformedSections)
{
  EXPECT_FALSE(parse_project_config("- just\n- a list\n", "/p").success);
  EXPECT_FALSE(parse_project_config("package: demo\n", "/p").success);
  EXPECT_FALSE(parse_project_config("compiler: [1, 2]\n", "/p").success);

  const auto not_a_list = parse_project_config("compiler:\n  entry_points: main.ouro\n", "/p");
  EXPECT_FALSE(not_a_list.success);
  EXPECT_NE(not_a_list.error.find("entry_points"), std::string::npos);
}

TEST(ProjectConfigTest, RejectsNonPositiveJobs)
{
  const auto zero = parse_project_config("compiler:\n  jobs: 0\n", "/p");
  EXPECT_FALSE(zero.success);
  EXPECT_NE(zero.error.find("jobs"), std::string::npos);

  EXPECT_FALSE(parse_project_config("compiler:\n  jobs: -2\n", "/p").success);
}

TEST(ProjectConfigTest, InvalidYamlIsAnError)
{
  const auto loaded = parse_project_config("package: {name: [unclosed\n", "/p");
  EXPECT_FALSE(loaded.success);
  EXPECT_NE(loaded.error.find("YAML"), std::string::npos);
}

TEST(ProjectConfigTest, PathsResolveAgainstProjectRoot)
{
  ProjectConfig cfg;
  cfg.project_root = "/work/demo";
  cfg.compiler.entry_points = {"src/main.ouro", "/abs/other.ouro"};
  cfg.compiler.output_dir = "dist";

  const auto paths = cfg.entry_point_paths();
  ASSERT_EQ(paths.size(), 2u);
  EXPECT_EQ(paths[0], std::filesystem::path("/work/demo/src/main.ouro"));
  EXPECT_EQ(paths[1], std::filesystem::path("/abs/other.ouro"));
  EXPECT_EQ(cfg.output_path(), std::filesystem::path("/work/demo/dist"));

  cfg.compiler.output_dir = "/var/out";
  EXPECT_EQ(cfg.output_path(), std::filesystem::path("/var/out"));
}

TEST(ProjectConfigTest, DefaultConfigParsesBack)
{
  const std::string text = default_project_config("hello");
  const auto loaded = parse_project_config(text, "/work/hello");

  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.config.package.name, "hello");
  EXPECT_EQ(loaded.config.package.version, "0.1.0");
  ASSERT_EQ(loaded.config.compiler.entry_points.size(), 1u);
  EXPECT_EQ(loaded.config.compiler.entry_points[0], "src/main.ouro");
  EXPECT_EQ(loaded.config.compiler.output_dir, "build");
}

TEST(ProjectConfigTest, LoadsFromDisk)
{
  const TempDir dir(test_dir());
  const auto file = dir.path / k_project_config_file_name;
  {
    std::ofstream out(file);
    out << "package:\n  name: disk\ncompiler:\n  entry_points: [main.ouro]\n";
  }

  const auto loaded = load_project_config(file);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.config.package.name, "disk");
  EXPECT_EQ(loaded.config.project_root, std::filesystem::absolute(dir.path));
  ASSERT_EQ(loaded.config.entry_point_paths().size(), 1u);
  EXPECT_EQ(loaded.config.entry_point_paths()[0], std::filesystem::absolute(dir.path) / "main.ouro");
}

TEST(ProjectConfigTest, MissingFileFails)
{
  const TempDir dir(test_dir());
  const auto loaded = load_project_config(dir.path / "ouro.yaml");
  EXPECT_FALSE(loaded.success);
  EXPECT_NE(loaded.error.find("not found"), std::string::npos);
}

TEST(ProjectConfigTest, FindSearchesUpward)
{
  const TempDir dir(test_dir());
  const auto nested = dir.path / "a" / "b" / "c";
  std::filesystem::create_directories(nested);
  {
    std::ofstream out(dir.path / k_project_config_file_name);
    out << "package:\n  name: found\n";
  }

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(
    std::filesystem::weakly_canonical(*found),
    std::filesystem::weakly_canonical(dir.path / k_project_config_file_name));

  // Starting from a file uses its directory.
  {
    std::ofstream out(nested / "main.ouro");
    out << "var x = 1;\n";
  }
  const auto from_file = find_project_config(nested / "main.ouro");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(
    std::filesystem::weakly_canonical(*from_file),
    std::filesystem::weakly_canonical(dir.path / k_project_config_file_name));
}
