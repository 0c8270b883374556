// ouro/project/project_config.cpp - Project configuration implementation
//
#include "ouro/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace ouro
{

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level of ouro.yaml must be a map");
  }

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (!pkg.IsMap()) {
      return ConfigLoadResult::fail("package must be a map");
    }
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'compiler' section
  if (root["compiler"]) {
    const auto & comp = root["compiler"];
    if (!comp.IsMap()) {
      return ConfigLoadResult::fail("compiler must be a map");
    }

    if (comp["entry_points"]) {
      if (!comp["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("compiler.entry_points must be a list");
      }
      for (const auto & ep : comp["entry_points"]) {
        config.compiler.entry_points.emplace_back(ep.as<std::string>());
      }
    }

    if (comp["output_dir"]) {
      config.compiler.output_dir = comp["output_dir"].as<std::string>();
    }

    if (comp["optimize"]) {
      config.compiler.optimize = comp["optimize"].as<bool>();
    }

    if (comp["jobs"]) {
      const int jobs = comp["jobs"].as<int>();
      if (jobs < 1) {
        return ConfigLoadResult::fail(
          "invalid compiler.jobs: " + std::to_string(jobs) + " (must be at least 1)");
      }
      config.compiler.jobs = static_cast<unsigned>(jobs);
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::vector<std::filesystem::path> ProjectConfig::entry_point_paths() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(compiler.entry_points.size());
  for (const auto & ep : compiler.entry_points) {
    out.push_back(ep.is_absolute() ? ep : project_root / ep);
  }
  return out;
}

std::filesystem::path ProjectConfig::output_path() const
{
  return compiler.output_dir.is_absolute() ? compiler.output_dir
                                           : project_root / compiler.output_dir;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  const fs::path root_dir = fs::absolute(config_path, ec).parent_path();
  try {
    return parse_root(YAML::LoadFile(config_path.string()), root_dir);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(std::string(yaml_text)), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) return std::nullopt;

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config(std::string_view project_name)
{
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "package" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << std::string(project_name);
  out << YAML::Key << "version" << YAML::Value << "0.1.0";
  out << YAML::EndMap;
  out << YAML::Key << "compiler" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "entry_points" << YAML::Value << YAML::BeginSeq << "src/main.ouro"
      << YAML::EndSeq;
  out << YAML::Key << "output_dir" << YAML::Value << "build";
  out << YAML::Key << "optimize" << YAML::Value << false;
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

}  // namespace ouro
