// wfgraph/project/project_config.cpp - Project configuration implementation
//
#include "wfgraph/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace wfgraph
{

namespace
{

namespace fs = std::filesystem;

fs::path resolve_against(const fs::path & root, const fs::path & p)
{
  return p.is_absolute() ? p : (root / p).lexically_normal();
}

ConfigLoadResult parse_root(const YAML::Node & root, ProjectConfig config)
{
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("wfgraph.yaml must be a map");
  }

  // Parse 'project' section
  if (root["project"]) {
    const auto & proj = root["project"];
    if (proj["name"]) {
      config.project.name = proj["name"].as<std::string>();
    }
  }

  if (root["catalog"]) {
    config.catalog = resolve_against(config.project_root, root["catalog"].as<std::string>());
  }

  if (root["scenario"]) {
    config.scenario = resolve_against(config.project_root, root["scenario"].as<std::string>());
  }

  // Parse 'tracer' section
  if (root["tracer"]) {
    const auto & tracer = root["tracer"];
    if (tracer["jobs"]) {
      const int jobs = tracer["jobs"].as<int>();
      if (jobs < 0) {
        return ConfigLoadResult::fail(
          "invalid tracer.jobs: " + std::to_string(jobs) + " (must be 0 or more)");
      }
      config.tracer.jobs = static_cast<unsigned>(jobs);
    }
    if (tracer["dry_run_root"]) {
      config.tracer.dry_run_root = tracer["dry_run_root"].as<std::string>();
    }
  }

  // Parse 'output' section
  if (root["output"]) {
    const auto & output = root["output"];
    if (output["dir"]) {
      config.output.dir = output["dir"].as<std::string>();
    }
  }
  config.output.dir = resolve_against(config.project_root, config.output.dir);

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    return parse_root(YAML::LoadFile(config_path.string()), std::move(config));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace wfgraph
