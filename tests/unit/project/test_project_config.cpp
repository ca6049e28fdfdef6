// tests/project/test_project_config.cpp - Unit tests for wfgraph.yaml loading

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "wfgraph/project/project_config.hpp"

using namespace wfgraph;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
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

void write_file(const std::filesystem::path & path, const std::string & text)
{
  std::ofstream out(path);
  out << text;
}

}  // namespace

TEST(ProjectConfig, LoadResolvesPaths)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "wfgraph_config_load");
  const auto root = std::filesystem::absolute(dir.path);
  write_file(root / k_project_config_file_name, R"(
project:
  name: district
catalog: catalogs/cea.yml
scenario: /data/scenario
tracer:
  jobs: 4
  dry_run_root: /tmp/dry
output:
  dir: graphs
)");

  const auto result = load_project_config(root / k_project_config_file_name);
  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & config = result.config;

  EXPECT_EQ(config.project.name, "district");
  EXPECT_EQ(config.project_root, root);
  ASSERT_TRUE(config.catalog.has_value());
  EXPECT_EQ(*config.catalog, (root / "catalogs/cea.yml").lexically_normal());
  ASSERT_TRUE(config.scenario.has_value());
  EXPECT_EQ(*config.scenario, std::filesystem::path("/data/scenario"));
  EXPECT_EQ(config.tracer.jobs, 4U);
  EXPECT_EQ(config.tracer.dry_run_root, std::filesystem::path("/tmp/dry"));
  EXPECT_EQ(config.output.dir, (root / "graphs").lexically_normal());
}

TEST(ProjectConfig, Defaults)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "wfgraph_config_defaults");
  const auto root = std::filesystem::absolute(dir.path);
  write_file(root / k_project_config_file_name, "project:\n  name: empty\n");

  const auto result = load_project_config(root / k_project_config_file_name);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_FALSE(result.config.catalog.has_value());
  EXPECT_FALSE(result.config.scenario.has_value());
  EXPECT_EQ(result.config.tracer.jobs, 0U);
  EXPECT_EQ(result.config.output.dir, (root / "docs/graphs").lexically_normal());
}

TEST(ProjectConfig, Errors)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "wfgraph_config_errors");
  const auto file = dir.path / k_project_config_file_name;

  EXPECT_FALSE(load_project_config(file).success);

  write_file(file, "tracer:\n  jobs: -2\n");
  const auto negative = load_project_config(file);
  ASSERT_FALSE(negative.success);
  EXPECT_NE(negative.error.find("invalid tracer.jobs"), std::string::npos);

  write_file(file, "- just\n- a list\n");
  EXPECT_FALSE(load_project_config(file).success);

  write_file(file, "project: {name: [unclosed\n");
  EXPECT_FALSE(load_project_config(file).success);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "wfgraph_config_find");
  const auto root = std::filesystem::absolute(dir.path);
  const auto nested = root / "scenarios" / "baseline";
  std::filesystem::create_directories(nested);
  write_file(root / k_project_config_file_name, "project:\n  name: up\n");
  write_file(nested / "notes.txt", "x");

  const auto from_dir = find_project_config(nested);
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(*from_dir, root / k_project_config_file_name);

  const auto from_file = find_project_config(nested / "notes.txt");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(*from_file, root / k_project_config_file_name);
}
