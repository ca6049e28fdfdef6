// tests/project/test_catalog.cpp - Unit tests for catalog loading

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "wfgraph/project/catalog.hpp"
#include "wfgraph/trace/call_tracer.hpp"

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

const char * k_small_catalog = R"(
accessors:
  get_weather:
    category: inputs/weather
    file: weather.epw
    kind: weather
    direction: read
  write_total_demand:
    category: outputs/data/demand
    file: Total_demand.csv
    direction: write
external_inputs: [inputs/weather/*]
published_outputs:
  - outputs/data/demand/Total_demand.csv
scripts:
  demand:
    inputs: [get_weather]
    outputs: [write_total_demand]
  idle:
)";

}  // namespace

TEST(ProjectCatalog, ParseAccessorsAndScripts)
{
  const auto result = parse_catalog(k_small_catalog);
  ASSERT_TRUE(result.success) << result.error;
  const Catalog & catalog = result.catalog;

  EXPECT_EQ(catalog.registry->size(), 2U);
  const Accessor & weather = catalog.registry->resolve("get_weather");
  EXPECT_EQ(weather.artifact.kind, ArtifactKind::Weather);
  EXPECT_TRUE(weather.is_read());

  // Kind defaults to a computed result
  EXPECT_EQ(
    catalog.registry->resolve("write_total_demand").artifact.kind, ArtifactKind::ComputedResult);

  EXPECT_EQ(catalog.script_names(), (std::vector<std::string>{"demand", "idle"}));
  ASSERT_NE(catalog.find_script("demand"), nullptr);
  EXPECT_EQ(catalog.find_script("nope"), nullptr);
  EXPECT_TRUE(catalog.external_inputs.matches(weather.artifact));
  EXPECT_EQ(catalog.published_outputs.entries().size(), 1U);
  EXPECT_TRUE(catalog.source.empty());
}

TEST(ProjectCatalog, DeclaredScriptsTraceTheirAccessors)
{
  const auto result = parse_catalog(k_small_catalog);
  ASSERT_TRUE(result.success) << result.error;

  const CallTracer tracer(result.catalog.registry);
  const auto records = tracer.trace(*result.catalog.find_script("demand"));
  ASSERT_EQ(records.size(), 2U);
  EXPECT_EQ(records[0].accessor, "get_weather");
  EXPECT_EQ(records[1].direction, Direction::Write);
  EXPECT_TRUE(tracer.trace(*result.catalog.find_script("idle")).empty());
}

TEST(ProjectCatalog, UnknownAccessorInScript)
{
  const auto result = parse_catalog(R"(
accessors: {}
scripts:
  demand:
    inputs: [get_weather]
)");
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error, "script 'demand' uses unknown accessor 'get_weather'");
}

TEST(ProjectCatalog, WrongDirectionRejected)
{
  const auto result = parse_catalog(R"(
accessors:
  get_weather: {category: inputs/weather, file: weather.epw, direction: read}
scripts:
  demand:
    outputs: [get_weather]
)");
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error, "script 'demand' lists read accessor 'get_weather' under outputs");
}

TEST(ProjectCatalog, InvalidAccessorFields)
{
  const auto missing = parse_catalog(R"(
accessors:
  get_weather: {category: inputs/weather, direction: read}
)");
  ASSERT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("missing 'file'"), std::string::npos);

  const auto kind = parse_catalog(R"(
accessors:
  get_weather: {category: inputs/weather, file: w.epw, direction: read, kind: binary}
)");
  ASSERT_FALSE(kind.success);
  EXPECT_NE(kind.error.find("unknown kind 'binary'"), std::string::npos);

  const auto direction = parse_catalog(R"(
accessors:
  get_weather: {category: inputs/weather, file: w.epw, direction: both}
)");
  ASSERT_FALSE(direction.success);
  EXPECT_NE(direction.error.find("invalid direction 'both'"), std::string::npos);
}

TEST(ProjectCatalog, MalformedDocuments)
{
  EXPECT_FALSE(parse_catalog("- a\n- b\n").success);
  EXPECT_FALSE(parse_catalog("accessors: [a, b]\n").success);
  EXPECT_FALSE(parse_catalog("scripts: 3\n").success);
  EXPECT_FALSE(parse_catalog("external_inputs: weather.epw\n").success);
  EXPECT_FALSE(parse_catalog("accessors: {unclosed\n").success);
}

TEST(ProjectCatalog, LoadFromFile)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "wfgraph_catalog_load");
  const auto file = dir.path / "catalog.yml";

  const auto missing = load_catalog(file);
  ASSERT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("not found"), std::string::npos);

  {
    std::ofstream out(file);
    out << k_small_catalog;
  }
  const auto loaded = load_catalog(file);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.catalog.source, std::filesystem::absolute(file));

  {
    std::ofstream out(file);
    out << "scripts:\n  demand:\n    inputs: [get_nothing]\n";
  }
  const auto bad = load_catalog(file);
  ASSERT_FALSE(bad.success);
  EXPECT_EQ(bad.error.rfind(file.string() + ": ", 0), 0U);
}
