// tests/trace/test_trace_store.cpp - Unit tests for trace persistence

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include "wfgraph/test_support/trace_helpers.hpp"
#include "wfgraph/trace/trace_store.hpp"

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

}  // namespace

TEST(TraceStore, WrittenTracesLoadBack)
{
  TraceSet traces = test_support::traces({
    {"radiation", {"inputs/weather/weather.epw"}, {"outputs/data/solar-radiation/{BUILDING}_geometry.csv"}},
    {"empty", {}, {}},
  });
  traces["radiation"][0].artifact.kind = ArtifactKind::Weather;

  std::ostringstream out;
  write_trace_set(traces, out);

  const auto loaded = parse_trace_set(out.str());
  ASSERT_TRUE(loaded.success) << loaded.error;
  ASSERT_EQ(loaded.traces.size(), 2U);
  EXPECT_TRUE(loaded.traces.at("empty").empty());

  const auto & records = loaded.traces.at("radiation");
  ASSERT_EQ(records.size(), 2U);
  EXPECT_EQ(records[0].accessor, "get_weather.epw");
  EXPECT_EQ(records[0].artifact.kind, ArtifactKind::Weather);
  EXPECT_EQ(records[0].direction, Direction::Read);
  EXPECT_EQ(records[1].artifact.key(), "outputs/data/solar-radiation/{BUILDING}_geometry.csv");
  EXPECT_EQ(records[1].direction, Direction::Write);
  EXPECT_EQ(records[1].sequence, 1U);
  EXPECT_EQ(records[1].script, "radiation");
}

TEST(TraceStore, SequenceDefaultsToPosition)
{
  const std::string yaml = R"(
demand:
  - {accessor: get_weather, category: inputs/weather, file: weather.epw, direction: read}
  - {accessor: write_demand, category: outputs/data/demand, file: Total_demand.csv, direction: output}
)";
  const auto loaded = parse_trace_set(yaml);
  ASSERT_TRUE(loaded.success) << loaded.error;
  const auto & records = loaded.traces.at("demand");
  ASSERT_EQ(records.size(), 2U);
  EXPECT_EQ(records[0].sequence, 0U);
  EXPECT_EQ(records[1].sequence, 1U);
  EXPECT_EQ(records[1].direction, Direction::Write);
  EXPECT_EQ(records[0].artifact.kind, ArtifactKind::ComputedResult);
}

TEST(TraceStore, RejectsMalformedRecords)
{
  EXPECT_FALSE(parse_trace_set("- a\n- b\n").success);
  EXPECT_FALSE(parse_trace_set("demand: 3\n").success);

  const auto missing = parse_trace_set("demand:\n  - {accessor: get_weather, file: weather.epw, direction: read}\n");
  ASSERT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("category"), std::string::npos);

  const auto direction = parse_trace_set(
    "demand:\n  - {accessor: a, category: c, file: f, direction: sideways}\n");
  ASSERT_FALSE(direction.success);
  EXPECT_NE(direction.error.find("sideways"), std::string::npos);

  EXPECT_FALSE(parse_trace_set("demand: [unclosed\n").success);

  const auto duplicate = parse_trace_set(
    "demand:\n  - {accessor: get_weather, category: inputs/weather, file: weather.epw, direction: read}\n"
    "demand:\n  - {accessor: write_demand, category: outputs/data/demand, file: Total_demand.csv, direction: write}\n");
  ASSERT_FALSE(duplicate.success);
  EXPECT_NE(duplicate.error.find("duplicate script 'demand'"), std::string::npos);
}

TEST(TraceStore, EmptyDocumentIsEmptySet)
{
  const auto loaded = parse_trace_set("");
  ASSERT_TRUE(loaded.success);
  EXPECT_TRUE(loaded.traces.empty());
}

TEST(TraceStore, LoadFromFile)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "wfgraph_trace_store");
  const auto file = dir.path / k_trace_file_name;

  EXPECT_FALSE(load_trace_set(file).success);

  {
    std::ofstream out(file);
    write_trace_set(test_support::traces({{"demand", {"inputs/weather/weather.epw"}, {}}}), out);
  }
  const auto loaded = load_trace_set(file);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.traces.at("demand").size(), 1U);
}
