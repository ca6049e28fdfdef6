// tests/locator/test_locator_registry.cpp - Unit tests for the accessor registry and scenario locator

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <system_error>

#include "wfgraph/basic/errors.hpp"
#include "wfgraph/locator/locator.hpp"
#include "wfgraph/locator/locator_registry.hpp"
#include "wfgraph/test_support/trace_helpers.hpp"

using namespace wfgraph;
using wfgraph::test_support::accessor;

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

TEST(LocatorRegistry, DefineAndResolve)
{
  LocatorRegistry reg;
  EXPECT_TRUE(reg.define(accessor("get_weather", "inputs/weather/weather.epw", Direction::Read)));
  EXPECT_TRUE(reg.contains("get_weather"));
  EXPECT_EQ(reg.size(), 1U);

  const Accessor & acc = reg.resolve("get_weather");
  EXPECT_EQ(acc.artifact.key(), "inputs/weather/weather.epw");
  EXPECT_TRUE(acc.is_read());
}

TEST(LocatorRegistry, DuplicateNameRejected)
{
  LocatorRegistry reg;
  EXPECT_TRUE(reg.define(accessor("get_zone", "inputs/building-geometry/zone.shp", Direction::Read)));
  EXPECT_FALSE(reg.define(accessor("get_zone", "inputs/other/zone.shp", Direction::Write)));

  // First definition wins
  EXPECT_EQ(reg.resolve("get_zone").artifact.category, "inputs/building-geometry");
}

TEST(LocatorRegistry, UnknownAccessorThrows)
{
  LocatorRegistry reg;
  EXPECT_EQ(reg.lookup("get_nothing"), nullptr);
  try {
    (void)reg.resolve("get_nothing");
    FAIL() << "expected UnknownAccessor";
  } catch (const UnknownAccessor & e) {
    EXPECT_EQ(e.accessor(), "get_nothing");
  }
}

TEST(LocatorRegistry, SortedAndAccessorsFor)
{
  LocatorRegistry reg;
  reg.define(accessor("write_demand", "outputs/data/demand/Total_demand.csv", Direction::Write));
  reg.define(accessor("get_demand", "outputs/data/demand/Total_demand.csv", Direction::Read));
  reg.define(accessor("get_weather", "inputs/weather/weather.epw", Direction::Read));

  const auto all = reg.sorted();
  ASSERT_EQ(all.size(), 3U);
  EXPECT_EQ(all[0]->name, "get_demand");
  EXPECT_EQ(all[1]->name, "get_weather");
  EXPECT_EQ(all[2]->name, "write_demand");

  const auto demand = reg.accessors_for(test_support::artifact("outputs/data/demand/Total_demand.csv"));
  ASSERT_EQ(demand.size(), 2U);
  EXPECT_EQ(demand[0]->name, "get_demand");
  EXPECT_EQ(demand[1]->name, "write_demand");
}

TEST(ScenarioLocator, ResolvesBelowScenarioRoot)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "wfgraph_locator_read");
  auto reg = test_support::registry({
    accessor("get_geometry", "outputs/data/solar-radiation/{BUILDING}_geometry.csv", Direction::Read),
  });

  ScenarioLocator locator(reg, dir.path);
  const auto p = locator.building_path("get_geometry", "B01");
  EXPECT_EQ(p, dir.path / "outputs/data/solar-radiation" / "B01_geometry.csv");

  // Reads never create folders
  EXPECT_FALSE(std::filesystem::exists(dir.path / "outputs"));
}

TEST(ScenarioLocator, WriteAccessorCreatesFolder)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "wfgraph_locator_write");
  auto reg = test_support::registry({
    accessor("write_total_demand", "outputs/data/demand/Total_demand.csv", Direction::Write),
  });

  ScenarioLocator locator(reg, dir.path);
  const auto p = locator.path("write_total_demand");
  EXPECT_EQ(p.filename(), "Total_demand.csv");
  EXPECT_TRUE(std::filesystem::is_directory(dir.path / "outputs/data/demand"));
  EXPECT_FALSE(std::filesystem::exists(p));
}

TEST(ScenarioLocator, UnknownAccessorThrows)
{
  auto reg = test_support::registry({});
  ScenarioLocator locator(reg, "scenario");
  EXPECT_THROW((void)locator.path("get_nothing"), UnknownAccessor);
}
