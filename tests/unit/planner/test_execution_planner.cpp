// tests/planner/test_execution_planner.cpp - Unit tests for run order planning

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "wfgraph/basic/errors.hpp"
#include "wfgraph/planner/execution_planner.hpp"
#include "wfgraph/test_support/trace_helpers.hpp"

using namespace wfgraph;

namespace
{

// helper -> radiation -> demand, solar reads radiation only, weather is external.
DependencyGraph district()
{
  return test_support::graph({
    {"data-helper", {"inputs/building-geometry/zone.shp"},
     {"inputs/building-properties/age.dbf"}},
    {"radiation", {"inputs/building-geometry/zone.shp", "inputs/weather/weather.epw"},
     {"outputs/data/solar-radiation/{BUILDING}_geometry.csv"}},
    {"demand",
     {"inputs/building-properties/age.dbf", "outputs/data/solar-radiation/{BUILDING}_geometry.csv",
      "inputs/weather/weather.epw"},
     {"outputs/data/demand/Total_demand.csv"}},
    {"solar-collector",
     {"outputs/data/solar-radiation/{BUILDING}_geometry.csv", "inputs/weather/weather.epw"},
     {"outputs/data/potentials/solar/SC_results.csv"}},
  });
}

size_t position(const std::vector<std::string> & order, const std::string & script)
{
  return static_cast<size_t>(std::find(order.begin(), order.end(), script) - order.begin());
}

}  // namespace

TEST(ExecutionPlanner, AllContainsEveryScriptOnce)
{
  const auto graph = district();
  const auto order = plan(graph, "all");

  ASSERT_EQ(order.size(), graph.script_count());
  std::vector<std::string> sorted = order;
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(sorted, graph.scripts());

  // Every producer precedes its consumers
  const ScriptProjection proj(graph);
  for (const auto & s : order) {
    for (const auto & consumer : proj.successors(s)) {
      EXPECT_LT(position(order, s), position(order, consumer)) << s << " -> " << consumer;
    }
  }
}

TEST(ExecutionPlanner, TiesBrokenByName)
{
  EXPECT_EQ(
    plan(district(), "all"),
    (std::vector<std::string>{"data-helper", "radiation", "demand", "solar-collector"}));

  const auto independent = test_support::graph({
    {"zeta", {}, {"x/z.csv"}},
    {"alpha", {}, {"x/a.csv"}},
    {"mid", {}, {"x/m.csv"}},
  });
  EXPECT_EQ(plan(independent, "all"), (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

TEST(ExecutionPlanner, ScriptTargetOnlyPullsUpstream)
{
  const auto graph = district();
  EXPECT_EQ(
    plan(graph, "demand"), (std::vector<std::string>{"data-helper", "radiation", "demand"}));
  EXPECT_EQ(plan(graph, "solar-collector"), (std::vector<std::string>{"radiation", "solar-collector"}));
  EXPECT_EQ(plan(graph, "radiation"), (std::vector<std::string>{"radiation"}));
}

TEST(ExecutionPlanner, ArtifactTargets)
{
  const auto graph = district();
  const ExecutionPlanner planner(graph);

  const auto by_key = planner.resolve("outputs/data/demand/Total_demand.csv");
  EXPECT_EQ(by_key.kind, PlanTarget::Kind::Artifact);
  EXPECT_EQ(
    planner.plan(by_key), (std::vector<std::string>{"data-helper", "radiation", "demand"}));

  const auto by_name = planner.resolve("{BUILDING}_geometry.csv");
  EXPECT_EQ(by_name.describe(), "outputs/data/solar-radiation/{BUILDING}_geometry.csv");
  EXPECT_EQ(planner.plan(by_name), (std::vector<std::string>{"radiation"}));

  // Externally supplied: nothing to run
  EXPECT_TRUE(planner.plan("inputs/weather/weather.epw").empty());
  EXPECT_TRUE(planner.plan("weather.epw").empty());
}

TEST(ExecutionPlanner, ArtifactWithSeveralWritersMergesClosures)
{
  const auto graph = test_support::graph({
    {"zeta", {"x/z-up.csv"}, {"out/shared.csv"}},
    {"alpha", {"x/a-up.csv"}, {"out/shared.csv"}},
    {"z-up", {}, {"x/z-up.csv"}},
    {"a-up", {}, {"x/a-up.csv"}},
    {"other", {}, {"x/other.csv"}},
  });
  const ExecutionPlanner planner(graph);

  const auto target = planner.resolve("out/shared.csv");
  EXPECT_EQ(target.kind, PlanTarget::Kind::Artifact);
  EXPECT_EQ(
    planner.plan(target), (std::vector<std::string>{"a-up", "alpha", "z-up", "zeta"}));
}

TEST(ExecutionPlanner, ResolveOrder)
{
  const auto graph = test_support::graph({
    {"all", {}, {"x/out.csv"}},
    {"demand", {"x/out.csv"}, {"y/demand"}},
  });
  const ExecutionPlanner planner(graph);

  EXPECT_EQ(planner.resolve("all").kind, PlanTarget::Kind::All);
  // A script name wins over an artifact of the same name
  EXPECT_EQ(planner.resolve("demand").kind, PlanTarget::Kind::Script);
  EXPECT_EQ(planner.resolve("y/demand").kind, PlanTarget::Kind::Artifact);
}

TEST(ExecutionPlanner, UnknownTarget)
{
  const auto graph = district();
  const ExecutionPlanner planner(graph);
  try {
    (void)planner.resolve("thermal-network");
    FAIL() << "expected UnknownTarget";
  } catch (const UnknownTarget & e) {
    EXPECT_EQ(e.target(), "thermal-network");
    EXPECT_NE(std::string(e.what()).find("unknown target"), std::string::npos);
  }

  EXPECT_THROW((void)planner.plan(PlanTarget::of_script("nope")), UnknownTarget);
  EXPECT_THROW(
    (void)planner.plan(PlanTarget::of_artifact(test_support::artifact("x/none.csv"))),
    UnknownTarget);
}

TEST(ExecutionPlanner, AmbiguousBareName)
{
  const auto graph = test_support::graph({
    {"a", {"inputs/one/zone.shp", "inputs/two/zone.shp"}, {"x/a.csv"}},
  });
  try {
    (void)ExecutionPlanner(graph).resolve("zone.shp");
    FAIL() << "expected UnknownTarget";
  } catch (const UnknownTarget & e) {
    const std::string message = e.what();
    EXPECT_NE(message.find("ambiguous"), std::string::npos);
    EXPECT_NE(message.find("inputs/one/zone.shp"), std::string::npos);
    EXPECT_NE(message.find("inputs/two/zone.shp"), std::string::npos);
  }
}

TEST(ExecutionPlanner, CycleOnPathRejected)
{
  const auto graph = test_support::graph({
    {"A", {"x/b.csv"}, {"x/a.csv"}},
    {"B", {"x/a.csv"}, {"x/b.csv"}},
    {"C", {"x/a.csv"}, {"x/c.csv"}},
    {"D", {}, {"x/d.csv"}},
  });
  const ExecutionPlanner planner(graph);

  try {
    (void)planner.plan("C");
    FAIL() << "expected CyclicDependency";
  } catch (const CyclicDependency & e) {
    EXPECT_EQ(e.scripts(), (std::vector<std::string>{"A", "B"}));
  }
  EXPECT_THROW((void)planner.plan("all"), CyclicDependency);

  // The cycle is not upstream of D
  EXPECT_EQ(planner.plan("D"), (std::vector<std::string>{"D"}));
}
