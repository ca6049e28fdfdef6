// tests/integration/test_cea_catalog.cpp - End-to-end checks against the shipped CEA catalog

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "wfgraph/driver/workflow.hpp"
#include "wfgraph/planner/execution_planner.hpp"
#include "wfgraph/project/catalog.hpp"
#include "wfgraph/render/graphviz_reader.hpp"
#include "wfgraph/render/graphviz_renderer.hpp"

using namespace wfgraph;

// Computed from __FILE__: tests/integration -> repository root
static std::filesystem::path get_catalog_path()
{
  const std::filesystem::path this_file = std::filesystem::absolute(__FILE__);
  const std::filesystem::path repo_root = this_file.parent_path().parent_path().parent_path();
  return repo_root / "share" / "wfgraph" / "catalogs" / "cea.yml";
}

static Catalog load_cea()
{
  auto result = load_catalog(get_catalog_path());
  if (!result.success) {
    ADD_FAILURE() << result.error;
  }
  return std::move(result.catalog);
}

static WorkflowOptions options_for(OutputMode mode, std::string target = "all")
{
  WorkflowOptions options;
  options.mode = mode;
  options.target = std::move(target);
  return options;
}

TEST(CeaCatalog, LoadsEveryScript)
{
  const Catalog catalog = load_cea();
  EXPECT_EQ(
    catalog.script_names(),
    (std::vector<std::string>{
      "data-helper", "radiation-daysim", "demand", "solar-collector", "photovoltaic", "emissions",
      "network-layout", "thermal-network", "dashboard"}));
  EXPECT_TRUE(catalog.registry->contains("get_weather"));
  EXPECT_TRUE(catalog.registry->contains("write_total_demand"));
}

TEST(CeaCatalog, ValidatesWithoutFindings)
{
  const auto result = Workflow::run(load_cea(), options_for(OutputMode::Validate));
  EXPECT_TRUE(result.success);
  for (const auto & f : result.findings) {
    ADD_FAILURE() << f.code() << ": " << f.message;
  }
  EXPECT_EQ(result.graph.script_count(), 9U);
}

TEST(CeaCatalog, FullRunOrder)
{
  const auto result = Workflow::run(load_cea(), options_for(OutputMode::Order));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(
    result.plan, (std::vector<std::string>{
                   "data-helper", "radiation-daysim", "demand", "network-layout", "photovoltaic",
                   "emissions", "solar-collector", "thermal-network", "dashboard"}));
}

TEST(CeaCatalog, DemandPlanSkipsSolar)
{
  const auto result = Workflow::run(load_cea(), options_for(OutputMode::Order, "demand"));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(
    result.plan, (std::vector<std::string>{"data-helper", "radiation-daysim", "demand"}));

  const auto solar = Workflow::run(load_cea(), options_for(OutputMode::Order, "solar-collector"));
  ASSERT_TRUE(solar.success);
  EXPECT_EQ(
    solar.plan, (std::vector<std::string>{"data-helper", "radiation-daysim", "solar-collector"}));
}

TEST(CeaCatalog, ArtifactTargets)
{
  const auto result = Workflow::run(load_cea(), options_for(OutputMode::Validate));
  const ExecutionPlanner planner(result.graph);

  EXPECT_EQ(
    planner.plan("Total_demand.csv"),
    (std::vector<std::string>{"data-helper", "radiation-daysim", "demand"}));
  EXPECT_TRUE(planner.plan("inputs/weather/weather.epw").empty());
}

TEST(CeaCatalog, RenderedGraphReadsBack)
{
  const auto result = Workflow::run(load_cea(), options_for(OutputMode::Graph));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(read_graphviz(result.rendered), RenderedGraph::from(result.graph));

  for (const auto & script : result.graph.scripts()) {
    RenderOptions options;
    options.script = script;
    EXPECT_EQ(
      read_graphviz(render(result.graph, options)), RenderedGraph::from(result.graph, script))
      << script;
  }
}
