// wfgraph/driver/workflow.cpp - Workflow driver implementation
//
#include "wfgraph/driver/workflow.hpp"

#include <utility>

#include "wfgraph/analysis/graph_validator.hpp"
#include "wfgraph/basic/errors.hpp"
#include "wfgraph/graph/graph_builder.hpp"
#include "wfgraph/planner/execution_planner.hpp"
#include "wfgraph/render/graphviz_renderer.hpp"
#include "wfgraph/trace/trace_store.hpp"

namespace wfgraph
{

bool Workflow::collect_traces(
  const Catalog & catalog, const WorkflowOptions & options, WorkflowResult & result)
{
  if (options.traces_file) {
    auto loaded = load_trace_set(*options.traces_file);
    if (!loaded.success) {
      result.findings.report_error(FindingKind::Config, loaded.error)
        .with_subject(options.traces_file->string());
      return false;
    }
    result.traces = std::move(loaded.traces);
    return true;
  }

  const CallTracer tracer(catalog.registry, options.trace);
  auto traced = tracer.trace_all(catalog.scripts);
  result.traces = std::move(traced.traces);

  for (const auto & failure : traced.failures) {
    auto builder =
      result.findings.report_error(FindingKind::TraceFailure, failure.what());
    builder.with_subject(failure.script());
    if (!failure.partial_trace().empty()) {
      const auto & last = failure.partial_trace().back();
      builder.with_note("last locator call: " + last.accessor + " -> " + last.artifact.key());
    }
    builder.with_help("the script is left out of the graph until its dry run succeeds");
  }
  return traced.ok();
}

bool Workflow::run_planner(const WorkflowOptions & options, WorkflowResult & result)
{
  const ExecutionPlanner planner(result.graph);
  try {
    const PlanTarget target = planner.resolve(options.target);
    result.resolved_target = target.describe();
    result.plan = planner.plan(target);
    return true;
  } catch (const UnknownTarget & e) {
    result.findings.report_error(FindingKind::UnknownTarget, e.what())
      .with_subject(e.target())
      .with_help("run `wfgraph order all` to list every script");
  } catch (const CyclicDependency & e) {
    result.findings.report_error(FindingKind::CyclicDependency, e.what())
      .with_subjects(e.scripts())
      .with_help("run `wfgraph validate` to see which artifacts close the cycle");
  }
  return false;
}

bool Workflow::run_renderer(const WorkflowOptions & options, WorkflowResult & result)
{
  RenderOptions render_options;
  render_options.script = options.render_script;
  try {
    result.rendered = render(result.graph, render_options);
    return true;
  } catch (const UnknownTarget & e) {
    result.findings.report_error(FindingKind::UnknownTarget, e.what()).with_subject(e.target());
  }
  return false;
}

WorkflowResult Workflow::run(const Catalog & catalog, const WorkflowOptions & options)
{
  WorkflowResult result;

  // === 1. Traces ===
  bool ok = collect_traces(catalog, options, result);
  if (options.traces_file && !ok) {
    return result;
  }

  // === 2. Graph ===
  try {
    result.graph = GraphBuilder::build(result.traces);
  } catch (const GraphBuildError & e) {
    result.findings.report_error(FindingKind::BuildFailure, e.what());
    return result;
  }

  // === 3. Validation ===
  const GraphValidator validator(catalog.external_inputs, catalog.published_outputs);
  FindingBag validation = validator.validate(result.graph);
  const bool validation_errors = validation.has_errors();
  result.findings.merge(std::move(validation));

  // === 4. Requested operation ===
  switch (options.mode) {
    case OutputMode::Order:
      ok = run_planner(options, result) && ok;
      break;
    case OutputMode::Graph:
      ok = run_renderer(options, result) && ok;
      break;
    case OutputMode::Validate:
      ok = !validation_errors && ok;
      break;
    case OutputMode::Trace:
      break;
  }

  if (options.strict && (result.findings.has_warnings() || result.findings.has_errors())) {
    ok = false;
  }
  result.success = ok;
  return result;
}

}  // namespace wfgraph
