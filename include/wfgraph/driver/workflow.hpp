// wfgraph/driver/workflow.hpp - Workflow driver
//
// Single entry point for trace -> build -> validate -> plan/render.
// Used by the CLI and can be embedded in other tools.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "wfgraph/basic/finding.hpp"
#include "wfgraph/graph/dependency_graph.hpp"
#include "wfgraph/project/catalog.hpp"
#include "wfgraph/trace/call_tracer.hpp"
#include "wfgraph/trace/trace_record.hpp"

namespace wfgraph
{

// ============================================================================
// Output Mode
// ============================================================================

enum class OutputMode {
  Order,     ///< Run order for a target
  Graph,     ///< Rendered .gv text
  Validate,  ///< Findings only
  Trace,     ///< Dry runs only (the caller persists the traces)
};

// ============================================================================
// Workflow Options
// ============================================================================

struct WorkflowOptions
{
  OutputMode mode = OutputMode::Validate;

  /// Order mode: "all", a script name, or an artifact
  std::string target = "all";

  /// Graph mode: render only this script
  std::optional<std::string> render_script;

  /// Build from a persisted trace file instead of dry-running the scripts
  std::optional<std::filesystem::path> traces_file;

  TraceOptions trace;

  /// Treat warnings as failures
  bool strict = false;
};

// ============================================================================
// Workflow Result
// ============================================================================

struct WorkflowResult
{
  /// Whether the requested operation succeeded
  bool success = false;

  /// Trace, build, validation and planning findings, in that order
  FindingBag findings;

  /// Order mode: scripts to run
  std::vector<std::string> plan;

  /// Order mode: the resolved target ("all", script name or artifact key)
  std::string resolved_target;

  /// Graph mode: .gv text
  std::string rendered;

  TraceSet traces;
  DependencyGraph graph;
};

// ============================================================================
// Workflow
// ============================================================================

/**
 * Pipeline:
 * 1. Dry-run every catalog script (or load a trace file)
 * 2. Build the dependency graph
 * 3. Validate it
 * 4. Plan (Order) or render (Graph)
 *
 * Failures of any stage are reported as error findings, never thrown.
 * Outside Validate mode a cycle only fails the run when the requested plan
 * touches it.
 */
class Workflow
{
public:
  [[nodiscard]] static WorkflowResult run(const Catalog & catalog, const WorkflowOptions & options);

private:
  static bool collect_traces(
    const Catalog & catalog, const WorkflowOptions & options, WorkflowResult & result);

  static bool run_planner(const WorkflowOptions & options, WorkflowResult & result);

  static bool run_renderer(const WorkflowOptions & options, WorkflowResult & result);
};

}  // namespace wfgraph
