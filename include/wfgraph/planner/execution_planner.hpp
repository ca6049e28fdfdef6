// wfgraph/planner/execution_planner.hpp - Run orders for scripts and artifacts
#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>

#include "wfgraph/graph/dependency_graph.hpp"
#include "wfgraph/graph/script_projection.hpp"

namespace wfgraph
{

/**
 * What the user wants to produce: everything, one script, or one artifact.
 */
struct PlanTarget
{
  enum class Kind : uint8_t {
    All,
    Script,
    Artifact,
  };

  Kind kind = Kind::All;
  std::string script;  ///< Kind::Script
  Artifact artifact;   ///< Kind::Artifact

  static PlanTarget all() { return {}; }
  static PlanTarget of_script(std::string name);
  static PlanTarget of_artifact(Artifact artifact);

  /// "all", the script name, or the artifact key
  [[nodiscard]] std::string describe() const;
};

inline constexpr std::string_view k_all_target = "all";

class ExecutionPlanner
{
public:
  explicit ExecutionPlanner(const DependencyGraph & graph);

  /**
   * Resolve a user-supplied target string.
   *
   * Order: "all", a script name, an artifact key ("category/name"), a bare
   * artifact name. A bare name matching several artifacts is rejected.
   *
   * @throws UnknownTarget
   */
  [[nodiscard]] PlanTarget resolve(std::string_view target) const;

  /**
   * Scripts to run, in order, so that every producer precedes its consumers.
   * Ties are broken by script name.
   *
   * @throws UnknownTarget if the script or artifact is not in the graph
   * @throws CyclicDependency if a cycle touches the scripts to run
   */
  [[nodiscard]] std::vector<std::string> plan(const PlanTarget & target) const;

  [[nodiscard]] std::vector<std::string> plan(std::string_view target) const
  {
    return plan(resolve(target));
  }

  /// Scripts needed for `target` (unordered)
  [[nodiscard]] std::set<std::string> required_scripts(const PlanTarget & target) const;

private:
  [[nodiscard]] std::vector<std::string> topological_order(
    gsl::span<const std::string> scripts) const;

  const DependencyGraph & graph_;
  ScriptProjection projection_;
};

/// Convenience wrapper around ExecutionPlanner
[[nodiscard]] std::vector<std::string> plan(const DependencyGraph & graph, std::string_view target);

}  // namespace wfgraph
