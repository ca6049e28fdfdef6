// wfgraph/planner/execution_planner.cpp - Run orders for scripts and artifacts
#include "wfgraph/planner/execution_planner.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "wfgraph/basic/errors.hpp"

namespace wfgraph
{

// ============================================================================
// PlanTarget
// ============================================================================

PlanTarget PlanTarget::of_script(std::string name)
{
  PlanTarget t;
  t.kind = Kind::Script;
  t.script = std::move(name);
  return t;
}

PlanTarget PlanTarget::of_artifact(Artifact artifact)
{
  PlanTarget t;
  t.kind = Kind::Artifact;
  t.artifact = std::move(artifact);
  return t;
}

std::string PlanTarget::describe() const
{
  switch (kind) {
    case Kind::All:
      return std::string(k_all_target);
    case Kind::Script:
      return script;
    case Kind::Artifact:
      return artifact.key();
  }
  return std::string(k_all_target);
}

// ============================================================================
// ExecutionPlanner
// ============================================================================

ExecutionPlanner::ExecutionPlanner(const DependencyGraph & graph)
: graph_(graph), projection_(graph)
{
}

PlanTarget ExecutionPlanner::resolve(std::string_view target) const
{
  if (target == k_all_target) {
    return PlanTarget::all();
  }
  if (graph_.has_script(target)) {
    return PlanTarget::of_script(std::string(target));
  }
  if (const auto * node = graph_.find_artifact_by_key(target)) {
    return PlanTarget::of_artifact(node->artifact);
  }

  const auto by_name = graph_.find_artifacts_by_name(target);
  if (by_name.size() == 1) {
    return PlanTarget::of_artifact(by_name.front()->artifact);
  }

  const std::string name(target);
  if (by_name.empty()) {
    throw UnknownTarget(name, "unknown target '" + name + "': no script or artifact of that name");
  }

  std::string candidates;
  for (const auto * node : by_name) {
    if (!candidates.empty()) candidates += ", ";
    candidates += node->artifact.key();
  }
  throw UnknownTarget(
    name, "ambiguous target '" + name + "': matches " + candidates + " (use the full key)");
}

std::set<std::string> ExecutionPlanner::required_scripts(const PlanTarget & target) const
{
  std::set<std::string> required;

  switch (target.kind) {
    case PlanTarget::Kind::All: {
      const auto & all = projection_.scripts();
      required.insert(all.begin(), all.end());
      break;
    }
    case PlanTarget::Kind::Script: {
      if (!graph_.has_script(target.script)) {
        throw UnknownTarget(target.script, "unknown script '" + target.script + "'");
      }
      required = projection_.upstream_closure(target.script);
      required.insert(target.script);
      break;
    }
    case PlanTarget::Kind::Artifact: {
      const auto * node = graph_.find_artifact(target.artifact);
      if (node == nullptr) {
        const std::string key = target.artifact.key();
        throw UnknownTarget(key, "unknown artifact '" + key + "'");
      }
      // Externally supplied artifacts have no writers: nothing to run.
      for (const auto & writer : node->writers) {
        const auto upstream = projection_.upstream_closure(writer);
        required.insert(upstream.begin(), upstream.end());
        required.insert(writer);
      }
      break;
    }
  }

  return required;
}

std::vector<std::string> ExecutionPlanner::plan(const PlanTarget & target) const
{
  const auto required = required_scripts(target);

  // Refuse to plan if a cycle touches the scripts to run.
  std::vector<std::string> cyclic;
  for (const auto & component : projection_.cycles()) {
    const bool touched = std::any_of(component.begin(), component.end(), [&](const auto & s) {
      return required.count(s) > 0;
    });
    if (touched) {
      cyclic.insert(cyclic.end(), component.begin(), component.end());
    }
  }
  if (!cyclic.empty()) {
    std::sort(cyclic.begin(), cyclic.end());
    throw CyclicDependency(std::move(cyclic));
  }

  const std::vector<std::string> scripts(required.begin(), required.end());
  return topological_order(scripts);
}

std::vector<std::string> ExecutionPlanner::topological_order(
  gsl::span<const std::string> scripts) const
{
  // Kahn's algorithm restricted to `scripts`; the ready set is ordered by
  // name so equal-rank scripts come out alphabetically.
  const std::set<std::string> members(scripts.begin(), scripts.end());
  std::map<std::string, size_t> in_degree;
  for (const auto & s : members) {
    size_t degree = 0;
    for (const auto & p : projection_.predecessors(s)) {
      if (members.count(p) > 0) ++degree;
    }
    in_degree.emplace(s, degree);
  }

  std::set<std::string> ready;
  for (const auto & [s, degree] : in_degree) {
    if (degree == 0) ready.insert(s);
  }

  std::vector<std::string> order;
  order.reserve(members.size());
  while (!ready.empty()) {
    std::string current = *ready.begin();
    ready.erase(ready.begin());

    for (const auto & consumer : projection_.successors(current)) {
      auto it = in_degree.find(consumer);
      if (it == in_degree.end()) continue;
      if (--it->second == 0) {
        ready.insert(consumer);
      }
    }
    order.push_back(std::move(current));
  }

  if (order.size() != members.size()) {
    // Scripts left over sit on a cycle.
    std::vector<std::string> stuck;
    for (const auto & [s, degree] : in_degree) {
      if (degree > 0) stuck.push_back(s);
    }
    throw CyclicDependency(std::move(stuck));
  }

  return order;
}

std::vector<std::string> plan(const DependencyGraph & graph, std::string_view target)
{
  return ExecutionPlanner(graph).plan(target);
}

}  // namespace wfgraph
