// wfgraph/analysis/graph_validator.hpp - Structural checks on a DependencyGraph
//
// Findings are never thrown; the caller decides what is fatal. Only `cycle`
// is reported as an error since it blocks planning.
//
#pragma once

#include "wfgraph/analysis/artifact_catalog.hpp"
#include "wfgraph/basic/finding.hpp"
#include "wfgraph/graph/dependency_graph.hpp"

namespace wfgraph
{

class GraphValidator
{
public:
  /**
   * @param external_inputs Artifacts supplied from outside the pipeline
   * @param published_outputs Final deliverables (no consumer expected)
   */
  GraphValidator(ArtifactCatalog external_inputs, ArtifactCatalog published_outputs);

  /**
   * Run every check. Findings are ordered by check, then by artifact or
   * script order of the graph.
   */
  [[nodiscard]] FindingBag validate(const DependencyGraph & graph) const;

  // Individual checks (exposed for tests and partial runs)
  void check_orphan_inputs(const DependencyGraph & graph, FindingBag & out) const;
  void check_cycles(const DependencyGraph & graph, FindingBag & out) const;
  void check_dangling_outputs(const DependencyGraph & graph, FindingBag & out) const;
  void check_scripts_without_outputs(const DependencyGraph & graph, FindingBag & out) const;
  void check_produced_external_inputs(const DependencyGraph & graph, FindingBag & out) const;

private:
  ArtifactCatalog external_inputs_;
  ArtifactCatalog published_outputs_;
};

}  // namespace wfgraph
