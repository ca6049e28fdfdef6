// wfgraph/graph/graph_builder.hpp - Fold trace sets into a DependencyGraph
#pragma once

#include "wfgraph/graph/dependency_graph.hpp"
#include "wfgraph/trace/trace_record.hpp"

namespace wfgraph
{

/**
 * Builds the dependency graph from the traces of every script.
 *
 * Edges are deduplicated by (script, artifact, direction); accessor names are
 * kept as labels only. The result does not depend on record order.
 */
class GraphBuilder
{
public:
  GraphBuilder() = default;

  /**
   * @param traces Per-script traces; scripts with an empty trace still become nodes
   * @throws GraphBuildError if a record belongs to another script, or a script
   *         both reads and writes the same artifact
   */
  [[nodiscard]] static DependencyGraph build(const TraceSet & traces);
};

}  // namespace wfgraph
