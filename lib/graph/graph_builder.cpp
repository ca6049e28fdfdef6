// wfgraph/graph/graph_builder.cpp - Fold trace sets into a DependencyGraph
#include "wfgraph/graph/graph_builder.hpp"

#include "wfgraph/basic/errors.hpp"

namespace wfgraph
{

DependencyGraph GraphBuilder::build(const TraceSet & traces)
{
  DependencyGraph graph;

  for (const auto & [script, records] : traces) {
    graph.add_script(script);

    for (const auto & record : records) {
      if (!record.script.empty() && record.script != script) {
        throw GraphBuildError(
          "trace of '" + script + "' contains a record of script '" + record.script + "'");
      }
      graph.add_edge(script, record.artifact, record.direction, record.accessor);
    }
  }

  // A script may only sit on one side of an artifact.
  for (const auto & [name, node] : graph.script_nodes()) {
    for (const auto & artifact : node.inputs) {
      if (node.outputs.count(artifact) > 0) {
        throw GraphBuildError(
          "script '" + name + "' both reads and writes '" + artifact.key() + "'");
      }
    }
  }

  return graph;
}

}  // namespace wfgraph
