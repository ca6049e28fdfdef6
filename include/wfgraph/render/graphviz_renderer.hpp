// wfgraph/render/graphviz_renderer.hpp - Graphviz (.gv) documentation output
//
// Layout:
//   - legend cluster (process / inputs / outputs)
//   - one process node per script
//   - cluster_<n>_in / cluster_<n>_out per artifact category, n being the
//     index of the category in sorted order
//   - one edge per (script, artifact, direction), labeled "(accessor)"
//
#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "wfgraph/graph/dependency_graph.hpp"

namespace wfgraph
{

struct RenderOptions
{
  /// Render only this script and its direct edges
  std::optional<std::string> script;

  std::string graph_name = "trace_inputlocator";

  bool legend = true;
};

class GraphvizRenderer
{
public:
  explicit GraphvizRenderer(RenderOptions options = {});

  /**
   * Render `graph`. The graph is not modified.
   *
   * @throws UnknownTarget if options.script is not in the graph
   */
  void render(const DependencyGraph & graph, std::ostream & out) const;

  [[nodiscard]] std::string render(const DependencyGraph & graph) const;

private:
  RenderOptions options_;
};

[[nodiscard]] std::string render(const DependencyGraph & graph, const RenderOptions & options = {});

/// Quote a Graphviz ID, escaping '"' and '\'
[[nodiscard]] std::string quote_id(const std::string & id);

}  // namespace wfgraph
