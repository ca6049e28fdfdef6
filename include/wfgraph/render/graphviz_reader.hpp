// wfgraph/render/graphviz_reader.hpp - Read back rendered .gv documents
//
// Only the structure is recovered (scripts, artifact category and name,
// edges and their accessor labels); styling attributes are ignored.
//
#pragma once

#include <set>
#include <string>
#include <string_view>

#include "wfgraph/graph/dependency_graph.hpp"

namespace wfgraph
{

struct RenderedEdge
{
  std::string script;
  Artifact artifact;
  Direction direction = Direction::Read;
  std::set<std::string> accessors;

  friend bool operator<(const RenderedEdge & a, const RenderedEdge & b);
  friend bool operator==(const RenderedEdge & a, const RenderedEdge & b);
};

/**
 * Comparable structural view of a rendered graph.
 */
struct RenderedGraph
{
  std::set<std::string> scripts;
  std::set<Artifact> artifacts;
  std::set<RenderedEdge> edges;

  /// View of the whole graph, as GraphvizRenderer draws it
  [[nodiscard]] static RenderedGraph from(const DependencyGraph & graph);

  /// View of one script's direct edges
  [[nodiscard]] static RenderedGraph from(const DependencyGraph & graph, std::string_view script);

  friend bool operator==(const RenderedGraph & a, const RenderedGraph & b)
  {
    return a.scripts == b.scripts && a.artifacts == b.artifacts && a.edges == b.edges;
  }
  friend bool operator!=(const RenderedGraph & a, const RenderedGraph & b) { return !(a == b); }
};

/**
 * Parse the .gv dialect written by GraphvizRenderer.
 *
 * @throws GraphSyntaxError with the offending line
 */
[[nodiscard]] RenderedGraph read_graphviz(std::string_view text);

}  // namespace wfgraph
