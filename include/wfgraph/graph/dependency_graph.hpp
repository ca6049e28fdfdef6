// wfgraph/graph/dependency_graph.hpp - Bipartite script/artifact graph
//
// Every edge joins one script and one artifact. Artifact -> Script means the
// script reads the artifact, Script -> Artifact means it writes it.
// All iteration is ordered: artifacts by (category, name), scripts by name.
//
#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "wfgraph/model/artifact.hpp"

namespace wfgraph
{

// ============================================================================
// Nodes and Edges
// ============================================================================

struct ScriptNode
{
  std::string name;
  std::set<Artifact> inputs;
  std::set<Artifact> outputs;
};

struct ArtifactNode
{
  Artifact artifact;
  std::set<std::string> readers;
  std::set<std::string> writers;

  [[nodiscard]] bool is_read() const noexcept { return !readers.empty(); }
  [[nodiscard]] bool is_written() const noexcept { return !writers.empty(); }
};

struct Edge
{
  std::string script;
  Artifact artifact;
  Direction direction = Direction::Read;

  /// Accessors observed on this edge (documentation only)
  std::set<std::string> accessors;

  [[nodiscard]] bool is_read() const noexcept { return direction == Direction::Read; }
};

// ============================================================================
// DependencyGraph
// ============================================================================

class DependencyGraph
{
public:
  DependencyGraph() = default;

  // ===========================================================================
  // Construction (used by GraphBuilder)
  // ===========================================================================

  /// Add a script node, or reuse the existing one
  ScriptNode & add_script(const std::string & name);

  /// Add an artifact node, or reuse the existing one (first kind wins)
  ArtifactNode & add_artifact(const Artifact & artifact);

  /**
   * Add an edge, or reuse the existing (script, artifact, direction) edge and
   * append the accessor to its labels. Creates missing endpoints.
   */
  Edge & add_edge(
    const std::string & script, const Artifact & artifact, Direction direction,
    const std::string & accessor);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] const std::map<std::string, ScriptNode, std::less<>> & script_nodes() const noexcept
  {
    return scripts_;
  }

  [[nodiscard]] const std::map<Artifact, ArtifactNode> & artifact_nodes() const noexcept
  {
    return artifacts_;
  }

  /// Script names, ascending
  [[nodiscard]] std::vector<std::string> scripts() const;

  /// Artifacts ordered by category, then name
  [[nodiscard]] std::vector<Artifact> artifacts() const;

  /// Edges ordered by artifact, then script, then direction
  [[nodiscard]] std::vector<const Edge *> edges() const;

  /// Edges touching one script, same order as edges()
  [[nodiscard]] std::vector<const Edge *> edges_of(std::string_view script) const;

  [[nodiscard]] const ScriptNode * find_script(std::string_view name) const;
  [[nodiscard]] const ArtifactNode * find_artifact(const Artifact & artifact) const;

  /// Find by "category/name"
  [[nodiscard]] const ArtifactNode * find_artifact_by_key(std::string_view key) const;

  /// All artifacts whose name template equals `name` (any category)
  [[nodiscard]] std::vector<const ArtifactNode *> find_artifacts_by_name(
    std::string_view name) const;

  [[nodiscard]] const Edge * find_edge(
    std::string_view script, const Artifact & artifact, Direction direction) const;

  [[nodiscard]] bool has_script(std::string_view name) const { return find_script(name) != nullptr; }

  [[nodiscard]] size_t script_count() const noexcept { return scripts_.size(); }
  [[nodiscard]] size_t artifact_count() const noexcept { return artifacts_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }
  [[nodiscard]] bool empty() const noexcept { return scripts_.empty() && artifacts_.empty(); }

  /// Structural equality: same nodes, same edges, same edge labels
  friend bool operator==(const DependencyGraph & a, const DependencyGraph & b);
  friend bool operator!=(const DependencyGraph & a, const DependencyGraph & b) { return !(a == b); }

private:
  using EdgeKey = std::tuple<Artifact, std::string, Direction>;

  std::map<std::string, ScriptNode, std::less<>> scripts_;
  std::map<Artifact, ArtifactNode> artifacts_;
  std::map<EdgeKey, Edge> edges_;
};

}  // namespace wfgraph
