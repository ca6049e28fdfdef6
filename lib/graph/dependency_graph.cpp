// wfgraph/graph/dependency_graph.cpp - Bipartite script/artifact graph
#include "wfgraph/graph/dependency_graph.hpp"

#include <utility>

namespace wfgraph
{

ScriptNode & DependencyGraph::add_script(const std::string & name)
{
  auto it = scripts_.find(name);
  if (it == scripts_.end()) {
    ScriptNode node;
    node.name = name;
    it = scripts_.emplace(name, std::move(node)).first;
  }
  return it->second;
}

ArtifactNode & DependencyGraph::add_artifact(const Artifact & artifact)
{
  auto it = artifacts_.find(artifact);
  if (it == artifacts_.end()) {
    ArtifactNode node;
    node.artifact = artifact;
    it = artifacts_.emplace(artifact, std::move(node)).first;
  }
  return it->second;
}

Edge & DependencyGraph::add_edge(
  const std::string & script, const Artifact & artifact, Direction direction,
  const std::string & accessor)
{
  ScriptNode & s = add_script(script);
  ArtifactNode & a = add_artifact(artifact);

  if (direction == Direction::Read) {
    s.inputs.insert(a.artifact);
    a.readers.insert(script);
  } else {
    s.outputs.insert(a.artifact);
    a.writers.insert(script);
  }

  EdgeKey key{a.artifact, script, direction};
  auto it = edges_.find(key);
  if (it == edges_.end()) {
    Edge e;
    e.script = script;
    e.artifact = a.artifact;
    e.direction = direction;
    it = edges_.emplace(std::move(key), std::move(e)).first;
  }
  if (!accessor.empty()) {
    it->second.accessors.insert(accessor);
  }
  return it->second;
}

std::vector<std::string> DependencyGraph::scripts() const
{
  std::vector<std::string> out;
  out.reserve(scripts_.size());
  for (const auto & [name, _] : scripts_) {
    out.push_back(name);
  }
  return out;
}

std::vector<Artifact> DependencyGraph::artifacts() const
{
  std::vector<Artifact> out;
  out.reserve(artifacts_.size());
  for (const auto & [artifact, _] : artifacts_) {
    out.push_back(artifact);
  }
  return out;
}

std::vector<const Edge *> DependencyGraph::edges() const
{
  std::vector<const Edge *> out;
  out.reserve(edges_.size());
  for (const auto & [_, edge] : edges_) {
    out.push_back(&edge);
  }
  return out;
}

std::vector<const Edge *> DependencyGraph::edges_of(std::string_view script) const
{
  std::vector<const Edge *> out;
  for (const auto & [_, edge] : edges_) {
    if (edge.script == script) {
      out.push_back(&edge);
    }
  }
  return out;
}

const ScriptNode * DependencyGraph::find_script(std::string_view name) const
{
  auto it = scripts_.find(name);
  return it != scripts_.end() ? &it->second : nullptr;
}

const ArtifactNode * DependencyGraph::find_artifact(const Artifact & artifact) const
{
  auto it = artifacts_.find(artifact);
  return it != artifacts_.end() ? &it->second : nullptr;
}

const ArtifactNode * DependencyGraph::find_artifact_by_key(std::string_view key) const
{
  // The category itself may contain '/', so split on the last one.
  const size_t slash = key.rfind('/');
  if (slash == std::string_view::npos) {
    return nullptr;
  }
  Artifact probe;
  probe.category = std::string(key.substr(0, slash));
  probe.name_template = std::string(key.substr(slash + 1));
  return find_artifact(probe);
}

std::vector<const ArtifactNode *> DependencyGraph::find_artifacts_by_name(
  std::string_view name) const
{
  std::vector<const ArtifactNode *> out;
  for (const auto & [artifact, node] : artifacts_) {
    if (artifact.name_template == name) {
      out.push_back(&node);
    }
  }
  return out;
}

const Edge * DependencyGraph::find_edge(
  std::string_view script, const Artifact & artifact, Direction direction) const
{
  auto it = edges_.find(EdgeKey{artifact, std::string(script), direction});
  return it != edges_.end() ? &it->second : nullptr;
}

bool operator==(const DependencyGraph & a, const DependencyGraph & b)
{
  if (
    a.scripts_.size() != b.scripts_.size() || a.artifacts_.size() != b.artifacts_.size() ||
    a.edges_.size() != b.edges_.size()) {
    return false;
  }

  for (const auto & [name, _] : a.scripts_) {
    if (b.scripts_.count(name) == 0) {
      return false;
    }
  }
  for (const auto & [artifact, _] : a.artifacts_) {
    if (b.artifacts_.count(artifact) == 0) {
      return false;
    }
  }
  for (const auto & [key, edge] : a.edges_) {
    auto it = b.edges_.find(key);
    if (it == b.edges_.end() || it->second.accessors != edge.accessors) {
      return false;
    }
  }
  return true;
}

}  // namespace wfgraph
