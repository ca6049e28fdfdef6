// wfgraph/test_support/trace_helpers.hpp - helpers for unit/integration tests
//
// Compact builders for artifacts, registries and trace sets, so tests can
// describe a pipeline as "script reads these keys, writes those keys".
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "wfgraph/graph/dependency_graph.hpp"
#include "wfgraph/graph/graph_builder.hpp"
#include "wfgraph/locator/locator_registry.hpp"
#include "wfgraph/trace/trace_record.hpp"

namespace wfgraph::test_support
{

/// Artifact from "category/name" (split on the last '/')
[[nodiscard]] inline Artifact artifact(
  const std::string & key, ArtifactKind kind = ArtifactKind::ComputedResult)
{
  Artifact a;
  const size_t slash = key.rfind('/');
  a.category = slash == std::string::npos ? std::string("inputs") : key.substr(0, slash);
  a.name_template = slash == std::string::npos ? key : key.substr(slash + 1);
  a.kind = kind;
  return a;
}

[[nodiscard]] inline Accessor accessor(
  std::string name, const std::string & key, Direction direction,
  ArtifactKind kind = ArtifactKind::ComputedResult)
{
  Accessor acc;
  acc.name = std::move(name);
  acc.artifact = artifact(key, kind);
  acc.direction = direction;
  return acc;
}

[[nodiscard]] inline std::shared_ptr<const LocatorRegistry> registry(
  std::initializer_list<Accessor> accessors)
{
  auto reg = std::make_shared<LocatorRegistry>();
  for (const auto & acc : accessors) {
    reg->define(acc);
  }
  return reg;
}

/// A script as the keys of the artifacts it reads and writes
struct ScriptSketch
{
  std::string name;
  std::vector<std::string> reads;
  std::vector<std::string> writes;
};

/// Accessor name used for a sketched read/write of `key`: get_<file> / write_<file>
[[nodiscard]] inline std::string sketch_accessor(const std::string & key, Direction direction)
{
  const Artifact a = artifact(key);
  return (direction == Direction::Read ? "get_" : "write_") + a.name_template;
}

[[nodiscard]] inline std::vector<TraceRecord> records_of(const ScriptSketch & script)
{
  std::vector<TraceRecord> out;
  auto push = [&](const std::string & key, Direction direction) {
    TraceRecord r;
    r.script = script.name;
    r.accessor = sketch_accessor(key, direction);
    r.artifact = artifact(key);
    r.direction = direction;
    r.sequence = static_cast<uint32_t>(out.size());
    out.push_back(std::move(r));
  };
  for (const auto & key : script.reads) push(key, Direction::Read);
  for (const auto & key : script.writes) push(key, Direction::Write);
  return out;
}

[[nodiscard]] inline TraceSet traces(const std::vector<ScriptSketch> & scripts)
{
  TraceSet set;
  for (const auto & s : scripts) {
    set[s.name] = records_of(s);
  }
  return set;
}

[[nodiscard]] inline DependencyGraph graph(const std::vector<ScriptSketch> & scripts)
{
  return GraphBuilder::build(traces(scripts));
}

}  // namespace wfgraph::test_support
