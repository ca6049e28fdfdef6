// wfgraph/analysis/artifact_catalog.hpp - Named sets of artifacts
//
// Used for the externally-supplied inputs and the published outputs.
// An entry is one of:
//   inputs/weather/weather.epw   exact artifact key
//   weather.epw                  bare file name, any category
//   inputs/building-properties/* every artifact of a category
//
#pragma once

#include <set>
#include <string>
#include <vector>

#include "wfgraph/model/artifact.hpp"

namespace wfgraph
{

class ArtifactCatalog
{
public:
  ArtifactCatalog() = default;
  explicit ArtifactCatalog(const std::vector<std::string> & entries);

  void add(const std::string & entry);

  [[nodiscard]] bool matches(const Artifact & artifact) const;

  /// Entries in insertion order
  [[nodiscard]] const std::vector<std::string> & entries() const noexcept { return entries_; }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
  std::vector<std::string> entries_;
  std::set<std::string> keys_;
  std::set<std::string> names_;
  std::set<std::string> categories_;
};

}  // namespace wfgraph
