// wfgraph/graph/script_projection.hpp - Script-to-script precedence view
//
// Contracting every artifact between its writers and readers gives a directed
// graph over scripts: P -> C when C reads something P writes. Self edges
// are dropped. Used by cycle detection and execution planning.
//
#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "wfgraph/graph/dependency_graph.hpp"

namespace wfgraph
{

class ScriptProjection
{
public:
  explicit ScriptProjection(const DependencyGraph & graph);

  /// All scripts, ascending
  [[nodiscard]] const std::vector<std::string> & scripts() const noexcept { return scripts_; }

  /// Scripts consuming an output of `script`
  [[nodiscard]] const std::set<std::string> & successors(std::string_view script) const;

  /// Scripts producing an input of `script`
  [[nodiscard]] const std::set<std::string> & predecessors(std::string_view script) const;

  /**
   * Strongly connected components with more than one script (cycles).
   *
   * Each component is sorted by name; components are sorted by their first name.
   */
  [[nodiscard]] std::vector<std::vector<std::string>> cycles() const;

  /**
   * Every script that transitively produces an input of `script`
   * (excluding `script` itself unless it sits on a cycle).
   */
  [[nodiscard]] std::set<std::string> upstream_closure(std::string_view script) const;

private:
  std::vector<std::string> scripts_;
  std::map<std::string, std::set<std::string>, std::less<>> successors_;
  std::map<std::string, std::set<std::string>, std::less<>> predecessors_;
};

}  // namespace wfgraph
