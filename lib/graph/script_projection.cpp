// wfgraph/graph/script_projection.cpp - Precedence edges + SCC analysis
#include "wfgraph/graph/script_projection.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>
#include <utility>

namespace wfgraph
{

namespace
{

const std::set<std::string> k_no_scripts;

}  // namespace

ScriptProjection::ScriptProjection(const DependencyGraph & graph) : scripts_(graph.scripts())
{
  for (const auto & name : scripts_) {
    successors_[name];
    predecessors_[name];
  }

  for (const auto & [artifact, node] : graph.artifact_nodes()) {
    for (const auto & producer : node.writers) {
      for (const auto & consumer : node.readers) {
        if (producer == consumer) {
          continue;
        }
        successors_[producer].insert(consumer);
        predecessors_[consumer].insert(producer);
      }
    }
  }
}

const std::set<std::string> & ScriptProjection::successors(std::string_view script) const
{
  auto it = successors_.find(script);
  return it != successors_.end() ? it->second : k_no_scripts;
}

const std::set<std::string> & ScriptProjection::predecessors(std::string_view script) const
{
  auto it = predecessors_.find(script);
  return it != predecessors_.end() ? it->second : k_no_scripts;
}

std::vector<std::vector<std::string>> ScriptProjection::cycles() const
{
  // Tarjan's algorithm, visiting scripts and successors in name order so the
  // output is reproducible.
  struct VisitState
  {
    size_t index = 0;
    size_t lowlink = 0;
    bool on_stack = false;
  };

  std::unordered_map<std::string, VisitState> state;
  state.reserve(scripts_.size());
  std::vector<std::string> stack;
  size_t next_index = 0;
  std::vector<std::vector<std::string>> components;

  std::function<void(const std::string &)> strongconnect;
  strongconnect = [&](const std::string & v) {
    VisitState & vs = state[v];
    vs.index = next_index;
    vs.lowlink = next_index;
    ++next_index;
    stack.push_back(v);
    vs.on_stack = true;

    for (const auto & w : successors(v)) {
      auto it = state.find(w);
      if (it == state.end()) {
        strongconnect(w);
        state[v].lowlink = std::min(state[v].lowlink, state[w].lowlink);
      } else if (it->second.on_stack) {
        state[v].lowlink = std::min(state[v].lowlink, it->second.index);
      }
    }

    if (state[v].lowlink == state[v].index) {
      std::vector<std::string> component;
      while (true) {
        std::string w = stack.back();
        stack.pop_back();
        state[w].on_stack = false;
        const bool done = (w == v);
        component.push_back(std::move(w));
        if (done) break;
      }
      if (component.size() > 1) {
        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
      }
    }
  };

  for (const auto & s : scripts_) {
    if (state.find(s) == state.end()) {
      strongconnect(s);
    }
  }

  std::sort(components.begin(), components.end());
  return components;
}

std::set<std::string> ScriptProjection::upstream_closure(std::string_view script) const
{
  std::set<std::string> closure;
  std::vector<std::string> work;
  for (const auto & p : predecessors(script)) {
    work.push_back(p);
  }

  while (!work.empty()) {
    std::string current = std::move(work.back());
    work.pop_back();
    if (!closure.insert(current).second) {
      continue;
    }
    for (const auto & p : predecessors(current)) {
      if (closure.count(p) == 0) {
        work.push_back(p);
      }
    }
  }

  return closure;
}

}  // namespace wfgraph
