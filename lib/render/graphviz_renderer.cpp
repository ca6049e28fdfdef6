// wfgraph/render/graphviz_renderer.cpp - Graphviz (.gv) documentation output
#include "wfgraph/render/graphviz_renderer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <map>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

#include "wfgraph/basic/errors.hpp"

namespace wfgraph
{

namespace
{

constexpr const char * k_process_color = "#3FC0C2";
constexpr const char * k_input_color = "#E1F2F2";
constexpr const char * k_output_color = "#aadcdd";

std::string edge_label(const Edge & edge)
{
  std::string label = "(";
  bool first = true;
  for (const auto & acc : edge.accessors) {
    if (!first) label += ", ";
    label += acc;
    first = false;
  }
  label += ")";
  return label;
}

struct CategoryClusters
{
  std::vector<const Artifact *> inputs;
  std::vector<const Artifact *> outputs;
};

void write_header(std::ostream & out, const RenderOptions & options)
{
  fmt::print(out, "digraph {} {{\n", options.graph_name);
  fmt::print(out, "    rankdir=\"LR\";\n");
  fmt::print(out, "    graph [overlap=false, fontname=arial];\n");
  fmt::print(
    out,
    "    node [shape=box, style=filled, color=white, fontsize=15, fontname=arial, "
    "fixedsize=true, width=5];\n");
  fmt::print(out, "    edge [fontname=arial, fontsize=15];\n");
  fmt::print(out, "    newrank=true;\n");

  if (!options.legend) {
    return;
  }
  fmt::print(out, "    subgraph cluster_legend {{\n");
  fmt::print(out, "        fontsize=25;\n");
  fmt::print(out, "        style=invis;\n");
  fmt::print(
    out, "        \"process\"[style=filled, fillcolor=\"{}\", shape=note, fontsize=20];\n",
    k_process_color);
  fmt::print(
    out, "        \"inputs\"[style=filled, shape=folder, color=white, fillcolor=\"{}\"];\n",
    k_input_color);
  fmt::print(
    out, "        \"outputs\"[style=filled, shape=folder, color=white, fillcolor=\"{}\"];\n",
    k_output_color);
  fmt::print(out, "        \"inputs\" -> \"process\"[style=invis];\n");
  fmt::print(out, "        \"process\" -> \"outputs\"[style=invis];\n");
  fmt::print(out, "    }}\n");
}

void write_cluster(
  std::ostream & out, size_t index, const char * suffix, const char * color,
  const std::string & category, const std::vector<const Artifact *> & artifacts,
  const std::map<Artifact, std::string> & ids)
{
  if (artifacts.empty()) {
    return;
  }
  fmt::print(out, "    subgraph cluster_{}_{} {{\n", index, suffix);
  fmt::print(out, "        style=filled;\n");
  fmt::print(out, "        color=\"{}\";\n", color);
  fmt::print(out, "        fontsize=20;\n");
  fmt::print(out, "        rank=same;\n");
  fmt::print(out, "        label={};\n", quote_id(category));
  for (const auto * artifact : artifacts) {
    const std::string & id = ids.at(*artifact);
    if (id == artifact->name_template) {
      fmt::print(out, "        {};\n", quote_id(id));
    } else {
      fmt::print(out, "        {}[label={}];\n", quote_id(id), quote_id(artifact->name_template));
    }
  }
  fmt::print(out, "    }}\n");
}

}  // namespace

std::string quote_id(const std::string & id)
{
  std::string quoted = "\"";
  for (char c : id) {
    if (c == '"' || c == '\\') quoted += '\\';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

GraphvizRenderer::GraphvizRenderer(RenderOptions options) : options_(std::move(options)) {}

void GraphvizRenderer::render(const DependencyGraph & graph, std::ostream & out) const
{
  // === Select what to draw ===
  std::vector<const Edge *> edges;
  std::vector<std::string> scripts;
  if (options_.script) {
    if (!graph.has_script(*options_.script)) {
      throw UnknownTarget(*options_.script, "cannot render unknown script '" + *options_.script + "'");
    }
    edges = graph.edges_of(*options_.script);
    scripts.push_back(*options_.script);
  } else {
    edges = graph.edges();
    scripts = graph.scripts();
  }

  std::set<Artifact> artifacts;
  std::set<Artifact> written;
  for (const auto * e : edges) {
    artifacts.insert(e->artifact);
    if (!e->is_read()) written.insert(e->artifact);
  }
  if (!options_.script) {
    for (const auto & a : graph.artifacts()) artifacts.insert(a);
  }

  // === Node ids: the bare name unless it is shared ===
  std::map<std::string, size_t> name_uses;
  if (options_.legend) {
    for (const char * legend_id : {"process", "inputs", "outputs"}) ++name_uses[legend_id];
  }
  for (const auto & s : scripts) ++name_uses[s];
  for (const auto & a : artifacts) ++name_uses[a.name_template];

  std::map<Artifact, std::string> ids;
  for (const auto & a : artifacts) {
    ids.emplace(a, name_uses[a.name_template] > 1 ? a.key() : a.name_template);
  }

  std::map<std::string, CategoryClusters> clusters;
  for (const auto & a : artifacts) {
    auto & cluster = clusters[a.category];
    if (written.count(a) > 0) {
      cluster.outputs.push_back(&a);
    } else {
      cluster.inputs.push_back(&a);
    }
  }

  // === Emit ===
  write_header(out, options_);

  for (const auto & s : scripts) {
    fmt::print(
      out,
      "    {}[style=filled, color=white, fillcolor=\"{}\", shape=note, fontsize=20, "
      "fontname=arial];\n",
      quote_id(s), k_process_color);
  }

  size_t index = 0;
  for (const auto & [category, cluster] : clusters) {
    write_cluster(out, index, "in", k_input_color, category, cluster.inputs, ids);
    write_cluster(out, index, "out", k_output_color, category, cluster.outputs, ids);
    ++index;
  }

  for (const auto * e : edges) {
    const std::string artifact_id = quote_id(ids.at(e->artifact));
    const std::string script_id = quote_id(e->script);
    const std::string label = quote_id(edge_label(*e));
    if (e->is_read()) {
      fmt::print(out, "    {} -> {}[label={}];\n", artifact_id, script_id, label);
    } else {
      fmt::print(out, "    {} -> {}[label={}];\n", script_id, artifact_id, label);
    }
  }

  fmt::print(out, "}}\n");
}

std::string GraphvizRenderer::render(const DependencyGraph & graph) const
{
  std::ostringstream out;
  render(graph, out);
  return out.str();
}

std::string render(const DependencyGraph & graph, const RenderOptions & options)
{
  return GraphvizRenderer(options).render(graph);
}

}  // namespace wfgraph
