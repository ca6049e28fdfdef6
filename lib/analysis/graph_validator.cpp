// wfgraph/analysis/graph_validator.cpp - Structural checks on a DependencyGraph
#include "wfgraph/analysis/graph_validator.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wfgraph/graph/script_projection.hpp"

namespace wfgraph
{

namespace
{

std::string join(const std::set<std::string> & names, std::string_view sep = ", ")
{
  std::string out;
  for (const auto & n : names) {
    if (!out.empty()) out += sep;
    out += n;
  }
  return out;
}

std::string accessor_label(const Edge * edge)
{
  if (edge == nullptr || edge->accessors.empty()) {
    return "";
  }
  return " via (" + join(edge->accessors) + ")";
}

std::string cycle_path(const std::vector<std::string> & component)
{
  std::string out;
  for (const auto & s : component) {
    out += s;
    out += " -> ";
  }
  out += component.front();
  return out;
}

}  // namespace

GraphValidator::GraphValidator(ArtifactCatalog external_inputs, ArtifactCatalog published_outputs)
: external_inputs_(std::move(external_inputs)), published_outputs_(std::move(published_outputs))
{
}

FindingBag GraphValidator::validate(const DependencyGraph & graph) const
{
  FindingBag findings;
  check_cycles(graph, findings);
  check_orphan_inputs(graph, findings);
  check_scripts_without_outputs(graph, findings);
  check_dangling_outputs(graph, findings);
  check_produced_external_inputs(graph, findings);
  return findings;
}

void GraphValidator::check_orphan_inputs(const DependencyGraph & graph, FindingBag & out) const
{
  for (const auto & [artifact, node] : graph.artifact_nodes()) {
    if (!node.is_read() || node.is_written() || external_inputs_.matches(artifact)) {
      continue;
    }

    auto builder = out.report_warning(
      FindingKind::OrphanInput,
      "artifact '" + artifact.key() + "' is read but no script writes it");
    builder.with_subject(artifact.key());
    for (const auto & reader : node.readers) {
      builder.with_subject(reader);
      builder.with_note(
        "read by " + reader + accessor_label(graph.find_edge(reader, artifact, Direction::Read)));
    }
    builder.with_help("add the producing script to the trace set, or list '" + artifact.key() +
                      "' under external_inputs");
  }
}

void GraphValidator::check_cycles(const DependencyGraph & graph, FindingBag & out) const
{
  const ScriptProjection projection(graph);

  for (const auto & component : projection.cycles()) {
    auto builder = out.report_error(
      FindingKind::Cycle, "scripts depend on each other: " + cycle_path(component));
    builder.with_subjects(component);

    for (const auto & script : component) {
      for (const auto & consumer : projection.successors(script)) {
        if (std::find(component.begin(), component.end(), consumer) == component.end()) {
          continue;
        }
        builder.with_note(script + " writes an input of " + consumer);
      }
    }
    builder.with_help("break the cycle by splitting one of the shared artifacts");
  }
}

void GraphValidator::check_dangling_outputs(const DependencyGraph & graph, FindingBag & out) const
{
  for (const auto & [artifact, node] : graph.artifact_nodes()) {
    if (!node.is_written() || node.is_read() || published_outputs_.matches(artifact)) {
      continue;
    }

    out
      .report_info(
        FindingKind::DanglingOutput,
        "artifact '" + artifact.key() + "' is written but never read")
      .with_subject(artifact.key())
      .with_subjects(std::vector<std::string>(node.writers.begin(), node.writers.end()))
      .with_help("list it under published_outputs if it is a final deliverable");
  }
}

void GraphValidator::check_scripts_without_outputs(
  const DependencyGraph & graph, FindingBag & out) const
{
  for (const auto & [name, node] : graph.script_nodes()) {
    if (!node.outputs.empty()) {
      continue;
    }
    out.report_warning(FindingKind::NoOutputs, "script '" + name + "' declares no outputs")
      .with_subject(name)
      .with_note(
        node.inputs.empty() ? "its dry run called no accessor at all"
                            : "it reads " + std::to_string(node.inputs.size()) + " artifact(s)");
  }
}

void GraphValidator::check_produced_external_inputs(
  const DependencyGraph & graph, FindingBag & out) const
{
  for (const auto & [artifact, node] : graph.artifact_nodes()) {
    if (!node.is_written() || !external_inputs_.matches(artifact)) {
      continue;
    }
    out
      .report_info(
        FindingKind::ExternalProduced,
        "artifact '" + artifact.key() + "' is listed as external but written by " +
          join(node.writers))
      .with_subject(artifact.key())
      .with_help("remove it from external_inputs so missing producers are reported");
  }
}

}  // namespace wfgraph
