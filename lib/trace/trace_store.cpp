// wfgraph/trace/trace_store.cpp - Trace set persistence (YAML)
//
#include "wfgraph/trace/trace_store.hpp"

#include <yaml-cpp/yaml.h>

#include <ostream>
#include <set>
#include <utility>

namespace wfgraph
{

namespace
{

/// Parse one record of the sequence belonging to `script`
bool parse_record(
  const YAML::Node & node, const std::string & script, TraceRecord & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "trace record of '" + script + "' must be a map";
    return false;
  }

  for (const char * key : {"accessor", "category", "file", "direction"}) {
    if (!node[key]) {
      error = "trace record of '" + script + "' is missing '" + key + "'";
      return false;
    }
  }

  out.script = script;
  out.accessor = node["accessor"].as<std::string>();
  out.artifact.category = node["category"].as<std::string>();
  out.artifact.name_template = node["file"].as<std::string>();

  if (node["kind"]) {
    const auto kind_text = node["kind"].as<std::string>();
    const auto kind = parse_artifact_kind(kind_text);
    if (!kind) {
      error = "unknown artifact kind '" + kind_text + "' in trace of '" + script + "'";
      return false;
    }
    out.artifact.kind = *kind;
  }

  const auto direction_text = node["direction"].as<std::string>();
  const auto direction = parse_direction(direction_text);
  if (!direction) {
    error = "invalid direction '" + direction_text + "' in trace of '" + script + "'";
    return false;
  }
  out.direction = *direction;

  if (node["sequence"]) {
    out.sequence = node["sequence"].as<uint32_t>();
  }

  return true;
}

TraceLoadResult parse_root(const YAML::Node & root)
{
  if (root.IsNull()) {
    return TraceLoadResult::ok({});
  }
  if (!root.IsMap()) {
    return TraceLoadResult::fail("trace file must map script names to record lists");
  }

  TraceSet traces;
  std::set<std::string> seen;
  for (const auto & entry : root) {
    const auto script = entry.first.as<std::string>();
    const YAML::Node & records = entry.second;
    if (!seen.insert(script).second) {
      return TraceLoadResult::fail("duplicate script '" + script + "' in trace file");
    }

    auto & list = traces[script];
    if (records.IsNull()) {
      continue;
    }
    if (!records.IsSequence()) {
      return TraceLoadResult::fail("trace of '" + script + "' must be a list");
    }

    uint32_t next_sequence = 0;
    for (const auto & node : records) {
      TraceRecord record;
      record.sequence = next_sequence;
      std::string error;
      if (!parse_record(node, script, record, error)) {
        return TraceLoadResult::fail(error);
      }
      next_sequence = record.sequence + 1;
      list.push_back(std::move(record));
    }
  }

  return TraceLoadResult::ok(std::move(traces));
}

}  // namespace

void write_trace_set(const TraceSet & traces, std::ostream & os)
{
  YAML::Emitter out;
  out << YAML::BeginMap;
  for (const auto & [script, records] : traces) {
    out << YAML::Key << script << YAML::Value << YAML::BeginSeq;
    for (const auto & r : records) {
      out << YAML::BeginMap;
      out << YAML::Key << "accessor" << YAML::Value << r.accessor;
      out << YAML::Key << "category" << YAML::Value << r.artifact.category;
      out << YAML::Key << "file" << YAML::Value << r.artifact.name_template;
      out << YAML::Key << "kind" << YAML::Value << std::string(to_string(r.artifact.kind));
      out << YAML::Key << "direction" << YAML::Value << std::string(to_string(r.direction));
      out << YAML::Key << "sequence" << YAML::Value << r.sequence;
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;
  }
  out << YAML::EndMap;

  os << out.c_str() << "\n";
}

TraceLoadResult parse_trace_set(const std::string & yaml_text)
{
  try {
    return parse_root(YAML::Load(yaml_text));
  } catch (const YAML::Exception & e) {
    return TraceLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

TraceLoadResult load_trace_set(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return TraceLoadResult::fail("trace file not found: " + path.string());
  }

  try {
    return parse_root(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception & e) {
    return TraceLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

}  // namespace wfgraph
