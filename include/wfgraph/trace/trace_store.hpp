// wfgraph/trace/trace_store.hpp - Trace set persistence (YAML)
//
// Traces are kept next to the rendered graphs for audit. They are never the
// source of truth; the graph is always rebuilt from them.
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <utility>

#include "wfgraph/trace/trace_record.hpp"

namespace wfgraph
{

struct TraceLoadResult
{
  TraceSet traces;
  bool success = false;
  std::string error;

  static TraceLoadResult ok(TraceSet traces)
  {
    TraceLoadResult r;
    r.traces = std::move(traces);
    r.success = true;
    return r;
  }

  static TraceLoadResult fail(std::string msg)
  {
    TraceLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Write a trace set as YAML: one sequence of records per script.
 */
void write_trace_set(const TraceSet & traces, std::ostream & os);

/**
 * Parse a trace set from YAML text.
 */
[[nodiscard]] TraceLoadResult parse_trace_set(const std::string & yaml_text);

/**
 * Load a trace set from a YAML file.
 */
[[nodiscard]] TraceLoadResult load_trace_set(const std::filesystem::path & path);

/**
 * Default name of the trace file written by `wfgraph trace`.
 */
inline constexpr const char * k_trace_file_name = "trace_inputlocator.output.yml";

}  // namespace wfgraph
