// wfgraph/trace/trace_record.hpp - One observed locator call
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "wfgraph/model/artifact.hpp"

namespace wfgraph
{

/**
 * One accessor invocation observed during a script's dry run.
 */
struct TraceRecord
{
  std::string script;
  std::string accessor;
  Artifact artifact;
  Direction direction = Direction::Read;

  /// Position of the call within its dry run, starting at 0
  uint32_t sequence = 0;
};

/// Per-script traces, keyed by script name
using TraceSet = std::map<std::string, std::vector<TraceRecord>>;

}  // namespace wfgraph
