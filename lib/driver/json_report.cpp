// wfgraph/driver/json_report.cpp - JSON serialization of workflow results
//
#include "wfgraph/driver/json_report.hpp"

namespace wfgraph
{

using nlohmann::json;

json to_json(const Finding & finding)
{
  json j{
    {"code", finding.code()},
    {"severity", to_string(finding.severity)},
    {"message", finding.message},
    {"subjects", finding.subjects},
  };
  if (!finding.notes.empty()) {
    j["notes"] = finding.notes;
  }
  j["help"] = finding.help_message ? json(*finding.help_message) : json(nullptr);
  return j;
}

json to_json(const FindingBag & findings)
{
  json arr = json::array();
  for (const auto & f : findings) {
    arr.push_back(to_json(f));
  }
  return arr;
}

json to_json(const WorkflowResult & result, OutputMode mode)
{
  json j = json::object();
  if (mode == OutputMode::Order) {
    j["target"] = result.resolved_target.empty() ? json(nullptr) : json(result.resolved_target);
    j["order"] = result.plan;
  }
  j["success"] = result.success;
  j["findings"] = to_json(result.findings);
  return j;
}

}  // namespace wfgraph
