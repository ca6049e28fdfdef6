// wfgraph/driver/json_report.hpp - JSON serialization of workflow results
//
// Shape (--format json):
//   {"target": "demand", "order": [...],
//    "findings": [{"code", "severity", "message", "subjects", "help"}]}
//
#pragma once

#include <nlohmann/json.hpp>

#include "wfgraph/basic/finding.hpp"
#include "wfgraph/driver/workflow.hpp"

namespace wfgraph
{

[[nodiscard]] nlohmann::json to_json(const Finding & finding);

[[nodiscard]] nlohmann::json to_json(const FindingBag & findings);

/**
 * Serialize a workflow result. "target" and "order" are only present in
 * Order mode.
 */
[[nodiscard]] nlohmann::json to_json(const WorkflowResult & result, OutputMode mode);

}  // namespace wfgraph
