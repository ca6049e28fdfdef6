// wfgraph/basic/errors.cpp - Exception messages
#include "wfgraph/basic/errors.hpp"

namespace wfgraph
{

namespace
{

std::string join_names(const std::vector<std::string> & names)
{
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out += ", ";
    out += names[i];
  }
  return out;
}

}  // namespace

CyclicDependency::CyclicDependency(std::vector<std::string> scripts)
: Error("cyclic dependency between scripts: " + join_names(scripts)), scripts_(std::move(scripts))
{
}

TraceFailure::TraceFailure(
  std::string script, const std::string & reason, std::vector<TraceRecord> partial)
: Error(
    "dry run of '" + script + "' failed after " + std::to_string(partial.size()) +
    " locator call(s): " + reason),
  script_(std::move(script)),
  reason_(reason),
  partial_(std::move(partial))
{
}

}  // namespace wfgraph
