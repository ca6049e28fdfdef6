// wfgraph/trace/tracing_locator.cpp - Interception locator
#include "wfgraph/trace/tracing_locator.hpp"

#include <utility>

#include "wfgraph/basic/errors.hpp"

namespace wfgraph
{

TracingLocator::TracingLocator(
  std::string script, std::shared_ptr<const LocatorRegistry> registry,
  std::filesystem::path dry_run_root, const CancellationToken * cancel)
: script_(std::move(script)),
  registry_(std::move(registry)),
  dry_run_root_(std::move(dry_run_root)),
  cancel_(cancel)
{
}

std::filesystem::path TracingLocator::path(
  std::string_view accessor, const PlaceholderMap & placeholders)
{
  if (cancel_ != nullptr && cancel_->is_cancelled()) {
    throw TraceCancelled(script_, records_);
  }

  const Accessor & acc = registry_->resolve(accessor);

  TraceRecord record;
  record.script = script_;
  record.accessor = acc.name;
  record.artifact = acc.artifact;
  record.direction = acc.direction;
  record.sequence = static_cast<uint32_t>(records_.size());
  records_.push_back(std::move(record));

  return dry_run_root_ / acc.artifact.category / acc.artifact.expand(placeholders);
}

std::vector<TraceRecord> TracingLocator::take_records() noexcept
{
  std::vector<TraceRecord> out = std::move(records_);
  records_.clear();
  return out;
}

}  // namespace wfgraph
