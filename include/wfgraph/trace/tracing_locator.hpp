// wfgraph/trace/tracing_locator.hpp - Interception locator for dry runs
#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "wfgraph/locator/locator.hpp"
#include "wfgraph/trace/trace_record.hpp"

namespace wfgraph
{

/**
 * Cooperative cancellation flag shared between a controller and dry runs.
 */
class CancellationToken
{
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
  [[nodiscard]] bool is_cancelled() const noexcept
  {
    return cancelled_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> cancelled_{false};
};

/**
 * Records every accessor call of one dry run and hands back a path below the
 * dry-run root. Nothing is created on disk.
 *
 * One instance per dry run; not shared between threads.
 */
class TracingLocator : public Locator
{
public:
  TracingLocator(
    std::string script, std::shared_ptr<const LocatorRegistry> registry,
    std::filesystem::path dry_run_root, const CancellationToken * cancel = nullptr);

  using Locator::path;

  /**
   * @throws UnknownAccessor if the accessor is not registered
   * @throws TraceCancelled if the token was cancelled
   */
  [[nodiscard]] std::filesystem::path path(
    std::string_view accessor, const PlaceholderMap & placeholders) override;

  [[nodiscard]] const std::vector<TraceRecord> & records() const noexcept { return records_; }

  /// Move the collected records out, leaving the locator empty
  [[nodiscard]] std::vector<TraceRecord> take_records() noexcept;

private:
  std::string script_;
  std::shared_ptr<const LocatorRegistry> registry_;
  std::filesystem::path dry_run_root_;
  const CancellationToken * cancel_ = nullptr;
  std::vector<TraceRecord> records_;
};

}  // namespace wfgraph
