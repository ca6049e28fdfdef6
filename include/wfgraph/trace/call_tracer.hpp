// wfgraph/trace/call_tracer.hpp - Dry-run tracing of scripts
//
// Runs scripts against a TracingLocator and returns the observed locator calls.
// Each dry run owns its records; nothing is shared between runs except the
// read-only registry, so trace_all() runs scripts on parallel workers.
//
#pragma once

#include <filesystem>
#include <gsl/span>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wfgraph/basic/errors.hpp"
#include "wfgraph/locator/locator_registry.hpp"
#include "wfgraph/trace/script.hpp"
#include "wfgraph/trace/trace_record.hpp"
#include "wfgraph/trace/tracing_locator.hpp"

namespace wfgraph
{

struct TraceOptions
{
  /// Root of the synthetic paths handed to scripts
  std::filesystem::path dry_run_root = "dry-run";

  /// Worker threads for trace_all(); 0 = hardware concurrency
  unsigned jobs = 0;

  /// Optional shared cancellation flag
  std::shared_ptr<CancellationToken> cancel;
};

/**
 * Result of tracing a set of scripts.
 */
struct TraceAllResult
{
  /// Traces of the scripts whose dry run completed
  TraceSet traces;

  /// Failed or cancelled dry runs, in script order
  std::vector<TraceFailure> failures;

  [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

class CallTracer
{
public:
  explicit CallTracer(
    std::shared_ptr<const LocatorRegistry> registry, TraceOptions options = TraceOptions{});

  /**
   * Dry-run one script.
   *
   * A MissingFile raised by the script ends the run with the records so far.
   *
   * @return One record per accessor call, in call order
   * @throws TraceFailure (or TraceCancelled) with the partial trace
   */
  [[nodiscard]] std::vector<TraceRecord> trace(const Script & script) const;

  /**
   * Dry-run an ad-hoc callable under the given script name.
   */
  [[nodiscard]] std::vector<TraceRecord> trace(
    const std::string & script, const FunctionScript::RunFn & run_fn) const;

  /**
   * Dry-run every script on up to `options.jobs` workers and wait for all of
   * them. Failures are collected, never thrown.
   */
  [[nodiscard]] TraceAllResult trace_all(gsl::span<const std::unique_ptr<Script>> scripts) const;

  [[nodiscard]] const TraceOptions & options() const noexcept { return options_; }

private:
  [[nodiscard]] unsigned worker_count(size_t tasks) const;

  std::shared_ptr<const LocatorRegistry> registry_;
  TraceOptions options_;
};

}  // namespace wfgraph
