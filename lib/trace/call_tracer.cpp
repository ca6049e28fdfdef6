// wfgraph/trace/call_tracer.cpp - Dry-run tracing implementation
#include "wfgraph/trace/call_tracer.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <utility>

namespace wfgraph
{

namespace
{

/// Per-script slot written by exactly one worker
struct TraceOutcome
{
  std::vector<TraceRecord> records;
  std::optional<TraceFailure> failure;
};

}  // namespace

CallTracer::CallTracer(std::shared_ptr<const LocatorRegistry> registry, TraceOptions options)
: registry_(std::move(registry)), options_(std::move(options))
{
}

std::vector<TraceRecord> CallTracer::trace(const Script & script) const
{
  TracingLocator locator(script.name(), registry_, options_.dry_run_root, options_.cancel.get());

  try {
    script.run(locator);
  } catch (const TraceCancelled &) {
    throw;
  } catch (const MissingFile &) {
    // The script gave up on an absent input; what it asked for so far stands.
  } catch (const std::exception & e) {
    throw TraceFailure(script.name(), e.what(), locator.take_records());
  } catch (...) {
    throw TraceFailure(script.name(), "non-standard exception", locator.take_records());
  }

  return locator.take_records();
}

std::vector<TraceRecord> CallTracer::trace(
  const std::string & script, const FunctionScript::RunFn & run_fn) const
{
  const FunctionScript adhoc(script, run_fn);
  return trace(adhoc);
}

TraceAllResult CallTracer::trace_all(gsl::span<const std::unique_ptr<Script>> scripts) const
{
  const size_t count = scripts.size();
  std::vector<TraceOutcome> outcomes(count);
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
      const Script * script = scripts[i].get();
      if (script == nullptr) {
        continue;
      }
      try {
        outcomes[i].records = trace(*script);
      } catch (const TraceFailure & failure) {
        outcomes[i].failure = failure;
      }
    }
  };

  const unsigned jobs = worker_count(count);
  if (jobs <= 1) {
    worker();
  } else {
    std::vector<std::thread> workers;
    workers.reserve(jobs);
    for (unsigned j = 0; j < jobs; ++j) {
      workers.emplace_back(worker);
    }
    for (auto & t : workers) {
      t.join();
    }
  }

  TraceAllResult result;
  for (size_t i = 0; i < count; ++i) {
    if (!scripts[i]) {
      continue;
    }
    if (outcomes[i].failure) {
      result.failures.push_back(std::move(*outcomes[i].failure));
    } else {
      result.traces[scripts[i]->name()] = std::move(outcomes[i].records);
    }
  }
  return result;
}

unsigned CallTracer::worker_count(size_t tasks) const
{
  unsigned jobs = options_.jobs;
  if (jobs == 0) {
    jobs = std::max(1U, std::thread::hardware_concurrency());
  }
  return static_cast<unsigned>(std::min<size_t>(jobs, tasks));
}

}  // namespace wfgraph
