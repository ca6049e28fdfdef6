// wfgraph/basic/errors.hpp - Exception taxonomy
//
// Fatal conditions raised by the registry, tracer, builder, planner and reader.
// Advisory problems are reported as Findings instead (see finding.hpp).
//
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "wfgraph/trace/trace_record.hpp"

namespace wfgraph
{

/**
 * Base class for all wfgraph exceptions.
 */
class Error : public std::runtime_error
{
public:
  explicit Error(const std::string & message) : std::runtime_error(message) {}
};

/**
 * Registry lookup failure.
 */
class UnknownAccessor : public Error
{
public:
  explicit UnknownAccessor(std::string accessor)
  : Error("unknown accessor '" + accessor + "'"), accessor_(std::move(accessor))
  {
  }

  [[nodiscard]] const std::string & accessor() const noexcept { return accessor_; }

private:
  std::string accessor_;
};

/**
 * The planner was asked for a script or artifact that is not in the graph.
 */
class UnknownTarget : public Error
{
public:
  UnknownTarget(std::string target, const std::string & message)
  : Error(message), target_(std::move(target))
  {
  }

  [[nodiscard]] const std::string & target() const noexcept { return target_; }

private:
  std::string target_;
};

/**
 * The planner refuses to order scripts that take part in a cycle.
 */
class CyclicDependency : public Error
{
public:
  explicit CyclicDependency(std::vector<std::string> scripts);

  /// Scripts on the cycle(s), sorted by name
  [[nodiscard]] const std::vector<std::string> & scripts() const noexcept { return scripts_; }

private:
  std::vector<std::string> scripts_;
};

/**
 * Raised by script logic when a file it needs does not exist.
 *
 * During a dry run this is not a failure: the tracer ends the run and keeps
 * the records collected so far.
 */
class MissingFile : public Error
{
public:
  explicit MissingFile(const std::string & path) : Error("missing file: " + path), path_(path) {}

  [[nodiscard]] const std::string & path() const noexcept { return path_; }

private:
  std::string path_;
};

/**
 * A dry run raised for a reason unrelated to tracing.
 */
class TraceFailure : public Error
{
public:
  TraceFailure(std::string script, const std::string & reason, std::vector<TraceRecord> partial);

  [[nodiscard]] const std::string & script() const noexcept { return script_; }
  [[nodiscard]] const std::string & reason() const noexcept { return reason_; }

  /// Records collected before the failure
  [[nodiscard]] const std::vector<TraceRecord> & partial_trace() const noexcept
  {
    return partial_;
  }

private:
  std::string script_;
  std::string reason_;
  std::vector<TraceRecord> partial_;
};

/**
 * A dry run was stopped through its cancellation token.
 */
class TraceCancelled : public TraceFailure
{
public:
  TraceCancelled(std::string script, std::vector<TraceRecord> partial)
  : TraceFailure(std::move(script), "dry run cancelled", std::move(partial))
  {
  }
};

/**
 * The trace set violates a graph invariant (e.g. a script reading and
 * writing the same artifact).
 */
class GraphBuildError : public Error
{
public:
  using Error::Error;
};

/**
 * Malformed rendered graph text.
 */
class GraphSyntaxError : public Error
{
public:
  GraphSyntaxError(size_t line, const std::string & message)
  : Error("line " + std::to_string(line) + ": " + message), line_(line)
  {
  }

  [[nodiscard]] size_t line() const noexcept { return line_; }

private:
  size_t line_;
};

}  // namespace wfgraph
