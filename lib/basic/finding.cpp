// wfgraph/basic/finding.cpp - Finding implementation
#include "wfgraph/basic/finding.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace wfgraph
{

const char * to_code(FindingKind kind) noexcept
{
  switch (kind) {
    case FindingKind::OrphanInput:
      return "orphan-input";
    case FindingKind::Cycle:
      return "cycle";
    case FindingKind::DanglingOutput:
      return "dangling-output";
    case FindingKind::NoOutputs:
      return "no-outputs";
    case FindingKind::ExternalProduced:
      return "external-produced";
    case FindingKind::UnknownTarget:
      return "unknown-target";
    case FindingKind::CyclicDependency:
      return "cyclic-dependency";
    case FindingKind::TraceFailure:
      return "trace-failure";
    case FindingKind::BuildFailure:
      return "build-failure";
    case FindingKind::Config:
      return "config";
  }
  return "config";
}

const char * to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

// ============================================================================
// FindingBuilder
// ============================================================================

FindingBuilder::FindingBuilder(FindingBag & bag, Finding finding)
: bag_(bag), finding_(std::move(finding))
{
}

FindingBuilder::FindingBuilder(FindingBuilder && other) noexcept
: bag_(other.bag_), finding_(std::move(other.finding_)), active_(other.active_)
{
  other.active_ = false;
}

FindingBuilder::~FindingBuilder()
{
  if (active_) {
    bag_.add(std::move(finding_));
  }
}

FindingBuilder & FindingBuilder::with_subject(std::string subject)
{
  finding_.subjects.push_back(std::move(subject));
  return *this;
}

FindingBuilder & FindingBuilder::with_subjects(std::vector<std::string> subjects)
{
  finding_.subjects.insert(
    finding_.subjects.end(), std::make_move_iterator(subjects.begin()),
    std::make_move_iterator(subjects.end()));
  return *this;
}

FindingBuilder & FindingBuilder::with_note(std::string note)
{
  finding_.notes.push_back(std::move(note));
  return *this;
}

FindingBuilder & FindingBuilder::with_help(std::string help_msg)
{
  finding_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// FindingBag
// ============================================================================

namespace
{

Finding make_finding(Severity severity, FindingKind kind, std::string message)
{
  Finding f;
  f.kind = kind;
  f.severity = severity;
  f.message = std::move(message);
  return f;
}

}  // namespace

FindingBuilder FindingBag::report_error(FindingKind kind, std::string message)
{
  return {*this, make_finding(Severity::Error, kind, std::move(message))};
}

FindingBuilder FindingBag::report_warning(FindingKind kind, std::string message)
{
  return {*this, make_finding(Severity::Warning, kind, std::move(message))};
}

FindingBuilder FindingBag::report_info(FindingKind kind, std::string message)
{
  return {*this, make_finding(Severity::Info, kind, std::move(message))};
}

void FindingBag::add(Finding && finding) { findings_.push_back(std::move(finding)); }

void FindingBag::add(const Finding & finding) { findings_.push_back(finding); }

std::vector<Finding> FindingBag::of_kind(FindingKind kind) const
{
  std::vector<Finding> result;
  std::copy_if(
    findings_.begin(), findings_.end(), std::back_inserter(result),
    [kind](const Finding & f) { return f.kind == kind; });
  return result;
}

std::vector<Finding> FindingBag::errors() const
{
  std::vector<Finding> result;
  std::copy_if(
    findings_.begin(), findings_.end(), std::back_inserter(result),
    [](const Finding & f) { return f.severity == Severity::Error; });
  return result;
}

std::vector<Finding> FindingBag::warnings() const
{
  std::vector<Finding> result;
  std::copy_if(
    findings_.begin(), findings_.end(), std::back_inserter(result),
    [](const Finding & f) { return f.severity == Severity::Warning; });
  return result;
}

bool FindingBag::has_errors() const
{
  return std::any_of(findings_.begin(), findings_.end(), [](const Finding & f) {
    return f.severity == Severity::Error;
  });
}

bool FindingBag::has_warnings() const
{
  return std::any_of(findings_.begin(), findings_.end(), [](const Finding & f) {
    return f.severity == Severity::Warning;
  });
}

void FindingBag::merge(FindingBag && other)
{
  findings_.insert(
    findings_.end(), std::make_move_iterator(other.findings_.begin()),
    std::make_move_iterator(other.findings_.end()));
  other.findings_.clear();
}

void FindingBag::merge(const FindingBag & other)
{
  findings_.insert(findings_.end(), other.findings_.begin(), other.findings_.end());
}

}  // namespace wfgraph
