// wfgraph/basic/finding.hpp - Findings reported by validation and the driver
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wfgraph
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/**
 * Finding codes. The string form (see to_code) is what users see.
 */
enum class FindingKind : uint8_t {
  OrphanInput,
  Cycle,
  DanglingOutput,
  NoOutputs,
  ExternalProduced,
  UnknownTarget,
  CyclicDependency,
  TraceFailure,
  BuildFailure,
  Config,
};

[[nodiscard]] const char * to_code(FindingKind kind) noexcept;
[[nodiscard]] const char * to_string(Severity severity) noexcept;

struct Finding
{
  FindingKind kind = FindingKind::Config;
  Severity severity = Severity::Error;
  std::string message;

  /// Scripts and/or artifact keys the finding is about (sorted by reporter)
  std::vector<std::string> subjects;

  std::vector<std::string> notes;
  std::optional<std::string> help_message;

  [[nodiscard]] const char * code() const noexcept { return to_code(kind); }
};

class FindingBag;

// ============================================================================
// FindingBuilder
// ============================================================================

/**
 * Builds a finding fluently and registers it in the bag on destruction (RAII).
 */
class FindingBuilder
{
public:
  FindingBuilder(FindingBag & bag, Finding finding);

  FindingBuilder(const FindingBuilder &) = delete;
  FindingBuilder & operator=(const FindingBuilder &) = delete;

  FindingBuilder(FindingBuilder && other) noexcept;

  ~FindingBuilder();

  FindingBuilder & with_subject(std::string subject);
  FindingBuilder & with_subjects(std::vector<std::string> subjects);
  FindingBuilder & with_note(std::string note);
  FindingBuilder & with_help(std::string help_msg);

private:
  FindingBag & bag_;
  Finding finding_;
  bool active_ = true;
};

// ============================================================================
// FindingBag
// ============================================================================

class FindingBag
{
public:
  FindingBag() = default;

  FindingBuilder report_error(FindingKind kind, std::string message);
  FindingBuilder report_warning(FindingKind kind, std::string message);
  FindingBuilder report_info(FindingKind kind, std::string message);

  void add(Finding && finding);
  void add(const Finding & finding);

  [[nodiscard]] const std::vector<Finding> & all() const { return findings_; }
  [[nodiscard]] bool empty() const { return findings_.empty(); }
  [[nodiscard]] size_t size() const { return findings_.size(); }

  [[nodiscard]] std::vector<Finding> of_kind(FindingKind kind) const;
  [[nodiscard]] std::vector<Finding> errors() const;
  [[nodiscard]] std::vector<Finding> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  void merge(FindingBag && other);
  void merge(const FindingBag & other);

  [[nodiscard]] auto begin() const { return findings_.begin(); }
  [[nodiscard]] auto end() const { return findings_.end(); }

private:
  std::vector<Finding> findings_;
};

}  // namespace wfgraph
