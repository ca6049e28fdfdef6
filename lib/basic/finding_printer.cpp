// wfgraph/basic/finding_printer.cpp - Rust-style finding output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "wfgraph/basic/finding_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace wfgraph
{

FindingPrinter::FindingPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void FindingPrinter::print(const Finding & finding)
{
  // === Header line: warning[code]: message ===
  print_severity_header(finding);

  // === Subjects: --> first, then one per line ===
  print_subjects(finding);

  if (!finding.notes.empty() || finding.help_message) {
    fmt::print(os_, "{}\n", gutter_pipe());
  }

  for (const auto & note : finding.notes) {
    print_note(note);
  }

  if (finding.help_message) {
    print_help(*finding.help_message);
  }

  fmt::print(os_, "\n");
}

void FindingPrinter::print_all(const FindingBag & findings)
{
  std::vector<Finding> sorted;
  sorted.reserve(findings.size());
  std::copy(findings.begin(), findings.end(), std::back_inserter(sorted));

  std::stable_sort(sorted.begin(), sorted.end(), [](const Finding & a, const Finding & b) {
    return static_cast<int>(a.severity) < static_cast<int>(b.severity);
  });

  for (const auto & f : sorted) {
    print(f);
  }
}

void FindingPrinter::print_summary(const FindingBag & findings)
{
  const size_t errors = findings.errors().size();
  const size_t warnings = findings.warnings().size();
  const size_t other = findings.size() - errors - warnings;

  const std::string text = fmt::format(
    "{} error{}, {} warning{}, {} note{}", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s", other, other == 1 ? "" : "s");

  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::green) << text
        << rang::fg::reset << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", text);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void FindingPrinter::print_severity_header(const Finding & finding)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (finding.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << to_string(finding.severity) << "[" << finding.code() << "]" << rang::fg::reset << ": "
        << finding.message << rang::style::reset << "\n";
  } else {
    fmt::print(
      os_, "{}[{}]: {}\n", to_string(finding.severity), finding.code(), finding.message);
  }
}

void FindingPrinter::print_subjects(const Finding & finding)
{
  if (finding.subjects.empty()) {
    return;
  }

  fmt::print(os_, "{} {}\n", gutter_arrow(), finding.subjects.front());
  for (size_t i = 1; i < finding.subjects.size(); ++i) {
    fmt::print(os_, "      {}\n", finding.subjects[i]);
  }
}

void FindingPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

void FindingPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string FindingPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string FindingPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace wfgraph
