// wfgraph/basic/finding_printer.hpp
//
// Prints findings in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "wfgraph/basic/finding.hpp"

namespace wfgraph
{

/**
 * Prints findings in Rust-style format.
 *
 * Produces output like:
 *   warning[orphan-input]: artifact 'inputs/misc/foo.csv' is read but no script writes it
 *     --> inputs/misc/foo.csv
 *         demand
 *         |
 *         = note: read by demand via (get_foo)
 *         = help: add the producing script to the trace set, or list ...
 */
class FindingPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit FindingPrinter(std::ostream & os, bool use_color = true);

  void print(const Finding & finding);

  /**
   * Print all findings, errors first, then in reporting order.
   */
  void print_all(const FindingBag & findings);

  /**
   * Print the one-line tally, e.g. "1 error, 2 warnings".
   */
  void print_summary(const FindingBag & findings);

private:
  void print_severity_header(const Finding & finding);
  void print_subjects(const Finding & finding);
  void print_note(std::string_view message);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace wfgraph
