// open_union/report/report_printer.hpp
//
// Prints error reports with cause chain, context and backtrace in
// Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "open_union/report/error_report.hpp"

namespace open_union
{

/**
 * Prints error reports in Rust-style format.
 *
 * Produces output like:
 *   error: connection refused
 *     = caused by: socket closed by peer
 *     |
 *   Context:
 *     - From func2
 *     - From func3
 *
 * A "Backtrace:" block follows when requested and frames were captured.
 */
class ReportPrinter
{
public:
  /**
   * Create a report printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit ReportPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single report.
   *
   * @param with_backtrace Also print the captured frames, if any
   */
  void print(const ErrorReport & report, bool with_backtrace = false);

  /// Print a union's report (see Union::report())
  template <typename UnionT>
  void print_union(const UnionT & error, bool with_backtrace = false)
  {
    print(error.report(), with_backtrace);
  }

private:
  void print_header(std::string_view message);
  void print_cause(std::string_view cause);
  void print_section(std::string_view title);

  [[nodiscard]] std::string_view gutter_pipe() const { return "  |"; }

  std::ostream & os_;
  bool use_color_;
};

}  // namespace open_union
