// open_union/report/report_printer.cpp - Rust-style error report output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "open_union/report/report_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>

#include "open_union/trace/backtrace.hpp"

namespace open_union
{

ReportPrinter::ReportPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void ReportPrinter::print(const ErrorReport & report, bool with_backtrace)
{
  // === Header line: error: message ===
  print_header(report.message);

  // === Cause chain, outermost first ===
  for (const auto & cause : report.causes) {
    print_cause(cause);
  }

  // === Context, oldest first ===
  if (!report.context.empty()) {
    fmt::print(os_, "{}\n", gutter_pipe());
    print_section("Context");
    for (const auto & message : report.context) {
      fmt::print(os_, "  - {}\n", message);
    }
  }

  // === Backtrace ===
  if (with_backtrace) {
    if (report.backtrace_status == BacktraceStatus::Captured) {
      print_section("Backtrace");
      for (std::size_t i = 0; i < report.backtrace.size(); ++i) {
        fmt::print(os_, "  {}: {}\n", i, report.backtrace[i]);
      }
    } else {
      fmt::print(os_, "Backtrace: {}\n", to_string(report.backtrace_status));
    }
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

// =============================================================================
// Private helpers
// =============================================================================

void ReportPrinter::print_header(std::string_view message)
{
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << "error" << rang::fg::reset << ": " << message
        << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "error: {}\n", message);
  }
}

void ReportPrinter::print_cause(std::string_view cause)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "  = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "caused by: {}\n", cause);
  } else {
    fmt::print(os_, "  = caused by: {}\n", cause);
  }
}

void ReportPrinter::print_section(std::string_view title)
{
  if (use_color_) {
    os_ << rang::style::bold << title << ":" << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}:\n", title);
  }
}

}  // namespace open_union
