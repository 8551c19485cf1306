// open_union/report/error_report.hpp - Candidate-list-independent error snapshot
//
// Union<Ts...>::report() flattens a union into this plain structure so that
// printers and serializers do not need to be templates over the candidates.
//
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "open_union/trace/backtrace.hpp"

namespace open_union
{

struct ErrorReport
{
  std::string message;  // Display rendering of the payload
  std::string detail;   // Debug rendering of the payload

  std::size_t candidate_index = 0;  // position of the payload in its list
  std::size_t candidate_count = 0;

  std::vector<std::string> context;  // oldest first
  std::vector<std::string> causes;   // outermost first

  BacktraceStatus backtrace_status = BacktraceStatus::Disabled;
  std::vector<std::string> backtrace;
};

}  // namespace open_union
