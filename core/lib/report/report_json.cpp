// open_union/report/report_json.cpp - JSON serialization implementation
//
#include "open_union/report/report_json.hpp"

#include <nlohmann/json.hpp>

#include "open_union/trace/backtrace.hpp"

namespace open_union
{
namespace
{

using nlohmann::json;

json j_strings(const std::vector<std::string> & values)
{
  json out = json::array();
  for (const auto & value : values) {
    out.push_back(value);
  }
  return out;
}

}  // namespace

json to_json(const ErrorReport & report)
{
  return json{
    {"message", report.message},
    {"detail", report.detail},
    {"candidate", json{{"index", report.candidate_index}, {"count", report.candidate_count}}},
    {"context", j_strings(report.context)},
    {"causes", j_strings(report.causes)},
    {"backtrace",
     json{
       {"status", to_string(report.backtrace_status)},
       {"frames", j_strings(report.backtrace)}}}};
}

}  // namespace open_union
