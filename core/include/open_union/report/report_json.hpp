// open_union/report/report_json.hpp - JSON serialization for error reports
//
#pragma once

#include <nlohmann/json.hpp>

#include "open_union/report/error_report.hpp"

namespace open_union
{

/**
 * Serialize an error report to JSON.
 *
 * Produces:
 *   {
 *     "message": "...", "detail": "...",
 *     "candidate": {"index": 1, "count": 3},
 *     "context": ["..."], "causes": ["..."],
 *     "backtrace": {"status": "captured", "frames": ["..."]}
 *   }
 */
[[nodiscard]] nlohmann::json to_json(const ErrorReport & report);

}  // namespace open_union
