// open_union/open_union.hpp - Umbrella header
//
#pragma once

#include "open_union/basic/context_message.hpp"
#include "open_union/basic/result.hpp"
#include "open_union/dispatch/any_error.hpp"
#include "open_union/dispatch/error_chain.hpp"
#include "open_union/dispatch/payload_traits.hpp"
#include "open_union/report/error_report.hpp"
#include "open_union/report/report_json.hpp"
#include "open_union/report/report_printer.hpp"
#include "open_union/trace/trace_config.hpp"
#include "open_union/type_set/algebra.hpp"
#include "open_union/type_set/type_list.hpp"
#include "open_union/union/enum_bridge.hpp"
#include "open_union/union/result_ops.hpp"
#include "open_union/union/union.hpp"
