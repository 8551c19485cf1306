// open_union/basic/panic.hpp - Loud failure for violated internal invariants
//
// A panic means the library's own bookkeeping is inconsistent (for example a
// union whose stored payload matches none of its candidates). Continuing would
// be unsound, so the process is aborted in every build type.
//
// Usage:
//   OPEN_UNION_PANIC("take() found no candidate for payload '{}'", name);
//
#pragma once

#include <fmt/core.h>

#include <string_view>

namespace open_union::detail
{

/// Print the panic banner to stderr and abort.
[[noreturn]] void internal_panic(const char * file, int line, std::string_view message);

}  // namespace open_union::detail

#define OPEN_UNION_PANIC(...) \
  ::open_union::detail::internal_panic(__FILE__, __LINE__, ::fmt::format(__VA_ARGS__))
