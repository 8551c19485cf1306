// open_union/trace/backtrace.cpp - Stack capture through <execinfo.h>
//
#include "open_union/trace/backtrace.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <iterator>
#include <memory>
#include <utility>

#include "open_union/trace/trace_config.hpp"

#if defined(__GLIBC__) || defined(__APPLE__)
#include <execinfo.h>
#define OPEN_UNION_HAS_EXECINFO 1
#else
#define OPEN_UNION_HAS_EXECINFO 0
#endif

namespace open_union
{

namespace
{

#if OPEN_UNION_HAS_EXECINFO
struct FreeDeleter
{
  void operator()(char ** symbols) const noexcept { std::free(symbols); }
};
#endif

}  // namespace

Backtrace::Backtrace(BacktraceStatus status, std::vector<BacktraceFrame> frames) noexcept
: status_(status), frames_(std::move(frames))
{
}

Backtrace Backtrace::disabled() noexcept { return Backtrace(BacktraceStatus::Disabled, {}); }

Backtrace Backtrace::capture()
{
  const TraceConfig config = current_trace_config();
  if (!config.capture_backtrace || config.max_backtrace_frames == 0) {
    return disabled();
  }

#if OPEN_UNION_HAS_EXECINFO
  std::vector<void *> addresses(config.max_backtrace_frames);
  const int depth = ::backtrace(addresses.data(), static_cast<int>(addresses.size()));
  if (depth <= 0) {
    return Backtrace(BacktraceStatus::Unsupported, {});
  }

  const std::unique_ptr<char *, FreeDeleter> symbols(::backtrace_symbols(addresses.data(), depth));

  std::vector<BacktraceFrame> frames;
  frames.reserve(static_cast<std::size_t>(depth));
  for (int i = 0; i < depth; ++i) {
    BacktraceFrame frame;
    frame.address = addresses[static_cast<std::size_t>(i)];
    if (symbols && symbols.get()[i] != nullptr) {
      frame.symbol = symbols.get()[i];
    } else {
      frame.symbol = fmt::format("{}", frame.address);
    }
    frames.push_back(std::move(frame));
  }
  return Backtrace(BacktraceStatus::Captured, std::move(frames));
#else
  return Backtrace(BacktraceStatus::Unsupported, {});
#endif
}

std::string Backtrace::to_string() const
{
  fmt::memory_buffer out;
  for (std::size_t i = 0; i < frames_.size(); ++i) {
    if (i != 0) {
      fmt::format_to(std::back_inserter(out), "\n");
    }
    fmt::format_to(std::back_inserter(out), "  {}: {}", i, frames_[i].symbol);
  }
  return fmt::to_string(out);
}

const char * to_string(BacktraceStatus status) noexcept
{
  switch (status) {
    case BacktraceStatus::Captured:
      return "captured";
    case BacktraceStatus::Disabled:
      return "disabled";
    case BacktraceStatus::Unsupported:
      return "unsupported";
  }
  return "unsupported";
}

}  // namespace open_union
