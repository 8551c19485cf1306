// open_union/trace/context_trace.cpp
//
#include "open_union/trace/context_trace.hpp"

#include <iterator>
#include <utility>

namespace open_union
{

ContextTrace ContextTrace::capture() { return ContextTrace(Backtrace::capture()); }

ContextTrace::ContextTrace(Backtrace backtrace) noexcept : backtrace_(std::move(backtrace)) {}

void ContextTrace::push(ContextMessage message) { messages_.push_back(std::move(message)); }

std::vector<std::string> ContextTrace::message_strings() const
{
  std::vector<std::string> result;
  result.reserve(messages_.size());
  for (const auto & message : messages_) {
    result.push_back(message.str());
  }
  return result;
}

void ContextTrace::render_context(fmt::memory_buffer & out) const
{
  if (messages_.empty()) {
    return;
  }
  fmt::format_to(std::back_inserter(out), "\n\nContext:");
  for (const auto & message : messages_) {
    fmt::format_to(std::back_inserter(out), "\n\t- {}", message);
  }
}

void ContextTrace::render_backtrace(fmt::memory_buffer & out) const
{
  if (!backtrace_.captured()) {
    return;
  }
  fmt::format_to(std::back_inserter(out), "\n\nBacktrace:\n{}", backtrace_.to_string());
}

}  // namespace open_union
