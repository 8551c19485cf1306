// open_union/trace/context_trace.hpp - Ordered diagnostic context of a union
//
#pragma once

#include <fmt/format.h>

#include <string>
#include <vector>

#include "open_union/basic/context_message.hpp"
#include "open_union/trace/backtrace.hpp"

namespace open_union
{

/**
 * Append-only list of context messages plus the backtrace captured when the
 * owning union was created.
 *
 * Messages render in push order: the root cause's own context first, each
 * outer call site after it. Moving a ContextTrace keeps the same message
 * storage and backtrace frames.
 */
class ContextTrace
{
public:
  /// Empty context with a fresh backtrace (subject to TraceConfig)
  [[nodiscard]] static ContextTrace capture();

  explicit ContextTrace(Backtrace backtrace) noexcept;

  ContextTrace(const ContextTrace &) = delete;
  ContextTrace & operator=(const ContextTrace &) = delete;
  ContextTrace(ContextTrace &&) noexcept = default;
  ContextTrace & operator=(ContextTrace &&) noexcept = default;
  ~ContextTrace() = default;

  void push(ContextMessage message);

  [[nodiscard]] const std::vector<ContextMessage> & messages() const noexcept { return messages_; }
  [[nodiscard]] bool empty() const noexcept { return messages_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return messages_.size(); }

  [[nodiscard]] const Backtrace & backtrace() const noexcept { return backtrace_; }

  /// Messages copied out as plain strings
  [[nodiscard]] std::vector<std::string> message_strings() const;

  /// Append "\n\nContext:" and one "\n\t- <message>" line per message (if any)
  void render_context(fmt::memory_buffer & out) const;

  /// Append "\n\nBacktrace:\n" and the frames (only if captured)
  void render_backtrace(fmt::memory_buffer & out) const;

private:
  std::vector<ContextMessage> messages_;
  Backtrace backtrace_;
};

}  // namespace open_union
