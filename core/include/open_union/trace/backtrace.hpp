// open_union/trace/backtrace.hpp - One-time call stack snapshot
//
// Captured once when a union is first constructed and then moved, never
// copied or recaptured, through every narrow/widen/subset so it keeps
// pointing at the error's true origin.
//
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <gsl/span>

namespace open_union
{

enum class BacktraceStatus : uint8_t {
  Captured,     ///< Frames were recorded
  Disabled,     ///< Capture turned off by configuration
  Unsupported,  ///< Platform could not produce frames
};

struct BacktraceFrame
{
  const void * address = nullptr;
  std::string symbol;
};

class Backtrace
{
public:
  /// Capture the current stack if the trace configuration allows it
  [[nodiscard]] static Backtrace capture();

  /// A backtrace that was deliberately not captured
  [[nodiscard]] static Backtrace disabled() noexcept;

  Backtrace(const Backtrace &) = delete;
  Backtrace & operator=(const Backtrace &) = delete;
  Backtrace(Backtrace &&) noexcept = default;
  Backtrace & operator=(Backtrace &&) noexcept = default;
  ~Backtrace() = default;

  [[nodiscard]] BacktraceStatus status() const noexcept { return status_; }
  [[nodiscard]] bool captured() const noexcept { return status_ == BacktraceStatus::Captured; }

  [[nodiscard]] gsl::span<const BacktraceFrame> frames() const noexcept
  {
    return {frames_.data(), frames_.size()};
  }

  /// One "  <n>: <symbol>" line per frame
  [[nodiscard]] std::string to_string() const;

private:
  Backtrace(BacktraceStatus status, std::vector<BacktraceFrame> frames) noexcept;

  BacktraceStatus status_;
  std::vector<BacktraceFrame> frames_;
};

[[nodiscard]] const char * to_string(BacktraceStatus status) noexcept;

}  // namespace open_union
