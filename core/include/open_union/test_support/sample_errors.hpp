// open_union/test_support/sample_errors.hpp - payload types for unit/integration tests
//
#pragma once

#include <fmt/format.h>

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace open_union::test_support
{

class IoError : public std::runtime_error
{
public:
  explicit IoError(const std::string & message) : std::runtime_error(message) {}
};

class NotEnoughMemory : public std::runtime_error
{
public:
  NotEnoughMemory() : std::runtime_error("not enough memory") {}
};

class Timeout : public std::runtime_error
{
public:
  Timeout() : std::runtime_error("operation timed out") {}
};

/// Carries the failure of the last attempt as its nested cause
class RetriesExhausted : public std::runtime_error, public std::nested_exception
{
public:
  explicit RetriesExhausted(int attempts)
  : std::runtime_error("retries exhausted"), attempts_(attempts)
  {
  }

  [[nodiscard]] int attempts() const noexcept { return attempts_; }

private:
  int attempts_;
};

/// Build a RetriesExhausted whose nested cause is `last_failure`
[[nodiscard]] inline RetriesExhausted make_retries_exhausted(
  int attempts, const std::exception_ptr & last_failure)
{
  try {
    std::rethrow_exception(last_failure);
  } catch (...) {
    return RetriesExhausted(attempts);
  }
}

/// Plain value payload rendered through fmt::formatter
struct Coordinate
{
  int x = 0;
  int y = 0;
};

/// Move-only payload
class OwnedBuffer
{
public:
  explicit OwnedBuffer(std::string text) : text_(std::make_unique<std::string>(std::move(text))) {}

  [[nodiscard]] const std::string & text() const noexcept { return *text_; }

private:
  std::unique_ptr<std::string> text_;
};

}  // namespace open_union::test_support

template <>
struct fmt::formatter<open_union::test_support::Coordinate>
{
  constexpr auto parse(fmt::format_parse_context & ctx) -> decltype(ctx.begin())
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const open_union::test_support::Coordinate & value, FormatContext & ctx) const
    -> decltype(ctx.out())
  {
    return fmt::format_to(ctx.out(), "({}, {})", value.x, value.y);
  }
};

template <>
struct fmt::formatter<open_union::test_support::OwnedBuffer>
{
  constexpr auto parse(fmt::format_parse_context & ctx) -> decltype(ctx.begin())
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const open_union::test_support::OwnedBuffer & value, FormatContext & ctx) const
    -> decltype(ctx.out())
  {
    return fmt::format_to(ctx.out(), "buffer[{}]", value.text());
  }
};
