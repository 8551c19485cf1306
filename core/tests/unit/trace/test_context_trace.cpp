// test_context_trace.cpp - Unit tests for the ordered context trace
//
#include <gtest/gtest.h>

#include <fmt/format.h>

#include <string>
#include <utility>
#include <vector>

#include "open_union/trace/context_trace.hpp"
#include "open_union/trace/trace_config.hpp"

namespace open_union
{

namespace
{

std::string rendered_context(const ContextTrace & trace)
{
  fmt::memory_buffer out;
  trace.render_context(out);
  return fmt::to_string(out);
}

}  // namespace

TEST(ContextTraceTest, StartsEmpty)
{
  const ContextTrace trace(Backtrace::disabled());
  EXPECT_TRUE(trace.empty());
  EXPECT_EQ(trace.size(), 0u);
  EXPECT_EQ(rendered_context(trace), "");
}

TEST(ContextTraceTest, RendersInPushOrder)
{
  ContextTrace trace(Backtrace::disabled());
  trace.push("A");
  trace.push(std::string("B"));

  EXPECT_EQ(rendered_context(trace), "\n\nContext:\n\t- A\n\t- B");
  EXPECT_EQ(trace.message_strings(), (std::vector<std::string>{"A", "B"}));
}

TEST(ContextTraceTest, StaticMessagesStayStatic)
{
  ContextTrace trace(Backtrace::disabled());
  trace.push("literal");
  ASSERT_EQ(trace.size(), 1u);
  EXPECT_TRUE(trace.messages()[0].is_static());
}

TEST(ContextTraceTest, DisabledBacktraceRendersNothing)
{
  const ContextTrace trace(Backtrace::disabled());
  fmt::memory_buffer out;
  trace.render_backtrace(out);
  EXPECT_EQ(out.size(), 0u);
}

TEST(ContextTraceTest, CapturedBacktraceRendersBlock)
{
  TraceConfig config;
  config.capture_backtrace = true;
  const ScopedTraceConfig scope(config);

  const ContextTrace trace = ContextTrace::capture();
  fmt::memory_buffer out;
  trace.render_backtrace(out);
  const std::string text = fmt::to_string(out);

  if (trace.backtrace().captured()) {
    EXPECT_EQ(text.rfind("\n\nBacktrace:\n", 0), 0u);
  } else {
    EXPECT_TRUE(text.empty());
  }
}

TEST(ContextTraceTest, MoveKeepsMessages)
{
  ContextTrace trace(Backtrace::disabled());
  trace.push("kept");
  const ContextTrace moved = std::move(trace);
  ASSERT_EQ(moved.size(), 1u);
  EXPECT_EQ(moved.messages()[0].view(), "kept");
}

}  // namespace open_union
