// test_result_ops.cpp - Unit tests for context and reshaping on results
//
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "open_union/test_support/sample_errors.hpp"
#include "open_union/trace/trace_config.hpp"
#include "open_union/union/result_ops.hpp"

namespace open_union
{

using test_support::IoError;
using test_support::Timeout;

static_assert(is_union_v<Union<int>>);
static_assert(is_union_v<const Union<int> &>);
static_assert(!is_union_v<int>);

static_assert(std::is_same_v<
              decltype(context(std::declval<Result<int, IoError>>(), "ctx")),
              Result<int, Union<IoError>>>);
static_assert(std::is_same_v<
              decltype(narrow<IoError>(std::declval<Result<int, Union<IoError, Timeout>>>())),
              Result<IoError, Result<int, Union<Timeout>>>>);

class ResultOpsTest : public ::testing::Test
{
protected:
  ResultOpsTest() : scope_(make_config()) {}

  static TraceConfig make_config()
  {
    TraceConfig config;
    config.capture_backtrace = false;
    return config;
  }

private:
  ScopedTraceConfig scope_;
};

// ============================================================================
// Context
// ============================================================================

TEST_F(ResultOpsTest, ContextOnSuccessIsIgnored)
{
  Result<int, Union<IoError>> ok = 3;
  auto result = context(std::move(ok), "unused");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, 3);
}

TEST_F(ResultOpsTest, ContextOnFailureAppends)
{
  Result<int, Union<IoError>> failed = make_unexpected(traced(IoError("boom")).context("inner"));
  auto result = context(std::move(failed), "outer");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().trace().message_strings(), (std::vector<std::string>{"inner", "outer"}));
}

TEST_F(ResultOpsTest, ContextLiftsBareErrors)
{
  Result<void, IoError> failed = make_unexpected(IoError("boom"));
  Result<void, Union<IoError>> lifted = context(std::move(failed), "while saving");

  ASSERT_FALSE(lifted);
  EXPECT_STREQ(lifted.error()->what(), "boom");
  EXPECT_EQ(lifted.error().trace().size(), 1u);
}

TEST_F(ResultOpsTest, ContextLiftsBareSuccess)
{
  Result<std::string, IoError> ok = std::string("fine");
  auto lifted = context(std::move(ok), "unused");
  ASSERT_TRUE(lifted);
  EXPECT_EQ(*lifted, "fine");
}

TEST_F(ResultOpsTest, WithContextOnlyRunsOnFailure)
{
  int calls = 0;
  auto make_message = [&calls] {
    ++calls;
    return std::string("lazy");
  };

  Result<int, Union<IoError>> ok = 1;
  (void)with_context(std::move(ok), make_message);
  EXPECT_EQ(calls, 0);

  Result<int, Union<IoError>> failed = make_unexpected(traced(IoError("x")));
  auto result = with_context(std::move(failed), make_message);
  EXPECT_EQ(calls, 1);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().trace().messages()[0].view(), "lazy");

  Result<int, Timeout> bare = make_unexpected(Timeout());
  auto lifted = with_context(std::move(bare), make_message);
  EXPECT_EQ(calls, 2);
  ASSERT_FALSE(lifted);
  EXPECT_TRUE(lifted.error().holds<Timeout>());
}

// ============================================================================
// Reshaping
// ============================================================================

TEST_F(ResultOpsTest, WidenResult)
{
  Result<int, Union<Timeout>> failed = make_unexpected(traced(Timeout()).context("retry"));
  Result<int, Union<IoError, Timeout>> wide = widen<IoError, Timeout>(std::move(failed));

  ASSERT_FALSE(wide);
  EXPECT_EQ(wide.error().index(), 1u);
  EXPECT_EQ(wide.error().trace().size(), 1u);
}

TEST_F(ResultOpsTest, NarrowResultMatchingError)
{
  Result<int, Union<IoError, Timeout>> failed =
    make_unexpected(Union<IoError, Timeout>(Timeout()));
  auto narrowed = narrow<Timeout>(std::move(failed));
  ASSERT_TRUE(narrowed);
  EXPECT_STREQ(narrowed->what(), "operation timed out");
}

TEST_F(ResultOpsTest, NarrowResultOtherError)
{
  Result<int, Union<IoError, Timeout>> failed =
    make_unexpected(Union<IoError, Timeout>(IoError("io")));
  auto narrowed = narrow<Timeout>(std::move(failed));
  ASSERT_FALSE(narrowed);

  Result<int, Union<IoError>> & rest = narrowed.error();
  ASSERT_FALSE(rest);
  EXPECT_TRUE(rest.error().holds<IoError>());
}

TEST_F(ResultOpsTest, NarrowResultSuccessLandsInFailureArm)
{
  Result<int, Union<IoError, Timeout>> ok = 9;
  auto narrowed = narrow<Timeout>(std::move(ok));
  ASSERT_FALSE(narrowed);
  ASSERT_TRUE(narrowed.error());
  EXPECT_EQ(*narrowed.error(), 9);
}

TEST_F(ResultOpsTest, IntoUnion)
{
  Result<int, Timeout> bare = make_unexpected(Timeout());
  Result<int, Union<IoError, Timeout, bool>> lifted =
    into_union<IoError, Timeout, bool>(std::move(bare));
  ASSERT_FALSE(lifted);
  EXPECT_TRUE(lifted.error().holds<Timeout>());
}

TEST_F(ResultOpsTest, TracedWrapsBareError)
{
  const IoError error("copy me");
  Union<IoError> wrapped = traced(error);
  EXPECT_STREQ(wrapped->what(), "copy me");
  EXPECT_TRUE(wrapped.trace().empty());
}

// ============================================================================
// Optionals
// ============================================================================

TEST_F(ResultOpsTest, OkOrAbsentWithValue)
{
  auto result = ok_or_absent(std::optional<int>(4), "should be present");
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, 4);
}

TEST_F(ResultOpsTest, OkOrAbsentWithoutValue)
{
  auto result = ok_or_absent<int>(std::nullopt, "This value should be some");
  ASSERT_FALSE(result);
  EXPECT_STREQ(result.error()->what(), "value was absent");
  EXPECT_EQ(result.error().trace().messages()[0].view(), "This value should be some");

  auto outer = context(std::move(result), "Some context");
  ASSERT_FALSE(outer);
  AbsentValueError inner = std::move(outer.error()).into_inner();
  EXPECT_STREQ(inner.what(), "value was absent");
}

}  // namespace open_union
