// test_error_chain.cpp - Unit tests for nested-exception chain walking
//
#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "open_union/dispatch/error_chain.hpp"
#include "open_union/test_support/sample_errors.hpp"

namespace open_union
{

namespace
{

std::exception_ptr nested_three_levels()
{
  try {
    try {
      try {
        throw std::runtime_error("disk unplugged");
      } catch (...) {
        std::throw_with_nested(std::runtime_error("write failed"));
      }
    } catch (...) {
      std::throw_with_nested(std::runtime_error("save failed"));
    }
  } catch (...) {
    return std::current_exception();
  }
  return nullptr;
}

}  // namespace

TEST(ErrorChainTest, NullCauseGivesEmptyChain)
{
  EXPECT_TRUE(describe_chain(nullptr).empty());
}

TEST(ErrorChainTest, SingleException)
{
  const auto chain = describe_chain(std::make_exception_ptr(test_support::Timeout()));
  EXPECT_EQ(chain, std::vector<std::string>{"operation timed out"});
}

TEST(ErrorChainTest, NestedExceptionsOutermostFirst)
{
  const auto chain = describe_chain(nested_three_levels());
  const std::vector<std::string> expected{"save failed", "write failed", "disk unplugged"};
  EXPECT_EQ(chain, expected);
}

TEST(ErrorChainTest, NonStandardExceptionIsReportedAndEndsTheChain)
{
  const auto chain = describe_chain(std::make_exception_ptr(42));
  EXPECT_EQ(chain, std::vector<std::string>{"unknown exception"});
}

}  // namespace open_union
