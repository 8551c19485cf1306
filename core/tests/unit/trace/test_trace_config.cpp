// test_trace_config.cpp - Unit tests for open_union.yaml and environment overrides
//
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include "open_union/trace/trace_config.hpp"

namespace open_union
{

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & path, const std::string & content)
{
  std::ofstream f(path);
  f << content;
}

/// Sets an environment variable for the lifetime of the object
struct ScopedEnv
{
  std::string name;
  ScopedEnv(std::string n, const char * value) : name(std::move(n))
  {
    ::setenv(name.c_str(), value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name.c_str()); }
  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv & operator=(const ScopedEnv &) = delete;
};

}  // namespace

// ============================================================================
// YAML loading
// ============================================================================

TEST(TraceConfigTest, LoadsAllKeys)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "open_union_cfg_all");
  const auto file = dir.path / "open_union.yaml";
  write_file(file, "trace:\n  backtrace: false\n  max_frames: 16\n  display_context: true\n");

  const auto result = load_trace_config(file);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_FALSE(result.config.capture_backtrace);
  EXPECT_EQ(result.config.max_backtrace_frames, 16u);
  EXPECT_TRUE(result.config.display_context);
}

TEST(TraceConfigTest, MissingKeysKeepDefaults)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "open_union_cfg_defaults");
  const auto file = dir.path / "open_union.yaml";
  write_file(file, "trace:\n  max_frames: 8\n  colour: blue\nother: 1\n");

  const auto result = load_trace_config(file);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.capture_backtrace);
  EXPECT_EQ(result.config.max_backtrace_frames, 8u);
  EXPECT_FALSE(result.config.display_context);
}

TEST(TraceConfigTest, FileWithoutTraceSectionIsDefault)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "open_union_cfg_empty");
  const auto file = dir.path / "open_union.yaml";
  write_file(file, "unrelated: true\n");

  const auto result = load_trace_config(file);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.config.max_backtrace_frames, TraceConfig{}.max_backtrace_frames);
}

TEST(TraceConfigTest, MissingFileFails)
{
  const auto result =
    load_trace_config(std::filesystem::temp_directory_path() / "open_union_missing.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(TraceConfigTest, MalformedValuesFail)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "open_union_cfg_bad");
  const auto file = dir.path / "open_union.yaml";

  write_file(file, "trace:\n  backtrace: maybe\n");
  EXPECT_FALSE(load_trace_config(file).success);

  write_file(file, "trace:\n  max_frames: 0\n");
  const auto zero = load_trace_config(file);
  EXPECT_FALSE(zero.success);
  EXPECT_NE(zero.error.find("max_frames"), std::string::npos);

  write_file(file, "trace: [1, 2]\n");
  EXPECT_FALSE(load_trace_config(file).success);

  write_file(file, "trace: {backtrace: true\n");
  EXPECT_FALSE(load_trace_config(file).success);
}

TEST(TraceConfigTest, FindSearchesUpward)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "open_union_cfg_find");
  const auto nested = dir.path / "a" / "b";
  std::filesystem::create_directories(nested);
  write_file(dir.path / "open_union.yaml", "trace:\n  backtrace: true\n");

  const auto found = find_trace_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(
    std::filesystem::weakly_canonical(*found),
    std::filesystem::weakly_canonical(dir.path / "open_union.yaml"));
}

// ============================================================================
// Environment and process-wide state
// ============================================================================

TEST(TraceConfigTest, EnvironmentOverridesSwitches)
{
  const ScopedEnv backtrace("OPEN_UNION_BACKTRACE", "off");
  const ScopedEnv display("OPEN_UNION_DISPLAY_CONTEXT", "1");

  const TraceConfig config = apply_environment(TraceConfig{});
  EXPECT_FALSE(config.capture_backtrace);
  EXPECT_TRUE(config.display_context);
}

TEST(TraceConfigTest, EnvironmentValuesAreCaseInsensitive)
{
  const ScopedEnv backtrace("OPEN_UNION_BACKTRACE", "FALSE");
  EXPECT_FALSE(apply_environment(TraceConfig{}).capture_backtrace);
}

TEST(TraceConfigTest, UnsetEnvironmentKeepsBase)
{
  ::unsetenv("OPEN_UNION_BACKTRACE");
  ::unsetenv("OPEN_UNION_DISPLAY_CONTEXT");

  TraceConfig base;
  base.capture_backtrace = false;
  base.display_context = true;
  const TraceConfig config = apply_environment(base);
  EXPECT_FALSE(config.capture_backtrace);
  EXPECT_TRUE(config.display_context);
}

TEST(TraceConfigTest, ScopedConfigRestoresPrevious)
{
  const TraceConfig before = current_trace_config();
  {
    TraceConfig custom;
    custom.max_backtrace_frames = 3;
    custom.display_context = !before.display_context;
    const ScopedTraceConfig scope(custom);
    EXPECT_EQ(current_trace_config().max_backtrace_frames, 3u);
    EXPECT_EQ(current_trace_config().display_context, !before.display_context);
  }
  EXPECT_EQ(current_trace_config().max_backtrace_frames, before.max_backtrace_frames);
  EXPECT_EQ(current_trace_config().display_context, before.display_context);
}

}  // namespace open_union
