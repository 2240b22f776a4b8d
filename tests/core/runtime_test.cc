// =============================================================================
// Anchor Explain - Runtime Initialization Tests
// =============================================================================

#include "anchor_explain/anchor_explain.h"

#include <spdlog/spdlog.h>

#include <gtest/gtest.h>

namespace anchor {
namespace {

class RuntimeTest : public ::testing::Test {
  protected:
    void TearDown() override {
        shutdown();
        spdlog::set_level(spdlog::level::warn);
    }
};

TEST_F(RuntimeTest, VersionString) {
    EXPECT_EQ(Version::string(), "0.3.0");
}

TEST_F(RuntimeTest, InitializeSetsLogLevel) {
    RuntimeConfig config;
    config.log_level = "error";
    ASSERT_TRUE(initialize(config));
    EXPECT_TRUE(isInitialized());
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);

    // Second initialization is ignored
    RuntimeConfig other;
    other.log_level = "trace";
    EXPECT_TRUE(initialize(other));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
}

TEST_F(RuntimeTest, DebugOutputOverridesLevel) {
    RuntimeConfig config;
    config.log_level = "error";
    config.enable_debug_output = true;
    ASSERT_TRUE(initialize(config));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
}

TEST_F(RuntimeTest, UnknownLevelIsRejected) {
    RuntimeConfig config;
    config.log_level = "chatty";
    auto result = initialize(config);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidConfig);
    EXPECT_FALSE(isInitialized());
}

TEST_F(RuntimeTest, ShutdownResetsState) {
    ASSERT_TRUE(initialize());
    shutdown();
    EXPECT_FALSE(isInitialized());
}

}  // namespace
}  // namespace anchor
