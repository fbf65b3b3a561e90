#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include "zktable/config.hpp"

using namespace zktable;

class ReaderConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        unsetenv("ZKTABLE_ENDPOINT");
        unsetenv("ZKTABLE_BASE_ZNODE");
        unsetenv("ZKTABLE_TABLE_ZNODE");
        unsetenv("ZKTABLE_CALL_TIMEOUT_MS");
    }
};

TEST_F(ReaderConfigTest, FromEnv_NothingSet_ShouldUseDefaults) {
    auto config = ReaderConfig::from_env();

    EXPECT_EQ(config.endpoint, "localhost:2181");
    EXPECT_EQ(config.tables_root(), "/wasp/table");
    EXPECT_EQ(config.call_timeout.count(), 0);
}

TEST_F(ReaderConfigTest, FromEnv_Overrides_ShouldBeApplied) {
    setenv("ZKTABLE_ENDPOINT", "http://zk-gateway:9000", 1);
    setenv("ZKTABLE_BASE_ZNODE", "/cluster-a", 1);
    setenv("ZKTABLE_TABLE_ZNODE", "tables", 1);
    setenv("ZKTABLE_CALL_TIMEOUT_MS", "1500", 1);

    auto config = ReaderConfig::from_env();

    EXPECT_EQ(config.endpoint, "http://zk-gateway:9000");
    EXPECT_EQ(config.tables_root(), "/cluster-a/tables");
    EXPECT_EQ(config.call_timeout.count(), 1500);
}

TEST_F(ReaderConfigTest, FromEnv_NonNumericTimeout_ShouldThrowInvalidArgument) {
    setenv("ZKTABLE_CALL_TIMEOUT_MS", "soon", 1);
    EXPECT_THROW(ReaderConfig::from_env(), InvalidArgumentError);
}

TEST_F(ReaderConfigTest, FromEnv_NegativeTimeout_ShouldThrowInvalidArgument) {
    setenv("ZKTABLE_CALL_TIMEOUT_MS", "-5", 1);
    EXPECT_THROW(ReaderConfig::from_env(), InvalidArgumentError);
}

TEST_F(ReaderConfigTest, FromEnv_HugeTimeout_ShouldThrowInvalidArgument) {
    // Fits in long long but overflows once converted to clock ticks
    setenv("ZKTABLE_CALL_TIMEOUT_MS", "9223372036854775807", 1);
    EXPECT_THROW(ReaderConfig::from_env(), InvalidArgumentError);
}

TEST_F(ReaderConfigTest, FromEnv_TimeoutJustAboveCap_ShouldThrowInvalidArgument) {
    setenv("ZKTABLE_CALL_TIMEOUT_MS", std::to_string(MAX_CALL_TIMEOUT.count() + 1).c_str(), 1);
    EXPECT_THROW(ReaderConfig::from_env(), InvalidArgumentError);
}

TEST_F(ReaderConfigTest, FromEnv_TimeoutAtCap_ShouldBeAccepted) {
    setenv("ZKTABLE_CALL_TIMEOUT_MS", std::to_string(MAX_CALL_TIMEOUT.count()).c_str(), 1);
    EXPECT_EQ(ReaderConfig::from_env().call_timeout, MAX_CALL_TIMEOUT);
}

TEST(CheckedCallTimeoutTest, OutOfRange_ShouldThrowInvalidArgument) {
    EXPECT_THROW(checked_call_timeout(std::chrono::milliseconds(-1)), InvalidArgumentError);
    EXPECT_THROW(checked_call_timeout(MAX_CALL_TIMEOUT + std::chrono::milliseconds(1)),
                 InvalidArgumentError);
    EXPECT_EQ(checked_call_timeout(std::chrono::milliseconds(0)).count(), 0);
}

TEST_F(ReaderConfigTest, TablesRoot_BaseIsRoot_ShouldNotDoubleSlash) {
    ReaderConfig config;
    config.base_znode = "/";
    EXPECT_EQ(config.tables_root(), "/table");
}
