// tests/test_layer3_device/test_ljm_error.cpp
/**
 * @file test_ljm_error.cpp
 * @brief Unit tests for LjmError classification.
 */
#include <stdexcept>
#include <string>

#include "device/ljm_error.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ljdaq::device::LjmError;
using ::testing::HasSubstr;

TEST(LjmErrorTest, CarriesCodeNameAndContext)
{
    const LjmError e(1224, "LJME_DEVICE_NOT_OPEN", "Close()");
    EXPECT_EQ(e.code(), 1224);
    EXPECT_EQ(e.name(), "LJME_DEVICE_NOT_OPEN");
    EXPECT_EQ(e.context(), "Close()");
    EXPECT_STREQ(e.what(), "Close(): LJME_DEVICE_NOT_OPEN (1224)");
}

TEST(LjmErrorTest, IsARuntimeError)
{
    EXPECT_THROW(throw LjmError(1, "X", "ctx"), std::runtime_error);
}

TEST(LjmErrorTest, DeviceNotOpenIsMatchedByName)
{
    EXPECT_TRUE(LjmError(1224, "LJME_DEVICE_NOT_OPEN", "").is_device_not_open());
    EXPECT_FALSE(LjmError(1227, "LJME_DEVICE_NOT_FOUND", "").is_device_not_open());
    EXPECT_FALSE(LjmError(1224, "LJME_DEVICE_NOT_OPEN", "").is_stream_not_running());
}

/// Both the device-side and the library-side spelling count as "not running".
TEST(LjmErrorTest, StreamNotRunningMatchesBothSpellings)
{
    EXPECT_TRUE(LjmError(2620, "STREAM_NOT_RUNNING", "").is_stream_not_running());
    EXPECT_TRUE(LjmError(1303, "LJME_STREAM_NOT_RUNNING", "").is_stream_not_running());
    EXPECT_FALSE(LjmError(2605, "STREAM_NOT_RUNNING_YET", "").is_stream_not_running());
}

TEST(LjmErrorTest, WrappingKeepsCodeAndName)
{
    const LjmError cause(1239, "LJME_RECONNECT_FAILED", "Close()");
    const LjmError wrapped("Cannot close LabJack", cause);

    EXPECT_EQ(wrapped.code(), 1239);
    EXPECT_EQ(wrapped.name(), "LJME_RECONNECT_FAILED");
    EXPECT_EQ(wrapped.context(), "Cannot close LabJack");
    EXPECT_THAT(wrapped.what(), HasSubstr("Cannot close LabJack"));
    EXPECT_THAT(wrapped.what(), HasSubstr("LJME_RECONNECT_FAILED"));
}
