// tests/test_layer3_device/test_labjack_daq.cpp
/**
 * @file test_labjack_daq.cpp
 * @brief Unit tests for LabJackDaq: device lifetime, experiment presets and helpers.
 */
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "ljdaq_device.hpp"
#include "mock_driver.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ljdaq::DaqConfig;
using ljdaq::ExperimentConfig;
using ljdaq::UpdateConfig;
using ljdaq::device::HandleInfo;
using ljdaq::device::LabJackDaq;
using ljdaq::device::LjmError;
using ljdaq::tests::ljm_error;
using ljdaq::tests::make_nice_driver;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

namespace
{
constexpr int kHandle = 7;

HandleInfo t7_usb()
{
    HandleInfo info;
    info.device_type = 7;
    info.connection_type = 1;
    info.serial_number = 470012345;
    info.ip_address = 0;
    info.port = 0;
    info.max_bytes_per_mb = 64;
    return info;
}

/// A nice mock that opens as handle 7 and describes itself.
std::shared_ptr<ljdaq::tests::NiceMockDriver> opening_driver()
{
    auto d = make_nice_driver();
    ON_CALL(*d, open(_, _, _)).WillByDefault(Return(kHandle));
    ON_CALL(*d, handle_info(kHandle)).WillByDefault(Return(t7_usb()));
    ON_CALL(*d, describe(_)).WillByDefault(Return("device type: T7; connection type: USB"));
    return d;
}
} // namespace

TEST(LabJackDaqTest, OpensAndDescribes)
{
    auto d = opening_driver();
    EXPECT_CALL(*d, open("T7", "USB", "470012345")).WillOnce(Return(kHandle));
    EXPECT_CALL(*d, close(kHandle)).Times(1);

    LabJackDaq daq(d, "T7", "USB", "470012345");
    EXPECT_TRUE(daq.is_open());
    EXPECT_EQ(daq.handle(), kHandle);
    EXPECT_EQ(daq.info().serial_number, 470012345);
    EXPECT_EQ(daq.info().max_bytes_per_mb, 64);
    EXPECT_EQ(daq.description(), "device type: T7; connection type: USB");
    EXPECT_EQ(&daq.driver(), d.get());
}

TEST(LabJackDaqTest, OpenFailurePropagates)
{
    auto d = opening_driver();
    EXPECT_CALL(*d, open(_, _, _)).WillOnce(Throw(ljm_error(1227, "LJME_DEVICE_NOT_FOUND")));
    EXPECT_CALL(*d, close(_)).Times(0);

    EXPECT_THROW(LabJackDaq(d, "T4"), LjmError);
}

/// A handle that opened but could not be queried is closed before the error propagates.
TEST(LabJackDaqTest, ClosesHandleWhenQueryFails)
{
    auto d = opening_driver();
    EXPECT_CALL(*d, handle_info(kHandle)).WillOnce(Throw(ljm_error(1239, "LJME_RECONNECT_FAILED")));
    EXPECT_CALL(*d, close(kHandle)).Times(1);

    EXPECT_THROW(LabJackDaq(d, "T7"), LjmError);
}

TEST(LabJackDaqTest, CloseIsIdempotentOnNotOpen)
{
    auto d = opening_driver();
    EXPECT_CALL(*d, close(kHandle)).WillOnce(Throw(ljm_error(1224, "LJME_DEVICE_NOT_OPEN")));

    LabJackDaq daq(d);
    EXPECT_NO_THROW(daq.close());
    EXPECT_FALSE(daq.is_open());
    // Destruction does not close again.
}

TEST(LabJackDaqTest, CloseWrapsOtherErrors)
{
    auto d = opening_driver();
    EXPECT_CALL(*d, close(kHandle))
        .WillOnce(Throw(ljm_error(1239, "LJME_RECONNECT_FAILED")))
        .WillOnce(Throw(ljm_error(1239, "LJME_RECONNECT_FAILED")));

    {
        LabJackDaq daq(d);
        try
        {
            daq.close();
            FAIL() << "close should have thrown";
        }
        catch (const LjmError &e)
        {
            EXPECT_EQ(e.context(), "Cannot close LabJack");
            EXPECT_THAT(e.what(), HasSubstr("LJME_RECONNECT_FAILED"));
        }
        EXPECT_TRUE(daq.is_open());
    } // the destructor retries and only logs
}

TEST(LabJackDaqTest, HelperAccessorsRequireAdd)
{
    auto d = opening_driver();
    LabJackDaq daq(d);

    EXPECT_FALSE(daq.has_update());
    EXPECT_FALSE(daq.has_asynch());
    EXPECT_FALSE(daq.has_stream_out());
    EXPECT_FALSE(daq.has_interval());
    EXPECT_THROW(daq.update(), std::logic_error);
    EXPECT_THROW(daq.asynch(), std::logic_error);
    EXPECT_THROW(daq.stream_out(), std::logic_error);
    EXPECT_THROW(daq.interval(), std::logic_error);
}

TEST(LabJackDaqTest, AddHelpers)
{
    auto d = opening_driver();
    LabJackDaq daq(d);

    const std::vector<std::string> writes{"DAC0_BINARY"};
    const std::vector<std::string> reads{"DAC0", "AIN0"};
    daq.add_update(writes, reads);
    ASSERT_TRUE(daq.has_update());
    EXPECT_THAT(daq.update().write_names(), ElementsAre("DAC0_BINARY"));
    EXPECT_THAT(daq.update().read_names(), ElementsAre("DAC0", "AIN0"));

    daq.add_interval(10'000, 25);
    ASSERT_TRUE(daq.has_interval());
    EXPECT_EQ(daq.interval().interval_time_us(), 10'000);
    EXPECT_EQ(daq.interval().num_iter(), 25);

    const std::vector<std::string> targets{"DAC1"};
    daq.add_stream_out(targets);
    ASSERT_TRUE(daq.has_stream_out());
    EXPECT_THAT(daq.stream_out().out_names(), ElementsAre("DAC1"));

    daq.add_asynch("reflow");
    EXPECT_TRUE(daq.has_asynch());
    EXPECT_THROW(daq.add_asynch("nonexistent"), std::invalid_argument);
}

TEST(LabJackDaqTest, ResetDacsWritesZeroVolts)
{
    auto d = opening_driver();
    const std::vector<std::string> dacs{"DAC0", "DAC1"};
    EXPECT_CALL(*d, write_names(kHandle, dacs, ElementsAre(0.0, 0.0)));

    LabJackDaq daq(d);
    daq.reset_dacs();
}

/// Stream-out is disabled and stopped before the handle is closed.
TEST(LabJackDaqTest, DestructorTearsDownBeforeClosing)
{
    auto d = opening_driver();
    EXPECT_CALL(*d, write_name(_, _, _)).Times(AnyNumber());
    {
        InSequence seq;
        EXPECT_CALL(*d, write_name(kHandle, "STREAM_OUT0_ENABLE", 0.0));
        EXPECT_CALL(*d, stream_stop(kHandle));
        EXPECT_CALL(*d, close(kHandle));
    }

    auto daq = std::make_unique<LabJackDaq>(d);
    const std::vector<std::string> targets{"DAC0"};
    daq->add_stream_out(targets);
    daq.reset();
}

TEST(LabJackDaqTest, CloseReleasesStreamOutAndInterval)
{
    auto d = opening_driver();
    LabJackDaq daq(d);
    daq.add_stream_out(std::vector<std::string>{"DAC0"});
    daq.add_interval(1000, 1);

    daq.close();
    EXPECT_FALSE(daq.has_stream_out());
    EXPECT_FALSE(daq.has_interval());
    EXPECT_FALSE(daq.is_open());
}

TEST(LabJackDaqExperimentTest, Machine)
{
    auto d = opening_driver();
    EXPECT_CALL(*d, open("T7", "ANY", "ANY")).WillOnce(Return(kHandle));
    EXPECT_CALL(*d, write_name(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(*d, write_name(kHandle, "ASYNCH_TX_DIONUM", 1.0));
    EXPECT_CALL(*d, write_name(kHandle, "ASYNCH_RX_DIONUM", 0.0));

    auto daq = LabJackDaq::experiment("machine", d);
    ASSERT_TRUE(daq->has_asynch());
    ASSERT_TRUE(daq->has_update());
    ASSERT_TRUE(daq->has_stream_out());
    EXPECT_FALSE(daq->has_interval());
    EXPECT_THAT(daq->update().write_names(), ElementsAre("DAC0_BINARY", "DAC1_BINARY"));
    EXPECT_THAT(daq->update().read_names(), ElementsAre("DAC0", "DAC1"));
    EXPECT_THAT(daq->stream_out().out_names(), ElementsAre("DAC0", "DAC1"));
}

TEST(LabJackDaqExperimentTest, Reflow)
{
    auto d = opening_driver();
    EXPECT_CALL(*d, open("T4", "ANY", "ANY")).WillOnce(Return(kHandle));
    EXPECT_CALL(*d, write_name(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(*d, write_name(kHandle, "ASYNCH_TX_DIONUM", 5.0));
    EXPECT_CALL(*d, write_name(kHandle, "ASYNCH_RX_DIONUM", 4.0));
    EXPECT_CALL(*d, write_name(kHandle, "ASYNCH_ENABLE", 1.0));

    auto daq = LabJackDaq::experiment("reflow", d);
    EXPECT_TRUE(daq->has_asynch());
    EXPECT_FALSE(daq->has_update());
    EXPECT_FALSE(daq->has_stream_out());
}

TEST(LabJackDaqExperimentTest, UnknownNameOpensNothing)
{
    auto d = opening_driver();
    EXPECT_CALL(*d, open(_, _, _)).Times(0);
    EXPECT_THROW(LabJackDaq::experiment("nonexistent", d), std::invalid_argument);
}

/// An experiment accepting any device type opens what the device section names.
TEST(LabJackDaqExperimentTest, FromConfigUsesDeviceSection)
{
    DaqConfig cfg = DaqConfig::defaults();
    cfg.device.type = "T7";
    cfg.device.connection = "TCP";
    cfg.device.identifier = "192.168.1.10";

    ExperimentConfig dac_only;
    dac_only.update = UpdateConfig{{"DAC0_BINARY"}, {"DAC0"}};
    cfg.experiments["dac_only"] = dac_only;

    auto d = opening_driver();
    EXPECT_CALL(*d, open("T7", "TCP", "192.168.1.10")).WillOnce(Return(kHandle));

    auto daq = LabJackDaq::from_config(cfg, "dac_only", d);
    EXPECT_TRUE(daq->has_update());
    EXPECT_FALSE(daq->has_asynch());
    EXPECT_FALSE(daq->has_stream_out());
    EXPECT_FALSE(daq->update().has_same_registers());
}
