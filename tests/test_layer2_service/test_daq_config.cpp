// tests/test_layer2_service/test_daq_config.cpp
/**
 * @file test_daq_config.cpp
 * @brief Unit tests for DaqConfig parsing and layering.
 */
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "ljdaq_service.hpp"
#include "test_entrypoint.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace fs = std::filesystem;
using ljdaq::DaqConfig;
using ljdaq::parse_log_level;
using ljdaq::device::AsynchConfig;
using ljdaq::tests::helper::ScopedEnv;
using ljdaq::tests::helper::unique_temp_path;
using ljdaq::utils::Logger;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace
{

fs::path write_temp_json(const std::string &stem, const std::string &text)
{
    auto p = unique_temp_path(stem, ".json");
    std::ofstream(p) << text;
    return p;
}

/// Runs @p fn and returns the runtime_error message it throws.
template <typename Fn> std::string runtime_error_message(Fn &&fn)
{
    try
    {
        fn();
    }
    catch (const std::runtime_error &e)
    {
        return e.what();
    }
    return {};
}

} // namespace

TEST(DaqConfigTest, DefaultsCarryBuiltInPresets)
{
    const DaqConfig cfg = DaqConfig::defaults();

    EXPECT_EQ(cfg.device.type, "ANY");
    EXPECT_EQ(cfg.device.connection, "ANY");
    EXPECT_EQ(cfg.device.identifier, "ANY");
    EXPECT_EQ(cfg.logging.level, Logger::Level::L_INFO);
    EXPECT_TRUE(cfg.logging.file.empty());

    EXPECT_EQ(cfg.asynch_profile("reflow"), (AsynchConfig{5, 4, 9600, 6, 0, 1, 0}));
    EXPECT_EQ(cfg.asynch_profile("machining"), (AsynchConfig{1, 0, 9600, 6, 0, 1, 0}));

    const auto &reflow = cfg.experiment("reflow");
    EXPECT_EQ(reflow.device_type, "T4");
    EXPECT_EQ(reflow.asynch, "reflow");
    EXPECT_FALSE(reflow.update.has_value());
    EXPECT_TRUE(reflow.stream_out.empty());

    const auto &machine = cfg.experiment("machine");
    EXPECT_EQ(machine.device_type, "T7");
    EXPECT_EQ(machine.asynch, "machining");
    ASSERT_TRUE(machine.update.has_value());
    EXPECT_THAT(machine.update->write, ElementsAre("DAC0_BINARY", "DAC1_BINARY"));
    EXPECT_THAT(machine.update->read, ElementsAre("DAC0", "DAC1"));
    EXPECT_THAT(machine.stream_out, ElementsAre("DAC0", "DAC1"));
}

TEST(DaqConfigTest, UnknownNamesThrowInvalidArgument)
{
    const DaqConfig cfg = DaqConfig::defaults();
    EXPECT_THROW(cfg.experiment("nonexistent"), std::invalid_argument);
    EXPECT_THROW(cfg.asynch_profile("machine"), std::invalid_argument);
}

TEST(DaqConfigTest, ParseLogLevel)
{
    EXPECT_EQ(parse_log_level("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(parse_log_level("debug"), Logger::Level::L_DEBUG);
    EXPECT_EQ(parse_log_level("info"), Logger::Level::L_INFO);
    EXPECT_EQ(parse_log_level("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(parse_log_level("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(parse_log_level("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(parse_log_level("system"), Logger::Level::L_SYSTEM);
    EXPECT_THROW(parse_log_level("verbose"), std::runtime_error);
}

/// A partial document only changes the keys it names.
TEST(DaqConfigTest, JsonMergesOverDefaults)
{
    const auto j = nlohmann::json::parse(R"({
        "logging": { "level": "debug" },
        "device":  { "type": "T7", "connection": "USB" },
        "asynch_profiles": {
            "reflow": { "baud": 19200 },
            "sensor": { "tx": 2, "rx": 3, "baud": 9600, "rx_buffer": 32 }
        },
        "experiments": {
            "sensor_rig": {
                "device_type": "T7",
                "asynch": "sensor",
                "update": { "write": "DAC0_BINARY", "read": ["AIN0", "AIN1"] },
                "stream_out": ["DAC0"]
            }
        }
    })");
    const DaqConfig cfg = DaqConfig::from_json(j);

    EXPECT_EQ(cfg.logging.level, Logger::Level::L_DEBUG);
    EXPECT_EQ(cfg.device.type, "T7");
    EXPECT_EQ(cfg.device.connection, "USB");
    EXPECT_EQ(cfg.device.identifier, "ANY");

    // Existing profile: only the baud rate changes.
    EXPECT_EQ(cfg.asynch_profile("reflow"), (AsynchConfig{5, 4, 19200, 6, 0, 1, 0}));
    EXPECT_EQ(cfg.asynch_profile("sensor"), (AsynchConfig{2, 3, 9600, 32, 0, 0, 0}));

    const auto &rig = cfg.experiment("sensor_rig");
    EXPECT_EQ(rig.asynch, "sensor");
    ASSERT_TRUE(rig.update.has_value());
    EXPECT_THAT(rig.update->write, ElementsAre("DAC0_BINARY"));
    EXPECT_THAT(rig.update->read, ElementsAre("AIN0", "AIN1"));
    EXPECT_THAT(rig.stream_out, ElementsAre("DAC0"));

    // Built-in experiments survive the merge.
    EXPECT_NO_THROW(cfg.experiment("machine"));
}

TEST(DaqConfigTest, MalformedValuesNameTheKey)
{
    EXPECT_THAT(runtime_error_message([] {
                    DaqConfig::from_json(nlohmann::json::parse(R"({"logging": {"level": "loud"}})"));
                }),
                HasSubstr("logging.level"));
    EXPECT_THAT(runtime_error_message([] {
                    DaqConfig::from_json(nlohmann::json::parse(R"({"device": {"type": 7}})"));
                }),
                HasSubstr("device.type"));
    EXPECT_THAT(runtime_error_message([] {
                    DaqConfig::from_json(nlohmann::json::parse(
                        R"({"asynch_profiles": {"bad": {"parity": 3}}})"));
                }),
                HasSubstr("asynch_profiles.bad"));
    EXPECT_THAT(runtime_error_message([] {
                    DaqConfig::from_json(nlohmann::json::parse(
                        R"({"experiments": {"x": {"asynch": "missing"}}})"));
                }),
                HasSubstr("experiments.x.asynch"));
    EXPECT_THAT(runtime_error_message([] {
                    DaqConfig::from_json(nlohmann::json::parse(
                        R"({"experiments": {"x": {"update": {"write": ["DAC0"]}}}})"));
                }),
                HasSubstr("experiments.x.update"));
    EXPECT_THROW(DaqConfig::from_json(nlohmann::json::array()), std::runtime_error);
}

TEST(DaqConfigTest, FromFile)
{
    const auto path = write_temp_json("from_file", R"({"device": {"identifier": "470012345"}})");
    const DaqConfig cfg = DaqConfig::from_file(path);
    EXPECT_EQ(cfg.device.identifier, "470012345");
    fs::remove(path);
}

TEST(DaqConfigTest, FromFileErrors)
{
    EXPECT_THROW(DaqConfig::from_file(unique_temp_path("missing", ".json")), std::runtime_error);

    const auto path = write_temp_json("broken", "{ not json");
    EXPECT_THAT(runtime_error_message([&] { DaqConfig::from_file(path); }),
                HasSubstr("cannot parse"));
    fs::remove(path);
}

/// Priority: defaults < file < environment.
TEST(DaqConfigTest, LoadAppliesEnvironmentLast)
{
    const auto path = write_temp_json(
        "layered", R"({"device": {"type": "T4", "connection": "USB"}, "logging": {"level": "error"}})");

    ScopedEnv type("LJDAQ_DEVICE_TYPE", "T7");
    ScopedEnv level("LJDAQ_LOG_LEVEL", "debug");
    const DaqConfig cfg = DaqConfig::load(path);

    EXPECT_EQ(cfg.device.type, "T7");
    EXPECT_EQ(cfg.device.connection, "USB");
    EXPECT_EQ(cfg.logging.level, Logger::Level::L_DEBUG);
    fs::remove(path);
}

TEST(DaqConfigTest, LoadUsesConfigFileFromEnvironment)
{
    const auto path = write_temp_json("env_file", R"({"device": {"identifier": "192.168.1.207"}})");
    ScopedEnv file("LJDAQ_CONFIG_FILE", path.string());

    EXPECT_EQ(DaqConfig::load().device.identifier, "192.168.1.207");
    fs::remove(path);
}

/// An unreadable LJDAQ_CONFIG_FILE falls back to defaults instead of failing.
TEST(DaqConfigTest, UnreadableEnvironmentFileFallsBack)
{
    ScopedEnv file("LJDAQ_CONFIG_FILE", unique_temp_path("absent", ".json").string());
    const DaqConfig cfg = DaqConfig::load();
    EXPECT_EQ(cfg.device.type, "ANY");
}

TEST(DaqConfigTest, BadEnvironmentLogLevelThrows)
{
    ScopedEnv level("LJDAQ_LOG_LEVEL", "chatty");
    EXPECT_THAT(runtime_error_message([] { DaqConfig::load(); }), HasSubstr("LJDAQ_LOG_LEVEL"));
}

TEST(DaqConfigTest, ApplyLoggingSetsLevel)
{
    DaqConfig cfg = DaqConfig::defaults();
    cfg.logging.level = Logger::Level::L_ERROR;
    ljdaq::apply_logging(cfg);
    EXPECT_EQ(Logger::instance().level(), Logger::Level::L_ERROR);

    Logger::instance().set_level(Logger::Level::L_INFO);
}
