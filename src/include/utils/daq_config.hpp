#pragma once

/**
 * @file daq_config.hpp
 * @brief DaqConfig: device, preset and logging configuration.
 *
 * ## Loading, layered (priority low → high)
 *
 *  1. Built-in defaults: device "ANY"/"ANY"/"ANY", log level "info" on the
 *     console, UART profiles `reflow` / `machining`, experiments `reflow` /
 *     `machine`.
 *  2. A JSON file, given explicitly or through `LJDAQ_CONFIG_FILE`. Objects
 *     are merged key by key over the defaults, so a file only needs the keys
 *     it changes.
 *  3. Environment overrides: `LJDAQ_DEVICE_TYPE`, `LJDAQ_CONNECTION_TYPE`,
 *     `LJDAQ_IDENTIFIER`, `LJDAQ_LOG_LEVEL`.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "logging": { "level": "debug", "file": "/tmp/ljdaq.log" },
 *   "device":  { "type": "T7", "connection": "USB", "identifier": "ANY" },
 *   "asynch_profiles": {
 *     "sensor": { "tx": 2, "rx": 3, "baud": 19200, "rx_buffer": 32,
 *                "num_data_bits": 8, "num_stop_bits": 1, "parity": 0 }
 *   },
 *   "experiments": {
 *     "sensor_rig": {
 *       "device_type": "T7",
 *       "asynch": "sensor",
 *       "update": { "write": ["DAC0_BINARY"], "read": ["AIN0"] },
 *       "stream_out": ["DAC0"]
 *     }
 *   }
 * }
 * @endcode
 *
 * Malformed values throw `std::runtime_error` naming the offending key.
 */

#include "device/asynch_updater.hpp"
#include "utils/logger.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ljdaq_export.h"

namespace ljdaq
{

struct LoggingConfig
{
    utils::Logger::Level level{utils::Logger::Level::L_INFO};
    std::string file; ///< Empty = console.
};

struct DeviceConfig
{
    std::string type{"ANY"};
    std::string connection{"ANY"};
    std::string identifier{"ANY"};
};

struct UpdateConfig
{
    std::vector<std::string> write;
    std::vector<std::string> read;
};

/// A named preset: which device to open and which helpers to add to it.
struct ExperimentConfig
{
    std::string device_type{"ANY"};
    std::optional<std::string> asynch; ///< UART profile name
    std::optional<UpdateConfig> update;
    std::vector<std::string> stream_out;
};

struct LJDAQ_EXPORT DaqConfig
{
    LoggingConfig logging;
    DeviceConfig device;
    std::map<std::string, device::AsynchConfig> asynch_profiles;
    std::map<std::string, ExperimentConfig> experiments;

    /// Built-in defaults only.
    static DaqConfig defaults();

    /// Defaults with @p j merged over them.
    static DaqConfig from_json(const nlohmann::json &j);

    /// Defaults with the file at @p path merged over them. Throws if the file
    /// cannot be read or parsed.
    static DaqConfig from_file(const std::filesystem::path &path);

    /**
     * @brief Full layered load.
     *
     * Uses @p path if given, else `LJDAQ_CONFIG_FILE` if set, then applies the
     * environment overrides. An unreadable `LJDAQ_CONFIG_FILE` is logged and
     * skipped.
     */
    static DaqConfig load(const std::filesystem::path &path = {});

    /// Applies the `LJDAQ_*` environment overrides in place.
    void apply_env_overrides();

    /// @throws std::invalid_argument for an unknown experiment.
    const ExperimentConfig &experiment(std::string_view name) const;

    /// @throws std::invalid_argument for an unknown profile.
    const device::AsynchConfig &asynch_profile(std::string_view name) const;
};

/// "trace", "debug", "info", "warn"/"warning", "error", "system".
/// @throws std::runtime_error for anything else.
LJDAQ_EXPORT utils::Logger::Level parse_log_level(std::string_view name);

/// Sets the logger level and, when `cfg.logging.file` is set, logs to that file.
LJDAQ_EXPORT void apply_logging(const DaqConfig &cfg);

} // namespace ljdaq
