/**
 * @file daq_config.cpp
 * @brief DaqConfig JSON parsing and layering.
 */
#include "utils/daq_config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace ljdaq
{

namespace
{

// ============================================================================
// Parsing helpers
// ============================================================================

[[noreturn]] void bad_value(const std::string &key, const std::string &why)
{
    throw std::runtime_error(fmt::format("DaqConfig: invalid '{}': {}", key, why));
}

std::string get_string(const nlohmann::json &j, const std::string &key,
                       const std::string &path)
{
    const auto &v = j.at(key);
    if (!v.is_string())
        bad_value(path + "." + key, "expected a string");
    return v.get<std::string>();
}

int get_int(const nlohmann::json &j, const std::string &key, const std::string &path)
{
    const auto &v = j.at(key);
    if (!v.is_number_integer())
        bad_value(path + "." + key, "expected an integer");
    return v.get<int>();
}

/// A single name or a list of names.
std::vector<std::string> get_names(const nlohmann::json &v, const std::string &path)
{
    if (v.is_string())
        return {v.get<std::string>()};
    if (!v.is_array())
        bad_value(path, "expected a register name or a list of register names");

    std::vector<std::string> out;
    for (const auto &item : v)
    {
        if (!item.is_string())
            bad_value(path, "register names must be strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

void apply_logging_json(LoggingConfig &lc, const nlohmann::json &j)
{
    if (!j.is_object())
        bad_value("logging", "expected an object");
    if (j.contains("level"))
    {
        const auto level = get_string(j, "level", "logging");
        try
        {
            lc.level = parse_log_level(level);
        }
        catch (const std::runtime_error &e)
        {
            bad_value("logging.level", e.what());
        }
    }
    if (j.contains("file"))
        lc.file = get_string(j, "file", "logging");
}

void apply_device_json(DeviceConfig &dc, const nlohmann::json &j)
{
    if (!j.is_object())
        bad_value("device", "expected an object");
    if (j.contains("type"))
        dc.type = get_string(j, "type", "device");
    if (j.contains("connection"))
        dc.connection = get_string(j, "connection", "device");
    if (j.contains("identifier"))
        dc.identifier = get_string(j, "identifier", "device");
}

device::AsynchConfig parse_asynch(const nlohmann::json &j, const std::string &path,
                                  device::AsynchConfig cfg)
{
    if (!j.is_object())
        bad_value(path, "expected an object");

    const std::pair<const char *, int device::AsynchConfig::*> fields[] = {
        {"tx", &device::AsynchConfig::tx},
        {"rx", &device::AsynchConfig::rx},
        {"baud", &device::AsynchConfig::baud},
        {"rx_buffer", &device::AsynchConfig::rx_buffer},
        {"num_data_bits", &device::AsynchConfig::num_data_bits},
        {"num_stop_bits", &device::AsynchConfig::num_stop_bits},
        {"parity", &device::AsynchConfig::parity},
    };
    for (const auto &[key, member] : fields)
    {
        if (j.contains(key))
            cfg.*member = get_int(j, key, path);
    }

    try
    {
        device::validate(cfg);
    }
    catch (const std::invalid_argument &e)
    {
        bad_value(path, e.what());
    }
    return cfg;
}

ExperimentConfig parse_experiment(const nlohmann::json &j, const std::string &path,
                                  ExperimentConfig ec)
{
    if (!j.is_object())
        bad_value(path, "expected an object");

    if (j.contains("device_type"))
        ec.device_type = get_string(j, "device_type", path);

    if (j.contains("asynch"))
    {
        if (j["asynch"].is_null())
            ec.asynch.reset();
        else
            ec.asynch = get_string(j, "asynch", path);
    }

    if (j.contains("update"))
    {
        const auto &u = j["update"];
        if (u.is_null())
            ec.update.reset();
        else
        {
            if (!u.is_object() || !u.contains("write") || !u.contains("read"))
                bad_value(path + ".update", "expected an object with 'write' and 'read'");
            ec.update = UpdateConfig{get_names(u["write"], path + ".update.write"),
                                     get_names(u["read"], path + ".update.read")};
        }
    }

    if (j.contains("stream_out"))
    {
        if (j["stream_out"].is_null())
            ec.stream_out.clear();
        else
            ec.stream_out = get_names(j["stream_out"], path + ".stream_out");
    }
    return ec;
}

void apply_json(DaqConfig &cfg, const nlohmann::json &j)
{
    if (!j.is_object())
        bad_value("<root>", "expected a JSON object");

    if (j.contains("logging"))
        apply_logging_json(cfg.logging, j["logging"]);
    if (j.contains("device"))
        apply_device_json(cfg.device, j["device"]);

    if (j.contains("asynch_profiles"))
    {
        const auto &profiles = j["asynch_profiles"];
        if (!profiles.is_object())
            bad_value("asynch_profiles", "expected an object");
        for (auto it = profiles.begin(); it != profiles.end(); ++it)
        {
            auto existing = cfg.asynch_profiles.find(it.key());
            const device::AsynchConfig base =
                existing != cfg.asynch_profiles.end() ? existing->second : device::AsynchConfig{};
            cfg.asynch_profiles[it.key()] =
                parse_asynch(it.value(), "asynch_profiles." + it.key(), base);
        }
    }

    if (j.contains("experiments"))
    {
        const auto &experiments = j["experiments"];
        if (!experiments.is_object())
            bad_value("experiments", "expected an object");
        for (auto it = experiments.begin(); it != experiments.end(); ++it)
        {
            auto existing = cfg.experiments.find(it.key());
            const ExperimentConfig base =
                existing != cfg.experiments.end() ? existing->second : ExperimentConfig{};
            cfg.experiments[it.key()] =
                parse_experiment(it.value(), "experiments." + it.key(), base);
        }
    }

    // Every experiment must name a profile that exists after the merge.
    for (const auto &[name, ec] : cfg.experiments)
    {
        if (ec.asynch && cfg.asynch_profiles.find(*ec.asynch) == cfg.asynch_profiles.end())
            bad_value("experiments." + name + ".asynch",
                      fmt::format("unknown asynch profile '{}'", *ec.asynch));
    }
}

nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error(
            fmt::format("DaqConfig: cannot open config file '{}'", path.string()));
    try
    {
        return nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(
            fmt::format("DaqConfig: cannot parse '{}': {}", path.string(), e.what()));
    }
}

const char *env_or_null(const char *name)
{
    const char *v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? v : nullptr;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

utils::Logger::Level parse_log_level(std::string_view name)
{
    using L = utils::Logger::Level;
    if (name == "trace")
        return L::L_TRACE;
    if (name == "debug")
        return L::L_DEBUG;
    if (name == "info")
        return L::L_INFO;
    if (name == "warn" || name == "warning")
        return L::L_WARNING;
    if (name == "error")
        return L::L_ERROR;
    if (name == "system")
        return L::L_SYSTEM;
    throw std::runtime_error(fmt::format(
        "unknown log level '{}' (must be trace, debug, info, warn, error or system)", name));
}

DaqConfig DaqConfig::defaults()
{
    DaqConfig cfg;
    cfg.asynch_profiles["reflow"] = device::asynch_profile("reflow");
    cfg.asynch_profiles["machining"] = device::asynch_profile("machining");

    ExperimentConfig reflow;
    reflow.device_type = "T4";
    reflow.asynch = "reflow";
    cfg.experiments["reflow"] = reflow;

    ExperimentConfig machine;
    machine.device_type = "T7";
    machine.asynch = "machining";
    machine.update = UpdateConfig{{"DAC0_BINARY", "DAC1_BINARY"}, {"DAC0", "DAC1"}};
    machine.stream_out = {"DAC0", "DAC1"};
    cfg.experiments["machine"] = machine;

    return cfg;
}

DaqConfig DaqConfig::from_json(const nlohmann::json &j)
{
    DaqConfig cfg = defaults();
    try
    {
        apply_json(cfg, j);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(fmt::format("DaqConfig: {}", e.what()));
    }
    return cfg;
}

DaqConfig DaqConfig::from_file(const fs::path &path)
{
    return from_json(read_json_file(path));
}

DaqConfig DaqConfig::load(const fs::path &path)
{
    DaqConfig cfg = defaults();

    if (!path.empty())
    {
        cfg = from_file(path);
        LOGGER_INFO("DaqConfig: loaded '{}'", path.string());
    }
    else if (const char *env = env_or_null("LJDAQ_CONFIG_FILE"))
    {
        try
        {
            cfg = from_file(env);
            LOGGER_INFO("DaqConfig: loaded LJDAQ_CONFIG_FILE '{}'", env);
        }
        catch (const std::runtime_error &e)
        {
            LOGGER_WARN("DaqConfig: LJDAQ_CONFIG_FILE ignored, using defaults: {}", e.what());
        }
    }

    cfg.apply_env_overrides();
    return cfg;
}

void DaqConfig::apply_env_overrides()
{
    if (const char *v = env_or_null("LJDAQ_DEVICE_TYPE"))
        device.type = v;
    if (const char *v = env_or_null("LJDAQ_CONNECTION_TYPE"))
        device.connection = v;
    if (const char *v = env_or_null("LJDAQ_IDENTIFIER"))
        device.identifier = v;
    if (const char *v = env_or_null("LJDAQ_LOG_LEVEL"))
    {
        try
        {
            logging.level = parse_log_level(v);
        }
        catch (const std::runtime_error &e)
        {
            bad_value("LJDAQ_LOG_LEVEL", e.what());
        }
    }
}

const ExperimentConfig &DaqConfig::experiment(std::string_view name) const
{
    auto it = experiments.find(std::string(name));
    if (it == experiments.end())
        throw std::invalid_argument(
            fmt::format("Experiment '{}' doesn't exist. Please choose a valid experiment name.",
                        name));
    return it->second;
}

const device::AsynchConfig &DaqConfig::asynch_profile(std::string_view name) const
{
    auto it = asynch_profiles.find(std::string(name));
    if (it == asynch_profiles.end())
        throw std::invalid_argument(fmt::format("Asynch profile '{}' doesn't exist", name));
    return it->second;
}

void apply_logging(const DaqConfig &cfg)
{
    auto &logger = utils::Logger::instance();
    logger.set_level(cfg.logging.level);
    if (!cfg.logging.file.empty())
        logger.set_logfile(cfg.logging.file);
}

} // namespace ljdaq
