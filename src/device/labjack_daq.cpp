#include "device/labjack_daq.hpp"
#include "device/ljm_error.hpp"
#include "utils/daq_config.hpp"
#include "utils/logger.hpp"

#include <stdexcept>
#include <utility>

namespace ljdaq::device
{

LabJackDaq::LabJackDaq(const std::string &device_type, const std::string &connection_type,
                       const std::string &identifier)
    : LabJackDaq(std::make_shared<LjmDriver>(), device_type, connection_type, identifier)
{
}

LabJackDaq::LabJackDaq(std::shared_ptr<Driver> driver, const std::string &device_type,
                       const std::string &connection_type, const std::string &identifier)
    : m_driver(driver ? std::move(driver)
                      : std::shared_ptr<Driver>(std::make_shared<LjmDriver>()))
{
    m_handle = m_driver->open(device_type, connection_type, identifier);
    m_open = true;

    try
    {
        m_info = m_driver->handle_info(m_handle);
        m_description = m_driver->describe(m_info);
    }
    catch (const std::exception &)
    {
        // The destructor will not run for a half-built object.
        try
        {
            m_driver->close(m_handle);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("LabJackDaq: closing after failed open: {}", e.what());
        }
        throw;
    }

    LOGGER_INFO("Opened LabJack: {}", m_description);
}

LabJackDaq::~LabJackDaq()
{
    release_helpers();
    if (!m_open)
        return;
    try
    {
        close();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("LabJackDaq: {}", e.what());
    }
}

std::unique_ptr<LabJackDaq> LabJackDaq::experiment(std::string_view name,
                                                   std::shared_ptr<Driver> driver)
{
    return from_config(DaqConfig::defaults(), name, std::move(driver));
}

std::unique_ptr<LabJackDaq> LabJackDaq::from_config(const DaqConfig &cfg, std::string_view name,
                                                    std::shared_ptr<Driver> driver)
{
    const ExperimentConfig &exp = cfg.experiment(name);
    // An experiment that accepts any device defers to the configured device type.
    const std::string &device_type =
        exp.device_type == "ANY" ? cfg.device.type : exp.device_type;

    auto daq = std::make_unique<LabJackDaq>(std::move(driver), device_type,
                                            cfg.device.connection, cfg.device.identifier);
    if (exp.asynch)
        daq->add_asynch(cfg.asynch_profile(*exp.asynch));
    if (exp.update)
        daq->add_update(exp.update->write, exp.update->read);
    if (!exp.stream_out.empty())
        daq->add_stream_out(exp.stream_out);

    LOGGER_INFO("Experiment '{}' ready", name);
    return daq;
}

void LabJackDaq::release_helpers() noexcept
{
    // Both destructors log their own driver errors.
    m_stream_out.reset();
    m_interval.reset();
}

void LabJackDaq::close()
{
    release_helpers();
    try
    {
        m_driver->close(m_handle);
        LOGGER_INFO("Closed LabJack handle {}", m_handle);
    }
    catch (const LjmError &e)
    {
        if (!e.is_device_not_open())
            throw LjmError("Cannot close LabJack", e);
    }
    m_open = false;
}

void LabJackDaq::reset_dacs()
{
    m_driver->write_names(m_handle, {"DAC0", "DAC1"}, {0.0, 0.0});
}

void LabJackDaq::add_update(std::vector<std::string> write_names,
                            std::vector<std::string> read_names)
{
    m_update.emplace(*m_driver, m_handle, std::move(write_names), std::move(read_names));
}

void LabJackDaq::add_stream_out(std::vector<std::string> out_names)
{
    m_stream_out = Streamer::init_reset(*m_driver, m_handle, std::move(out_names));
}

void LabJackDaq::add_asynch(std::string_view profile)
{
    m_asynch.emplace(AsynchUpdater::experiment(*m_driver, m_handle, profile));
}

void LabJackDaq::add_asynch(const AsynchConfig &cfg)
{
    m_asynch.emplace(AsynchUpdater::with_configuration(*m_driver, m_handle, cfg));
}

void LabJackDaq::add_interval(std::int64_t interval_time_us, int num_iter)
{
    m_interval = std::make_unique<Intervaler>(*m_driver, interval_time_us, num_iter);
}

Updater &LabJackDaq::update()
{
    if (!m_update)
        throw std::logic_error("No updater added; call add_update() first");
    return *m_update;
}

AsynchUpdater &LabJackDaq::asynch()
{
    if (!m_asynch)
        throw std::logic_error("No asynch updater added; call add_asynch() first");
    return *m_asynch;
}

Streamer &LabJackDaq::stream_out()
{
    if (!m_stream_out)
        throw std::logic_error("No stream-out added; call add_stream_out() first");
    return *m_stream_out;
}

Intervaler &LabJackDaq::interval()
{
    if (!m_interval)
        throw std::logic_error("No interval added; call add_interval() first");
    return *m_interval;
}

} // namespace ljdaq::device
