#include "device/asynch_updater.hpp"
#include "utils/logger.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/format.h>

namespace ljdaq::device
{

namespace
{
void check_range(const char *field, int value, int lo, int hi)
{
    if (value < lo || value > hi)
        throw std::invalid_argument(
            fmt::format("AsynchConfig.{} = {} is outside [{}, {}]", field, value, lo, hi));
}
} // namespace

void validate(const AsynchConfig &cfg)
{
    if (cfg.tx < 0)
        throw std::invalid_argument(fmt::format("AsynchConfig.tx = {} is negative", cfg.tx));
    if (cfg.rx < 0)
        throw std::invalid_argument(fmt::format("AsynchConfig.rx = {} is negative", cfg.rx));
    if (cfg.baud < 0)
        throw std::invalid_argument(fmt::format("AsynchConfig.baud = {} is negative", cfg.baud));
    check_range("rx_buffer", cfg.rx_buffer, 0, AsynchUpdater::kMaxRxBufferBytes);
    check_range("num_data_bits", cfg.num_data_bits, 0, 8);
    check_range("num_stop_bits", cfg.num_stop_bits, 0, 2);
    check_range("parity", cfg.parity, 0, 2);
}

AsynchConfig asynch_profile(std::string_view name)
{
    if (name == "reflow")
        return AsynchConfig{5, 4, 9600, 6, 0, 1, 0};
    if (name == "machining")
        return AsynchConfig{1, 0, 9600, 6, 0, 1, 0};
    throw std::invalid_argument(fmt::format("Asynch profile '{}' doesn't exist", name));
}

AsynchUpdater::AsynchUpdater(Driver &driver, int handle)
    : m_driver(&driver), m_handle(handle), m_last_host_tick(driver.host_tick())
{
}

AsynchUpdater AsynchUpdater::experiment(Driver &driver, int handle, std::string_view profile)
{
    const AsynchConfig cfg = asynch_profile(profile);
    AsynchUpdater au(driver, handle);
    au.init_asynch(cfg);
    return au;
}

AsynchUpdater AsynchUpdater::with_configuration(Driver &driver, int handle,
                                                const AsynchConfig &cfg)
{
    AsynchUpdater au(driver, handle);
    au.init_asynch(cfg);
    return au;
}

bool AsynchUpdater::asynch_enabled()
{
    return m_driver->read_name(m_handle, "ASYNCH_ENABLE") != 0.0;
}

void AsynchUpdater::init_asynch(const AsynchConfig &cfg)
{
    validate(cfg);

    if (asynch_enabled())
        m_driver->write_name(m_handle, "ASYNCH_ENABLE", 0);

    m_driver->write_name(m_handle, "ASYNCH_TX_DIONUM", cfg.tx);
    m_driver->write_name(m_handle, "ASYNCH_RX_DIONUM", cfg.rx);
    m_driver->write_name(m_handle, "ASYNCH_BAUD", cfg.baud);
    m_driver->write_name(m_handle, "ASYNCH_RX_BUFFER_SIZE_BYTES", cfg.rx_buffer);
    m_driver->write_name(m_handle, "ASYNCH_NUM_DATA_BITS", cfg.num_data_bits);
    m_driver->write_name(m_handle, "ASYNCH_NUM_STOP_BITS", cfg.num_stop_bits);
    m_driver->write_name(m_handle, "ASYNCH_PARITY", cfg.parity);
    m_driver->write_name(m_handle, "ASYNCH_ENABLE", 1);

    LOGGER_INFO("Asynch initialised: TX DIO{} RX DIO{} {} baud, rx buffer {} bytes", cfg.tx,
                cfg.rx, cfg.baud, cfg.rx_buffer);
}

void AsynchUpdater::wait_for_spacing()
{
    const std::int64_t elapsed = m_driver->host_tick() - m_last_host_tick;
    if (elapsed < kMinActionSpacingUs)
        std::this_thread::sleep_for(std::chrono::microseconds(kMinActionSpacingUs - elapsed));
}

void AsynchUpdater::transmit(const std::vector<std::uint8_t> &frame)
{
    if (frame.empty())
        throw std::invalid_argument("Cannot transmit an empty asynch frame");

    wait_for_spacing();
    m_driver->write_name(m_handle, "ASYNCH_NUM_BYTES_TX", static_cast<double>(frame.size()));
    m_driver->write_name_array(m_handle, "ASYNCH_DATA_TX",
                               std::vector<double>(frame.begin(), frame.end()));
    m_driver->write_name(m_handle, "ASYNCH_TX_GO", 1);
    m_last_host_tick = m_driver->host_tick();

    LOGGER_TRACE("Asynch TX {} bytes", frame.size());
}

std::vector<std::uint8_t> AsynchUpdater::receive()
{
    wait_for_spacing();
    const double raw_rx = m_driver->read_name(m_handle, "ASYNCH_NUM_BYTES_RX");
    if (!(raw_rx >= 0.0 && raw_rx <= kMaxRxBufferBytes))
        throw std::runtime_error(
            fmt::format("ASYNCH_NUM_BYTES_RX = {} is outside [0, {}]", raw_rx, kMaxRxBufferBytes));
    const int num_rx = static_cast<int>(raw_rx);

    std::vector<std::uint8_t> out;
    if (num_rx > 0)
    {
        auto values = m_driver->read_name_array(m_handle, "ASYNCH_DATA_RX", num_rx);
        out.reserve(values.size());
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            const double v = values[i];
            if (!(v >= 0.0 && v <= 255.0))
                throw std::runtime_error(
                    fmt::format("ASYNCH_DATA_RX[{}] = {} is not a byte", i, v));
            out.push_back(static_cast<std::uint8_t>(v));
        }
    }
    m_last_host_tick = m_driver->host_tick();

    LOGGER_TRACE("Asynch RX {} bytes", out.size());
    return out;
}

} // namespace ljdaq::device
