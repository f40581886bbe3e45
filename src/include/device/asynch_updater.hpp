#pragma once
/**
 * @file asynch_updater.hpp
 * @brief UART (asynchronous serial) over the T-series DIO lines.
 *
 * The T4/T7 UART uses RS-232 timing and framing at 3.3 V logic levels; an
 * RS-232 peer needs a level converter (e.g. MAX233).
 *
 * Consecutive `transmit()` / `receive()` calls on the same object are spaced
 * at least `kMinActionSpacingUs` apart, measured with the LJM host tick, so
 * the peer has time to take each command.
 */

#include "device/ljm_driver.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

#include "ljdaq_export.h"

namespace ljdaq::device
{

/**
 * @brief Values for the ASYNCH_* configuration registers.
 *
 * | Field         | Register                      | Range                          |
 * |---------------|-------------------------------|--------------------------------|
 * | tx            | ASYNCH_TX_DIONUM              | DIO line number                |
 * | rx            | ASYNCH_RX_DIONUM              | DIO line number                |
 * | baud          | ASYNCH_BAUD                   | typically 9600, max 38400      |
 * | rx_buffer     | ASYNCH_RX_BUFFER_SIZE_BYTES   | 0..2048 (0 selects 200)        |
 * | num_data_bits | ASYNCH_NUM_DATA_BITS          | 0..8 (0 selects 8)             |
 * | num_stop_bits | ASYNCH_NUM_STOP_BITS          | 0..2                           |
 * | parity        | ASYNCH_PARITY                 | 0 none, 1 odd, 2 even          |
 */
struct AsynchConfig
{
    int tx{0};
    int rx{0};
    int baud{0};
    int rx_buffer{0};
    int num_data_bits{0};
    int num_stop_bits{0};
    int parity{0};

    bool operator==(const AsynchConfig &) const = default;
};

/// @throws std::invalid_argument naming the first field out of range.
LJDAQ_EXPORT void validate(const AsynchConfig &cfg);

/// Built-in profiles "reflow" and "machining". @throws std::invalid_argument otherwise.
LJDAQ_EXPORT AsynchConfig asynch_profile(std::string_view name);

class LJDAQ_EXPORT AsynchUpdater
{
  public:
    static constexpr std::int64_t kMinActionSpacingUs = 50'000;
    /// Largest UART receive buffer the device supports.
    static constexpr int kMaxRxBufferBytes = 2048;

    AsynchUpdater(Driver &driver, int handle);

    /// Creates the updater and configures UART from a built-in profile.
    static AsynchUpdater experiment(Driver &driver, int handle, std::string_view profile);

    /// Creates the updater and configures UART from @p cfg.
    static AsynchUpdater with_configuration(Driver &driver, int handle, const AsynchConfig &cfg);

    /// Reads ASYNCH_ENABLE.
    bool asynch_enabled();

    /**
     * @brief Writes the UART configuration and enables it.
     *
     * If UART is already enabled it is disabled first, since the
     * configuration registers only take effect while disabled.
     */
    void init_asynch(const AsynchConfig &cfg);

    /// Sends one frame. @throws std::invalid_argument on an empty frame.
    void transmit(const std::vector<std::uint8_t> &frame);

    /**
     * @brief Returns whatever is waiting in the receive buffer (possibly nothing).
     * @throws std::runtime_error if the device reports a byte count or a byte
     *         value it cannot hold.
     */
    std::vector<std::uint8_t> receive();

    std::int64_t last_host_tick() const noexcept { return m_last_host_tick; }

  private:
    void wait_for_spacing();

    Driver *m_driver;
    int m_handle;
    std::int64_t m_last_host_tick;
};

} // namespace ljdaq::device
