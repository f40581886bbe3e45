#pragma once
/**
 * @file labjack_daq.hpp
 * @brief LabJackDaq: owns an open T-series device and its helpers.
 *
 * Opening the device happens in the constructor; the handle is closed when
 * the object is destroyed (or earlier, by `close()`). Helpers are added on
 * demand and share the handle:
 *
 * | Helper          | Added by            | Accessor        |
 * |-----------------|---------------------|-----------------|
 * | `Updater`       | `add_update()`      | `update()`      |
 * | `AsynchUpdater` | `add_asynch()`      | `asynch()`      |
 * | `Streamer`      | `add_stream_out()`  | `stream_out()`  |
 * | `Intervaler`    | `add_interval()`    | `interval()`    |
 *
 * @code
 *   auto daq = LabJackDaq::experiment("machine");
 *   daq->update().update({32768, 32768});
 *   daq->stream_out().configure_stream();
 * @endcode
 */

#include "device/asynch_updater.hpp"
#include "device/intervaler.hpp"
#include "device/ljm_driver.hpp"
#include "device/streamer.hpp"
#include "device/updater.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ljdaq_export.h"

namespace ljdaq
{
struct DaqConfig;
}

namespace ljdaq::device
{

class LJDAQ_EXPORT LabJackDaq
{
  public:
    /**
     * @brief Opens a device through the LJM library.
     * @param device_type     "ANY", "T4", "T7", "DIGIT", optionally prefixed "LJM_dt".
     * @param connection_type "ANY", "USB", "TCP", "ETHERNET", "WIFI", optionally prefixed "LJM_ct".
     * @param identifier      Serial number, IP address, device name or "ANY".
     */
    explicit LabJackDaq(const std::string &device_type = "ANY",
                        const std::string &connection_type = "ANY",
                        const std::string &identifier = "ANY");

    /// Opens a device through @p driver.
    LabJackDaq(std::shared_ptr<Driver> driver, const std::string &device_type = "ANY",
               const std::string &connection_type = "ANY",
               const std::string &identifier = "ANY");

    /// Tears down stream-out and the interval, then closes the device. Never throws.
    ~LabJackDaq();

    LabJackDaq(const LabJackDaq &) = delete;
    LabJackDaq &operator=(const LabJackDaq &) = delete;
    LabJackDaq(LabJackDaq &&) = delete;
    LabJackDaq &operator=(LabJackDaq &&) = delete;

    /**
     * @brief Opens a device and adds the helpers of a built-in experiment.
     *
     * - "reflow":  T4 with the `reflow` UART profile.
     * - "machine": T7 with the `machining` UART profile, an updater writing
     *   DAC0_BINARY/DAC1_BINARY and reading DAC0/DAC1, and stream-out on DAC0/DAC1.
     *
     * @throws std::invalid_argument for any other name.
     */
    static std::unique_ptr<LabJackDaq> experiment(std::string_view name,
                                                  std::shared_ptr<Driver> driver = nullptr);

    /// Same, with experiments, UART profiles and the device taken from @p cfg.
    static std::unique_ptr<LabJackDaq> from_config(const DaqConfig &cfg, std::string_view name,
                                                   std::shared_ptr<Driver> driver = nullptr);

    /**
     * @brief Closes the device.
     *
     * Stream-out and the interval are torn down first. A device that is
     * already closed is not an error; any other failure is rethrown as
     * `LjmError("Cannot close LabJack", ...)`.
     */
    void close();

    bool is_open() const noexcept { return m_open; }
    int handle() const noexcept { return m_handle; }
    Driver &driver() noexcept { return *m_driver; }
    const HandleInfo &info() const noexcept { return m_info; }
    /// One-line summary of the open device (type, connection, serial, IP, port, packet size).
    const std::string &description() const noexcept { return m_description; }

    /// Writes 0 V to DAC0 and DAC1.
    void reset_dacs();

    // --- Helpers ---
    void add_update(std::vector<std::string> write_names, std::vector<std::string> read_names);
    /// Creates a `Streamer` and resets the stream configuration.
    void add_stream_out(std::vector<std::string> out_names);
    /// Creates an `AsynchUpdater` configured from a built-in UART profile.
    void add_asynch(std::string_view profile);
    void add_asynch(const AsynchConfig &cfg);
    void add_interval(std::int64_t interval_time_us, int num_iter);

    bool has_update() const noexcept { return m_update.has_value(); }
    bool has_asynch() const noexcept { return m_asynch.has_value(); }
    bool has_stream_out() const noexcept { return m_stream_out != nullptr; }
    bool has_interval() const noexcept { return m_interval != nullptr; }

    /// @throws std::logic_error if the helper was never added.
    Updater &update();
    AsynchUpdater &asynch();
    Streamer &stream_out();
    Intervaler &interval();

  private:
    void release_helpers() noexcept;

    std::shared_ptr<Driver> m_driver;
    int m_handle{0};
    bool m_open{false};
    HandleInfo m_info;
    std::string m_description;

    std::optional<Updater> m_update;
    std::optional<AsynchUpdater> m_asynch;
    std::unique_ptr<Streamer> m_stream_out;
    std::unique_ptr<Intervaler> m_interval;
};

} // namespace ljdaq::device
