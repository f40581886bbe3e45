#pragma once
/**
 * @file streamer.hpp
 * @brief Stream-out: play buffered waveforms to output registers.
 *
 * Each target register (e.g. "DAC0") gets a stream-out slot n with its own
 * device-side buffer (`STREAM_OUT{n}_*` registers). A stream scans every
 * `STREAM_OUT{n}` once per scan, so the whole waveform plays in
 * `max data length / scan rate` seconds.
 *
 * Typical sequence:
 * @code
 *   auto s = Streamer::init_reset(driver, handle, {"DAC0", "DAC1"});
 *   s->configure_stream();
 *   s->load_data({ramp, ramp}, Streamer::parse_buffer_type("int"));
 *   auto res = s->start_stream(2.0);   // blocks ~2 s
 * @endcode
 *
 * The object stops the stream and disables its stream-out slots when destroyed.
 */

#include "device/ljm_driver.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ljdaq_export.h"

namespace ljdaq::device
{

/// Outcome of `Streamer::start_stream()`.
struct StreamResult
{
    double wait_time_s{0.0};  ///< Computed wait: 2% longer than the waveform at `scan_rate_hz`.
    double scan_rate_hz{0.0}; ///< Scan rate the device chose.
    bool stopped{false};      ///< True if `request_stop()` ended the wait early.
};

class LJDAQ_EXPORT Streamer
{
  public:
    enum class BufferType
    {
        U16, ///< STREAM_OUT{n}_BUFFER_U16, 2 bytes per value, 0..65535
        F32, ///< STREAM_OUT{n}_BUFFER_F32, 4 bytes per value
    };

    /// Largest stream-out buffer the device accepts (2^14 bytes).
    static constexpr int kMaxBufferBytes = 1 << 14;

    Streamer(Driver &driver, int handle, std::vector<std::string> out_names);
    ~Streamer();

    Streamer(const Streamer &) = delete;
    Streamer &operator=(const Streamer &) = delete;
    Streamer(Streamer &&) = delete;
    Streamer &operator=(Streamer &&) = delete;

    /// Constructs and calls `reset_stream()`.
    static std::unique_ptr<Streamer> init_reset(Driver &driver, int handle,
                                                std::vector<std::string> out_names);

    // --- Pure helpers ---
    /// "int" → U16, "float" → F32. @throws std::invalid_argument otherwise.
    static BufferType parse_buffer_type(std::string_view name);
    static std::size_t bytes_per_value(BufferType type) noexcept;
    /// Smallest power of two >= n (1 for n == 0).
    /// @throws std::overflow_error if that power does not fit in `std::size_t`.
    static std::size_t round_up_power_of_two(std::size_t n);
    /// Buffer bytes needed for @p num_values. @throws std::invalid_argument above kMaxBufferBytes.
    static std::size_t required_buffer_bytes(std::size_t num_values, BufferType type);

    // --- Targets ---
    const std::vector<std::string> &out_names() const noexcept { return m_out_names; }
    std::vector<int> out_addresses();
    std::vector<int> stream_nums() const;
    /// Address of `STREAM_OUT{n}` for every target, in target order.
    std::vector<int> scan_list();

    // --- Device configuration ---
    /// Zeroes stream settling, resolution, clock source and trigger.
    void reset_stream();

    /**
     * @brief Allocates and enables a stream-out slot per target.
     * @param loop_num_vals Values from the end of the data to repeat once it is exhausted.
     * @param buffer_bytes  Buffer size per slot; a power of two, at most kMaxBufferBytes.
     */
    void configure_stream(int loop_num_vals = 0, int buffer_bytes = kMaxBufferBytes);

    /**
     * @brief Loads one channel of data per target.
     * @throws std::invalid_argument if the channel count differs from the target
     *         count, a channel is empty, a channel does not fit the configured
     *         buffer, or a U16 value is outside 0..65535.
     */
    void load_data(const std::vector<std::vector<double>> &channels, BufferType type);

    const std::vector<std::size_t> &data_lengths() const noexcept { return m_data_lengths; }

    // --- Running ---
    /**
     * @brief Starts the stream and blocks until it should have finished.
     *
     * The scan rate is `max data length / stream_time_s`. The wait lasts 2%
     * longer than the waveform at the rate the device actually chose, and
     * ends early on `request_stop()`. A stopped wait disables stream-out and
     * stops the stream before returning.
     *
     * @throws std::logic_error if no data was loaded.
     */
    StreamResult start_stream(double stream_time_s, int scans_per_read = 1);

    /// Wakes a blocked `start_stream()`. Safe from any thread.
    void request_stop();

    /// Writes STREAM_OUT{n}_ENABLE = 0 for every target.
    void disable_stream_out();

    /// Stops the stream. A "stream not running" error is not an error here.
    void stop_stream();

  private:
    Driver *m_driver;
    int m_handle;
    std::vector<std::string> m_out_names;
    std::vector<std::size_t> m_data_lengths;
    int m_buffer_bytes{kMaxBufferBytes};

    std::mutex m_stop_mutex;
    std::condition_variable m_stop_cv;
    bool m_stop_requested{false};
};

} // namespace ljdaq::device
