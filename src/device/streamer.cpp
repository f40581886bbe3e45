#include "device/streamer.hpp"
#include "device/ljm_error.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace ljdaq::device
{

using format_tools::indexed_register;

Streamer::Streamer(Driver &driver, int handle, std::vector<std::string> out_names)
    : m_driver(&driver), m_handle(handle), m_out_names(std::move(out_names))
{
    if (m_out_names.empty())
        throw std::invalid_argument("Streamer needs at least one stream-out target");
}

Streamer::~Streamer()
{
    try
    {
        disable_stream_out();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Streamer: disabling stream-out failed: {}", e.what());
    }
    try
    {
        stop_stream();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Streamer: stopping stream failed: {}", e.what());
    }
}

std::unique_ptr<Streamer> Streamer::init_reset(Driver &driver, int handle,
                                               std::vector<std::string> out_names)
{
    auto s = std::make_unique<Streamer>(driver, handle, std::move(out_names));
    s->reset_stream();
    return s;
}

Streamer::BufferType Streamer::parse_buffer_type(std::string_view name)
{
    if (name == "int")
        return BufferType::U16;
    if (name == "float")
        return BufferType::F32;
    throw std::invalid_argument(
        fmt::format("Buffer type '{}' is invalid - choose either 'int' or 'float'", name));
}

std::size_t Streamer::bytes_per_value(BufferType type) noexcept
{
    return type == BufferType::U16 ? 2 : 4;
}

std::size_t Streamer::round_up_power_of_two(std::size_t n)
{
    constexpr std::size_t kLargestPower = ~(std::numeric_limits<std::size_t>::max() >> 1);
    if (n > kLargestPower)
        throw std::overflow_error(
            fmt::format("No power of two >= {} fits in {} bits", n,
                        std::numeric_limits<std::size_t>::digits));
    std::size_t p = 1;
    while (p < n)
        p <<= 1;
    return p;
}

std::size_t Streamer::required_buffer_bytes(std::size_t num_values, BufferType type)
{
    const std::size_t max_values = static_cast<std::size_t>(kMaxBufferBytes) / bytes_per_value(type);
    if (num_values > max_values)
        throw std::invalid_argument(
            fmt::format("{} values do not fit a stream-out buffer; the maximum is {} ({} bytes)",
                        num_values, max_values, kMaxBufferBytes));
    return round_up_power_of_two(num_values) * bytes_per_value(type);
}

std::vector<int> Streamer::out_addresses()
{
    std::vector<int> out;
    out.reserve(m_out_names.size());
    for (const auto &name : m_out_names)
        out.push_back(m_driver->name_to_address(name));
    return out;
}

std::vector<int> Streamer::stream_nums() const
{
    std::vector<int> nums(m_out_names.size());
    for (std::size_t i = 0; i < nums.size(); ++i)
        nums[i] = static_cast<int>(i);
    return nums;
}

std::vector<int> Streamer::scan_list()
{
    std::vector<int> out;
    out.reserve(m_out_names.size());
    for (int n : stream_nums())
        out.push_back(m_driver->name_to_address(indexed_register("STREAM_OUT{}", n)));
    return out;
}

void Streamer::reset_stream()
{
    m_driver->write_name(m_handle, "STREAM_SETTLING_US", 0);
    m_driver->write_name(m_handle, "STREAM_RESOLUTION_INDEX", 0);
    m_driver->write_name(m_handle, "STREAM_CLOCK_SOURCE", 0);
    m_driver->write_name(m_handle, "STREAM_TRIGGER_INDEX", 0);
}

void Streamer::configure_stream(int loop_num_vals, int buffer_bytes)
{
    if (buffer_bytes <= 0 || buffer_bytes > kMaxBufferBytes ||
        round_up_power_of_two(static_cast<std::size_t>(buffer_bytes)) !=
            static_cast<std::size_t>(buffer_bytes))
        throw std::invalid_argument(fmt::format(
            "Stream-out buffer size {} must be a power of two no larger than {}", buffer_bytes,
            kMaxBufferBytes));
    if (loop_num_vals < 0)
        throw std::invalid_argument("Stream-out loop size must not be negative");

    const auto addresses = out_addresses();
    for (int n : stream_nums())
    {
        m_driver->write_name(m_handle,
                             indexed_register("STREAM_OUT{}_BUFFER_ALLOCATE_NUM_BYTES", n),
                             buffer_bytes);
        m_driver->write_name(m_handle, indexed_register("STREAM_OUT{}_TARGET", n),
                             addresses[static_cast<std::size_t>(n)]);
        m_driver->write_name(m_handle, indexed_register("STREAM_OUT{}_ENABLE", n), 1);
        m_driver->write_name(m_handle, indexed_register("STREAM_OUT{}_LOOP_SIZE", n),
                             loop_num_vals);
        // Alias of STREAM_OUT{n}_LOOP_NUM_VALUES; makes new data take effect immediately.
        m_driver->write_name(m_handle, indexed_register("STREAM_OUT{}_SET_LOOP", n), 1);
    }
    m_buffer_bytes = buffer_bytes;

    LOGGER_DEBUG("Stream-out configured for [{}]: {} byte buffers, loop {}",
                 format_tools::join(m_out_names), buffer_bytes, loop_num_vals);
}

void Streamer::load_data(const std::vector<std::vector<double>> &channels, BufferType type)
{
    if (channels.size() != m_out_names.size())
        throw std::invalid_argument(fmt::format("Got {} data channels for {} stream-out targets",
                                                channels.size(), m_out_names.size()));

    const std::size_t capacity = static_cast<std::size_t>(m_buffer_bytes) / bytes_per_value(type);
    for (std::size_t i = 0; i < channels.size(); ++i)
    {
        const auto &data = channels[i];
        if (data.empty())
            throw std::invalid_argument(fmt::format("Data channel {} is empty", i));
        if (data.size() > capacity)
            throw std::invalid_argument(
                fmt::format("Data channel {} holds {} values; the {} byte buffer fits {}", i,
                            data.size(), m_buffer_bytes, capacity));
        if (type == BufferType::U16)
        {
            auto bad = std::find_if(data.begin(), data.end(),
                                    [](double v) { return !(v >= 0.0 && v <= 65535.0); });
            if (bad != data.end())
                throw std::invalid_argument(fmt::format(
                    "Data channel {} value {} is outside the U16 range", i, *bad));
        }
    }

    const char *pattern =
        type == BufferType::U16 ? "STREAM_OUT{}_BUFFER_U16" : "STREAM_OUT{}_BUFFER_F32";

    m_data_lengths.clear();
    for (int n : stream_nums())
    {
        const auto &data = channels[static_cast<std::size_t>(n)];
        m_driver->write_name_array(m_handle, indexed_register(pattern, n), data);
        m_data_lengths.push_back(data.size());
    }
}

StreamResult Streamer::start_stream(double stream_time_s, int scans_per_read)
{
    if (m_data_lengths.empty())
        throw std::logic_error("Load some data in before starting the stream");
    if (!(stream_time_s > 0.0))
        throw std::invalid_argument("Stream time must be positive");
    if (scans_per_read < 1)
        throw std::invalid_argument("Scans per read must be at least 1");

    {
        std::lock_guard<std::mutex> lock(m_stop_mutex);
        m_stop_requested = false;
    }

    const double max_len =
        static_cast<double>(*std::max_element(m_data_lengths.begin(), m_data_lengths.end()));
    const double scan_rate = max_len / stream_time_s;

    // Starting the stream does not block; the wait below does.
    const double actual_rate =
        m_driver->stream_start(m_handle, scans_per_read, scan_list(), scan_rate);
    if (!(actual_rate > 0.0))
        throw std::runtime_error(fmt::format("eStreamStart returned scan rate {}", actual_rate));

    const double actual_time = 1.02 * (max_len / actual_rate);
    LOGGER_INFO("Streaming {} values to [{}] at {:.3f} Hz (requested {:.3f} Hz) for {:.3f} s",
                max_len, format_tools::join(m_out_names), actual_rate, scan_rate, actual_time);

    StreamResult result{actual_time, actual_rate, false};
    {
        std::unique_lock<std::mutex> lock(m_stop_mutex);
        result.stopped = m_stop_cv.wait_for(lock, std::chrono::duration<double>(actual_time),
                                            [this] { return m_stop_requested; });
    }

    if (result.stopped)
    {
        LOGGER_INFO("Streaming stopped by user.");
        disable_stream_out();
        stop_stream();
    }
    return result;
}

void Streamer::request_stop()
{
    {
        std::lock_guard<std::mutex> lock(m_stop_mutex);
        m_stop_requested = true;
    }
    m_stop_cv.notify_all();
}

void Streamer::disable_stream_out()
{
    for (int n : stream_nums())
        m_driver->write_name(m_handle, indexed_register("STREAM_OUT{}_ENABLE", n), 0);
}

void Streamer::stop_stream()
{
    try
    {
        m_driver->stream_stop(m_handle);
    }
    catch (const LjmError &e)
    {
        if (!e.is_stream_not_running())
            throw LjmError("Cannot stop stream", e);
    }
}

} // namespace ljdaq::device
