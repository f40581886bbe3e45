#include "device/intervaler.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

#include <iterator>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace ljdaq::device
{

namespace
{
int random_interval_handle()
{
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(1, 999);
    return dist(gen);
}

void append(std::vector<Readings> &dst, std::vector<Readings> &&src)
{
    dst.insert(dst.end(), std::make_move_iterator(src.begin()),
               std::make_move_iterator(src.end()));
}
} // namespace

Intervaler::Intervaler(Driver &driver, std::int64_t interval_time_us, int num_iter)
    : Intervaler(driver, interval_time_us, num_iter, random_interval_handle())
{
}

Intervaler::Intervaler(Driver &driver, std::int64_t interval_time_us, int num_iter,
                       int interval_handle)
    : m_driver(&driver), m_interval_time_us(interval_time_us), m_num_iter(num_iter),
      m_interval_handle(interval_handle)
{
    if (interval_time_us <= 0)
        throw std::invalid_argument("Interval time must be positive");
    if (interval_time_us > std::numeric_limits<int>::max())
        throw std::invalid_argument(
            fmt::format("Interval time {} us exceeds the LJM maximum of {} us", interval_time_us,
                        std::numeric_limits<int>::max()));
    if (num_iter < 0)
        throw std::invalid_argument("Number of iterations must not be negative");
}

Intervaler::~Intervaler()
{
    if (!m_interval_active)
        return;
    try
    {
        clean_interval();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Intervaler: cleaning interval {} failed: {}", m_interval_handle, e.what());
    }
}

void Intervaler::clean_interval()
{
    m_driver->clean_interval(m_interval_handle);
    m_interval_active = false;
}

IntervalResult Intervaler::start_interval(const IntervalOperation &inside,
                                          const IntervalOperation &outside)
{
    if (!inside)
        throw std::invalid_argument("Intervaler needs an inside operation");

    m_stop_requested.store(false, std::memory_order_release);

    m_driver->start_interval(m_interval_handle, static_cast<int>(m_interval_time_us));
    m_interval_active = true;

    auto cleanup = utils::make_scope_guard(
        [this]()
        {
            try
            {
                clean_interval();
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("Intervaler: cleaning interval {} after failure: {}",
                             m_interval_handle, e.what());
            }
        });

    IntervalResult result;
    std::vector<std::int64_t> durations;
    durations.reserve(static_cast<std::size_t>(m_num_iter));

    const std::int64_t t_before_loop = m_driver->host_tick();
    int iteration = 0;

    while (iteration < m_num_iter)
    {
        if (m_stop_requested.load(std::memory_order_acquire))
        {
            result.stopped = true;
            LOGGER_INFO("Interval stopped by user at iteration {}", iteration);
            break;
        }

        const std::int64_t t_start = m_driver->host_tick();
        IterationResult in = inside(iteration);
        iteration = in.iteration;
        const int skipped = m_driver->wait_for_next_interval(m_interval_handle);
        const std::int64_t t_end = m_driver->host_tick();

        append(result.responses, std::move(in.responses));
        durations.push_back(t_end - t_start);

        if (outside)
        {
            // Only its responses are kept; the iteration it returns is ignored.
            IterationResult out = outside(iteration);
            append(result.responses, std::move(out.responses));
        }

        if (skipped > 0)
        {
            result.skipped_intervals += skipped;
            LOGGER_WARN("Iteration {} skipped intervals: {}", iteration, skipped);
        }
    }

    result.total_time_us = m_driver->host_tick() - t_before_loop;

    cleanup.dismiss();
    clean_interval();

    if (!durations.empty())
        result.interval_time_us =
            static_cast<double>(std::accumulate(durations.begin(), durations.end(),
                                                std::int64_t{0})) /
            static_cast<double>(durations.size());

    LOGGER_DEBUG("Interval {} done: {} iterations, mean {:.1f} us, total {} us",
                 m_interval_handle, durations.size(), result.interval_time_us,
                 result.total_time_us);
    return result;
}

} // namespace ljdaq::device
