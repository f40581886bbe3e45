#pragma once
/**
 * @file intervaler.hpp
 * @brief Timed loop paced by the LJM interval primitive.
 *
 * Each iteration runs an "inside" operation and then blocks in
 * `WaitForNextInterval`, so the inside operation starts once per interval.
 * If it overruns, the driver reports how many intervals were skipped.
 * An optional "outside" operation runs right after each interval ends.
 *
 * @code
 *   Intervaler iv(driver, 10'000, 100);  // 10 ms x 100
 *   auto res = iv.start_interval([&](int it) {
 *       return IterationResult{it + 1, {updater.update(codes[it])}};
 *   });
 * @endcode
 */

#include "device/ljm_driver.hpp"
#include "device/updater.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

#include "ljdaq_export.h"

namespace ljdaq::device
{

/// What an operation hands back to the loop.
struct IterationResult
{
    /// The iteration to continue from. The inside operation must advance it.
    int iteration{0};
    /// Appended to the loop's responses in order; may be empty.
    std::vector<Readings> responses;
};

using IntervalOperation = std::function<IterationResult(int iteration)>;

struct IntervalResult
{
    double interval_time_us{0.0};    ///< Mean iteration time, 0 when no iteration ran.
    std::int64_t total_time_us{0};   ///< From before the first iteration to after the last.
    std::vector<Readings> responses; ///< Inside and outside responses, in call order.
    int skipped_intervals{0};        ///< Sum of skipped intervals over all iterations.
    bool stopped{false};             ///< True if `request_stop()` ended the loop early.
};

class LJDAQ_EXPORT Intervaler
{
  public:
    /// Picks a random interval handle in [1, 999].
    Intervaler(Driver &driver, std::int64_t interval_time_us, int num_iter);
    Intervaler(Driver &driver, std::int64_t interval_time_us, int num_iter, int interval_handle);
    ~Intervaler();

    Intervaler(const Intervaler &) = delete;
    Intervaler &operator=(const Intervaler &) = delete;
    Intervaler(Intervaler &&) = delete;
    Intervaler &operator=(Intervaler &&) = delete;

    /**
     * @brief Runs the loop until the iteration count is reached or a stop is requested.
     *
     * The interval is cleaned before returning, including when an operation
     * or the driver throws.
     */
    IntervalResult start_interval(const IntervalOperation &inside,
                                  const IntervalOperation &outside = {});

    /// Ends a running loop after its current iteration. Safe from any thread.
    void request_stop() noexcept { m_stop_requested.store(true, std::memory_order_release); }

    int interval_handle() const noexcept { return m_interval_handle; }
    std::int64_t interval_time_us() const noexcept { return m_interval_time_us; }
    int num_iter() const noexcept { return m_num_iter; }

  private:
    void clean_interval();

    Driver *m_driver;
    std::int64_t m_interval_time_us;
    int m_num_iter;
    int m_interval_handle;
    bool m_interval_active{false};
    std::atomic<bool> m_stop_requested{false};
};

} // namespace ljdaq::device
