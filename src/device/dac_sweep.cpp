#include "device/dac_sweep.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace ljdaq::device
{

namespace
{
constexpr int kDacCodeLimit = 65536;
}

std::vector<int> dac_binary_steps(int start, int stop, int step)
{
    if (step <= 0)
        throw std::invalid_argument(fmt::format("DAC sweep step {} must be positive", step));
    if (start < 0 || start >= stop || stop > kDacCodeLimit)
        throw std::invalid_argument(fmt::format(
            "DAC sweep range [{}, {}) must lie within [0, {})", start, stop, kDacCodeLimit));

    std::vector<int> codes;
    codes.reserve(static_cast<std::size_t>((stop - start + step - 1) / step));
    for (int code = start; code < stop; code += step)
        codes.push_back(code);
    return codes;
}

DacSweep::DacSweep(Driver &driver, int handle, DacSweepConfig cfg)
    : m_updater(driver, handle, cfg.write_names, cfg.read_names), m_cfg(std::move(cfg)),
      m_codes(dac_binary_steps(m_cfg.start, m_cfg.stop, m_cfg.step))
{
    if (m_cfg.write_names.empty())
        throw std::invalid_argument("DAC sweep needs at least one write register");
    if (m_cfg.runs < 1)
        throw std::invalid_argument(fmt::format("DAC sweep runs {} must be at least 1", m_cfg.runs));
}

std::vector<SweepRun> DacSweep::run()
{
    std::vector<SweepRun> runs;
    runs.reserve(static_cast<std::size_t>(m_cfg.runs));

    LOGGER_INFO("DAC sweep: {} codes x {} runs, writing [{}], reading [{}]", m_codes.size(),
                m_cfg.runs, format_tools::join(m_cfg.write_names),
                format_tools::join(m_cfg.read_names));

    const std::size_t num_writes = m_cfg.write_names.size();
    m_updater.write(std::vector<double>(num_writes, 0.0));
    LOGGER_DEBUG("DAC sweep: write registers zeroed");

    for (int r = 0; r < m_cfg.runs; ++r)
    {
        SweepRun points;
        points.reserve(m_codes.size());
        for (int code : m_codes)
        {
            Readings readings =
                m_updater.update(std::vector<double>(num_writes, static_cast<double>(code)));
            points.push_back(SweepPoint{code, std::move(readings)});
            if (code % 4096 == 0)
                LOGGER_DEBUG("DAC sweep run {}: code {}", r, code);
        }
        runs.push_back(std::move(points));
        LOGGER_DEBUG("DAC sweep run {} finished", r);
    }
    return runs;
}

} // namespace ljdaq::device
