#pragma once
/**
 * @file dac_sweep.hpp
 * @brief DAC calibration sweep.
 *
 * Steps a binary code through the DAC write registers and reads the DAC and
 * analog-input registers after each step. The result is the raw material for
 * a code → voltage calibration; analysis is done elsewhere.
 */

#include "device/ljm_driver.hpp"
#include "device/updater.hpp"

#include <string>
#include <vector>

#include "ljdaq_export.h"

namespace ljdaq::device
{

struct DacSweepConfig
{
    std::vector<std::string> write_names{"DAC0_BINARY", "DAC1_BINARY"};
    std::vector<std::string> read_names{"DAC0", "DAC1", "AIN0", "AIN1"};
    int start{0};
    int stop{65536}; ///< exclusive
    int step{1};
    int runs{1};
};

struct SweepPoint
{
    int code{0};
    Readings readings;
};

using SweepRun = std::vector<SweepPoint>;

/**
 * @brief Codes in [start, stop) spaced by @p step.
 * @throws std::invalid_argument unless 0 <= start < stop <= 65536 and step > 0.
 */
LJDAQ_EXPORT std::vector<int> dac_binary_steps(int start, int stop, int step);

class LJDAQ_EXPORT DacSweep
{
  public:
    DacSweep(Driver &driver, int handle, DacSweepConfig cfg = {});

    const DacSweepConfig &config() const noexcept { return m_cfg; }

    /// Zeroes the write registers, then returns one `SweepRun` per configured
    /// run, each with one point per code.
    std::vector<SweepRun> run();

  private:
    Updater m_updater;
    DacSweepConfig m_cfg;
    std::vector<int> m_codes;
};

} // namespace ljdaq::device
