#pragma once
/**
 * @file updater.hpp
 * @brief Batch register writer/reader.
 *
 * An `Updater` pairs a list of write registers with a list of read registers
 * (they may be the same). `update()` writes one value per write register in a
 * single batch and then reads back in a single batch.
 *
 * @code
 *   Updater up(driver, handle, {"DAC0_BINARY", "DAC1_BINARY"}, {"DAC0", "DAC1"});
 *   auto volts = up.update({32768, 65535});   // {"DAC0": 2.5, "DAC1": 5.0}
 * @endcode
 */

#include "device/ljm_driver.hpp"

#include <map>
#include <string>
#include <vector>

#include "ljdaq_export.h"

namespace ljdaq::device
{

/// Register name → value, as returned by a batch read.
using Readings = std::map<std::string, double>;

class LJDAQ_EXPORT Updater
{
  public:
    Updater(Driver &driver, int handle, std::vector<std::string> write_names,
            std::vector<std::string> read_names);

    /// Single-register convenience overload.
    Updater(Driver &driver, int handle, std::string write_name, std::string read_name);

    /// Updater whose read and write registers are identical.
    static Updater same_registers(Driver &driver, int handle, std::vector<std::string> names);

    /// True when both lists hold the same set of names (order and duplicates ignored).
    [[nodiscard]] bool has_same_registers() const;

    const std::vector<std::string> &write_names() const noexcept { return m_write_names; }
    const std::vector<std::string> &read_names() const noexcept { return m_read_names; }

    /// Batch read of the read registers.
    Readings read();

    /**
     * @brief Batch write of the write registers.
     * @throws std::invalid_argument if `values.size()` differs from the number
     *         of write registers.
     */
    void write(const std::vector<double> &values);
    void write(double value);

    /**
     * @brief Writes @p values, then reads.
     *
     * Reads the write registers back when `has_same_registers()`, the read
     * registers otherwise.
     * @throws std::invalid_argument on a length mismatch (nothing is written).
     */
    Readings update(const std::vector<double> &values);
    Readings update(double value);

  private:
    void check_length(const std::vector<double> &values) const;
    Readings batch_read(const std::vector<std::string> &names);

    Driver *m_driver;
    int m_handle;
    std::vector<std::string> m_write_names;
    std::vector<std::string> m_read_names;
};

} // namespace ljdaq::device
