#pragma once
/**
 * @file ljm_driver.hpp
 * @brief The seam between the DAQ helpers and LabJack's LJM driver.
 *
 * `Driver` declares one virtual per vendor call the helpers make. `LjmDriver`
 * forwards each to `LabJackM.h`; tests substitute a mock.
 *
 * All calls throw `LjmError` on a driver error. Driver warnings are logged
 * and otherwise ignored.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "ljdaq_export.h"

namespace ljdaq::device
{

/// Result of LJM_GetHandleInfo.
struct HandleInfo
{
    int device_type{0};
    int connection_type{0};
    int serial_number{0};
    int ip_address{0};
    int port{0};
    int max_bytes_per_mb{0};
};

class LJDAQ_EXPORT Driver
{
  public:
    virtual ~Driver() = default;

    // --- Device handle ---
    virtual int open(const std::string &device_type, const std::string &connection_type,
                     const std::string &identifier) = 0;
    virtual void close(int handle) = 0;
    virtual HandleInfo handle_info(int handle) = 0;

    /// One-line human readable summary of @p info (device, connection, serial, IP, port, packet size).
    virtual std::string describe(const HandleInfo &info) = 0;

    // --- Register access by name ---
    virtual double read_name(int handle, const std::string &name) = 0;
    virtual void write_name(int handle, const std::string &name, double value) = 0;
    virtual std::vector<double> read_names(int handle, const std::vector<std::string> &names) = 0;
    virtual void write_names(int handle, const std::vector<std::string> &names,
                             const std::vector<double> &values) = 0;
    virtual std::vector<double> read_name_array(int handle, const std::string &name,
                                                int num_values) = 0;
    virtual void write_name_array(int handle, const std::string &name,
                                  const std::vector<double> &values) = 0;

    /// Modbus address of a register name.
    virtual int name_to_address(const std::string &name) = 0;

    // --- Stream ---
    /// Starts a stream and returns the scan rate the device actually chose.
    virtual double stream_start(int handle, int scans_per_read, const std::vector<int> &scan_list,
                                double scan_rate) = 0;
    virtual void stream_stop(int handle) = 0;

    // --- Timing ---
    virtual void start_interval(int interval_handle, int microseconds) = 0;
    /// Blocks until the next interval; returns the number of skipped intervals.
    virtual int wait_for_next_interval(int interval_handle) = 0;
    virtual void clean_interval(int interval_handle) = 0;
    /// Host clock in microseconds.
    virtual std::int64_t host_tick() = 0;
};

/// `Driver` backed by the LJM shared library.
class LJDAQ_EXPORT LjmDriver final : public Driver
{
  public:
    int open(const std::string &device_type, const std::string &connection_type,
             const std::string &identifier) override;
    void close(int handle) override;
    HandleInfo handle_info(int handle) override;
    std::string describe(const HandleInfo &info) override;

    double read_name(int handle, const std::string &name) override;
    void write_name(int handle, const std::string &name, double value) override;
    std::vector<double> read_names(int handle, const std::vector<std::string> &names) override;
    void write_names(int handle, const std::vector<std::string> &names,
                     const std::vector<double> &values) override;
    std::vector<double> read_name_array(int handle, const std::string &name,
                                        int num_values) override;
    void write_name_array(int handle, const std::string &name,
                          const std::vector<double> &values) override;
    int name_to_address(const std::string &name) override;

    double stream_start(int handle, int scans_per_read, const std::vector<int> &scan_list,
                        double scan_rate) override;
    void stream_stop(int handle) override;

    void start_interval(int interval_handle, int microseconds) override;
    int wait_for_next_interval(int interval_handle) override;
    void clean_interval(int interval_handle) override;
    std::int64_t host_tick() override;

    /// Vendor name of an LJM error code.
    static std::string error_name(int code);
};

} // namespace ljdaq::device
