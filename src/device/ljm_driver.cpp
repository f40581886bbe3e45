#include "device/ljm_driver.hpp"
#include "device/ljm_codes.hpp"

#include <LabJackM.h>

#include <fmt/format.h>

namespace ljdaq::device
{

namespace
{

std::vector<const char *> c_names(const std::vector<std::string> &names)
{
    std::vector<const char *> out;
    out.reserve(names.size());
    for (const auto &n : names)
        out.push_back(n.c_str());
    return out;
}

void check_error(int err, const std::string &context, int error_address = -1)
{
    check_ljm_result(err, context, error_address, &LjmDriver::error_name);
}

} // namespace

std::string LjmDriver::error_name(int code)
{
    char buf[LJM_MAX_NAME_SIZE] = {};
    LJM_ErrorToString(code, buf);
    return std::string(buf);
}

int LjmDriver::open(const std::string &device_type, const std::string &connection_type,
                    const std::string &identifier)
{
    int handle = 0;
    int err = LJM_OpenS(device_type.c_str(), connection_type.c_str(), identifier.c_str(), &handle);
    check_error(err, fmt::format("OpenS({}, {}, {})", device_type, connection_type, identifier));
    return handle;
}

void LjmDriver::close(int handle)
{
    check_error(LJM_Close(handle), "Close()");
}

HandleInfo LjmDriver::handle_info(int handle)
{
    HandleInfo info;
    int err = LJM_GetHandleInfo(handle, &info.device_type, &info.connection_type,
                                &info.serial_number, &info.ip_address, &info.port,
                                &info.max_bytes_per_mb);
    check_error(err, "GetHandleInfo()");
    return info;
}

std::string LjmDriver::describe(const HandleInfo &info)
{
    char ip[LJM_IPv4_STRING_SIZE] = {};
    check_error(LJM_NumberToIP(static_cast<unsigned int>(info.ip_address), ip), "NumberToIP()");
    return fmt::format("device type: {}; connection type: {}; serial number: {}; IP address: {}; "
                       "port: {}; max bytes per packet: {}",
                       device_type_name(info.device_type),
                       connection_type_name(info.connection_type), info.serial_number, ip,
                       info.port, info.max_bytes_per_mb);
}

double LjmDriver::read_name(int handle, const std::string &name)
{
    double value = 0.0;
    check_error(LJM_eReadName(handle, name.c_str(), &value), fmt::format("eReadName({})", name));
    return value;
}

void LjmDriver::write_name(int handle, const std::string &name, double value)
{
    check_error(LJM_eWriteName(handle, name.c_str(), value),
                fmt::format("eWriteName({}, {})", name, value));
}

std::vector<double> LjmDriver::read_names(int handle, const std::vector<std::string> &names)
{
    auto cn = c_names(names);
    std::vector<double> values(names.size(), 0.0);
    int error_address = -1;
    int err = LJM_eReadNames(handle, static_cast<int>(cn.size()), cn.data(), values.data(),
                             &error_address);
    check_error(err, "eReadNames()", error_address);
    return values;
}

void LjmDriver::write_names(int handle, const std::vector<std::string> &names,
                            const std::vector<double> &values)
{
    auto cn = c_names(names);
    int error_address = -1;
    int err = LJM_eWriteNames(handle, static_cast<int>(cn.size()), cn.data(), values.data(),
                              &error_address);
    check_error(err, "eWriteNames()", error_address);
}

std::vector<double> LjmDriver::read_name_array(int handle, const std::string &name,
                                               int num_values)
{
    std::vector<double> values(static_cast<std::size_t>(num_values), 0.0);
    int error_address = -1;
    int err =
        LJM_eReadNameArray(handle, name.c_str(), num_values, values.data(), &error_address);
    check_error(err, fmt::format("eReadNameArray({})", name), error_address);
    return values;
}

void LjmDriver::write_name_array(int handle, const std::string &name,
                                 const std::vector<double> &values)
{
    int error_address = -1;
    int err = LJM_eWriteNameArray(handle, name.c_str(), static_cast<int>(values.size()),
                                  values.data(), &error_address);
    check_error(err, fmt::format("eWriteNameArray({}, {} values)", name, values.size()),
                error_address);
}

int LjmDriver::name_to_address(const std::string &name)
{
    int address = 0;
    int type = 0;
    check_error(LJM_NameToAddress(name.c_str(), &address, &type),
                fmt::format("NameToAddress({})", name));
    return address;
}

double LjmDriver::stream_start(int handle, int scans_per_read, const std::vector<int> &scan_list,
                               double scan_rate)
{
    double actual = scan_rate;
    int err = LJM_eStreamStart(handle, scans_per_read, static_cast<int>(scan_list.size()),
                               scan_list.data(), &actual);
    check_error(err, fmt::format("eStreamStart({} Hz)", scan_rate));
    return actual;
}

void LjmDriver::stream_stop(int handle)
{
    check_error(LJM_eStreamStop(handle), "eStreamStop()");
}

void LjmDriver::start_interval(int interval_handle, int microseconds)
{
    check_error(LJM_StartInterval(interval_handle, microseconds),
                fmt::format("StartInterval({}, {} us)", interval_handle, microseconds));
}

int LjmDriver::wait_for_next_interval(int interval_handle)
{
    int skipped = 0;
    check_error(LJM_WaitForNextInterval(interval_handle, &skipped),
                fmt::format("WaitForNextInterval({})", interval_handle));
    return skipped;
}

void LjmDriver::clean_interval(int interval_handle)
{
    check_error(LJM_CleanInterval(interval_handle),
                fmt::format("CleanInterval({})", interval_handle));
}

std::int64_t LjmDriver::host_tick()
{
    return static_cast<std::int64_t>(LJM_GetHostTick());
}

} // namespace ljdaq::device
