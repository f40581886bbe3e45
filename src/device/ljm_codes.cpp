#include "device/ljm_codes.hpp"
#include "device/ljm_error.hpp"
#include "utils/logger.hpp"

#include <LabJackM.h>

#include <fmt/format.h>

namespace ljdaq::device
{

bool is_ljm_warning(int code) noexcept
{
    return code >= LJME_WARNINGS_BEGIN && code <= LJME_WARNINGS_END;
}

void check_ljm_result(int code, const std::string &context, int error_address,
                      ErrorNameLookup error_name)
{
    if (code == LJME_NOERROR)
        return;

    const std::string where =
        error_address >= 0 ? fmt::format("{} at address {}", context, error_address) : context;

    if (is_ljm_warning(code))
    {
        LOGGER_WARN("{}: warning {} ({})", where, error_name(code), code);
        return;
    }
    throw LjmError(code, error_name(code), where);
}

const char *connection_type_name(int connection_type) noexcept
{
    switch (connection_type)
    {
    case LJM_ctANY:
        return "ANY";
    case LJM_ctUSB:
        return "USB";
    case LJM_ctTCP:
        return "TCP";
    case LJM_ctETHERNET:
        return "ETHERNET";
    case LJM_ctWIFI:
        return "WIFI";
    case LJM_ctNETWORK_UDP:
        return "NETWORK_UDP";
    case LJM_ctETHERNET_UDP:
        return "ETHERNET_UDP";
    case LJM_ctWIFI_UDP:
        return "WIFI_UDP";
    case LJM_ctNETWORK_ANY:
        return "NETWORK_ANY";
    case LJM_ctETHERNET_ANY:
        return "ETHERNET_ANY";
    case LJM_ctWIFI_ANY:
        return "WIFI_ANY";
    default:
        return "unknown connection type";
    }
}

const char *device_type_name(int device_type) noexcept
{
    switch (device_type)
    {
    case LJM_dtANY:
        return "ANY";
    case LJM_dtT4:
        return "T4";
    case LJM_dtT7:
        return "T7";
    case LJM_dtTSERIES:
        return "TSERIES";
    case LJM_dtDIGIT:
        return "DIGIT";
    default:
        return "unknown device type";
    }
}

} // namespace ljdaq::device
