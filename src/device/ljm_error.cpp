#include "device/ljm_error.hpp"

#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace ljdaq::device
{

namespace
{
constexpr std::string_view kDeviceNotOpen = "LJME_DEVICE_NOT_OPEN";
// The device-side code is reported as "STREAM_NOT_RUNNING", LJM's own as
// "LJME_STREAM_NOT_RUNNING".
constexpr std::string_view kStreamNotRunning = "STREAM_NOT_RUNNING";
} // namespace

LjmError::LjmError(int code, std::string name, std::string context)
    : std::runtime_error(fmt::format("{}: {} ({})", context, name, code)), m_code(code),
      m_name(std::move(name)), m_context(std::move(context))
{
}

LjmError::LjmError(const std::string &context, const LjmError &cause)
    : std::runtime_error(fmt::format("{}: {}", context, cause.what())), m_code(cause.m_code),
      m_name(cause.m_name), m_context(context)
{
}

bool LjmError::is_device_not_open() const noexcept
{
    return m_name == kDeviceNotOpen;
}

bool LjmError::is_stream_not_running() const noexcept
{
    return std::string_view(m_name).ends_with(kStreamNotRunning);
}

} // namespace ljdaq::device
