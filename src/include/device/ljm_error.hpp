#pragma once
/**
 * @file ljm_error.hpp
 * @brief Exception raised for failed LJM driver calls.
 *
 * The driver reports failures as integer codes; `LJM_ErrorToString` maps a
 * code to its name (e.g. "LJME_DEVICE_NOT_OPEN", "STREAM_NOT_RUNNING").
 * Callers that tolerate a particular failure match on that name.
 */

#include <stdexcept>
#include <string>

#include "ljdaq_export.h"

namespace ljdaq::device
{

class LJDAQ_EXPORT LjmError : public std::runtime_error
{
  public:
    /**
     * @param code    Raw LJM return code (0 when the error did not come from the driver).
     * @param name    Vendor error name for @p code.
     * @param context The call that failed, e.g. "eWriteName(DAC0)".
     */
    LjmError(int code, std::string name, std::string context);

    /// Wraps @p cause with a higher-level description, keeping its code and name.
    LjmError(const std::string &context, const LjmError &cause);

    int code() const noexcept { return m_code; }
    const std::string &name() const noexcept { return m_name; }
    const std::string &context() const noexcept { return m_context; }

    bool is_device_not_open() const noexcept;
    bool is_stream_not_running() const noexcept;

  private:
    int m_code;
    std::string m_name;
    std::string m_context;
};

} // namespace ljdaq::device
