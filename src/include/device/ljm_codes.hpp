#pragma once
/**
 * @file ljm_codes.hpp
 * @brief Interpretation of LJM return codes and handle-info numbers.
 *
 * LJM reports every call's outcome as an integer: 0 for success, a code in
 * the warning range for a call that completed with a caveat, anything else
 * for a failure. Batch calls additionally report the address of the frame
 * that failed.
 */

#include <string>

#include "ljdaq_export.h"

namespace ljdaq::device
{

/// Vendor name of an LJM code, e.g. `LjmDriver::error_name`.
using ErrorNameLookup = std::string (*)(int code);

/// True for codes in [LJME_WARNINGS_BEGIN, LJME_WARNINGS_END].
LJDAQ_EXPORT bool is_ljm_warning(int code) noexcept;

/**
 * @brief Turns an LJM return code into an outcome.
 *
 * Success returns silently. A warning is logged at WARN and returns.
 * Anything else throws `LjmError` with @p code, its vendor name and
 * @p context; a non-negative @p error_address is appended to the context
 * as "at address N".
 *
 * @p error_name is only called for non-zero codes.
 */
LJDAQ_EXPORT void check_ljm_result(int code, const std::string &context, int error_address,
                                   ErrorNameLookup error_name);

/// "T4", "T7", ... for an `LJM_dt*` number.
LJDAQ_EXPORT const char *device_type_name(int device_type) noexcept;

/// "USB", "TCP", ... for an `LJM_ct*` number.
LJDAQ_EXPORT const char *connection_type_name(int connection_type) noexcept;

} // namespace ljdaq::device
