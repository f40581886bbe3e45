#pragma once
/**
 * @file ljdaq_service.hpp
 * @brief Layer 2: logging and configuration, built on ljdaq_base.
 */
#include "ljdaq_base.hpp"

#include "utils/daq_config.hpp"
#include "utils/logger.hpp"
