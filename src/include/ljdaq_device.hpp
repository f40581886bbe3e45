#pragma once
/**
 * @file ljdaq_device.hpp
 * @brief Layer 3: the LabJack device and its helpers.
 *
 * LabJackDaq owns the handle; Updater, AsynchUpdater, Intervaler and
 * Streamer each drive one device feature through the Driver seam.
 */
#include "ljdaq_service.hpp"

#include "device/asynch_updater.hpp"
#include "device/dac_sweep.hpp"
#include "device/intervaler.hpp"
#include "device/labjack_daq.hpp"
#include "device/ljm_codes.hpp"
#include "device/ljm_driver.hpp"
#include "device/ljm_error.hpp"
#include "device/streamer.hpp"
#include "device/updater.hpp"
