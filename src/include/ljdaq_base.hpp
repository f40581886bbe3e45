#pragma once
/**
 * @file ljdaq_base.hpp
 * @brief Layer 1: formatting helpers and RAII guards.
 *
 * Include this when you need format_tools or ScopeGuard.
 */
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/scope_guard.hpp"
