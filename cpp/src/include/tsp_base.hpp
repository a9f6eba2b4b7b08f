#pragma once
/**
 * @file tsp_base.hpp
 * @brief Layer 1: Basic modules built on tsp_platform.
 *
 * Provides format_tools, debug_info, and two RAII guards: scope_guard
 * (guaranteed cleanup around test invocation) and recursion_guard
 * (re-entrancy detection, used by the logger's error reporting).
 */
#include "tsp_platform.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/debug_info.hpp"
#include "utils/format_tools.hpp"
#include "utils/recursion_guard.hpp"
#include "utils/scope_guard.hpp"
