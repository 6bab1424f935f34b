#pragma once
/**
 * @file lgs_base.hpp
 * @brief Layer 1: Basic modules built on lgs_platform.
 *
 * Provides format_tools and debug_info (panic, debug messages, stack traces).
 */
#include "lgs_platform.hpp"

#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/debug_info.hpp"
#include "utils/format_tools.hpp"
