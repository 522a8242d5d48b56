#pragma once
/**
 * @file sfx_base.hpp
 * @brief Layer 1: Basic modules built on sfx_platform.
 *
 * Provides format_tools, debug_info, and foundational helpers: scope_guard and the
 * Result<T, E> error type. Include this when you need formatting, debug utilities,
 * or basic RAII guards.
 */
#include "sfx_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/debug_info.hpp"
#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
