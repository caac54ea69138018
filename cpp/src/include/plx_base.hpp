#pragma once
/**
 * @file plx_base.hpp
 * @brief Layer 1: Basic modules built on plx_platform.
 *
 * Provides the Result<T, E> return type and format_tools.
 * Include this when you need formatting helpers or Result without any messaging.
 */
#include "plx_platform.hpp"

#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/result.hpp"
