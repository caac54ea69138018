#pragma once
/**
 * @file plx_service.hpp
 * @brief Layer 2: Service modules built on plx_base.
 *
 * Provides the process-wide Logger and its sinks.
 */
#include "plx_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
