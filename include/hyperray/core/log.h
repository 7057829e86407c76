// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace hyperray::log {

/**
 * @brief Initialize the logging system
 *
 * Safe to call more than once; later calls only change the level.
 *
 * @param level Log level (trace, debug, info, warn, error, critical)
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Get the default logger
 *
 * @return std::shared_ptr<spdlog::logger> The logger instance
 */
std::shared_ptr<spdlog::logger> get_logger();

} // namespace hyperray::log

// Convenience macros
#define HYPERRAY_LOG_TRACE(...) ::hyperray::log::get_logger()->trace(__VA_ARGS__)
#define HYPERRAY_LOG_DEBUG(...) ::hyperray::log::get_logger()->debug(__VA_ARGS__)
#define HYPERRAY_LOG_INFO(...)  ::hyperray::log::get_logger()->info(__VA_ARGS__)
#define HYPERRAY_LOG_WARN(...)  ::hyperray::log::get_logger()->warn(__VA_ARGS__)
#define HYPERRAY_LOG_ERROR(...) ::hyperray::log::get_logger()->error(__VA_ARGS__)
#define HYPERRAY_LOG_CRITICAL(...) ::hyperray::log::get_logger()->critical(__VA_ARGS__)
