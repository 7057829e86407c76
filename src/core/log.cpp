// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/core/log.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace hyperray::log
{

static std::shared_ptr<spdlog::logger> s_logger;
static std::mutex s_logger_mutex;

void init(spdlog::level::level_enum level)
{
    std::lock_guard<std::mutex> lock(s_logger_mutex);
    if (s_logger)
    {
        s_logger->set_level(level);
        return;
    }

    s_logger = spdlog::get("hyperray");
    if (!s_logger)
    {
        s_logger = spdlog::stdout_color_mt("hyperray");
    }
    s_logger->set_level(level);
    s_logger->set_pattern("[%T] [%^%l%$] %v");

    s_logger->info("hyperray logging system initialized");
}

std::shared_ptr<spdlog::logger> get_logger()
{
    {
        std::lock_guard<std::mutex> lock(s_logger_mutex);
        if (s_logger)
        {
            return s_logger;
        }
    }
    init();
    return s_logger;
}

} // namespace hyperray::log
