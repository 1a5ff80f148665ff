// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/log.hpp>

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace geminimcp
{

std::shared_ptr<spdlog::logger> logger()
{
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(
        once,
        []
        {
            instance = spdlog::get(kLoggerName);
            if (!instance)
                instance = spdlog::stderr_color_mt(kLoggerName);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::info);
        }
    );
    return instance;
}

spdlog::level::level_enum parse_log_level(const std::string& level)
{
    // spdlog maps unknown names to `off`, which would hide typos
    if (level == "off")
        return spdlog::level::off;
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off)
        return spdlog::level::n_levels;
    return parsed;
}

void set_log_level(const std::string& level)
{
    auto parsed = parse_log_level(level);
    if (parsed == spdlog::level::n_levels)
        throw std::invalid_argument("Unknown log level: " + level);
    logger()->set_level(parsed);
}

} // namespace geminimcp
