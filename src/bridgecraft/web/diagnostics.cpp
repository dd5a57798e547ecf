///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <bridgecraft/web/diagnostics.hpp>

namespace bridgecraft::web
{
    namespace
    {
        constexpr spdlog::level::level_enum to_spdlog_level(severity level) noexcept
        {
            switch (level)
            {
            case severity::debug:
                return spdlog::level::debug;
            case severity::info:
                return spdlog::level::info;
            case severity::warning:
                return spdlog::level::warn;
            case severity::error:
                return spdlog::level::err;
            }
            return spdlog::level::err;
        }
    }

    spdlog_sink::spdlog_sink(std::shared_ptr<spdlog::logger> logger) : target(std::move(logger))
    {
    }

    void spdlog_sink::emit(severity level, std::string_view message) noexcept
    {
        // spdlog reports its own failures through the logger's error handler
        target->log(to_spdlog_level(level), "{}", message);
    }

    std::shared_ptr<diagnostic_sink> make_stderr_sink(const std::string &name)
    {
        auto logger = spdlog::get(name);
        if (!logger)
        {
            logger = spdlog::stderr_color_mt(name);
            logger->set_pattern("[%L %Y-%m-%d %H:%M:%S] %v");
            logger->set_level(spdlog::level::info);
        }
        return std::make_shared<spdlog_sink>(std::move(logger));
    }
}
