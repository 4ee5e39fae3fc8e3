#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    class Logger
    {
      public:
        void setLevel(Log::Level level)
        {
            spdlog::set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            return fromSpdlogLevel(spdlog::get_level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (!spdlog::should_log(toSpdlogLevel(level)))
                return;

            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            spdlog::log(toSpdlogLevel(level), buf);
        }
    };
}
