#pragma once

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    namespace Detail
    {
        struct LevelName
        {
            Level level;
            std::string_view name;
            spdlog::level::level_enum spdlogLevel;
        };

        // Same order as Level.
        inline constexpr std::array<LevelName, 7> levelNames{{
            {Level::Trace, "trace", spdlog::level::trace},
            {Level::Debug, "debug", spdlog::level::debug},
            {Level::Info, "info", spdlog::level::info},
            {Level::Warning, "warning", spdlog::level::warn},
            {Level::Error, "error", spdlog::level::err},
            {Level::Critical, "critical", spdlog::level::critical},
            {Level::Off, "off", spdlog::level::off},
        }};
    }

    inline spdlog::level::level_enum toSpdlogLevel(Level level)
    {
        return Detail::levelNames[static_cast<std::size_t>(level)].spdlogLevel;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum level)
    {
        for (auto const& entry : Detail::levelNames)
        {
            if (entry.spdlogLevel == level)
                return entry.level;
        }
        return Level::Info;
    }

    /**
     * @brief Parses a level name as written in the configuration or on the command line. Case is ignored and
     * "warn" is accepted for "warning".
     */
    inline std::optional<Level> parseLevel(std::string_view name)
    {
        std::string lowered;
        lowered.reserve(name.size());
        for (char c : name)
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

        if (lowered == "warn")
            return Level::Warning;
        for (auto const& entry : Detail::levelNames)
        {
            if (entry.name == lowered)
                return entry.level;
        }
        return std::nullopt;
    }

    inline std::string levelToString(Level level)
    {
        return std::string{Detail::levelNames[static_cast<std::size_t>(level)].name};
    }
}
