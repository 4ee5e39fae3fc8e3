#pragma once

namespace Constants
{
    constexpr static char const* configPath = "~/.harbor/config.json";
    constexpr static char const* taskStorePath = "~/.harbor/scheduled_tasks.json";
    constexpr static char const* logDirectory = "~/.harbor/logs";
}
