#pragma once

#include <chrono>

namespace Constants
{
    constexpr static unsigned short sidecarBasePort = 31415;
    constexpr static unsigned short sidecarPortRange = 500;
    constexpr static int sidecarMaxPortAttempts = 200;

    constexpr static int healthCheckAttempts = 60;
    constexpr static std::chrono::milliseconds healthCheckDelay{100};
    constexpr static std::chrono::milliseconds healthCheckTimeout{100};

    constexpr static std::chrono::seconds gracefulShutdownTimeout{5};
    constexpr static std::chrono::milliseconds killPollInterval{100};

    constexpr static char const* sidecarMarker = "--harbor-sidecar";
    constexpr static char const* placeholderSessionPrefix = "pending-";

    constexpr static char const* sharedRuntimeSessionId = "__shared__";
    constexpr static char const* sharedRuntimeDirectoryPrefix = "harbor-shared-";
}
