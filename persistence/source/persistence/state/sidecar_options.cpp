#include <persistence/state/sidecar_options.hpp>
#include <persistence/optional_fields.hpp>
#include <constants/sidecar.hpp>

namespace Persistence
{
    using namespace Detail;

    void SidecarOptions::useDefaultsFrom(SidecarOptions const& other)
    {
        fillIn(command, other.command);
        fillIn(arguments, other.arguments);
        fillIn(environment, other.environment);
        fillIn(pathExtension, other.pathExtension);
        fillIn(marker, other.marker);
        fillIn(basePort, other.basePort);
        fillIn(portRange, other.portRange);
        fillIn(maxPortAttempts, other.maxPortAttempts);
        fillIn(healthCheckAttempts, other.healthCheckAttempts);
        fillIn(healthCheckDelayMs, other.healthCheckDelayMs);
        fillIn(healthCheckTimeoutMs, other.healthCheckTimeoutMs);
        fillIn(gracefulShutdownSeconds, other.gracefulShutdownSeconds);
        fillIn(killPollIntervalMs, other.killPollIntervalMs);
        fillIn(idleGracePeriodMs, other.idleGracePeriodMs);
        fillIn(healthMonitorIntervalMs, other.healthMonitorIntervalMs);
    }

    SidecarOptions SidecarOptions::defaults()
    {
        return SidecarOptions{
            .command = "bun",
            .arguments = std::vector<std::string>{"run", "server.js"},
            .environment = std::unordered_map<std::string, std::string>{},
            .pathExtension = "",
            .marker = Constants::sidecarMarker,
            .basePort = Constants::sidecarBasePort,
            .portRange = Constants::sidecarPortRange,
            .maxPortAttempts = Constants::sidecarMaxPortAttempts,
            .healthCheckAttempts = Constants::healthCheckAttempts,
            .healthCheckDelayMs = static_cast<int>(Constants::healthCheckDelay.count()),
            .healthCheckTimeoutMs = static_cast<int>(Constants::healthCheckTimeout.count()),
            .gracefulShutdownSeconds = static_cast<int>(Constants::gracefulShutdownTimeout.count()),
            .killPollIntervalMs = static_cast<int>(Constants::killPollInterval.count()),
            .idleGracePeriodMs = 0,
            .healthMonitorIntervalMs = 5000,
        };
    }

    void to_json(nlohmann::json& j, SidecarOptions const& options)
    {
        j = nlohmann::json::object();
        writeIfSet(j, "command", options.command);
        writeIfSet(j, "arguments", options.arguments);
        writeIfSet(j, "environment", options.environment);
        writeIfSet(j, "pathExtension", options.pathExtension);
        writeIfSet(j, "marker", options.marker);
        writeIfSet(j, "basePort", options.basePort);
        writeIfSet(j, "portRange", options.portRange);
        writeIfSet(j, "maxPortAttempts", options.maxPortAttempts);
        writeIfSet(j, "healthCheckAttempts", options.healthCheckAttempts);
        writeIfSet(j, "healthCheckDelayMs", options.healthCheckDelayMs);
        writeIfSet(j, "healthCheckTimeoutMs", options.healthCheckTimeoutMs);
        writeIfSet(j, "gracefulShutdownSeconds", options.gracefulShutdownSeconds);
        writeIfSet(j, "killPollIntervalMs", options.killPollIntervalMs);
        writeIfSet(j, "idleGracePeriodMs", options.idleGracePeriodMs);
        writeIfSet(j, "healthMonitorIntervalMs", options.healthMonitorIntervalMs);
    }

    void from_json(nlohmann::json const& j, SidecarOptions& options)
    {
        readIfPresent(j, "command", options.command);
        readIfPresent(j, "arguments", options.arguments);
        readIfPresent(j, "environment", options.environment);
        readIfPresent(j, "pathExtension", options.pathExtension);
        readIfPresent(j, "marker", options.marker);
        readIfPresent(j, "basePort", options.basePort);
        readIfPresent(j, "portRange", options.portRange);
        readIfPresent(j, "maxPortAttempts", options.maxPortAttempts);
        readIfPresent(j, "healthCheckAttempts", options.healthCheckAttempts);
        readIfPresent(j, "healthCheckDelayMs", options.healthCheckDelayMs);
        readIfPresent(j, "healthCheckTimeoutMs", options.healthCheckTimeoutMs);
        readIfPresent(j, "gracefulShutdownSeconds", options.gracefulShutdownSeconds);
        readIfPresent(j, "killPollIntervalMs", options.killPollIntervalMs);
        readIfPresent(j, "idleGracePeriodMs", options.idleGracePeriodMs);
        readIfPresent(j, "healthMonitorIntervalMs", options.healthMonitorIntervalMs);
    }
}
