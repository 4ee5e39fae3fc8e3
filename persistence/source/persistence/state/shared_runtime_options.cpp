#include <persistence/state/shared_runtime_options.hpp>
#include <persistence/optional_fields.hpp>

namespace Persistence
{
    using namespace Detail;

    void SharedRuntimeOptions::useDefaultsFrom(SharedRuntimeOptions const& other)
    {
        fillIn(enabled, other.enabled);
        fillIn(workspacePath, other.workspacePath);
        fillIn(retryAttempts, other.retryAttempts);
        fillIn(retryBaseDelayMs, other.retryBaseDelayMs);
        fillIn(retryMaxDelayMs, other.retryMaxDelayMs);
    }
    SharedRuntimeOptions SharedRuntimeOptions::defaults()
    {
        return SharedRuntimeOptions{
            .enabled = true,
            .workspacePath = std::string{},
            .retryAttempts = 5,
            .retryBaseDelayMs = 2000,
            .retryMaxDelayMs = 32000,
        };
    }
    void to_json(nlohmann::json& j, SharedRuntimeOptions const& options)
    {
        j = nlohmann::json::object();
        writeIfSet(j, "enabled", options.enabled);
        writeIfSet(j, "workspacePath", options.workspacePath);
        writeIfSet(j, "retryAttempts", options.retryAttempts);
        writeIfSet(j, "retryBaseDelayMs", options.retryBaseDelayMs);
        writeIfSet(j, "retryMaxDelayMs", options.retryMaxDelayMs);
    }
    void from_json(nlohmann::json const& j, SharedRuntimeOptions& options)
    {
        readIfPresent(j, "enabled", options.enabled);
        readIfPresent(j, "workspacePath", options.workspacePath);
        readIfPresent(j, "retryAttempts", options.retryAttempts);
        readIfPresent(j, "retryBaseDelayMs", options.retryBaseDelayMs);
        readIfPresent(j, "retryMaxDelayMs", options.retryMaxDelayMs);
    }
}
