#include <persistence/state/scheduler_options.hpp>
#include <persistence/optional_fields.hpp>

namespace Persistence
{
    using namespace Detail;

    void SchedulerOptions::useDefaultsFrom(SchedulerOptions const& other)
    {
        fillIn(minimumIntervalMinutes, other.minimumIntervalMinutes);
        fillIn(firstExecutionDelaySeconds, other.firstExecutionDelaySeconds);
        fillIn(pastDueDelaySeconds, other.pastDueDelaySeconds);
        fillIn(executeTimeoutSeconds, other.executeTimeoutSeconds);
    }
    SchedulerOptions SchedulerOptions::defaults()
    {
        return SchedulerOptions{
            .minimumIntervalMinutes = 15,
            .firstExecutionDelaySeconds = 2,
            .pastDueDelaySeconds = 5,
            .executeTimeoutSeconds = 3600,
        };
    }
    void to_json(nlohmann::json& j, SchedulerOptions const& options)
    {
        j = nlohmann::json::object();
        writeIfSet(j, "minimumIntervalMinutes", options.minimumIntervalMinutes);
        writeIfSet(j, "firstExecutionDelaySeconds", options.firstExecutionDelaySeconds);
        writeIfSet(j, "pastDueDelaySeconds", options.pastDueDelaySeconds);
        writeIfSet(j, "executeTimeoutSeconds", options.executeTimeoutSeconds);
    }
    void from_json(nlohmann::json const& j, SchedulerOptions& options)
    {
        readIfPresent(j, "minimumIntervalMinutes", options.minimumIntervalMinutes);
        readIfPresent(j, "firstExecutionDelaySeconds", options.firstExecutionDelaySeconds);
        readIfPresent(j, "pastDueDelaySeconds", options.pastDueDelaySeconds);
        readIfPresent(j, "executeTimeoutSeconds", options.executeTimeoutSeconds);
    }
}
