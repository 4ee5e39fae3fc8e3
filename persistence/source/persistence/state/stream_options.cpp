#include <persistence/state/stream_options.hpp>
#include <persistence/optional_fields.hpp>

namespace Persistence
{
    using namespace Detail;

    void StreamOptions::useDefaultsFrom(StreamOptions const& other)
    {
        fillIn(reconnectMaxAttempts, other.reconnectMaxAttempts);
        fillIn(reconnectBaseDelayMs, other.reconnectBaseDelayMs);
        fillIn(reconnectMaxDelayMs, other.reconnectMaxDelayMs);
        fillIn(seenIdCapacity, other.seenIdCapacity);
    }
    StreamOptions StreamOptions::defaults()
    {
        return StreamOptions{
            .reconnectMaxAttempts = 3,
            .reconnectBaseDelayMs = 1000,
            .reconnectMaxDelayMs = 10000,
            .seenIdCapacity = 4096,
        };
    }
    void to_json(nlohmann::json& j, StreamOptions const& options)
    {
        j = nlohmann::json::object();
        writeIfSet(j, "reconnectMaxAttempts", options.reconnectMaxAttempts);
        writeIfSet(j, "reconnectBaseDelayMs", options.reconnectBaseDelayMs);
        writeIfSet(j, "reconnectMaxDelayMs", options.reconnectMaxDelayMs);
        writeIfSet(j, "seenIdCapacity", options.seenIdCapacity);
    }
    void from_json(nlohmann::json const& j, StreamOptions& options)
    {
        readIfPresent(j, "reconnectMaxAttempts", options.reconnectMaxAttempts);
        readIfPresent(j, "reconnectBaseDelayMs", options.reconnectBaseDelayMs);
        readIfPresent(j, "reconnectMaxDelayMs", options.reconnectMaxDelayMs);
        readIfPresent(j, "seenIdCapacity", options.seenIdCapacity);
    }
}
