#pragma once

#include <nlohmann/json.hpp>

#include <optional>

namespace Persistence
{
    struct StreamOptions
    {
        std::optional<int> reconnectMaxAttempts{std::nullopt};
        std::optional<int> reconnectBaseDelayMs{std::nullopt};
        std::optional<int> reconnectMaxDelayMs{std::nullopt};
        std::optional<int> seenIdCapacity{std::nullopt};

        void useDefaultsFrom(StreamOptions const& other);
        static StreamOptions defaults();
    };
    void to_json(nlohmann::json& j, StreamOptions const& options);
    void from_json(nlohmann::json const& j, StreamOptions& options);
}
