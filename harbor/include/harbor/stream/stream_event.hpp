#pragma once

#include <harbor/host_error.hpp>
#include <harbor/stream/sse_parser.hpp>

#include <boost/describe/enum.hpp>
#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace Harbor
{
    enum class StreamState
    {
        Connecting,
        Connected,
        Degraded,
        Reconnecting,
        Closed
    };
    BOOST_DESCRIBE_ENUM(StreamState, Connecting, Connected, Degraded, Reconnecting, Closed)

    struct StreamEvent
    {
        std::string name{};
        nlohmann::json payload{};
        std::optional<std::string> id{std::nullopt};
    };

    struct StreamHandlers
    {
        std::function<void(StreamEvent const&)> onEvent{};
        /// The error is set for Degraded and for Closed after retries ran out.
        std::function<void(StreamState, std::optional<HostError> const&)> onStateChange{};
    };

    namespace StreamEvents
    {
        constexpr static char const* init = "chat:init";
        constexpr static char const* status = "chat:status";
        constexpr static char const* replay = "chat:message-replay";
        constexpr static char const* chunk = "chat:message-chunk";
        constexpr static char const* complete = "chat:message-complete";
        constexpr static char const* stopped = "chat:message-stopped";
        constexpr static char const* error = "chat:message-error";
    }

    /**
     * @brief Decodes the data of an SSE event. Data that is not JSON is passed on as a string.
     */
    StreamEvent toStreamEvent(SseEvent const& event);

    /**
     * @brief The identity used to suppress duplicates: the SSE id, or the message id of a replayed message.
     */
    std::optional<std::string> eventIdentity(StreamEvent const& event);

    bool isTerminalEvent(std::string const& name);

    /**
     * @brief Whether the event says the runtime is generating (true), idle (false) or says nothing about it.
     */
    std::optional<bool> generationStateOf(StreamEvent const& event);
}
