#pragma once

#include <harbor/host_error.hpp>
#include <harbor/stream/sse_parser.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace Harbor
{
    struct EventSourceCallbacks
    {
        std::function<void()> onOpen{};
        std::function<void(SseEvent const&)> onEvent{};
        /// Called once when the connection ends on its own. Not called after close().
        std::function<void(std::optional<HostError> const&)> onClosed{};
    };

    /**
     * @brief One server push connection to an agent runtime.
     */
    class IEventSource
    {
      public:
        virtual ~IEventSource() = default;
        virtual void close() = 0;
    };

    class IEventSourceFactory
    {
      public:
        virtual ~IEventSourceFactory() = default;

        /**
         * @brief Starts connecting to the runtime on the given port. Callbacks are never invoked from within open.
         *
         * @param lastEventId Sent as Last-Event-ID so that the runtime replays what was missed.
         */
        virtual std::unique_ptr<IEventSource>
        open(unsigned short port, std::optional<std::string> const& lastEventId, EventSourceCallbacks callbacks) = 0;
    };
}
