#pragma once

#include <harbor/stream/event_source.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <memory>

namespace Harbor
{
    /**
     * @brief Opens "GET /chat/stream" on 127.0.0.1 with Boost.Beast and parses the body as text/event-stream.
     */
    class BeastEventSourceFactory : public IEventSourceFactory
    {
      public:
        explicit BeastEventSourceFactory(
            boost::asio::any_io_executor executor,
            std::chrono::seconds readTimeout = std::chrono::seconds{45});

        std::unique_ptr<IEventSource>
        open(unsigned short port, std::optional<std::string> const& lastEventId, EventSourceCallbacks callbacks) override;

      private:
        boost::asio::any_io_executor executor_;
        std::chrono::seconds readTimeout_;
    };
}
