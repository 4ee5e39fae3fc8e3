#pragma once

#include <harbor/stream/event_source.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Harbor::Test
{
    /**
     * @brief One connection opened through the FakeEventSourceFactory. The test drives it.
     */
    class FakeConnection
    {
      public:
        FakeConnection(unsigned short port, std::optional<std::string> lastEventId, EventSourceCallbacks callbacks)
            : port_{port}
            , lastEventId_{std::move(lastEventId)}
            , callbacks_{std::move(callbacks)}
        {}

        void open()
        {
            if (!closed() && callbacks_.onOpen)
                callbacks_.onOpen();
        }

        void emit(std::string const& event, std::string const& data, std::optional<std::string> id = std::nullopt)
        {
            if (!closed() && callbacks_.onEvent)
                callbacks_.onEvent(SseEvent{.id = std::move(id), .event = event, .data = data});
        }

        void drop(std::optional<HostError> error = std::nullopt)
        {
            {
                std::scoped_lock lock{guard_};
                if (closed_)
                    return;
                closed_ = true;
            }
            if (callbacks_.onClosed)
                callbacks_.onClosed(error);
        }

        void close()
        {
            std::scoped_lock lock{guard_};
            closed_ = true;
        }

        bool closed() const
        {
            std::scoped_lock lock{guard_};
            return closed_;
        }

        unsigned short port() const
        {
            return port_;
        }

        std::optional<std::string> const& lastEventId() const
        {
            return lastEventId_;
        }

      private:
        unsigned short port_;
        std::optional<std::string> lastEventId_;
        EventSourceCallbacks callbacks_;
        mutable std::mutex guard_{};
        bool closed_{false};
    };

    class FakeEventSource : public Harbor::IEventSource
    {
      public:
        explicit FakeEventSource(std::shared_ptr<FakeConnection> connection)
            : connection_{std::move(connection)}
        {}

        void close() override
        {
            connection_->close();
        }

      private:
        std::shared_ptr<FakeConnection> connection_;
    };

    class FakeEventSourceFactory : public Harbor::IEventSourceFactory
    {
      public:
        std::unique_ptr<IEventSource>
        open(unsigned short port, std::optional<std::string> const& lastEventId, EventSourceCallbacks callbacks) override
        {
            auto connection = std::make_shared<FakeConnection>(port, lastEventId, std::move(callbacks));
            {
                std::scoped_lock lock{guard_};
                connections_.push_back(connection);
            }
            opened_.notify_all();
            return std::make_unique<FakeEventSource>(connection);
        }

        std::size_t connectionCount() const
        {
            std::scoped_lock lock{guard_};
            return connections_.size();
        }

        std::shared_ptr<FakeConnection> connection(std::size_t index) const
        {
            std::scoped_lock lock{guard_};
            return connections_.at(index);
        }

        std::shared_ptr<FakeConnection> latest() const
        {
            std::scoped_lock lock{guard_};
            return connections_.empty() ? nullptr : connections_.back();
        }

        /**
         * @brief Waits until at least count connections were opened.
         */
        bool waitForConnections(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds{3})
        {
            std::unique_lock lock{guard_};
            return opened_.wait_for(lock, timeout, [this, count]() {
                return connections_.size() >= count;
            });
        }

      private:
        mutable std::mutex guard_{};
        std::condition_variable opened_{};
        std::vector<std::shared_ptr<FakeConnection>> connections_{};
    };
}
