#pragma once

#include <harbor/host_error.hpp>
#include <harbor/owner.hpp>
#include <harbor/retry_policy.hpp>
#include <harbor/stream/event_source.hpp>
#include <harbor/stream/stream_event.hpp>
#include <harbor/stream/stream_handle.hpp>
#include <ids/ids.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Harbor
{
    /**
     * @brief Connects owners to the event stream of their session's runtime.
     *
     * Each subscription keeps its own connection, reconnects with backoff and suppresses events it has already
     * delivered, so a replay after reconnecting is invisible to the consumer.
     */
    class EventStreamRouter : public std::enable_shared_from_this<EventStreamRouter>
    {
      public:
        /// Returns the port of the session's runtime, or nullopt if it has none right now.
        using PortResolver = std::function<std::optional<unsigned short>(Ids::SessionId const&)>;

        EventStreamRouter(
            boost::asio::any_io_executor executor,
            std::shared_ptr<IEventSourceFactory> factory,
            RetryOptions retryOptions,
            std::size_t seenIdCapacity = 4096);
        ~EventStreamRouter();
        EventStreamRouter(EventStreamRouter const&) = delete;
        EventStreamRouter& operator=(EventStreamRouter const&) = delete;
        EventStreamRouter(EventStreamRouter&&) = delete;
        EventStreamRouter& operator=(EventStreamRouter&&) = delete;

        void setPortResolver(PortResolver resolver);

        /**
         * @brief Opens a stream for the owner to the session's runtime.
         */
        std::expected<StreamHandle, HostError>
        attach(Owner const& owner, Ids::SessionId const& sessionId, StreamHandlers handlers);

        void detach(Ids::SubscriptionId const& id);

        /**
         * @brief Detaches all streams the owner has on the session.
         *
         * @return The number of detached streams.
         */
        std::size_t detachOwner(Owner const& owner, Ids::SessionId const& sessionId);

        /**
         * @brief Moves all streams of a session to a new session id. Streams stay connected if the port is
         * unchanged, otherwise they reconnect from scratch without replay.
         */
        bool rekey(Ids::SessionId const& from, Ids::SessionId const& to, std::optional<unsigned short> port);

        std::size_t subscriptionCount(Ids::SessionId const& sessionId) const;
        bool hasSubscriptions(Ids::SessionId const& sessionId) const;
        std::optional<StreamState> state(Ids::SubscriptionId const& id) const;
        std::vector<Ids::SubscriptionId> subscriptionsOf(Owner const& owner) const;

        /**
         * @brief Whether the runtime of the session last reported that it is generating.
         */
        bool isGenerating(Ids::SessionId const& sessionId) const;

        void shutdown();

      private:
        struct Subscription;

        void connect(std::shared_ptr<Subscription> const& subscription);
        void reconnect(std::shared_ptr<Subscription> const& subscription, std::uint64_t generation);
        void onOpen(std::string const& id, std::uint64_t generation);
        void onEvent(std::string const& id, std::uint64_t generation, SseEvent const& event);
        void onClosed(std::string const& id, std::uint64_t generation, std::optional<HostError> const& error);
        void disposeSource(std::unique_ptr<IEventSource> source);
        std::shared_ptr<Subscription> detachLocked(std::string const& id);

      private:
        boost::asio::any_io_executor executor_;
        std::shared_ptr<IEventSourceFactory> factory_;
        RetryOptions retryOptions_;
        std::size_t seenIdCapacity_;

        mutable std::mutex guard_;
        PortResolver portResolver_;
        std::unordered_map<std::string, std::shared_ptr<Subscription>> subscriptions_;
        std::unordered_map<std::string, bool> generating_;
        bool shuttingDown_;
    };
}
