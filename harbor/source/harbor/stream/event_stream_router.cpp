#include <harbor/stream/event_stream_router.hpp>
#include <log/log.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <deque>
#include <unordered_set>

namespace Harbor
{
    struct EventStreamRouter::Subscription
    {
        Ids::SubscriptionId id{};
        Owner owner{};
        Ids::SessionId sessionId{};
        StreamHandlers handlers{};
        std::optional<unsigned short> port{std::nullopt};
        StreamState state{StreamState::Connecting};
        std::unique_ptr<IEventSource> source{};
        // Incremented per connection, callbacks of older connections are ignored.
        std::uint64_t generation{0};
        std::optional<std::string> lastEventId{std::nullopt};
        std::unordered_set<std::string> seen{};
        std::deque<std::string> seenOrder{};
        std::unique_ptr<RetryPolicy> retry{};
        std::shared_ptr<boost::asio::steady_timer> reconnectTimer{};
        bool closed{false};

        bool remember(std::string const& identity, std::size_t capacity)
        {
            if (!seen.insert(identity).second)
                return false;
            seenOrder.push_back(identity);
            while (seenOrder.size() > capacity)
            {
                seen.erase(seenOrder.front());
                seenOrder.pop_front();
            }
            return true;
        }

        void forgetHistory()
        {
            seen.clear();
            seenOrder.clear();
            lastEventId.reset();
        }

        void cancelReconnect()
        {
            if (reconnectTimer)
            {
                reconnectTimer->cancel();
                reconnectTimer.reset();
            }
        }
    };

    EventStreamRouter::EventStreamRouter(
        boost::asio::any_io_executor executor,
        std::shared_ptr<IEventSourceFactory> factory,
        RetryOptions retryOptions,
        std::size_t seenIdCapacity)
        : executor_{std::move(executor)}
        , factory_{std::move(factory)}
        , retryOptions_{retryOptions}
        , seenIdCapacity_{seenIdCapacity}
        , guard_{}
        , portResolver_{}
        , subscriptions_{}
        , generating_{}
        , shuttingDown_{false}
    {}

    EventStreamRouter::~EventStreamRouter()
    {
        std::scoped_lock lock{guard_};
        for (auto& [id, subscription] : subscriptions_)
        {
            subscription->closed = true;
            subscription->cancelReconnect();
            if (subscription->source)
                subscription->source->close();
        }
    }

    void EventStreamRouter::setPortResolver(PortResolver resolver)
    {
        std::scoped_lock lock{guard_};
        portResolver_ = std::move(resolver);
    }

    std::expected<StreamHandle, HostError>
    EventStreamRouter::attach(Owner const& owner, Ids::SessionId const& sessionId, StreamHandlers handlers)
    {
        PortResolver resolver;
        {
            std::scoped_lock lock{guard_};
            if (shuttingDown_)
                return std::unexpected(makeError(HostErrorType::ShuttingDown, "Host is shutting down"));
            resolver = portResolver_;
        }

        const auto port = resolver ? resolver(sessionId) : std::nullopt;
        if (!port)
        {
            return std::unexpected(
                makeError(HostErrorType::NotFound, "Session " + sessionId.value() + " has no running runtime"));
        }

        auto subscription = std::make_shared<Subscription>();
        subscription->id = Ids::generateSubscriptionId();
        subscription->owner = owner;
        subscription->sessionId = sessionId;
        subscription->handlers = std::move(handlers);
        subscription->port = port;
        subscription->retry = std::make_unique<RetryPolicy>(retryOptions_);
        {
            std::scoped_lock lock{guard_};
            subscriptions_[subscription->id.value()] = subscription;
        }

        Log::debug(
            "{} attached to session {} on port {}.", toString(owner), sessionId.value(), static_cast<int>(*port));
        connect(subscription);
        return StreamHandle{weak_from_this(), subscription->id};
    }

    void EventStreamRouter::connect(std::shared_ptr<Subscription> const& subscription)
    {
        std::uint64_t generation = 0;
        unsigned short port = 0;
        std::optional<std::string> lastEventId;
        std::unique_ptr<IEventSource> previous;
        {
            std::scoped_lock lock{guard_};
            if (subscription->closed || !subscription->port)
                return;
            generation = ++subscription->generation;
            port = *subscription->port;
            lastEventId = subscription->lastEventId;
            previous = std::move(subscription->source);
            subscription->state = StreamState::Connecting;
        }
        disposeSource(std::move(previous));

        const auto id = subscription->id.value();
        EventSourceCallbacks callbacks{
            .onOpen =
                [weak = weak_from_this(), id, generation]() {
                    if (auto self = weak.lock(); self)
                        self->onOpen(id, generation);
                },
            .onEvent =
                [weak = weak_from_this(), id, generation](SseEvent const& event) {
                    if (auto self = weak.lock(); self)
                        self->onEvent(id, generation, event);
                },
            .onClosed =
                [weak = weak_from_this(), id, generation](std::optional<HostError> const& error) {
                    if (auto self = weak.lock(); self)
                        self->onClosed(id, generation, error);
                },
        };

        auto source = factory_->open(port, lastEventId, std::move(callbacks));
        {
            std::scoped_lock lock{guard_};
            if (!subscription->closed && subscription->generation == generation)
            {
                subscription->source = std::move(source);
                return;
            }
        }
        disposeSource(std::move(source));
    }

    void EventStreamRouter::onOpen(std::string const& id, std::uint64_t generation)
    {
        std::function<void(StreamState, std::optional<HostError> const&)> notify;
        {
            std::scoped_lock lock{guard_};
            auto iter = subscriptions_.find(id);
            if (iter == subscriptions_.end() || iter->second->generation != generation)
                return;

            auto& subscription = *iter->second;
            subscription.state = StreamState::Connected;
            subscription.retry->reset();
            notify = subscription.handlers.onStateChange;
        }
        if (notify)
            notify(StreamState::Connected, std::nullopt);
    }

    void EventStreamRouter::onEvent(std::string const& id, std::uint64_t generation, SseEvent const& sseEvent)
    {
        const auto event = toStreamEvent(sseEvent);

        std::function<void(StreamEvent const&)> deliver;
        {
            std::scoped_lock lock{guard_};
            auto iter = subscriptions_.find(id);
            if (iter == subscriptions_.end() || iter->second->generation != generation)
                return;

            auto& subscription = *iter->second;
            if (event.id)
                subscription.lastEventId = event.id;

            if (const auto identity = eventIdentity(event); identity)
            {
                if (!subscription.remember(*identity, seenIdCapacity_))
                {
                    Log::trace("Suppressed duplicate {} ({}).", event.name, *identity);
                    return;
                }
            }

            if (const auto generating = generationStateOf(event); generating)
                generating_[subscription.sessionId.value()] = *generating;

            deliver = subscription.handlers.onEvent;
        }
        if (deliver)
            deliver(event);
    }

    void EventStreamRouter::onClosed(
        std::string const& id,
        std::uint64_t generation,
        std::optional<HostError> const& error)
    {
        auto reason = error.value_or(makeError(HostErrorType::StreamDisconnected, "Event stream ended"));

        std::function<void(StreamState, std::optional<HostError> const&)> notify;
        std::unique_ptr<IEventSource> source;
        std::optional<std::chrono::milliseconds> delay;
        std::shared_ptr<Subscription> subscription;
        {
            std::scoped_lock lock{guard_};
            auto iter = subscriptions_.find(id);
            if (iter == subscriptions_.end() || iter->second->generation != generation)
                return;

            subscription = iter->second;
            source = std::move(subscription->source);
            notify = subscription->handlers.onStateChange;
            if (!shuttingDown_)
                delay = subscription->retry->nextDelay();

            if (delay)
            {
                subscription->state = StreamState::Reconnecting;
                auto timer = std::make_shared<boost::asio::steady_timer>(executor_, *delay);
                subscription->reconnectTimer = timer;
                timer->async_wait([weak = weak_from_this(), subscription, generation](boost::system::error_code ec) {
                    if (ec)
                        return;
                    if (auto self = weak.lock(); self)
                        self->reconnect(subscription, generation);
                });
            }
            else
                subscription->state = StreamState::Closed;
        }
        disposeSource(std::move(source));

        Log::warn(
            "Stream of {} on session {} lost: {}",
            toString(subscription->owner),
            subscription->sessionId.value(),
            reason.toString());

        if (!notify)
            return;

        notify(StreamState::Degraded, reason);
        if (delay)
            notify(StreamState::Reconnecting, std::nullopt);
        else
        {
            notify(
                StreamState::Closed,
                makeError(
                    HostErrorType::StreamDisconnected,
                    "Event stream could not be restored after " + std::to_string(retryOptions_.maxAttempts) +
                        " attempts: " + reason.message));
        }
    }

    void EventStreamRouter::reconnect(std::shared_ptr<Subscription> const& subscription, std::uint64_t generation)
    {
        PortResolver resolver;
        Ids::SessionId sessionId;
        {
            std::scoped_lock lock{guard_};
            if (subscription->closed || subscription->generation != generation)
                return;
            subscription->reconnectTimer.reset();
            resolver = portResolver_;
            sessionId = subscription->sessionId;
        }

        const auto port = resolver ? resolver(sessionId) : std::nullopt;
        {
            std::scoped_lock lock{guard_};
            if (subscription->closed || subscription->generation != generation)
                return;

            if (port && subscription->port != port)
            {
                Log::info(
                    "Runtime of session {} moved to port {}, reconnecting without replay.",
                    sessionId.value(),
                    static_cast<int>(*port));
                subscription->forgetHistory();
                subscription->port = port;
            }
        }

        if (!port)
        {
            return onClosed(
                subscription->id.value(),
                generation,
                makeError(HostErrorType::StreamDisconnected, "Runtime of session " + sessionId.value() + " is unavailable"));
        }
        connect(subscription);
    }

    void EventStreamRouter::disposeSource(std::unique_ptr<IEventSource> source)
    {
        if (!source)
            return;
        std::shared_ptr<IEventSource> shared{std::move(source)};
        boost::asio::post(executor_, [shared]() {
            shared->close();
        });
    }

    std::shared_ptr<EventStreamRouter::Subscription> EventStreamRouter::detachLocked(std::string const& id)
    {
        auto iter = subscriptions_.find(id);
        if (iter == subscriptions_.end())
            return nullptr;

        auto subscription = iter->second;
        subscriptions_.erase(iter);
        subscription->closed = true;
        subscription->state = StreamState::Closed;
        subscription->cancelReconnect();

        const auto sessionId = subscription->sessionId.value();
        if (std::none_of(subscriptions_.begin(), subscriptions_.end(), [&sessionId](auto const& entry) {
                return entry.second->sessionId.value() == sessionId;
            }))
        {
            generating_.erase(sessionId);
        }
        return subscription;
    }

    void EventStreamRouter::detach(Ids::SubscriptionId const& id)
    {
        std::unique_ptr<IEventSource> source;
        {
            std::scoped_lock lock{guard_};
            auto subscription = detachLocked(id.value());
            if (!subscription)
                return;
            source = std::move(subscription->source);
            Log::debug("{} detached from session {}.", toString(subscription->owner), subscription->sessionId.value());
        }
        disposeSource(std::move(source));
    }

    std::size_t EventStreamRouter::detachOwner(Owner const& owner, Ids::SessionId const& sessionId)
    {
        std::vector<std::unique_ptr<IEventSource>> sources;
        {
            std::scoped_lock lock{guard_};
            std::vector<std::string> ids;
            for (auto const& [id, subscription] : subscriptions_)
            {
                if (subscription->owner == owner && subscription->sessionId == sessionId)
                    ids.push_back(id);
            }
            for (auto const& id : ids)
            {
                if (auto subscription = detachLocked(id); subscription)
                    sources.push_back(std::move(subscription->source));
            }
        }

        for (auto& source : sources)
            disposeSource(std::move(source));
        return sources.size();
    }

    bool EventStreamRouter::rekey(
        Ids::SessionId const& from,
        Ids::SessionId const& to,
        std::optional<unsigned short> port)
    {
        std::vector<std::shared_ptr<Subscription>> moved;
        {
            std::scoped_lock lock{guard_};
            if (from == to)
                return true;

            for (auto const& [id, subscription] : subscriptions_)
            {
                if (subscription->sessionId == to)
                    return false;
                if (subscription->sessionId == from)
                    moved.push_back(subscription);
            }

            for (auto const& subscription : moved)
                subscription->sessionId = to;

            if (auto node = generating_.extract(from.value()); !node.empty())
            {
                node.key() = to.value();
                generating_.insert(std::move(node));
            }

            std::erase_if(moved, [&port](auto const& subscription) {
                if (!port || subscription->port == port)
                    return true;
                subscription->forgetHistory();
                subscription->port = port;
                subscription->retry->reset();
                subscription->cancelReconnect();
                return false;
            });
        }

        for (auto const& subscription : moved)
        {
            Log::info("Session {} is served by another runtime now, reconnecting.", to.value());
            connect(subscription);
        }
        return true;
    }

    std::size_t EventStreamRouter::subscriptionCount(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        return static_cast<std::size_t>(
            std::count_if(subscriptions_.begin(), subscriptions_.end(), [&sessionId](auto const& entry) {
                return entry.second->sessionId == sessionId;
            }));
    }

    bool EventStreamRouter::hasSubscriptions(Ids::SessionId const& sessionId) const
    {
        return subscriptionCount(sessionId) > 0;
    }

    std::optional<StreamState> EventStreamRouter::state(Ids::SubscriptionId const& id) const
    {
        std::scoped_lock lock{guard_};
        auto iter = subscriptions_.find(id.value());
        if (iter == subscriptions_.end())
            return std::nullopt;
        return iter->second->state;
    }

    std::vector<Ids::SubscriptionId> EventStreamRouter::subscriptionsOf(Owner const& owner) const
    {
        std::scoped_lock lock{guard_};
        std::vector<Ids::SubscriptionId> result;
        for (auto const& [id, subscription] : subscriptions_)
        {
            if (subscription->owner == owner)
                result.push_back(subscription->id);
        }
        return result;
    }

    bool EventStreamRouter::isGenerating(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        auto iter = generating_.find(sessionId.value());
        return iter != generating_.end() && iter->second;
    }

    void EventStreamRouter::shutdown()
    {
        std::vector<std::shared_ptr<Subscription>> closed;
        {
            std::scoped_lock lock{guard_};
            shuttingDown_ = true;
            for (auto const& [id, subscription] : subscriptions_)
            {
                subscription->closed = true;
                subscription->state = StreamState::Closed;
                subscription->cancelReconnect();
                closed.push_back(subscription);
            }
            subscriptions_.clear();
            generating_.clear();
        }

        Log::info("Closing {} event streams.", closed.size());
        for (auto const& subscription : closed)
        {
            disposeSource(std::move(subscription->source));
            if (subscription->handlers.onStateChange)
                subscription->handlers.onStateChange(StreamState::Closed, std::nullopt);
        }
    }
}
