#include <harbor/stream/stream_handle.hpp>
#include <harbor/stream/event_stream_router.hpp>

#include <utility>

namespace Harbor
{
    StreamHandle::StreamHandle()
        : router_{}
        , id_{}
    {}

    StreamHandle::StreamHandle(std::weak_ptr<EventStreamRouter> router, Ids::SubscriptionId id)
        : router_{std::move(router)}
        , id_{std::move(id)}
    {}

    StreamHandle::~StreamHandle()
    {
        close();
    }

    StreamHandle::StreamHandle(StreamHandle&& other) noexcept
        : router_{std::move(other.router_)}
        , id_{std::exchange(other.id_, Ids::SubscriptionId{})}
    {}

    StreamHandle& StreamHandle::operator=(StreamHandle&& other) noexcept
    {
        if (this != &other)
        {
            close();
            router_ = std::move(other.router_);
            id_ = std::exchange(other.id_, Ids::SubscriptionId{});
        }
        return *this;
    }

    void StreamHandle::close()
    {
        if (!id_.isValid())
            return;
        if (auto router = router_.lock(); router)
            router->detach(id_);
        id_ = Ids::SubscriptionId{};
        router_.reset();
    }

    bool StreamHandle::valid() const
    {
        return id_.isValid();
    }

    Ids::SubscriptionId const& StreamHandle::id() const
    {
        return id_;
    }

    Ids::SubscriptionId StreamHandle::release()
    {
        router_.reset();
        return std::exchange(id_, Ids::SubscriptionId{});
    }
}
