#pragma once

#include <ids/ids.hpp>

#include <memory>

namespace Harbor
{
    class EventStreamRouter;

    /**
     * @brief Owns one subscription of the EventStreamRouter. Destroying or closing it detaches the stream.
     */
    class StreamHandle
    {
      public:
        StreamHandle();
        StreamHandle(std::weak_ptr<EventStreamRouter> router, Ids::SubscriptionId id);
        ~StreamHandle();
        StreamHandle(StreamHandle const&) = delete;
        StreamHandle& operator=(StreamHandle const&) = delete;
        StreamHandle(StreamHandle&& other) noexcept;
        StreamHandle& operator=(StreamHandle&& other) noexcept;

        void close();
        bool valid() const;
        Ids::SubscriptionId const& id() const;

        /**
         * @brief Gives up ownership without detaching. The subscription then lives until its claim is released.
         */
        Ids::SubscriptionId release();

      private:
        std::weak_ptr<EventStreamRouter> router_;
        Ids::SubscriptionId id_;
    };
}
