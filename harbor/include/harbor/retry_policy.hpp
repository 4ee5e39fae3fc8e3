#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace Harbor
{
    struct RetryOptions
    {
        int maxAttempts{3};
        std::chrono::milliseconds baseDelay{1000};
        std::chrono::milliseconds maxDelay{10000};
    };

    /**
     * @brief Bounded exponential backoff. Once cancelled, no further attempts are granted.
     */
    class RetryPolicy
    {
      public:
        explicit RetryPolicy(RetryOptions options = {});

        /**
         * @brief Consumes one attempt.
         *
         * @return The delay to wait before the attempt, or nullopt if retries are exhausted or cancelled.
         */
        std::optional<std::chrono::milliseconds> nextDelay();

        void reset();
        void cancel();

        bool cancelled() const;
        int attempts() const;
        RetryOptions const& options() const;

      private:
        RetryOptions options_;
        mutable std::mutex guard_;
        int attempts_;
        bool cancelled_;
    };
}
