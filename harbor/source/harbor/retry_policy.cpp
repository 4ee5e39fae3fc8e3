#include <harbor/retry_policy.hpp>

#include <algorithm>
#include <cstdint>

namespace Harbor
{
    RetryPolicy::RetryPolicy(RetryOptions options)
        : options_{options}
        , guard_{}
        , attempts_{0}
        , cancelled_{false}
    {}

    std::optional<std::chrono::milliseconds> RetryPolicy::nextDelay()
    {
        std::scoped_lock lock{guard_};
        if (cancelled_ || attempts_ >= options_.maxAttempts)
            return std::nullopt;

        const auto shift = std::min(attempts_, 20);
        ++attempts_;
        const std::chrono::milliseconds delay{options_.baseDelay.count() * (std::int64_t{1} << shift)};
        return std::min(delay, options_.maxDelay);
    }

    void RetryPolicy::reset()
    {
        std::scoped_lock lock{guard_};
        attempts_ = 0;
    }

    void RetryPolicy::cancel()
    {
        std::scoped_lock lock{guard_};
        cancelled_ = true;
    }

    bool RetryPolicy::cancelled() const
    {
        std::scoped_lock lock{guard_};
        return cancelled_;
    }

    int RetryPolicy::attempts() const
    {
        std::scoped_lock lock{guard_};
        return attempts_;
    }

    RetryOptions const& RetryPolicy::options() const
    {
        return options_;
    }
}
