#pragma once

#include <chrono>
#include <functional>

namespace Harbor
{
    class IReadinessProbe
    {
      public:
        virtual ~IReadinessProbe() = default;

        /**
         * @brief Checks whether the runtime on the port accepts connections within the timeout.
         *
         * @param onResult Called exactly once with the outcome, possibly from within this call.
         */
        virtual void probe(unsigned short port, std::chrono::milliseconds timeout, std::function<void(bool)> onResult) = 0;
    };
}
