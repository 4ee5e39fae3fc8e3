#pragma once

#include <harbor/process/readiness_probe.hpp>

#include <gmock/gmock.h>

namespace Harbor::Test
{
    /**
     * @brief Answers each probe synchronously with the result of isReady.
     */
    class ReadinessProbeMock : public Harbor::IReadinessProbe
    {
      public:
        MOCK_METHOD(bool, isReady, (unsigned short port, std::chrono::milliseconds timeout));

        void probe(unsigned short port, std::chrono::milliseconds timeout, std::function<void(bool)> onResult) override
        {
            onResult(isReady(port, timeout));
        }
    };
}
