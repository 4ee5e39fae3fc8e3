#pragma once

#include <harbor/control/process_control.hpp>

#include <gmock/gmock.h>

#include <functional>

namespace Harbor::Test
{
    class ProcessControlMock : public Harbor::IProcessControl
    {
      public:
        MOCK_METHOD(
            void,
            stopGeneration,
            (unsigned short port, std::function<void(std::expected<void, HostError> const&)> onComplete),
            (override));
        MOCK_METHOD(
            void,
            executeTask,
            (unsigned short port,
             TaskExecutionRequest const& request,
             std::function<void(std::expected<TaskExecutionResult, HostError> const&)> onComplete),
            (override));
    };
}
