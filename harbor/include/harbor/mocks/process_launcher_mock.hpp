#pragma once

#include <harbor/process/process_launcher.hpp>

#include <gmock/gmock.h>

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace Harbor::Test
{
    class ProcessLauncherMock : public Harbor::IProcessLauncher
    {
      public:
        MOCK_METHOD(
            (std::expected<long long, std::string>),
            spawnProcess,
            (std::string const& command,
             std::vector<std::string> const& arguments,
             Environment const& environment,
             std::string const& label),
            (override));
        MOCK_METHOD(bool, sendSignal, (long long pid, int signal), (override));
        MOCK_METHOD(std::optional<int>, waitExit, (long long pid), (override));
        MOCK_METHOD(bool, isAlive, (long long pid), (override));
    };
}
