#pragma once

#include <harbor/process/environment.hpp>

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace Harbor
{
    /**
     * @brief The host operating system's process facility.
     */
    class IProcessLauncher
    {
      public:
        virtual ~IProcessLauncher() = default;

        /**
         * @brief Starts a process and returns its pid.
         *
         * @param label Prefix for the process's forwarded output.
         */
        virtual std::expected<long long, std::string> spawnProcess(
            std::string const& command,
            std::vector<std::string> const& arguments,
            Environment const& environment,
            std::string const& label) = 0;

        virtual bool sendSignal(long long pid, int signal) = 0;

        /**
         * @brief Blocks until the process exited, reaps it and returns the exit code.
         */
        virtual std::optional<int> waitExit(long long pid) = 0;

        virtual bool isAlive(long long pid) = 0;
    };
}
