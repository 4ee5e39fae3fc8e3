#pragma once

#include <harbor/process/process_table.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace Harbor
{
    struct StaleRuntimeSweepOptions
    {
        /// The argument every runtime of this host is started with.
        std::string marker{};
        std::chrono::milliseconds gracePeriod{300};
        std::chrono::milliseconds pollInterval{50};
    };

    struct SweepReport
    {
        std::size_t found{0};
        /// Runtimes that ignored SIGTERM and were killed.
        std::size_t killed{0};
        /// Runtimes still alive after SIGKILL.
        std::size_t survivors{0};
    };

    /**
     * @brief Stops the runtimes an earlier host left behind, for example after a crash. They still hold their
     * ports, so this has to run before anything is spawned.
     */
    class StaleRuntimeSweeper
    {
      public:
        StaleRuntimeSweeper(std::shared_ptr<IProcessTable> table, StaleRuntimeSweepOptions options);

        /**
         * @brief Sends SIGTERM, then SIGKILL to the ones still alive after the grace period. Blocks.
         */
        SweepReport sweep();

      private:
        std::vector<long long> awaitExit(std::vector<long long> pids) const;

      private:
        std::shared_ptr<IProcessTable> table_;
        StaleRuntimeSweepOptions options_;
    };
}
