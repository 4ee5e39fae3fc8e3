#pragma once

#include <harbor/host_error.hpp>
#include <harbor/scheduler/task_scheduler.hpp>
#include <ids/ids.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace Harbor
{
    struct RecoveryFailure
    {
        Ids::TaskId taskId{};
        HostError error{};
    };

    struct RecoveryReport
    {
        std::size_t total{0};
        std::size_t recovered{0};
        std::vector<RecoveryFailure> failures{};

        /// "N of M recurring tasks recovered"
        std::string summary() const;
        bool complete() const
        {
            return recovered == total;
        }
    };

    /**
     * @brief Restores the scheduled tasks that were running or paused when the host last stopped.
     */
    class RecoveryCoordinator
    {
      public:
        RecoveryCoordinator(
            std::shared_ptr<TaskScheduler> scheduler,
            std::chrono::milliseconds perTaskTimeout = std::chrono::seconds{60});

        /**
         * @brief Claims the runtimes of all tasks to recover, then waits for them. Blocks, so it must not run on
         * the host's only executor thread. A task that fails is stopped and does not affect the others.
         */
        RecoveryReport recover();

      private:
        std::shared_ptr<TaskScheduler> scheduler_;
        std::chrono::milliseconds perTaskTimeout_;
    };
}
