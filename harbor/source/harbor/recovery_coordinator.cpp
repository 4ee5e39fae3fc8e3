#include <harbor/recovery_coordinator.hpp>
#include <log/log.hpp>

#include <future>

namespace Harbor
{
    std::string RecoveryReport::summary() const
    {
        return std::to_string(recovered) + " of " + std::to_string(total) + " recurring tasks recovered";
    }

    RecoveryCoordinator::RecoveryCoordinator(
        std::shared_ptr<TaskScheduler> scheduler,
        std::chrono::milliseconds perTaskTimeout)
        : scheduler_{std::move(scheduler)}
        , perTaskTimeout_{perTaskTimeout}
    {}

    RecoveryReport RecoveryCoordinator::recover()
    {
        using Outcome = std::expected<void, HostError>;

        const auto tasks = scheduler_->tasksToRecover();
        RecoveryReport report{.total = tasks.size(), .recovered = 0, .failures = {}};
        if (tasks.empty())
            return report;

        Log::info("Recovering {} recurring tasks.", tasks.size());

        // All runtimes are requested first so that they start in parallel.
        std::vector<std::pair<Ids::TaskId, std::future<Outcome>>> pending;
        pending.reserve(tasks.size());
        for (auto const& task : tasks)
        {
            auto promise = std::make_shared<std::promise<Outcome>>();
            pending.emplace_back(task.id, promise->get_future());
            scheduler_->restoreTask(task.id, [promise](Outcome const& outcome) {
                promise->set_value(outcome);
            });
        }

        for (auto& [taskId, future] : pending)
        {
            Outcome outcome;
            if (future.wait_for(perTaskTimeout_) == std::future_status::ready)
                outcome = future.get();
            else
                outcome = std::unexpected(makeError(HostErrorType::SpawnFailed, "Timed out waiting for the runtime"));

            if (outcome)
            {
                ++report.recovered;
                continue;
            }

            auto error = outcome.error();
            error.message = "Task " + taskId.value() + ": " + error.message;
            scheduler_->failRecovery(taskId, error);
            report.failures.push_back(RecoveryFailure{
                .taskId = taskId,
                .error = makeError(HostErrorType::RecoveryPartialFailure, error.toString()),
            });
        }

        if (report.complete())
            Log::info("{}.", report.summary());
        else
            Log::warn("{}.", report.summary());
        return report;
    }
}
