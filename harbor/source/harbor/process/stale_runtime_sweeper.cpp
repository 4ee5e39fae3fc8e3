#include <harbor/process/stale_runtime_sweeper.hpp>
#include <log/log.hpp>

#include <csignal>
#include <thread>

namespace Harbor
{
    StaleRuntimeSweeper::StaleRuntimeSweeper(std::shared_ptr<IProcessTable> table, StaleRuntimeSweepOptions options)
        : table_{std::move(table)}
        , options_{std::move(options)}
    {}

    SweepReport StaleRuntimeSweeper::sweep()
    {
        SweepReport report{};
        if (options_.marker.empty())
            return report;

        const auto pids = table_->findByArgument(options_.marker);
        report.found = pids.size();
        if (pids.empty())
        {
            Log::debug("No runtimes of an earlier run found.");
            return report;
        }

        Log::info("Found {} runtimes of an earlier run, stopping them.", pids.size());
        for (auto const pid : pids)
        {
            if (!table_->sendSignal(pid, SIGTERM))
                Log::debug("Stale runtime {} exited before SIGTERM.", pid);
        }

        auto remaining = awaitExit(pids);
        if (!remaining.empty())
        {
            Log::warn("{} stale runtimes ignored SIGTERM, sending SIGKILL.", remaining.size());
            report.killed = remaining.size();
            for (auto const pid : remaining)
            {
                if (!table_->sendSignal(pid, SIGKILL))
                    Log::debug("Stale runtime {} exited before SIGKILL.", pid);
            }
            remaining = awaitExit(std::move(remaining));
        }

        report.survivors = remaining.size();
        if (report.survivors > 0)
            Log::error("{} stale runtimes could not be stopped.", report.survivors);
        Log::info("Stopped {} of {} stale runtimes.", report.found - report.survivors, report.found);
        return report;
    }

    std::vector<long long> StaleRuntimeSweeper::awaitExit(std::vector<long long> pids) const
    {
        const auto deadline = std::chrono::steady_clock::now() + options_.gracePeriod;
        while (true)
        {
            std::erase_if(pids, [this](long long pid) {
                return !table_->exists(pid);
            });
            if (pids.empty() || std::chrono::steady_clock::now() >= deadline)
                return pids;
            std::this_thread::sleep_for(options_.pollInterval);
        }
    }
}
