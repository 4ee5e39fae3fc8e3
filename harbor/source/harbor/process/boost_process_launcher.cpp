#include <harbor/process/boost_process_launcher.hpp>
#include <log/log.hpp>

#include <boost/system/system_error.hpp>

namespace Harbor
{
    BoostProcessLauncher::BoostProcessLauncher(boost::asio::any_io_executor executor)
        : executor_{std::move(executor)}
        , guard_{}
        , processes_{}
    {}

    BoostProcessLauncher::~BoostProcessLauncher()
    {
        std::scoped_lock lock{guard_};
        for (auto& [pid, process] : processes_)
        {
            if (process->running())
                Log::warn("Process {} is still running on shutdown, killing it.", pid);
        }
        processes_.clear();
    }

    std::expected<long long, std::string> BoostProcessLauncher::spawnProcess(
        std::string const& command,
        std::vector<std::string> const& arguments,
        Environment const& environment,
        std::string const& label)
    {
        auto process = std::make_shared<Process>(executor_);
        try
        {
            process->spawn(command, arguments, environment);
        }
        catch (boost::system::system_error const& e)
        {
            return std::unexpected(std::string{"Cannot start '"} + command + "': " + e.what());
        }

        process->startReading(
            [label](std::string_view line) {
                Log::info("[sidecar-out][{}] {}", label, line);
            },
            [label](std::string_view line) {
                Log::warn("[sidecar-err][{}] {}", label, line);
            });

        const auto pid = process->pid();
        {
            std::scoped_lock lock{guard_};
            processes_[pid] = std::move(process);
        }
        Log::debug("Started '{}' for {} with pid {}.", command, label, pid);
        return pid;
    }

    bool BoostProcessLauncher::sendSignal(long long pid, int signal)
    {
        auto process = find(pid);
        if (!process || !process->running())
            return false;
        process->signal(signal);
        return true;
    }

    std::optional<int> BoostProcessLauncher::waitExit(long long pid)
    {
        auto process = find(pid);
        if (!process)
            return std::nullopt;

        const auto code = process->wait();
        {
            std::scoped_lock lock{guard_};
            processes_.erase(pid);
        }
        return code;
    }

    bool BoostProcessLauncher::isAlive(long long pid)
    {
        auto process = find(pid);
        return process && process->running();
    }

    std::shared_ptr<Process> BoostProcessLauncher::find(long long pid) const
    {
        std::scoped_lock lock{guard_};
        auto iter = processes_.find(pid);
        if (iter == processes_.end())
            return nullptr;
        return iter->second;
    }
}
