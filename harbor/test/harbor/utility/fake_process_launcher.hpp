#pragma once

#include <harbor/process/process_launcher.hpp>

#include <csignal>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Harbor::Test
{
    /**
     * @brief Pretends to start processes. They live until signalled or crashed by the test.
     */
    class FakeProcessLauncher : public Harbor::IProcessLauncher
    {
      public:
        struct Spawn
        {
            std::string command{};
            std::vector<std::string> arguments{};
            std::string label{};
            long long pid{0};
        };

        std::expected<long long, std::string> spawnProcess(
            std::string const& command,
            std::vector<std::string> const& arguments,
            Environment const&,
            std::string const& label) override
        {
            std::scoped_lock lock{guard_};
            if (failingSpawns_ > 0)
            {
                --failingSpawns_;
                return std::unexpected(std::string{"executable not found"});
            }

            const auto pid = nextPid_++;
            spawns_.push_back(Spawn{.command = command, .arguments = arguments, .label = label, .pid = pid});
            if (exitImmediately_)
                exitCodes_[pid] = 1;
            else
                alive_[pid] = true;
            return pid;
        }

        bool sendSignal(long long pid, int signal) override
        {
            std::scoped_lock lock{guard_};
            signals_.emplace_back(pid, signal);
            if (!alive_.contains(pid))
                return false;
            if (signal == SIGKILL || (signal == SIGTERM && !ignoreTerm_))
            {
                alive_.erase(pid);
                exitCodes_[pid] = 128 + signal;
            }
            return true;
        }

        std::optional<int> waitExit(long long pid) override
        {
            std::scoped_lock lock{guard_};
            if (auto iter = exitCodes_.find(pid); iter != exitCodes_.end())
                return iter->second;
            return std::nullopt;
        }

        bool isAlive(long long pid) override
        {
            std::scoped_lock lock{guard_};
            return alive_.contains(pid);
        }

        void crash(long long pid, int exitCode = 139)
        {
            std::scoped_lock lock{guard_};
            alive_.erase(pid);
            exitCodes_[pid] = exitCode;
        }

        void failNextSpawns(int count)
        {
            std::scoped_lock lock{guard_};
            failingSpawns_ = count;
        }

        void exitImmediately(bool exit)
        {
            std::scoped_lock lock{guard_};
            exitImmediately_ = exit;
        }

        void ignoreTerm(bool ignore)
        {
            std::scoped_lock lock{guard_};
            ignoreTerm_ = ignore;
        }

        std::vector<Spawn> spawns() const
        {
            std::scoped_lock lock{guard_};
            return spawns_;
        }

        std::size_t aliveCount() const
        {
            std::scoped_lock lock{guard_};
            return alive_.size();
        }

        std::vector<int> signalsSentTo(long long pid) const
        {
            std::scoped_lock lock{guard_};
            std::vector<int> result;
            for (auto const& [target, signal] : signals_)
            {
                if (target == pid)
                    result.push_back(signal);
            }
            return result;
        }

      private:
        mutable std::mutex guard_{};
        long long nextPid_{1000};
        int failingSpawns_{0};
        bool exitImmediately_{false};
        bool ignoreTerm_{false};
        std::vector<Spawn> spawns_{};
        std::map<long long, bool> alive_{};
        std::map<long long, int> exitCodes_{};
        std::vector<std::pair<long long, int>> signals_{};
    };
}
