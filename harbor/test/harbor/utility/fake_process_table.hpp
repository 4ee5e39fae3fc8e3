#pragma once

#include <harbor/process/process_table.hpp>

#include <algorithm>
#include <csignal>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Harbor::Test
{
    /**
     * @brief A made up process list. Processes exit on SIGTERM unless told to ignore it, and always on SIGKILL.
     */
    class FakeProcessTable : public Harbor::IProcessTable
    {
      public:
        void add(long long pid, std::vector<std::string> arguments, bool ignoresTerm = false)
        {
            std::scoped_lock lock{guard_};
            processes_[pid] = Entry{.arguments = std::move(arguments), .ignoresTerm = ignoresTerm};
        }

        std::vector<long long> findByArgument(std::string const& argument) override
        {
            std::scoped_lock lock{guard_};
            std::vector<long long> found;
            for (auto const& [pid, entry] : processes_)
            {
                if (std::find(entry.arguments.begin(), entry.arguments.end(), argument) != entry.arguments.end())
                    found.push_back(pid);
            }
            return found;
        }

        bool sendSignal(long long pid, int signal) override
        {
            std::scoped_lock lock{guard_};
            signals_.emplace_back(pid, signal);
            auto iter = processes_.find(pid);
            if (iter == processes_.end())
                return false;
            if (signal == SIGKILL || (signal == SIGTERM && !iter->second.ignoresTerm))
                processes_.erase(iter);
            return true;
        }

        bool exists(long long pid) override
        {
            std::scoped_lock lock{guard_};
            return processes_.contains(pid);
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
        struct Entry
        {
            std::vector<std::string> arguments{};
            bool ignoresTerm{false};
        };

        mutable std::mutex guard_{};
        std::map<long long, Entry> processes_{};
        std::vector<std::pair<long long, int>> signals_{};
    };
}
