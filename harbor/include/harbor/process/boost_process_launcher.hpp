#pragma once

#include <harbor/process/process_launcher.hpp>
#include <harbor/process/process.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <mutex>
#include <unordered_map>

namespace Harbor
{
    /**
     * @brief Launches processes with Boost.Process and forwards their output to the log.
     */
    class BoostProcessLauncher : public IProcessLauncher
    {
      public:
        explicit BoostProcessLauncher(boost::asio::any_io_executor executor);
        ~BoostProcessLauncher() override;

        BoostProcessLauncher(BoostProcessLauncher const&) = delete;
        BoostProcessLauncher& operator=(BoostProcessLauncher const&) = delete;
        BoostProcessLauncher(BoostProcessLauncher&&) = delete;
        BoostProcessLauncher& operator=(BoostProcessLauncher&&) = delete;

        std::expected<long long, std::string> spawnProcess(
            std::string const& command,
            std::vector<std::string> const& arguments,
            Environment const& environment,
            std::string const& label) override;
        bool sendSignal(long long pid, int signal) override;
        std::optional<int> waitExit(long long pid) override;
        bool isAlive(long long pid) override;

      private:
        std::shared_ptr<Process> find(long long pid) const;

      private:
        boost::asio::any_io_executor executor_;
        mutable std::mutex guard_;
        std::unordered_map<long long, std::shared_ptr<Process>> processes_;
    };
}
