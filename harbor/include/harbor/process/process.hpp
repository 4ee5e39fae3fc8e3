#pragma once

#include <harbor/process/environment.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <roar/detail/pimpl_special_functions.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Harbor
{
    /**
     * @brief A child process with its output pipes attached to the executor.
     */
    class Process : public std::enable_shared_from_this<Process>
    {
      public:
        explicit Process(boost::asio::any_io_executor executor);
        ROAR_PIMPL_SPECIAL_FUNCTIONS(Process);

        /**
         * @brief Starts the executable. Throws boost::system::system_error if the process cannot be created.
         */
        void spawn(
            std::string const& executable,
            std::vector<std::string> const& arguments,
            Environment const& environment);

        void signal(int signal);
        void terminate();

        /**
         * @brief Blocks until the process has exited and was reaped.
         */
        std::optional<int> wait();

        std::optional<int> exitCode() const;
        long long pid() const;
        bool running() const;

        /**
         * @brief Reads stdout and stderr, calling back once per complete line.
         */
        void startReading(
            std::function<void(std::string_view)> onStdoutLine,
            std::function<void(std::string_view)> onStderrLine);

      private:
        struct Implementation;
        std::unique_ptr<Implementation> impl_;
    };
}
