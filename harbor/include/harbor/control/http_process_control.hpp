#pragma once

#include <harbor/control/process_control.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>

#include <chrono>

namespace Harbor
{
    struct HttpResponse
    {
        unsigned int status{0};
        nlohmann::json body{};
    };

    /**
     * @brief IProcessControl over plain HTTP/1.1 to 127.0.0.1 using Boost.Beast.
     */
    class HttpProcessControl : public IProcessControl
    {
      public:
        HttpProcessControl(
            boost::asio::any_io_executor executor,
            std::chrono::seconds stopTimeout = std::chrono::seconds{10},
            std::chrono::seconds executeTimeout = std::chrono::seconds{600});

        void stopGeneration(
            unsigned short port,
            std::function<void(std::expected<void, HostError> const&)> onComplete) override;

        void executeTask(
            unsigned short port,
            TaskExecutionRequest const& request,
            std::function<void(std::expected<TaskExecutionResult, HostError> const&)> onComplete) override;

        /**
         * @brief Sends a JSON POST request and decodes a JSON response.
         */
        void post(
            unsigned short port,
            std::string const& target,
            nlohmann::json const& body,
            std::chrono::seconds timeout,
            std::function<void(std::expected<HttpResponse, HostError> const&)> onComplete);

      private:
        boost::asio::any_io_executor executor_;
        std::chrono::seconds stopTimeout_;
        std::chrono::seconds executeTimeout_;
    };

    void to_json(nlohmann::json& j, TaskExecutionRequest const& request);
    void from_json(nlohmann::json const& j, TaskExecutionResult& result);
}
