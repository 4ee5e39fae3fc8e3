#include <harbor/control/http_process_control.hpp>
#include <log/log.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace Harbor
{
    namespace
    {
        namespace beast = boost::beast;
        namespace http = boost::beast::http;
        using tcp = boost::asio::ip::tcp;

        class JsonRequest : public std::enable_shared_from_this<JsonRequest>
        {
          public:
            JsonRequest(
                boost::asio::any_io_executor executor,
                unsigned short port,
                http::request<http::string_body> request,
                std::chrono::seconds timeout,
                std::function<void(std::expected<HttpResponse, HostError> const&)> onComplete)
                : stream_{boost::asio::make_strand(executor)}
                , port_{port}
                , request_{std::move(request)}
                , timeout_{timeout}
                , onComplete_{std::move(onComplete)}
                , buffer_{}
                , response_{}
            {}

            void run()
            {
                stream_.expires_after(timeout_);
                stream_.async_connect(
                    tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port_},
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec)
                            return self->fail("connect", ec);
                        self->write();
                    });
            }

          private:
            void write()
            {
                http::async_write(stream_, request_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec)
                        return self->fail("write", ec);
                    self->read();
                });
            }

            void read()
            {
                http::async_read(
                    stream_, buffer_, response_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec)
                            return self->fail("read", ec);

                        beast::error_code ignored;
                        self->stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);

                        HttpResponse response{.status = self->response_.result_int(), .body = {}};
                        if (!self->response_.body().empty())
                        {
                            response.body = nlohmann::json::parse(self->response_.body(), nullptr, false);
                            if (response.body.is_discarded())
                                response.body = self->response_.body();
                        }
                        self->complete(std::move(response));
                    });
            }

            void fail(char const* what, beast::error_code ec)
            {
                complete(std::unexpected(makeError(
                    HostErrorType::TransportError,
                    std::string{request_.target()} + " " + what + ": " + ec.message())));
            }

            void complete(std::expected<HttpResponse, HostError> const& result)
            {
                if (onComplete_)
                    onComplete_(result);
                onComplete_ = {};
            }

          private:
            beast::tcp_stream stream_;
            unsigned short port_;
            http::request<http::string_body> request_;
            std::chrono::seconds timeout_;
            std::function<void(std::expected<HttpResponse, HostError> const&)> onComplete_;
            beast::flat_buffer buffer_;
            http::response<http::string_body> response_;
        };
    }

    void to_json(nlohmann::json& j, TaskExecutionRequest const& request)
    {
        j = nlohmann::json{
            {"taskId", request.taskId},
            {"prompt", request.prompt},
            {"sessionId", request.sessionId},
            {"isFirstExecution", request.isFirstExecution},
            {"aiCanExit", request.aiCanExit},
            {"runMode", Persistence::toWireString(request.runMode)},
        };
        if (request.permissionMode)
            j["permissionMode"] = *request.permissionMode;
        if (request.model)
            j["model"] = *request.model;
    }

    void from_json(nlohmann::json const& j, TaskExecutionResult& result)
    {
        result.success = j.value("success", false);
        if (j.contains("error") && j["error"].is_string())
            result.error = j["error"].get<std::string>();
        result.aiRequestedExit = j.value("aiRequestedExit", false);
        if (j.contains("exitReason") && j["exitReason"].is_string())
            result.exitReason = j["exitReason"].get<std::string>();
    }

    HttpProcessControl::HttpProcessControl(
        boost::asio::any_io_executor executor,
        std::chrono::seconds stopTimeout,
        std::chrono::seconds executeTimeout)
        : executor_{std::move(executor)}
        , stopTimeout_{stopTimeout}
        , executeTimeout_{executeTimeout}
    {}

    void HttpProcessControl::post(
        unsigned short port,
        std::string const& target,
        nlohmann::json const& body,
        std::chrono::seconds timeout,
        std::function<void(std::expected<HttpResponse, HostError> const&)> onComplete)
    {
        http::request<http::string_body> request{http::verb::post, target, 11};
        request.set(http::field::host, "127.0.0.1:" + std::to_string(port));
        request.set(http::field::content_type, "application/json");
        request.set(http::field::accept, "application/json");
        request.body() = body.dump();
        request.prepare_payload();

        std::make_shared<JsonRequest>(executor_, port, std::move(request), timeout, std::move(onComplete))->run();
    }

    void HttpProcessControl::stopGeneration(
        unsigned short port,
        std::function<void(std::expected<void, HostError> const&)> onComplete)
    {
        Log::info("Asking runtime on port {} to stop generating.", static_cast<int>(port));
        post(
            port,
            "/chat/stop",
            nlohmann::json::object(),
            stopTimeout_,
            [onComplete = std::move(onComplete)](std::expected<HttpResponse, HostError> const& response) {
                if (!onComplete)
                    return;
                if (!response)
                    return onComplete(std::unexpected(response.error()));
                if (response->status >= 300)
                {
                    return onComplete(std::unexpected(makeError(
                        HostErrorType::TransportError,
                        "/chat/stop answered with HTTP status " + std::to_string(response->status))));
                }
                onComplete({});
            });
    }

    void HttpProcessControl::executeTask(
        unsigned short port,
        TaskExecutionRequest const& request,
        std::function<void(std::expected<TaskExecutionResult, HostError> const&)> onComplete)
    {
        Log::info("Executing task {} on port {}.", request.taskId, static_cast<int>(port));
        post(
            port,
            "/cron/execute",
            nlohmann::json(request),
            executeTimeout_,
            [onComplete = std::move(onComplete)](std::expected<HttpResponse, HostError> const& response) {
                if (!onComplete)
                    return;
                if (!response)
                    return onComplete(std::unexpected(response.error()));

                if (!response->body.is_object())
                {
                    return onComplete(std::unexpected(makeError(
                        HostErrorType::TransportError,
                        "/cron/execute answered with HTTP status " + std::to_string(response->status) +
                            " and no result")));
                }

                auto result = response->body.get<TaskExecutionResult>();
                if (response->status >= 300 && result.success)
                    result.success = false;
                if (!result.success && !result.error)
                    result.error = "HTTP status " + std::to_string(response->status);
                onComplete(result);
            });
    }
}
