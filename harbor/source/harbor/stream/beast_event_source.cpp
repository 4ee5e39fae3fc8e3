#include <harbor/stream/beast_event_source.hpp>
#include <log/log.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <limits>

namespace Harbor
{
    namespace
    {
        namespace beast = boost::beast;
        namespace http = boost::beast::http;
        using tcp = boost::asio::ip::tcp;

        class SseConnection : public std::enable_shared_from_this<SseConnection>
        {
          public:
            SseConnection(
                boost::asio::any_io_executor executor,
                unsigned short port,
                std::optional<std::string> lastEventId,
                EventSourceCallbacks callbacks,
                std::chrono::seconds readTimeout)
                : stream_{boost::asio::make_strand(executor)}
                , port_{port}
                , lastEventId_{std::move(lastEventId)}
                , callbacks_{std::move(callbacks)}
                , readTimeout_{readTimeout}
                , buffer_{}
                , request_{}
                , parser_{}
                , chunk_{}
                , sse_{}
                , closed_{false}
            {
                parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
            }

            void start()
            {
                boost::asio::post(stream_.get_executor(), [self = shared_from_this()]() {
                    self->connect();
                });
            }

            void close()
            {
                if (closed_.exchange(true))
                    return;
                boost::asio::post(stream_.get_executor(), [self = shared_from_this()]() {
                    beast::error_code ec;
                    self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
                    self->stream_.close();
                });
            }

          private:
            void connect()
            {
                if (closed_)
                    return;
                stream_.expires_after(readTimeout_);
                stream_.async_connect(
                    tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port_},
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec)
                            return self->fail("connect", ec);
                        self->sendRequest();
                    });
            }

            void sendRequest()
            {
                request_.method(http::verb::get);
                request_.target("/chat/stream");
                request_.version(11);
                request_.set(http::field::host, "127.0.0.1:" + std::to_string(port_));
                request_.set(http::field::accept, "text/event-stream");
                request_.set(http::field::cache_control, "no-cache");
                if (lastEventId_)
                    request_.set("Last-Event-ID", *lastEventId_);

                stream_.expires_after(readTimeout_);
                http::async_write(stream_, request_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec)
                        return self->fail("write", ec);
                    self->readHeader();
                });
            }

            void readHeader()
            {
                stream_.expires_after(readTimeout_);
                http::async_read_header(
                    stream_, buffer_, parser_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec)
                            return self->fail("read header", ec);

                        const auto status = self->parser_.get().result_int();
                        if (status != 200)
                        {
                            return self->finish(makeError(
                                HostErrorType::TransportError,
                                "Event stream answered with HTTP status " + std::to_string(status)));
                        }

                        if (!self->closed_ && self->callbacks_.onOpen)
                            self->callbacks_.onOpen();
                        self->readBody();
                    });
            }

            void readBody()
            {
                if (closed_)
                    return;

                parser_.get().body().data = chunk_.data();
                parser_.get().body().size = chunk_.size();
                stream_.expires_after(readTimeout_);
                http::async_read_some(
                    stream_, buffer_, parser_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec == http::error::need_buffer)
                            ec = {};

                        const auto received = self->chunk_.size() - self->parser_.get().body().size;
                        if (received > 0)
                        {
                            for (auto const& event :
                                 self->sse_.feed(std::string_view{self->chunk_.data(), received}))
                            {
                                if (self->closed_)
                                    return;
                                if (self->callbacks_.onEvent)
                                    self->callbacks_.onEvent(event);
                            }
                        }

                        if (ec)
                            return self->fail("read", ec);
                        if (self->parser_.is_done())
                            return self->finish(std::nullopt);
                        self->readBody();
                    });
            }

            void fail(char const* what, beast::error_code ec)
            {
                finish(makeError(HostErrorType::TransportError, std::string{what} + ": " + ec.message()));
            }

            void finish(std::optional<HostError> const& error)
            {
                if (closed_.exchange(true))
                    return;

                beast::error_code ignored;
                stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
                stream_.close();
                if (callbacks_.onClosed)
                    callbacks_.onClosed(error);
            }

          private:
            beast::tcp_stream stream_;
            unsigned short port_;
            std::optional<std::string> lastEventId_;
            EventSourceCallbacks callbacks_;
            std::chrono::seconds readTimeout_;
            beast::flat_buffer buffer_;
            http::request<http::empty_body> request_;
            http::response_parser<http::buffer_body> parser_;
            std::array<char, 8192> chunk_;
            SseParser sse_;
            std::atomic_bool closed_;
        };

        class BeastEventSource : public IEventSource
        {
          public:
            explicit BeastEventSource(std::shared_ptr<SseConnection> connection)
                : connection_{std::move(connection)}
            {}
            ~BeastEventSource() override
            {
                close();
            }

            void close() override
            {
                connection_->close();
            }

          private:
            std::shared_ptr<SseConnection> connection_;
        };
    }

    BeastEventSourceFactory::BeastEventSourceFactory(boost::asio::any_io_executor executor, std::chrono::seconds readTimeout)
        : executor_{std::move(executor)}
        , readTimeout_{readTimeout}
    {}

    std::unique_ptr<IEventSource> BeastEventSourceFactory::open(
        unsigned short port,
        std::optional<std::string> const& lastEventId,
        EventSourceCallbacks callbacks)
    {
        Log::debug(
            "Opening event stream on port {}{}.",
            static_cast<int>(port),
            lastEventId ? " after event " + *lastEventId : std::string{});
        auto connection = std::make_shared<SseConnection>(executor_, port, lastEventId, std::move(callbacks), readTimeout_);
        connection->start();
        return std::make_unique<BeastEventSource>(std::move(connection));
    }
}
