#include <harbor/process/tcp_readiness_probe.hpp>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <memory>

namespace Harbor
{
    namespace
    {
        struct ConnectAttempt
        {
            ConnectAttempt(boost::asio::any_io_executor executor, std::function<void(bool)> onResult)
                : strand{boost::asio::make_strand(executor)}
                , socket{strand}
                , timer{strand}
                , onResult{std::move(onResult)}
                , finished{false}
            {}

            // Runs on the strand.
            void finish(bool ready)
            {
                if (finished)
                    return;
                finished = true;
                boost::system::error_code ignored;
                timer.cancel();
                if (ready)
                    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
                socket.close(ignored);
                onResult(ready);
            }

            boost::asio::strand<boost::asio::any_io_executor> strand;
            boost::asio::ip::tcp::socket socket;
            boost::asio::steady_timer timer;
            std::function<void(bool)> onResult;
            bool finished;
        };
    }

    TcpReadinessProbe::TcpReadinessProbe(boost::asio::any_io_executor executor)
        : executor_{std::move(executor)}
    {}

    void
    TcpReadinessProbe::probe(unsigned short port, std::chrono::milliseconds timeout, std::function<void(bool)> onResult)
    {
        auto attempt = std::make_shared<ConnectAttempt>(executor_, std::move(onResult));

        attempt->timer.expires_after(timeout);
        attempt->timer.async_wait([attempt](boost::system::error_code ec) {
            if (ec)
                return;
            attempt->finish(false);
        });
        attempt->socket.async_connect(
            boost::asio::ip::tcp::endpoint{boost::asio::ip::address_v4::loopback(), port},
            [attempt](boost::system::error_code ec) {
                attempt->finish(!ec);
            });
    }
}
