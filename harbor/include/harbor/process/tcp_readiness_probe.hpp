#pragma once

#include <harbor/process/readiness_probe.hpp>

#include <boost/asio/any_io_executor.hpp>

namespace Harbor
{
    /**
     * @brief Ready means a TCP connect to 127.0.0.1:port succeeds. Never blocks the calling thread.
     */
    class TcpReadinessProbe : public IReadinessProbe
    {
      public:
        explicit TcpReadinessProbe(boost::asio::any_io_executor executor);

        void probe(unsigned short port, std::chrono::milliseconds timeout, std::function<void(bool)> onResult) override;

      private:
        boost::asio::any_io_executor executor_;
    };
}
