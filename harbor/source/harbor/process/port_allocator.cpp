#include <harbor/process/port_allocator.hpp>
#include <log/log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <fmt/format.h>

#include <stdexcept>

namespace Harbor
{
    std::expected<PortAllocator::Options, HostError>
    PortAllocator::makeOptions(int basePort, int range, int maxAttempts)
    {
        constexpr int portLimit = 65536;

        if (basePort < 1 || basePort >= portLimit)
            return std::unexpected(
                makeError(HostErrorType::InvalidArgument, fmt::format("basePort {} is not a valid port", basePort)));
        if (range < 1)
            return std::unexpected(
                makeError(HostErrorType::InvalidArgument, fmt::format("portRange must be at least 1, got {}", range)));
        if (basePort + range > portLimit)
        {
            return std::unexpected(makeError(
                HostErrorType::InvalidArgument,
                fmt::format("Port range [{}, {}) exceeds the highest port 65535", basePort, basePort + range)));
        }
        if (maxAttempts < 1)
        {
            return std::unexpected(makeError(
                HostErrorType::InvalidArgument, fmt::format("maxPortAttempts must be at least 1, got {}", maxAttempts)));
        }

        return Options{
            .basePort = static_cast<unsigned short>(basePort),
            .range = static_cast<unsigned short>(range),
            .maxAttempts = maxAttempts,
        };
    }

    PortAllocator::PortAllocator(Options options, std::function<bool(unsigned short)> isAvailable)
        : options_{[&options]() {
            auto validated = makeOptions(options.basePort, options.range, options.maxAttempts);
            if (!validated)
                throw std::invalid_argument{validated.error().toString()};
            return *validated;
        }()}
        , isAvailable_{std::move(isAvailable)}
        , guard_{}
        , reserved_{}
        , next_{0}
    {}

    std::optional<unsigned short> PortAllocator::reserve()
    {
        std::scoped_lock lock{guard_};
        for (int attempt = 0; attempt < options_.maxAttempts; ++attempt)
        {
            const auto port = static_cast<unsigned short>(options_.basePort + (next_++ % options_.range));
            if (reserved_.contains(port))
                continue;
            if (isAvailable_ && !isAvailable_(port))
            {
                Log::debug("Port {} is in use by another program, skipping.", port);
                continue;
            }
            reserved_.insert(port);
            return port;
        }
        Log::error(
            "No free port found in [{}, {}) after {} attempts.",
            options_.basePort,
            options_.basePort + options_.range,
            options_.maxAttempts);
        return std::nullopt;
    }

    void PortAllocator::release(unsigned short port)
    {
        std::scoped_lock lock{guard_};
        reserved_.erase(port);
    }

    bool PortAllocator::isReserved(unsigned short port) const
    {
        std::scoped_lock lock{guard_};
        return reserved_.contains(port);
    }

    std::size_t PortAllocator::reservedCount() const
    {
        std::scoped_lock lock{guard_};
        return reserved_.size();
    }

    bool PortAllocator::canBindLocally(unsigned short port)
    {
        boost::asio::io_context context;
        boost::asio::ip::tcp::acceptor acceptor{context};
        boost::system::error_code ec;
        const boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::address_v4::loopback(), port};

        acceptor.open(endpoint.protocol(), ec);
        if (ec)
            return false;
        acceptor.bind(endpoint, ec);
        const bool bound = !ec;
        acceptor.close(ec);
        return bound;
    }
}
