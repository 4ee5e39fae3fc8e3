#pragma once

#include <harbor/host_error.hpp>

#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <set>

namespace Harbor
{
    /**
     * @brief Hands out local ports round robin from a fixed range. A port stays reserved until release() is
     * called, which must only happen after the process that used it is confirmed dead.
     */
    class PortAllocator
    {
      public:
        struct Options
        {
            unsigned short basePort{31415};
            unsigned short range{500};
            int maxAttempts{200};
        };

        /**
         * @brief Validates a port range: at least one port, and every port of the range below 65536.
         */
        static std::expected<Options, HostError> makeOptions(int basePort, int range, int maxAttempts);

        /**
         * @throws std::invalid_argument if the options do not describe a valid range.
         */
        explicit PortAllocator(
            Options options,
            std::function<bool(unsigned short)> isAvailable = &PortAllocator::canBindLocally);

        std::optional<unsigned short> reserve();
        void release(unsigned short port);

        bool isReserved(unsigned short port) const;
        std::size_t reservedCount() const;

        static bool canBindLocally(unsigned short port);

      private:
        Options options_;
        std::function<bool(unsigned short)> isAvailable_;
        mutable std::mutex guard_;
        std::set<unsigned short> reserved_;
        unsigned int next_;
    };
}
