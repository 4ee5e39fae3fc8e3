#pragma once

#include <harbor/owner.hpp>

#include <boost/describe/enum.hpp>

#include <optional>
#include <string>

namespace Harbor
{
    enum class HostErrorType
    {
        SpawnFailed,
        SingletonConflict,
        MigrationConflict,
        StreamDisconnected,
        RecoveryPartialFailure,
        NotFound,
        InvalidArgument,
        ShuttingDown,
        TransportError
    };
    BOOST_DESCRIBE_ENUM(
        HostErrorType,
        SpawnFailed,
        SingletonConflict,
        MigrationConflict,
        StreamDisconnected,
        RecoveryPartialFailure,
        NotFound,
        InvalidArgument,
        ShuttingDown,
        TransportError)

    struct HostError
    {
        HostErrorType type{HostErrorType::SpawnFailed};
        std::string message{};
        /// Set for SingletonConflict: the owner that already holds the session.
        std::optional<Owner> conflictingOwner{std::nullopt};
        /// Set for SpawnFailed when the process exited early.
        std::optional<int> exitCode{std::nullopt};

        std::string toString() const;
    };

    inline HostError makeError(HostErrorType type, std::string message)
    {
        return HostError{.type = type, .message = std::move(message)};
    }
}
