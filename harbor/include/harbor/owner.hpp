#pragma once

#include <boost/describe/enum.hpp>

#include <compare>
#include <functional>
#include <string>

namespace Harbor
{
    enum class OwnerKind
    {
        Tab,
        ScheduledTask,
        BackgroundGuardian,
        /// The host's own runtime that is not bound to a workspace.
        SharedRuntime
    };
    BOOST_DESCRIBE_ENUM(OwnerKind, Tab, ScheduledTask, BackgroundGuardian, SharedRuntime)

    /**
     * @brief A consumer holding a claim on a session. The id depends on the kind.
     */
    struct Owner
    {
        OwnerKind kind{OwnerKind::Tab};
        std::string id{};

        friend auto operator<=>(Owner const&, Owner const&) = default;
    };

    std::string toString(Owner const& owner);

    struct OwnerHash
    {
        std::size_t operator()(Owner const& owner) const
        {
            return std::hash<std::string>{}(owner.id) ^ (static_cast<std::size_t>(owner.kind) << 1);
        }
    };
}
