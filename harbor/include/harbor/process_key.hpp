#pragma once

#include <ids/ids.hpp>

#include <compare>
#include <functional>
#include <string>
#include <string_view>

namespace Harbor
{
    /**
     * @brief Identifies one agent runtime process: the workspace it runs in and what it is for (the session).
     */
    struct ProcessKey
    {
        std::string workspacePath{};
        std::string purpose{};

        friend auto operator<=>(ProcessKey const&, ProcessKey const&) = default;
    };

    /// Strips trailing path separators so that "/a/b/" and "/a/b" name the same workspace.
    std::string normalizeWorkspacePath(std::string_view path);

    ProcessKey makeProcessKey(std::string_view workspacePath, Ids::SessionId const& sessionId);

    std::string toString(ProcessKey const& key);

    struct ProcessKeyHash
    {
        std::size_t operator()(ProcessKey const& key) const
        {
            const auto first = std::hash<std::string>{}(key.workspacePath);
            return first ^ (std::hash<std::string>{}(key.purpose) + 0x9e3779b9 + (first << 6) + (first >> 2));
        }
    };
}
