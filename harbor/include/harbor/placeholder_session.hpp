#pragma once

#include <ids/ids.hpp>

namespace Harbor
{
    /// The id a new conversation runs under until the runtime reports its real session id.
    Ids::SessionId makePlaceholderSessionId(Ids::TabId const& tabId);

    bool isPlaceholderSessionId(Ids::SessionId const& sessionId);
}
