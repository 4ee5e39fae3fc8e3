#include <harbor/placeholder_session.hpp>

#include <constants/sidecar.hpp>

#include <string>

namespace Harbor
{
    Ids::SessionId makePlaceholderSessionId(Ids::TabId const& tabId)
    {
        return Ids::makeSessionId(std::string{Constants::placeholderSessionPrefix} + tabId.value());
    }

    bool isPlaceholderSessionId(Ids::SessionId const& sessionId)
    {
        return sessionId.value().starts_with(Constants::placeholderSessionPrefix);
    }
}
