#include <harbor/process_key.hpp>

namespace Harbor
{
    std::string normalizeWorkspacePath(std::string_view path)
    {
        while (path.size() > 1 && (path.back() == '/' || path.back() == '\\'))
            path.remove_suffix(1);
        return std::string{path};
    }

    ProcessKey makeProcessKey(std::string_view workspacePath, Ids::SessionId const& sessionId)
    {
        return ProcessKey{
            .workspacePath = normalizeWorkspacePath(workspacePath),
            .purpose = sessionId.value(),
        };
    }

    std::string toString(ProcessKey const& key)
    {
        return key.workspacePath + "#" + key.purpose;
    }
}
