#include <harbor/host_error.hpp>

#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

namespace Harbor
{
    std::string HostError::toString() const
    {
        std::string result = fmt::format("{}: {}", Utility::enumToString(type), message);
        if (conflictingOwner)
            result += fmt::format(" (held by {})", Harbor::toString(*conflictingOwner));
        if (exitCode)
            result += fmt::format(" (exit code {})", *exitCode);
        return result;
    }
}
