#include <harbor/owner.hpp>

#include <utility/enum_string_convert.hpp>

namespace Harbor
{
    std::string toString(Owner const& owner)
    {
        return Utility::enumToString(owner.kind) + ":" + owner.id;
    }
}
