#pragma once

#include <utility/keyed_mutex.hpp>

#include <string>

namespace Harbor
{
    /**
     * @brief Serializes bookkeeping per session id. Operations on different sessions do not block each other.
     * Always taken before any component's internal mutex.
     */
    using SessionLocks = Utility::KeyedMutex<std::string>;
}
