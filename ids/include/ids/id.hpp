#pragma once

#include <nlohmann/json.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <compare>
#include <string>

namespace Ids
{
    /// Value of a default constructed id.
    constexpr static char const* invalidId = "INVALID_ID";

    /**
     * @brief Common base of Harbor's string ids. Session ids come from the runtime or are placeholders, tab ids
     * from the presentation layer. Task ids are "cron_" prefixed. Process, subscription and guardian ids are
     * generated by the host and never leave it.
     */
    class Id
    {
      public:
        Id(Id const&) = default;
        Id(Id&&) = default;
        Id& operator=(Id const&) = default;
        Id& operator=(Id&&) = default;
        ~Id() = default;

        std::string const& value() const
        {
            return id_;
        }

        friend std::strong_ordering operator<=>(Id const& lhs, Id const& rhs) = default;

        /// False for default constructed and empty ids. Requests carrying one are rejected.
        bool isValid() const
        {
            return !id_.empty() && id_ != invalidId;
        }

      protected:
        Id() = delete;
        explicit Id(std::string id)
            : id_{std::move(id)}
        {}

      private:
        std::string id_;
    };

    /**
     * @brief A random UUID string for ids the host mints itself.
     */
    inline std::string generateUuid()
    {
        thread_local boost::uuids::random_generator generator{};
        return boost::uuids::to_string(generator());
    }
}

/**
 * Declares Ids::<name> with make<name>(string) for ids received from outside, generate<name>() for ids the host
 * mints, and JSON conversion as a plain string.
 */
#define DEFINE_ID_TYPE(name) \
    namespace Ids \
    { \
        class name : public Id \
        { \
          public: \
            friend name make##name(std::string); \
\
            name() \
                : Id{invalidId} \
            {} \
\
          private: \
            explicit name(std::string str) \
                : Id{std::move(str)} \
            {} \
        }; \
\
        inline name make##name(std::string str) \
        { \
            return name{std::move(str)}; \
        } \
        inline name generate##name() \
        { \
            return make##name(generateUuid()); \
        } \
        inline void to_json(nlohmann::json& j, name const& id) \
        { \
            j = id.value(); \
        } \
        inline void from_json(nlohmann::json const& j, name& id) \
        { \
            id = make##name(j.get<std::string>()); \
        } \
    }
