#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Harbor
{
    struct SseEvent
    {
        std::optional<std::string> id{std::nullopt};
        std::string event{"message"};
        std::string data{};
    };

    /**
     * @brief Incremental text/event-stream parser. Chunks may split lines and events anywhere.
     */
    class SseParser
    {
      public:
        /**
         * @brief Consumes a chunk and returns all events it completed.
         */
        std::vector<SseEvent> feed(std::string_view chunk);

        /// Drops a partially received event, used when the connection is replaced.
        void reset();

      private:
        void processLine(std::string_view line, std::vector<SseEvent>& completed);
        void dispatch(std::vector<SseEvent>& completed);

      private:
        std::string buffer_{};
        bool skipLineFeed_{false};
        std::optional<std::string> id_{std::nullopt};
        std::optional<std::string> event_{std::nullopt};
        std::optional<std::string> data_{std::nullopt};
    };
}
