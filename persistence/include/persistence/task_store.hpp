#pragma once

#include <persistence/state/scheduled_task.hpp>

#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Persistence
{
    /**
     * @brief Thread safe store of scheduled task records, persisted as {"tasks": [...]}.
     * Every mutation is written through to disk.
     */
    class TaskStore
    {
      public:
        explicit TaskStore(std::filesystem::path path);

        /**
         * @brief Reads the file. A missing or unreadable file results in an empty store.
         */
        void load();

        std::optional<ScheduledTask> find(Ids::TaskId const& id) const;
        std::vector<ScheduledTask> all() const;

        std::expected<void, std::string> upsert(ScheduledTask const& task);

        /**
         * @brief Applies the modification and persists it.
         *
         * @return The updated task, or nullopt if no such task exists.
         */
        std::optional<ScheduledTask> update(Ids::TaskId const& id, std::function<void(ScheduledTask&)> const& modify);

        bool remove(Ids::TaskId const& id);

        std::filesystem::path const& path() const;

      private:
        std::expected<void, std::string> saveLocked() const;

      private:
        std::filesystem::path path_;
        mutable std::mutex guard_;
        std::vector<ScheduledTask> tasks_;
    };
}
