#include <persistence/task_store.hpp>
#include <log/log.hpp>

#include <roar/filesystem/special_paths.hpp>

#include <algorithm>
#include <fstream>

namespace Persistence
{
    TaskStore::TaskStore(std::filesystem::path path)
        : path_{Roar::resolvePath(path)}
        , guard_{}
        , tasks_{}
    {}

    std::filesystem::path const& TaskStore::path() const
    {
        return path_;
    }

    void TaskStore::load()
    {
        std::scoped_lock lock{guard_};
        tasks_.clear();

        std::ifstream reader{path_, std::ios_base::binary};
        if (!reader.good())
        {
            Log::info("No scheduled task file at '{}', starting empty.", path_.string());
            return;
        }

        try
        {
            const auto json = nlohmann::json::parse(reader);
            if (json.contains("tasks"))
                json.at("tasks").get_to(tasks_);
            Log::info("Loaded {} scheduled tasks from '{}'.", tasks_.size(), path_.string());
        }
        catch (std::exception const& e)
        {
            Log::warn("Failed to read scheduled tasks from '{}', starting empty: {}", path_.string(), e.what());
            tasks_.clear();
        }
    }

    std::optional<ScheduledTask> TaskStore::find(Ids::TaskId const& id) const
    {
        std::scoped_lock lock{guard_};
        auto iter = std::find_if(tasks_.begin(), tasks_.end(), [&id](auto const& task) {
            return task.id == id;
        });
        if (iter == tasks_.end())
            return std::nullopt;
        return *iter;
    }

    std::vector<ScheduledTask> TaskStore::all() const
    {
        std::scoped_lock lock{guard_};
        return tasks_;
    }

    std::expected<void, std::string> TaskStore::upsert(ScheduledTask const& task)
    {
        std::scoped_lock lock{guard_};
        auto iter = std::find_if(tasks_.begin(), tasks_.end(), [&task](auto const& existing) {
            return existing.id == task.id;
        });
        if (iter == tasks_.end())
            tasks_.push_back(task);
        else
            *iter = task;
        return saveLocked();
    }

    std::optional<ScheduledTask>
    TaskStore::update(Ids::TaskId const& id, std::function<void(ScheduledTask&)> const& modify)
    {
        std::scoped_lock lock{guard_};
        auto iter = std::find_if(tasks_.begin(), tasks_.end(), [&id](auto const& task) {
            return task.id == id;
        });
        if (iter == tasks_.end())
            return std::nullopt;

        modify(*iter);
        if (auto result = saveLocked(); !result)
            Log::error("Failed to persist task '{}': {}", id.value(), result.error());
        return *iter;
    }

    bool TaskStore::remove(Ids::TaskId const& id)
    {
        std::scoped_lock lock{guard_};
        const auto removed = std::erase_if(tasks_, [&id](auto const& task) {
            return task.id == id;
        });
        if (removed == 0)
            return false;

        if (auto result = saveLocked(); !result)
            Log::error("Failed to persist removal of task '{}': {}", id.value(), result.error());
        return true;
    }

    std::expected<void, std::string> TaskStore::saveLocked() const
    {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec)
            return std::unexpected("Cannot create directory: " + ec.message());

        auto temporary = path_;
        temporary += ".tmp";
        {
            std::ofstream writer{temporary, std::ios_base::binary | std::ios_base::trunc};
            if (!writer.good())
                return std::unexpected("Cannot open '" + temporary.string() + "' for writing");
            writer << nlohmann::json{{"tasks", tasks_}}.dump(2);
            if (!writer.good())
                return std::unexpected("Write to '" + temporary.string() + "' failed");
        }

        std::filesystem::rename(temporary, path_, ec);
        if (ec)
            return std::unexpected("Cannot replace '" + path_.string() + "': " + ec.message());
        return {};
    }
}
