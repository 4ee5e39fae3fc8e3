#include <persistence/state_holder.hpp>
#include <log/log.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <roar/filesystem/special_paths.hpp>

#include <chrono>
#include <fstream>

namespace Persistence
{
    StateHolder::StateHolder(std::filesystem::path path)
        : path_{Roar::resolvePath(path)}
        , stateCache_{}
    {}
    ROAR_PIMPL_SPECIAL_FUNCTIONS_IMPL(StateHolder);

    State& StateHolder::stateCache()
    {
        return stateCache_;
    }

    std::filesystem::path const& StateHolder::path() const
    {
        return path_;
    }

    void StateHolder::load(std::function<void(bool, StateHolder&)> const& onLoad)
    {
        if (!std::filesystem::exists(path_.parent_path()))
            std::filesystem::create_directories(path_.parent_path());

        auto makeBackup = [this]() {
            const auto backupFileName = [this]() {
                const auto now = std::chrono::system_clock::now();
                const auto time = fmt::format("{:%Y-%m-%d_%H-%M-%S}", now);

                return path_.parent_path() / (path_.filename().string() + ".backup_" + time);
            }();

            {
                std::ifstream reader{path_, std::ios_base::binary};
                std::ofstream writer{backupFileName, std::ios_base::binary};

                writer << reader.rdbuf();
            }
            Log::info("Copied config file to backup: {}", backupFileName.string());
        };

        try
        {
            const auto before = [this, &makeBackup]() {
                try
                {
                    std::ifstream reader{path_, std::ios_base::binary};
                    if (!reader.good())
                    {
                        Log::warn("Config file '{}' does not exist, creating it with defaults.", path_.string());
                        return nlohmann::json(nullptr);
                    }
                    return nlohmann::json::parse(reader, nullptr, true, true);
                }
                catch (std::exception const& e)
                {
                    Log::error("Failed to parse config file: {}", e.what());
                    makeBackup();
                    return nlohmann::json(nullptr);
                }
            }();

            if (before.is_null())
            {
                stateCache_ = State{};
                dataFixer(nlohmann::json::object());
                onLoad(true, *this);
                return;
            }

            before.get_to(stateCache_);
            dataFixer(before);
            onLoad(true, *this);
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to load config file: {}", e.what());
            onLoad(false, *this);
        }
    }

    void StateHolder::dataFixer(nlohmann::json const& before)
    {
        stateCache_.useDefaultsFrom(State::defaults());

        const auto after = nlohmann::json(stateCache_);
        const auto diff = nlohmann::json::diff(before, after);
        if (!diff.empty())
        {
            Log::warn("Config file misses some defaults, writing them back to disk: {}", diff.dump());
            save();
        }
    }

    void StateHolder::save(std::function<void()> const& onSaveComplete)
    {
        if (!std::filesystem::exists(path_.parent_path()))
            std::filesystem::create_directories(path_.parent_path());

        try
        {
            std::ofstream writer{path_, std::ios_base::binary};
            writer << nlohmann::json(stateCache_).dump(4);
            onSaveComplete();
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to save config file: {}", e.what());
            throw;
        }
    }
}
