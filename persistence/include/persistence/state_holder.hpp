#pragma once

#include <persistence/state/state.hpp>

#include <roar/detail/pimpl_special_functions.hpp>

#include <filesystem>
#include <functional>

namespace Persistence
{
    /**
     * @brief Owns the host configuration and its json file on disk.
     */
    class StateHolder
    {
      public:
        /**
         * @param path Location of the config file, "~" and environment variables are resolved.
         */
        explicit StateHolder(std::filesystem::path path);
        ROAR_PIMPL_SPECIAL_FUNCTIONS(StateHolder);

        /**
         * @brief Loads the config file. A missing file is created with defaults, an unparsable file is backed up and
         * replaced with defaults. The callback receives false if the file could not be loaded at all.
         */
        void load(std::function<void(bool, StateHolder&)> const& onLoad);
        void save(std::function<void()> const& onSaveComplete = []() {});

        State& stateCache();
        std::filesystem::path const& path() const;

      private:
        void dataFixer(nlohmann::json const& before);

      private:
        std::filesystem::path path_;
        State stateCache_;
    };
} // namespace Persistence
