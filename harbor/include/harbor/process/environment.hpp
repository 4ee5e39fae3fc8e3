#pragma once

#include <string>
#include <unordered_map>

namespace Harbor
{
    /**
     * @brief Environment variables handed to a spawned agent runtime.
     */
    class Environment
    {
      public:
        Environment() = default;
        Environment(
            bool clean,
            std::unordered_map<std::string, std::string> const& mergeIn,
            std::string const& pathMergeIn = {});

        std::unordered_map<std::string, std::string>& environment();
        std::unordered_map<std::string, std::string> const& environment() const;
        void loadFromCurrent();
        void extendPath(std::string const& path, bool front = true);
        void merge(std::unordered_map<std::string, std::string> const& other, bool overwrite = true);

      private:
        std::unordered_map<std::string, std::string> environment_;
    };
}
