#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief Creates a fresh directory below basePath that is removed again on destruction.
     */
    class TemporaryDirectory
    {
      public:
        TemporaryDirectory();
        explicit TemporaryDirectory(std::filesystem::path basePath, bool removeBaseOnExit = false);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path basePath_;
        std::filesystem::path path_;
        bool removeBaseOnExit_;
    };
}
