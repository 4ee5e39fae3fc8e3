#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "harbor_tmpdir", true}
    {}

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBaseOnExit)
        : basePath_{std::move(basePath)}
        , path_{}
        , removeBaseOnExit_{removeBaseOnExit}
    {
        if (!std::filesystem::exists(basePath_))
            std::filesystem::create_directories(basePath_);

        std::string dirNameAsString{(basePath_ / "dirXXXXXX").string()};
        if (mkdtemp(dirNameAsString.data()) == nullptr || !std::filesystem::is_directory(dirNameAsString))
            throw std::runtime_error(std::string{"Could not setup temporary directory in: "} + basePath_.string());

        path_ = dirNameAsString;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
        if (removeBaseOnExit_)
            std::filesystem::remove(basePath_, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }
}
