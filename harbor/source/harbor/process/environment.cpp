#include <harbor/process/environment.hpp>

#include <boost/process/v2/environment.hpp>

namespace bp2 = boost::process::v2;

namespace Harbor
{
    Environment::Environment(
        bool clean,
        std::unordered_map<std::string, std::string> const& mergeIn,
        std::string const& pathMergeIn)
        : environment_{}
    {
        if (!clean)
            loadFromCurrent();

        merge(mergeIn, true);
        if (!pathMergeIn.empty())
            extendPath(pathMergeIn);
    }
    std::unordered_map<std::string, std::string>& Environment::environment()
    {
        return environment_;
    }
    std::unordered_map<std::string, std::string> const& Environment::environment() const
    {
        return environment_;
    }
    void Environment::loadFromCurrent()
    {
        environment_ = {};
        const auto currentEnv = bp2::environment::current();
        for (auto iter = currentEnv.begin(); iter != currentEnv.end(); ++iter)
        {
            auto entry = *iter;
            const auto key = entry.key().string();
            if (key.empty())
                continue;
            environment_.emplace(key, entry.value().string());
        }
    }
    void Environment::extendPath(std::string const& path, bool front)
    {
        auto iter = environment_.find("PATH");
        if (iter == environment_.end() || iter->second.empty())
        {
            environment_["PATH"] = path;
            return;
        }

        if (front)
            iter->second = path + ":" + iter->second;
        else
            iter->second += ":" + path;
    }
    void Environment::merge(std::unordered_map<std::string, std::string> const& other, bool overwrite)
    {
        for (auto const& [key, value] : other)
        {
            if (overwrite || environment_.find(key) == environment_.end())
                environment_[key] = value;
        }
    }
}
