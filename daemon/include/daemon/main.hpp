#pragma once

#include <log/level.hpp>
#include <persistence/state_holder.hpp>

#include <boost/asio/thread_pool.hpp>

#include <filesystem>
#include <optional>
#include <string>

struct CommandLine
{
    std::filesystem::path configPath{};
    std::optional<Log::Level> logLevel{std::nullopt};
    bool help{false};
    std::string usage{};
};

/**
 * @brief Throws boost::program_options::error on malformed arguments.
 */
CommandLine parseCommandLine(int argc, char const* const* argv);

class Main
{
  public:
    Main(int const argc, char const* const* argv);
    ~Main();

    Main(Main const&) = delete;
    Main& operator=(Main const&) = delete;
    Main(Main&&) = delete;
    Main& operator=(Main&&) = delete;

    /**
     * @brief Runs the host until SIGINT or SIGTERM arrives.
     */
    int run();

  private:
    CommandLine commandLine_;
    Persistence::StateHolder stateHolder_;
    boost::asio::thread_pool pool_;
};
