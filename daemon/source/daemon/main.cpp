#include <daemon/main.hpp>
#include <constants/persistence.hpp>
#include <harbor/host.hpp>
#include <log/log.hpp>

#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <roar/filesystem/special_paths.hpp>

#include <algorithm>
#include <csignal>
#include <future>
#include <iostream>
#include <sstream>
#include <thread>

namespace
{
    constexpr std::chrono::seconds retireTimeout{10};
}

CommandLine parseCommandLine(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description description{"harbor-host options"};
    description.add_options()("help,h", "Show this help")(
        "config,c", po::value<std::string>()->default_value(Constants::configPath), "Path of the configuration file")(
        "log-level,l", po::value<std::string>(), "trace, debug, info, warning, error, critical or off");

    po::variables_map variables;
    po::store(po::parse_command_line(argc, argv, description), variables);
    po::notify(variables);

    std::stringstream usage;
    usage << description;

    CommandLine commandLine{
        .configPath = variables["config"].as<std::string>(),
        .help = variables.contains("help"),
        .usage = usage.str(),
    };
    if (variables.contains("log-level"))
    {
        const auto name = variables["log-level"].as<std::string>();
        commandLine.logLevel = Log::parseLevel(name);
        if (!commandLine.logLevel)
            throw po::invalid_option_value{name};
    }
    return commandLine;
}

Main::Main(int const argc, char const* const* argv)
    : commandLine_{parseCommandLine(argc, argv)}
    , stateHolder_{commandLine_.configPath}
    , pool_{std::max(4u, std::thread::hardware_concurrency())}
{}

Main::~Main()
{
    pool_.stop();
    pool_.join();
}

int Main::run()
{
    if (commandLine_.help)
    {
        std::cout << commandLine_.usage << "\n";
        return 0;
    }

    bool loaded = false;
    stateHolder_.load([&loaded](bool success, Persistence::StateHolder&) {
        loaded = success;
    });

    auto state = stateHolder_.stateCache();
    state.useDefaultsFrom(Persistence::State::defaults());
    if (commandLine_.logLevel)
        state.logLevel = *commandLine_.logLevel;

    Log::setup(Log::LogOptions{
        .level = state.logLevel,
        .directory = Roar::resolvePath(*state.logDirectory),
    });
    if (!loaded)
        Log::warn("Could not load {}, running with defaults.", stateHolder_.path().generic_string());

    if (const auto valid = Harbor::Host::validateConfiguration(state); !valid)
    {
        Log::critical("Invalid configuration in {}: {}", stateHolder_.path().generic_string(), valid.error().toString());
        return 1;
    }

    auto taskStore = std::make_shared<Persistence::TaskStore>(*state.taskStorePath);
    taskStore->load();

    Harbor::Host host{
        pool_.get_executor(),
        state,
        taskStore,
        Harbor::Host::systemDependencies(pool_.get_executor(), state),
    };

    if (const auto swept = host.sweepStaleRuntimes(); swept.found > 0)
        Log::info("Stopped {} runtimes left by an earlier run ({} killed).", swept.found, swept.killed);
    host.startSharedRuntime();
    host.recoverTasks();
    host.registry()->startHealthMonitor();

    std::promise<int> stopped;
    boost::asio::signal_set signals{pool_.get_executor(), SIGINT, SIGTERM};
    signals.async_wait([&stopped](boost::system::error_code ec, int signal) {
        if (ec)
            return;
        Log::info("Received signal {}, shutting down.", signal);
        stopped.set_value(signal);
    });

    Log::info("Harbor host is running.");
    stopped.get_future().wait();

    host.shutdown(retireTimeout);
    return 0;
}

int main(int argc, char** argv)
{
    try
    {
        Main m{argc, argv};
        return m.run();
    }
    catch (boost::program_options::error const& exc)
    {
        std::cerr << exc.what() << "\n";
        return 2;
    }
    catch (std::exception const& exc)
    {
        Log::critical("Harbor host stopped: {}", exc.what());
        return 1;
    }
}
