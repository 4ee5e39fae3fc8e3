#include <harbor/process/system_process_table.hpp>
#include <log/log.hpp>

#include <boost/process/v2/ext/cmd.hpp>
#include <boost/process/v2/pid.hpp>

#include <cerrno>

#include <signal.h>

namespace Harbor
{
    std::vector<long long> SystemProcessTable::findByArgument(std::string const& argument)
    {
        namespace bp = boost::process::v2;

        boost::system::error_code ec;
        const auto pids = bp::all_pids(ec);
        if (ec)
        {
            Log::warn("Cannot list processes: {}", ec.message());
            return {};
        }

        const auto self = bp::current_pid();
        std::vector<long long> found;
        for (auto const pid : pids)
        {
            if (pid == self)
                continue;

            // Processes of other users and ones that exited in the meantime cannot be inspected.
            boost::system::error_code cmdError;
            const auto command = bp::ext::cmd(pid, cmdError);
            if (cmdError)
                continue;

            const auto argv = command.argv();
            for (int i = 0; i < command.argc(); ++i)
            {
                if (argv[i] != nullptr && argument == argv[i])
                {
                    found.push_back(static_cast<long long>(pid));
                    break;
                }
            }
        }
        return found;
    }

    bool SystemProcessTable::sendSignal(long long pid, int signal)
    {
        return ::kill(static_cast<pid_t>(pid), signal) == 0;
    }

    bool SystemProcessTable::exists(long long pid)
    {
        return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
    }
}
