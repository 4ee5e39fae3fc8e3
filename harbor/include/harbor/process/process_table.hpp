#pragma once

#include <string>
#include <vector>

namespace Harbor
{
    /**
     * @brief All processes of the machine, not only the ones this host started.
     */
    class IProcessTable
    {
      public:
        virtual ~IProcessTable() = default;

        /**
         * @brief Pids of the processes, other than this one, that have the argument on their command line.
         */
        virtual std::vector<long long> findByArgument(std::string const& argument) = 0;

        virtual bool sendSignal(long long pid, int signal) = 0;
        virtual bool exists(long long pid) = 0;
    };
}
