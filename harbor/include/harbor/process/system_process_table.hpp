#pragma once

#include <harbor/process/process_table.hpp>

namespace Harbor
{
    class SystemProcessTable : public IProcessTable
    {
      public:
        std::vector<long long> findByArgument(std::string const& argument) override;
        bool sendSignal(long long pid, int signal) override;
        bool exists(long long pid) override;
    };
}
