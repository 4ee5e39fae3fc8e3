#include <log/log.hpp>

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void setup(LogOptions const& options)
    {
        std::vector<spdlog::sink_ptr> sinks{};
        if (options.console)
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        if (options.directory)
        {
            std::error_code ec;
            std::filesystem::create_directories(*options.directory, ec);
            if (ec)
                spdlog::error("Cannot create log directory '{}': {}", options.directory->string(), ec.message());
            else
            {
                sinks.push_back(std::make_shared<spdlog::sinks::daily_file_format_sink_mt>(
                    (*options.directory / "unified-%Y-%m-%d.log").string(), 0, 0));
            }
        }

        auto logger = std::make_shared<spdlog::logger>("harbor", sinks.begin(), sinks.end());
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(std::move(logger));
        Detail::logger.setLevel(options.level);
    }
}
