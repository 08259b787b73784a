#include "logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    constexpr const char *LOGGER_NAME = "blobfetch";
    constexpr const char *LOG_PATTERN = "%Y-%m-%d %H:%M:%S.%e [%l] %v";

    std::mutex loggerMutex;
    std::shared_ptr<spdlog::logger> currentLogger;

    std::shared_ptr<spdlog::logger> makeLogger(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level)
    {
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_pattern(LOG_PATTERN);
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        return logger;
    }
}

void initLogging(const LogConfig &config)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (config.file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*config.file));
    }

    auto logger = makeLogger(std::move(sinks), spdlog::level::from_str(config.level));

    std::lock_guard<std::mutex> lock(loggerMutex);
    currentLogger = std::move(logger);
}

std::shared_ptr<spdlog::logger> engineLogger()
{
    std::lock_guard<std::mutex> lock(loggerMutex);
    if (!currentLogger)
    {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
        currentLogger = makeLogger(std::move(sinks), spdlog::level::warn);
    }
    return currentLogger;
}
