#include "logging.hpp"

#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void initLogging(const std::string &level, const std::optional<std::string> &logFile)
{
    auto parsed = spdlog::level::from_str(level);

    // from_str() maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off")
    {
        throw std::invalid_argument("Unknown log level: " + level);
    }

    std::shared_ptr<spdlog::logger> logger;
    if (logFile)
    {
        logger = spdlog::basic_logger_mt("dw", *logFile);
    }
    else
    {
        // stdout belongs to the progress display
        logger = spdlog::stderr_color_mt("dw");
    }

    logger->set_level(parsed);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::set_default_logger(logger);
}
