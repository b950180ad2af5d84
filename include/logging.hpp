#pragma once

#include <optional>
#include <string>

/**
 * Configure the default spdlog logger used for diagnostics.
 *
 * @param level spdlog level name ("trace", "debug", "info", "warn", "error", "off")
 * @param logFile Write to this file instead of stderr
 * @throws std::invalid_argument if the level name is unknown
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void initLogging(const std::string &level, const std::optional<std::string> &logFile);
