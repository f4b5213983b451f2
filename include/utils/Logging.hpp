#pragma once
#include <optional>
#include <string>
#include <spdlog/common.h>

namespace Pequod {

// "trace", "debug", "info", "warn", "error" or "off".
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

// Routes the default logger to a file; the terminal belongs to the UI.
// Returns false and leaves logging disabled when the file cannot be opened.
bool initLogging(const std::string& logFile, spdlog::level::level_enum level);

}
