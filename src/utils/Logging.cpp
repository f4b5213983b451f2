#include "utils/Logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include <iostream>

namespace Pequod {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

bool initLogging(const std::string& logFile, spdlog::level::level_enum level) {
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile);
        auto logger = std::make_shared<spdlog::logger>("pequod", sink);
        spdlog::set_default_logger(logger);
        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::warn);
        spdlog::info("Logging to {} at level {}", logFile, spdlog::level::to_string_view(level));
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Warning: cannot open log file " << logFile << ": " << e.what() << std::endl;
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("pequod", std::make_shared<spdlog::sinks::null_sink_mt>()));
        return false;
    }
}

}
