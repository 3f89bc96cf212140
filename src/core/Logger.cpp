#include "core/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace core {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;

namespace {
std::mutex s_initMutex;
}

void Logger::init(spdlog::level::level_enum logLevel, const std::string& logFile) {
    std::lock_guard<std::mutex> lock(s_initMutex);
    if (s_logger) {
        return; // Already initialized
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink with color output
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(logLevel);
    sinks.push_back(console_sink);

    if (!logFile.empty()) {
        // Create the log directory if it doesn't exist
        std::filesystem::path logPath(logFile);
        if (logPath.has_parent_path()) {
            std::filesystem::create_directories(logPath.parent_path());
        }

        // File sink (truncate existing log)
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        file_sink->set_level(spdlog::level::trace); // Log everything to file
        sinks.push_back(file_sink);
    }

    s_logger = std::make_shared<spdlog::logger>("StencilLoom", sinks.begin(), sinks.end());
    s_logger->set_level(logLevel);

    // Set pattern: [HH:MM:SS.ms] [LEVEL] [thread ID] message
    s_logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [thread %t] %v");

    spdlog::register_logger(s_logger);

    s_logger->debug("Logger initialized (file sink: {})", logFile.empty() ? "none" : logFile);
}

void Logger::setLevel(spdlog::level::level_enum logLevel) {
    auto logger = get();
    logger->set_level(logLevel);
    for (auto& sink : logger->sinks()) {
        // The file sink keeps recording everything
        if (std::dynamic_pointer_cast<spdlog::sinks::basic_file_sink_mt>(sink) == nullptr) {
            sink->set_level(logLevel);
        }
    }
}

spdlog::level::level_enum Logger::parseLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        throw std::runtime_error("Unknown log level: " + name);
    }
    return level;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(s_initMutex);
    if (s_logger) {
        s_logger->flush();
        spdlog::drop_all();
        s_logger = nullptr;
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!s_logger) {
        // Auto-initialize if not done explicitly
        init();
    }
    return s_logger;
}

} // namespace core
