#include "torrentcast/core/logger.hpp"
#include "torrentcast/core/utils.hpp"
#include <spdlog/sinks/null_sink.h>
#include <vector>

namespace torrentcast::core {

namespace {

constexpr std::size_t MAX_LOG_FILE_BYTES = 10 * 1024 * 1024;
constexpr std::size_t MAX_LOG_FILES = 5;

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::initialize(const std::string& log_file, LogLevel level) {
    if (logger_) {
        shutdown();
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern("%H:%M:%S.%e %^%-5l%$ %v");
    console->set_level(to_spdlog(level));
    sinks.push_back(console);

    // An empty path keeps the daemon on the console only.
    if (!log_file.empty()) {
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, MAX_LOG_FILE_BYTES, MAX_LOG_FILES);
        rotating->set_pattern("%Y-%m-%dT%H:%M:%S.%e [%l] [tid %t] %v (%s:%#)");
        rotating->set_level(spdlog::level::trace);
        sinks.push_back(rotating);
    }

    logger_ = std::make_shared<spdlog::logger>("torrentcast", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog(level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);

    LOG_DEBUG("Logging at level {} to {}", spdlog::level::to_string_view(to_spdlog(level)),
              log_file.empty() ? std::string("console") : log_file);
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();
    spdlog::shutdown();
    logger_.reset();
    
    // LOG_* goes through the default logger, which must stay valid.
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "torrentcast", std::make_shared<spdlog::sinks::null_sink_mt>()));
}

LogLevel Logger::parse_level(const std::string& name) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

}
