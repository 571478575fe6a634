#include "utils/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace vc {

namespace {
const char* kLoggerName = "vocalysis";
}

void Logger::init(const std::string& log_file, spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) return;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    std::string file_error;
    if (!log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 5 * 1024 * 1024, 3);
            file_sink->set_level(level);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    spdlog::drop(kLoggerName);
    logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger_->set_level(level);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger_->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger_);
    initialized_ = true;

    if (!file_error.empty()) {
        logger_->warn("File logging disabled ({}): {}", log_file, file_error);
    }
}

void Logger::set_level(spdlog::level::level_enum level) {
    auto& logger = get();
    std::lock_guard<std::mutex> lock(mutex_);
    logger->set_level(level);
    for (auto& sink : logger->sinks()) {
        sink->set_level(level);
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        logger_->flush();
        spdlog::drop(kLoggerName);
        logger_.reset();
        initialized_ = false;
    }
}

} // namespace vc
