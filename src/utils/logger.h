#ifndef VC_LOGGER_H
#define VC_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <string>

namespace vc {

class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // Console + rotating file sink (5 MB x 3). Later calls are no-ops until shutdown().
    void init(const std::string& log_file = "vocalysis.log",
              spdlog::level::level_enum level = spdlog::level::info);

    // Applies to the logger and every sink, initializing with defaults first if needed
    void set_level(spdlog::level::level_enum level);

    bool is_initialized() {
        std::lock_guard<std::mutex> lock(mutex_);
        return initialized_;
    }

    std::shared_ptr<spdlog::logger>& get() {
        if (!initialized_) {
            init();
        }
        return logger_;
    }

    void shutdown();

private:
    // The spdlog registry must outlive this singleton, so create it first
    Logger() { spdlog::details::registry::instance(); }
    ~Logger() { shutdown(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> logger_;
    std::mutex mutex_;
    bool initialized_ = false;
};

} // namespace vc

#define VC_LOG_DEBUG(...) vc::Logger::instance().get()->debug(__VA_ARGS__)
#define VC_LOG_INFO(...)  vc::Logger::instance().get()->info(__VA_ARGS__)
#define VC_LOG_WARN(...)  vc::Logger::instance().get()->warn(__VA_ARGS__)
#define VC_LOG_ERROR(...) vc::Logger::instance().get()->error(__VA_ARGS__)

#endif // VC_LOGGER_H
