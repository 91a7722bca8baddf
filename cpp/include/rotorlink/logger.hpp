#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rotorlink {

/**
 * @brief Library-wide logger backed by spdlog
 *
 * A single "rotorlink" logger writing to stdout. The default level is
 * Warn so that element construction stays quiet unless something is
 * questionable; raise it to Debug to trace element creation and assembly.
 *
 * Usage:
 *   rotorlink::Logger::instance().set_level(rotorlink::Logger::Level::Debug);
 *   ROTORLINK_LOG_DEBUG("Assembled {} elements", n);
 */
class Logger {
public:
    enum class Level {
        Trace = SPDLOG_LEVEL_TRACE,
        Debug = SPDLOG_LEVEL_DEBUG,
        Info = SPDLOG_LEVEL_INFO,
        Warn = SPDLOG_LEVEL_WARN,
        Error = SPDLOG_LEVEL_ERROR,
        Critical = SPDLOG_LEVEL_CRITICAL,
        Off = SPDLOG_LEVEL_OFF
    };

    /// Get the global logger instance (singleton)
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief (Re)initialize with a colored console sink
     * @param level Minimum level that is emitted
     */
    void init_console(Level level = Level::Warn) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(static_cast<spdlog::level::level_enum>(level));

        logger_ = std::make_shared<spdlog::logger>("rotorlink", console_sink);
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [rotorlink] [%^%l%$] %v");
    }

    void set_level(Level level) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        for (auto& sink : logger_->sinks()) {
            sink->set_level(static_cast<spdlog::level::level_enum>(level));
        }
    }

    Level level() const {
        return static_cast<Level>(logger_->level());
    }

    /// Underlying spdlog logger
    const std::shared_ptr<spdlog::logger>& get() const { return logger_; }

    void flush() { logger_->flush(); }

private:
    Logger() { init_console(); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rotorlink

#define ROTORLINK_LOG_TRACE(...) ::rotorlink::Logger::instance().get()->trace(__VA_ARGS__)
#define ROTORLINK_LOG_DEBUG(...) ::rotorlink::Logger::instance().get()->debug(__VA_ARGS__)
#define ROTORLINK_LOG_INFO(...)  ::rotorlink::Logger::instance().get()->info(__VA_ARGS__)
#define ROTORLINK_LOG_WARN(...)  ::rotorlink::Logger::instance().get()->warn(__VA_ARGS__)
#define ROTORLINK_LOG_ERROR(...) ::rotorlink::Logger::instance().get()->error(__VA_ARGS__)
