#pragma once

#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

namespace dmm {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Log configuration handed to a session at construction. There is no
// process-wide switch: every session logs according to its own config.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    // Destination stream; nullptr silences the logger entirely.
    std::FILE *sink = stderr;
};

// Line-oriented printf-style logger. Each line is "[LEVEL] tag: message".
// Copies share the same output lock so concurrent threads of one session never
// interleave partial lines.
class Logger {
public:
    Logger() : Logger(LogConfig{}) {}
    explicit Logger(const LogConfig &config, std::string tag = {});

    [[nodiscard]] bool enabled(LogLevel level) const {
        return config_.sink != nullptr && static_cast<int>(level) <= static_cast<int>(config_.level);
    }

    void logf(LogLevel level, const char *fmt, ...) const
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    [[nodiscard]] const LogConfig &config() const { return config_; }
    [[nodiscard]] const std::string &tag() const { return tag_; }

private:
    LogConfig config_{};
    std::string tag_;
    std::shared_ptr<std::mutex> mutex_;
};

} // namespace dmm

// Formatting is skipped when the level is disabled.
#define DMM_LOGF(logger, level, fmt, ...)                        \
    do {                                                         \
        if ((logger).enabled(level)) {                           \
            (logger).logf((level), fmt, ##__VA_ARGS__);          \
        }                                                        \
    } while (0)

#define DMM_LOG_ERROR(logger, fmt, ...) DMM_LOGF(logger, ::dmm::LogLevel::Error, fmt, ##__VA_ARGS__)
#define DMM_LOG_WARN(logger, fmt, ...) DMM_LOGF(logger, ::dmm::LogLevel::Warn, fmt, ##__VA_ARGS__)
#define DMM_LOG_INFO(logger, fmt, ...) DMM_LOGF(logger, ::dmm::LogLevel::Info, fmt, ##__VA_ARGS__)
#define DMM_LOG_DEBUG(logger, fmt, ...) DMM_LOGF(logger, ::dmm::LogLevel::Debug, fmt, ##__VA_ARGS__)
