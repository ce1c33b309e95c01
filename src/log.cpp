#include "dmm/log.hpp"

#include <cstdarg>
#include <utility>

namespace dmm {

namespace {

const char *level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "[ERROR]";
        case LogLevel::Warn: return "[WARN]";
        case LogLevel::Info: return "[INFO]";
        case LogLevel::Debug: return "[DEBUG]";
    }
    return "[?]";
}

} // namespace

Logger::Logger(const LogConfig &config, std::string tag)
    : config_(config), tag_(std::move(tag)), mutex_(std::make_shared<std::mutex>()) {}

void Logger::logf(LogLevel level, const char *fmt, ...) const {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(*mutex_);
    if (tag_.empty()) {
        std::fprintf(config_.sink, "%s ", level_tag(level));
    } else {
        std::fprintf(config_.sink, "%s %s: ", level_tag(level), tag_.c_str());
    }
    va_list args;
    va_start(args, fmt);
    std::vfprintf(config_.sink, fmt, args);
    va_end(args);
    std::fputc('\n', config_.sink);
    std::fflush(config_.sink);
}

} // namespace dmm
