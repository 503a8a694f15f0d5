#include "worksplit/logging.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace worksplit {

const char *level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "?";
}

Logger &Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : sink_(&std::cerr), min_level_(LogLevel::Info) {}

void Logger::log(LogLevel level, const std::string &message) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

    std::lock_guard<std::mutex> lock(mutex_);
    *sink_ << '[' << ts << "] " << level_name(level) << ' ' << message << std::endl;
}

void Logger::set_sink(std::ostream &sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = &sink;
}

void Logger::reset_sink() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = &std::cerr;
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

} // namespace worksplit
