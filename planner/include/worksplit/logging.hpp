#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace worksplit {

enum class LogLevel { Debug, Info, Warn, Error };

const char *level_name(LogLevel level);

class Logger {
  public:
    static Logger &instance();

    void log(LogLevel level, const std::string &message);

    // Redirects output; the stream must outlive the logger's use of it.
    void set_sink(std::ostream &sink);

    void reset_sink();

    void set_min_level(LogLevel level);

    bool enabled(LogLevel level) const;

  private:
    Logger();

    mutable std::mutex mutex_;
    std::ostream *sink_;
    LogLevel min_level_;
};

} // namespace worksplit

#define WORKSPLIT_LOG(level, expr)                                                                 \
    do {                                                                                           \
        if (::worksplit::Logger::instance().enabled(level)) {                                      \
            std::ostringstream worksplit_log_oss_;                                                 \
            worksplit_log_oss_ << expr;                                                            \
            ::worksplit::Logger::instance().log(level, worksplit_log_oss_.str());                  \
        }                                                                                          \
    } while (false)

#define WORKSPLIT_LOG_DEBUG(expr) WORKSPLIT_LOG(::worksplit::LogLevel::Debug, expr)
#define WORKSPLIT_LOG_INFO(expr) WORKSPLIT_LOG(::worksplit::LogLevel::Info, expr)
#define WORKSPLIT_LOG_WARN(expr) WORKSPLIT_LOG(::worksplit::LogLevel::Warn, expr)
#define WORKSPLIT_LOG_ERROR(expr) WORKSPLIT_LOG(::worksplit::LogLevel::Error, expr)
