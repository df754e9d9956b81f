#pragma once

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace otree {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

namespace detail {
// Tag of the innermost LogScope on this thread, e.g. "events@3"
inline thread_local std::string log_scope;
}

/**
 * Process-wide logger. Lines look like
 *   [2024-05-01 10:00:00.123] INFO table_writer.cpp:156 write() {events@3} - Wrote ...
 * where the braces carry the active LogScope of the calling thread, if any.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    bool enabled(LogLevel level) const { return level >= this->level(); }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (!enabled(level)) return;

        const auto now = std::chrono::system_clock::now();
        const auto time_t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        const char* filename = strrchr(file, '/');
        filename = filename ? filename + 1 : file;

        // Formatting happens outside the lock; only the write is serialized
        std::ostringstream msg;
        msg << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] "
            << level_name(level) << " " << filename << ":" << line << " " << func << "()";
        if (!detail::log_scope.empty()) {
            msg << " {" << detail::log_scope << "}";
        }
        msg << " - ";
        (msg << ... << std::forward<Args>(args));

        std::lock_guard<std::mutex> lock(mutex_);
        *output_ << msg.str() << std::endl;
        if (level == LogLevel::FATAL) {
            *output_ << std::flush;
            std::abort();
        }
    }

    static const char* level_name(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::DEBUG: return "DEBG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "EROR";
            case LogLevel::FATAL: return "FATL";
        }
        return "UNKN";
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::clog) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_;
    std::ostream* output_;
    mutable std::mutex mutex_;
};

/**
 * Tags every line logged by the current thread with "table@revision" until
 * destroyed. Scopes nest; the previous tag comes back on destruction.
 */
class LogScope {
public:
    LogScope(const std::string& table_id, long long revision_id)
        : previous_(std::move(detail::log_scope)) {
        detail::log_scope = table_id + "@" + std::to_string(revision_id);
    }

    explicit LogScope(std::string tag) : previous_(std::move(detail::log_scope)) {
        detail::log_scope = std::move(tag);
    }

    ~LogScope() { detail::log_scope = std::move(previous_); }

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string previous_;
};

#define LOG_DEBUG(...) otree::Logger::getInstance().log(otree::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  otree::Logger::getInstance().log(otree::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  otree::Logger::getInstance().log(otree::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) otree::Logger::getInstance().log(otree::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_FATAL(...) otree::Logger::getInstance().log(otree::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

// Parses "debug", "info", "warn", "error", "fatal"; unknown names give INFO
inline LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    return LogLevel::INFO;
}

} // namespace otree
