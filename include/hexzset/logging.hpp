#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace hexzset {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

// Fixed-width tag written into every line
constexpr const char* log_level_tag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "EROR";
        case LogLevel::FATAL: return "FATL";
    }
    return "UNKN";
}

// "debug", "info", "warn", "error" or "fatal", any case
inline std::optional<LogLevel> parse_log_level(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

/**
 * Process-wide line logger:
 *
 *   [2026-10-18 09:14:02.315] EROR range_query.cpp:20 decode_checked() - ...
 *
 * The level check is lock-free and happens in the LOG_* macros before any
 * argument is evaluated. Each line is assembled first and written to the
 * output stream in one piece under the mutex.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }

    bool enabled(LogLevel level) const { return level >= this->level(); }

    // The stream must outlive every later log call
    void set_output(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, const Args&... args) {
        std::ostringstream out;
        write_prefix(out, level, file, line, func);
        (out << ... << args);
        out << '\n';

        std::lock_guard<std::mutex> lock(mutex_);
        *output_ << out.str();
        if (level >= LogLevel::ERROR) {
            output_->flush();
        }
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::cerr) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void write_prefix(std::ostream& out, LogLevel level, const char* file, int line,
                             const char* func) {
        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&secs, &local);

        const char* base = std::strrchr(file, '/');
        base = base ? base + 1 : file;

        out << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count() << "] "
            << log_level_tag(level) << ' ' << base << ':' << line << ' ' << func << "() - ";
    }

    std::atomic<LogLevel> level_;
    std::ostream* output_;
    std::mutex mutex_;
};

#define HEXZSET_LOG(level, ...)                                                              \
    do {                                                                                     \
        hexzset::Logger& hexzset_logger_ = hexzset::Logger::getInstance();                   \
        if (hexzset_logger_.enabled(level)) {                                                \
            hexzset_logger_.log(level, __FILE__, __LINE__, __func__, __VA_ARGS__);           \
        }                                                                                    \
    } while (0)

#define LOG_DEBUG(...) HEXZSET_LOG(hexzset::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  HEXZSET_LOG(hexzset::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  HEXZSET_LOG(hexzset::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) HEXZSET_LOG(hexzset::LogLevel::ERROR, __VA_ARGS__)
#define LOG_FATAL(...) HEXZSET_LOG(hexzset::LogLevel::FATAL, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().set_level(level);
}

// Leaves the level untouched and returns false for an unknown name
inline bool set_log_level(const std::string& name) {
    std::optional<LogLevel> level = parse_log_level(name);
    if (!level) return false;
    set_log_level(*level);
    return true;
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().set_output(stream);
}

} // namespace hexzset
