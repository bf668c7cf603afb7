#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace pysandbox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo) {
    if (value == "debug" || value == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (value == "info" || value == "INFO") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "warning" || value == "WARN" || value == "WARNING") {
        return LogLevel::kWarn;
    }
    if (value == "error" || value == "ERROR") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

namespace detail {

inline std::atomic<int>& MinLevel() {
    static std::atomic<int> level{static_cast<int>(LogLevel::kInfo)};
    return level;
}

inline std::mutex& SinkMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace detail

inline void ApplyLogConfig(const LogConfig& config) {
    detail::MinLevel().store(static_cast<int>(config.min_level));
}

inline bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= detail::MinLevel().load();
}

// One "[tag] message" line on stderr, written whole when the temporary dies.
class LogLine {
public:
    LogLine(LogLevel level, const char* tag)
        : enabled_(IsEnabled(level)) {
        if (enabled_) {
            stream_ << "[" << tag << "] ";
            if (level == LogLevel::kWarn || level == LogLevel::kError) {
                stream_ << ToString(level) << " ";
            }
        }
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    ~LogLine() {
        if (!enabled_) {
            return;
        }
        stream_ << '\n';
        std::lock_guard<std::mutex> lock(detail::SinkMutex());
        std::cerr << stream_.str() << std::flush;
    }

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    bool enabled_;
    std::ostringstream stream_;
};

inline LogLine Log(LogLevel level, const char* tag) {
    return LogLine(level, tag);
}

}  // namespace pysandbox::utils
