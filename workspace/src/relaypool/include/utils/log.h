#ifndef RELAYPOOL_UTILS_LOG_H
#define RELAYPOOL_UTILS_LOG_H

#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>

namespace relaypool {
namespace utils {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Default log level - can be overridden at compile time
// Example: -DRELAYPOOL_LOG_LEVEL_DEFAULT=::relaypool::utils::LogLevel::INFO
#ifndef RELAYPOOL_LOG_LEVEL_DEFAULT
    #define RELAYPOOL_LOG_LEVEL_DEFAULT ::relaypool::utils::LogLevel::INFO
#endif

/**
 * @brief Receives fully formatted log lines
 *
 * The default sink writes ERROR/FATAL to stderr and everything else to stdout.
 */
using LogSink = std::function<void(LogLevel level, const std::string& line)>;

namespace detail {

struct LogState {
    LogLevel maxLevel = RELAYPOOL_LOG_LEVEL_DEFAULT;
    LogSink sink;
    std::mutex mutex;
};

inline LogState& logState() {
    static LogState state;
    return state;
}

} // namespace detail

// Set the maximum log level at runtime
inline void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(detail::logState().mutex);
    detail::logState().maxLevel = level;
}

// Get the current maximum log level
inline LogLevel getLogLevel() {
    std::lock_guard<std::mutex> lock(detail::logState().mutex);
    return detail::logState().maxLevel;
}

/**
 * @brief Replace the output sink (pass an empty function to restore the console)
 */
inline void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(detail::logState().mutex);
    detail::logState().sink = std::move(sink);
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::VERBOSE: return "VERBOSE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    #ifdef _WIN32
        localtime_s(&tm_buf, &now_time_t);
    #else
        localtime_r(&now_time_t, &tm_buf);
    #endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return oss.str();
}

inline const char* extractFilename(const char* path) {
    const char* filename = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            filename = p + 1;
        }
    }
    return filename;
}

inline void log(LogLevel level, const char* file, int line, const std::string& message) {
    auto& state = detail::logState();
    std::lock_guard<std::mutex> lock(state.mutex);

    // Filter out logs below the maximum log level
    if (level < state.maxLevel) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << getCurrentTimestamp() << "] "
        << "[" << logLevelToString(level) << "] "
        << "[" << extractFilename(file) << ":" << line << "] "
        << message;

    if (state.sink) {
        state.sink(level, oss.str());
        return;
    }

    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        std::cerr << oss.str() << std::endl;
    } else {
        std::cout << oss.str() << std::endl;
    }
}

} // namespace utils
} // namespace relaypool

/**
 * @brief Log Level Filtering
 *
 * 1. Compile time (CMakeLists.txt):
 *    add_definitions(-DRELAYPOOL_LOG_LEVEL_DEFAULT=::relaypool::utils::LogLevel::DEBUG)
 *
 * 2. Runtime:
 *    relaypool::utils::setLogLevel(relaypool::utils::LogLevel::WARNING);
 *
 * Log levels (from lowest to highest):
 *   VERBOSE < DEBUG < INFO < WARNING < ERROR < FATAL
 */

// Log macros
#define LOGV(msg) ::relaypool::utils::log(::relaypool::utils::LogLevel::VERBOSE, __FILE__, __LINE__, msg)
#define LOGD(msg) ::relaypool::utils::log(::relaypool::utils::LogLevel::DEBUG, __FILE__, __LINE__, msg)
#define LOGI(msg) ::relaypool::utils::log(::relaypool::utils::LogLevel::INFO, __FILE__, __LINE__, msg)
#define LOGW(msg) ::relaypool::utils::log(::relaypool::utils::LogLevel::WARNING, __FILE__, __LINE__, msg)
#define LOGE(msg) ::relaypool::utils::log(::relaypool::utils::LogLevel::ERROR, __FILE__, __LINE__, msg)
#define LOGF(msg) ::relaypool::utils::log(::relaypool::utils::LogLevel::FATAL, __FILE__, __LINE__, msg)

// Formatted log macros (support for stream-style formatting)
#define LOGV_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGV(_oss.str()); }
#define LOGD_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGD(_oss.str()); }
#define LOGI_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGI(_oss.str()); }
#define LOGW_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGW(_oss.str()); }
#define LOGE_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGE(_oss.str()); }
#define LOGF_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGF(_oss.str()); }

#endif // RELAYPOOL_UTILS_LOG_H
