/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_CORE_LOGGER_H
#define PFL_CORE_LOGGER_H

/**
 * @file Logger.h
 * @brief Logging infrastructure for the field library
 *
 * Thread-safe, optionally MPI-aware logging with severity levels, custom
 * handlers and scoped timing. Deprecated API spellings report through
 * warn_deprecated().
 */

#include "Types.h"
#include "PFLConfig.h"
#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#if PFL_HAS_MPI
#include <mpi.h>
#endif

namespace pfl {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    DEBUG    = 0,
    INFO     = 1,
    WARNING  = 2,
    ERROR    = 3,
    CRITICAL = 4,
    OFF      = 5
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default:                 return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name (case-insensitive); returns false if unknown
 */
bool parse_log_level(const std::string& name, LogLevel& level);

// ============================================================================
// Timer
// ============================================================================

class Timer {
public:
    using Clock = std::chrono::steady_clock;

    void start() {
        start_time_ = Clock::now();
        is_running_ = true;
    }

    void stop() {
        if (is_running_) {
            end_time_ = Clock::now();
            is_running_ = false;
        }
    }

    /// Elapsed time in seconds
    double elapsed() const {
        auto end = is_running_ ? Clock::now() : end_time_;
        return std::chrono::duration<double>(end - start_time_).count();
    }

private:
    Clock::time_point start_time_{};
    Clock::time_point end_time_{};
    bool is_running_ = false;
};

// ============================================================================
// Log Message Structure
// ============================================================================

struct LogMessage {
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    int mpi_rank;
    std::thread::id thread_id;
};

// ============================================================================
// Logger Class
// ============================================================================

/**
 * @brief Process-wide logger
 *
 * Defaults are taken from the PFL_LOG_* environment variables at startup
 * (see Logger.cpp).
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_output_ = enabled;
    }

    /**
     * @brief Append log output to a file (rank suffix added under MPI)
     */
    void set_file_output(const std::string& filename);

    void set_show_rank(bool show) {
        std::lock_guard<std::mutex> lock(mutex_);
        show_rank_ = show;
    }

    void set_show_timestamp(bool show) {
        std::lock_guard<std::mutex> lock(mutex_);
        show_timestamp_ = show;
    }

    void log(LogLevel level,
             const std::string& message,
             const char* file = "",
             int line = 0,
             const char* function = "");

    void log_timed(LogLevel level,
                   const std::string& message,
                   double elapsed_seconds) {
        std::ostringstream oss;
        oss << message << " (elapsed: " << std::fixed << std::setprecision(3)
            << elapsed_seconds << "s)";
        log(level, oss.str());
    }

    using LogHandler = std::function<void(const LogMessage&)>;

    /// Register a handler; returns its id for remove_handler()
    std::size_t add_handler(LogHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.push_back(std::move(handler));
        return handlers_.size() - 1;
    }

    void remove_handler(std::size_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (id < handlers_.size()) {
            handlers_[id] = nullptr;
        }
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
        if (file_stream_.is_open()) {
            file_stream_.flush();
        }
    }

private:
    Logger() : min_level_(LogLevel::INFO),
               console_output_(true),
               show_rank_(true),
               show_timestamp_(true) {}

    ~Logger() {
        if (file_stream_.is_open()) {
            file_stream_.close();
        }
    }

    std::string format_message(const LogMessage& msg) const;

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool console_output_;
    bool show_rank_;
    bool show_timestamp_;
    std::ofstream file_stream_;
    std::vector<LogHandler> handlers_;
};

// ============================================================================
// Scoped Timer
// ============================================================================

/**
 * @brief RAII timer that logs elapsed time on destruction
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name,
                         LogLevel level = LogLevel::DEBUG)
        : name_(name), level_(level) {
        timer_.start();
    }

    ~ScopedTimer() {
        timer_.stop();
        Logger::instance().log_timed(level_, "Completed: " + name_, timer_.elapsed());
    }

private:
    std::string name_;
    LogLevel level_;
    Timer timer_;
};

// ============================================================================
// Deprecation Warnings
// ============================================================================

/**
 * @brief Report use of a deprecated spelling
 *
 * Logs at WARNING the first time `name` is used in this process. Never
 * throws and never aborts.
 */
void warn_deprecated(const std::string& name, const std::string& message);

/// Number of distinct deprecated names reported so far
std::size_t deprecated_names_reported();

// ============================================================================
// Logging Macros
// ============================================================================

#define PFL_LOG(level, message) \
    pfl::Logger::instance().log(level, message, __FILE__, __LINE__, __FUNCTION__)

#if PFL_DEBUG_MODE
    #define PFL_LOG_DEBUG(message) PFL_LOG(pfl::LogLevel::DEBUG, message)
#else
    #define PFL_LOG_DEBUG(message) ((void)0)
#endif

#define PFL_LOG_INFO(message) PFL_LOG(pfl::LogLevel::INFO, message)
#define PFL_LOG_WARNING(message) PFL_LOG(pfl::LogLevel::WARNING, message)
#define PFL_LOG_ERROR(message) PFL_LOG(pfl::LogLevel::ERROR, message)
#define PFL_LOG_CRITICAL(message) PFL_LOG(pfl::LogLevel::CRITICAL, message)

#define PFL_TIMED_SCOPE(name) \
    pfl::ScopedTimer _scoped_timer_##__LINE__(name)

// ============================================================================
// Stream-based Logging Interface
// ============================================================================

class LogStream {
public:
    explicit LogStream(LogLevel level) : level_(level) {}

    ~LogStream() {
        Logger::instance().log(level_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
};

inline LogStream log_stream(LogLevel level) {
    return LogStream(level);
}

#define PFL_INFO()    pfl::log_stream(pfl::LogLevel::INFO)
#define PFL_WARNING() pfl::log_stream(pfl::LogLevel::WARNING)

} // namespace pfl

#endif // PFL_CORE_LOGGER_H
