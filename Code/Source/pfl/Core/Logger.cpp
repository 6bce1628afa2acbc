/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

/**
 * @file Logger.cpp
 * @brief Logger implementation and environment-driven initialization
 */

#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>

namespace pfl {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool env_flag(const char* value) {
    const std::string s = to_lower(value);
    return s != "false" && s != "0" && s != "off";
}

/**
 * @brief Initialize the logger from environment variables
 *
 * PFL_LOG_LEVEL, PFL_LOG_FILE, PFL_LOG_CONSOLE, PFL_LOG_SHOW_RANK and
 * PFL_LOG_SHOW_TIME are read once at startup.
 */
class LoggerInitializer {
public:
    LoggerInitializer() {
        auto& logger = Logger::instance();

        if (const char* env_level = std::getenv("PFL_LOG_LEVEL")) {
            LogLevel level;
            if (parse_log_level(env_level, level)) {
                logger.set_level(level);
            }
        }
        if (const char* env_file = std::getenv("PFL_LOG_FILE")) {
            logger.set_file_output(env_file);
        }
        if (const char* env_console = std::getenv("PFL_LOG_CONSOLE")) {
            logger.set_console_output(env_flag(env_console));
        }
        if (const char* env_rank = std::getenv("PFL_LOG_SHOW_RANK")) {
            logger.set_show_rank(env_flag(env_rank));
        }
        if (const char* env_time = std::getenv("PFL_LOG_SHOW_TIME")) {
            logger.set_show_timestamp(env_flag(env_time));
        }
    }
};

static LoggerInitializer logger_init;

std::mutex& deprecation_mutex() {
    static std::mutex m;
    return m;
}

std::set<std::string>& deprecation_registry() {
    static std::set<std::string> names;
    return names;
}

} // anonymous namespace

bool parse_log_level(const std::string& name, LogLevel& level) {
    const std::string s = to_lower(name);
    if (s == "debug") {
        level = LogLevel::DEBUG;
    } else if (s == "info") {
        level = LogLevel::INFO;
    } else if (s == "warning" || s == "warn") {
        level = LogLevel::WARNING;
    } else if (s == "error") {
        level = LogLevel::ERROR;
    } else if (s == "critical" || s == "crit") {
        level = LogLevel::CRITICAL;
    } else if (s == "off") {
        level = LogLevel::OFF;
    } else {
        return false;
    }
    return true;
}

void Logger::set_file_output(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    if (filename.empty()) {
        return;
    }

    std::string actual_filename = filename;
    #if PFL_HAS_MPI
    int initialized = 0;
    MPI_Initialized(&initialized);
    if (initialized) {
        int rank;
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
        size_t dot_pos = filename.rfind('.');
        if (dot_pos != std::string::npos) {
            actual_filename = filename.substr(0, dot_pos) + "_rank" +
                              std::to_string(rank) + filename.substr(dot_pos);
        } else {
            actual_filename += "_rank" + std::to_string(rank);
        }
    }
    #endif

    file_stream_.open(actual_filename, std::ios::app);
    if (!file_stream_.is_open()) {
        std::cerr << "Failed to open log file: " << actual_filename << std::endl;
    }
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const char* file,
                 int line,
                 const char* function) {
    #if !PFL_DEBUG_MODE
    if (level == LogLevel::DEBUG) return;
    #endif

    LogMessage msg;
    msg.level = level;
    msg.message = message;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    msg.timestamp = std::chrono::system_clock::now();
    msg.thread_id = std::this_thread::get_id();
    msg.mpi_rank = -1;

    #if PFL_HAS_MPI
    int initialized = 0;
    MPI_Initialized(&initialized);
    if (initialized) {
        MPI_Comm_rank(MPI_COMM_WORLD, &msg.mpi_rank);
    }
    #endif

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_ || min_level_ == LogLevel::OFF) return;

    const std::string formatted = format_message(msg);

    if (console_output_) {
        if (level >= LogLevel::WARNING) {
            std::cerr << formatted << std::flush;
        } else {
            std::cout << formatted << std::flush;
        }
    }
    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::flush;
    }
    for (const auto& handler : handlers_) {
        if (handler) {
            handler(msg);
        }
    }
}

std::string Logger::format_message(const LogMessage& msg) const {
    std::ostringstream oss;

    if (show_timestamp_) {
        auto time_t = std::chrono::system_clock::to_time_t(msg.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            msg.timestamp.time_since_epoch()) % 1000;
        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);
        oss << "[" << std::put_time(&tm_buf, "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    if (show_rank_ && msg.mpi_rank >= 0) {
        oss << "[R" << msg.mpi_rank << "] ";
    }

    oss << "[" << log_level_to_string(msg.level) << "] " << msg.message;

    #if PFL_DEBUG_MODE
    if (msg.level >= LogLevel::WARNING && !msg.file.empty()) {
        oss << " (" << msg.file << ":" << msg.line;
        if (!msg.function.empty()) {
            oss << " in " << msg.function << "()";
        }
        oss << ")";
    }
    #endif

    oss << "\n";
    return oss.str();
}

void warn_deprecated(const std::string& name, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(deprecation_mutex());
        if (!deprecation_registry().insert(name).second) {
            return;
        }
    }
    Logger::instance().log(LogLevel::WARNING, "Deprecated: " + name + ". " + message);
}

std::size_t deprecated_names_reported() {
    std::lock_guard<std::mutex> lock(deprecation_mutex());
    return deprecation_registry().size();
}

} // namespace pfl
