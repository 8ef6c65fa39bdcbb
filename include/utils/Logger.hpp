#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include "core/Types.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace DiffExpr {
namespace Utils {

/**
 * @brief Process-wide logger.
 *
 * Messages go to the console (colored when attached to a terminal; warnings
 * and errors on stderr) and, if set, to a plain-text log file.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel log_level() const { return current_level_; }

    /**
     * @brief Appends all further messages to @p filename.
     * @throws std::runtime_error if the file cannot be opened.
     */
    void set_log_file(const std::string& filename);

    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    std::ofstream log_file_;
    std::mutex mutex_;
    bool stdout_colors_ = false;
    bool stderr_colors_ = false;

    static const char* level_to_string(LogLevel level);
    static const char* color_code(LogLevel level);
};

/**
 * @brief RAII helper to log start and end of a pipeline stage with its duration.
 *
 * A stage left by an exception is logged as "FAILED:" instead of "DONE :".
 */
class ScopedLogger {
public:
    explicit ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
    int uncaught_at_start_;
};

}  // namespace Utils
}  // namespace DiffExpr

#define LOG_DEBUG(msg) DiffExpr::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) DiffExpr::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) DiffExpr::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) DiffExpr::Utils::Logger::error(msg, __FILE__, __LINE__)
