#include "Logger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <fstream>

namespace revcheck {

// Static member initialization
std::mutex Logger::log_mutex_;
LogLevel Logger::min_log_level_ = LogLevel::Info;
std::string Logger::log_file_path_;
bool Logger::console_output_enabled_ = true;

namespace {
    std::string currentTimeString() {
        try {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            std::stringstream ss;
            std::tm tm_buf;

            #ifdef _WIN32
                localtime_s(&tm_buf, &time);
            #else
                localtime_r(&time, &tm_buf);
            #endif

            ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
               << '.' << std::setfill('0') << std::setw(3) << ms.count();
            return ss.str();
        }
        catch (const std::exception&) {
            return "TIME_ERROR";
        }
    }

    std::string levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:    return "[DEBUG]   ";
            case LogLevel::Info:     return "[INFO]    ";
            case LogLevel::Warning:  return "[WARNING] ";
            case LogLevel::Error:    return "[ERROR]   ";
            case LogLevel::Security: return "[SECURITY]";
            case LogLevel::Fatal:    return "[FATAL]   ";
            default:                 return "[UNKNOWN] ";
        }
    }
}

void Logger::logEvent(LogLevel level, std::string_view message) {
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (level < min_log_level_) {
            return;
        }
    }

    try {
        write(levelToString(level) + " " + currentTimeString() + " " +
              std::string(message) + "\n");
    }
    catch (const std::exception& e) {
        // Fallback logging to stderr in case of errors
        std::cerr << "[LOGGING_ERROR] Failed to log message: " << e.what() << std::endl;
    }
}

void Logger::logError(ErrorCode code, std::string_view details) {
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (LogLevel::Error < min_log_level_) {
            return;
        }
    }

    try {
        write(levelToString(LogLevel::Error) + " " + currentTimeString() +
              " Code: " + toString(code) + " Details: " + std::string(details) + "\n");
    }
    catch (const std::exception& e) {
        std::cerr << "[LOGGING_ERROR] Failed to log error: " << e.what() << std::endl;
    }
}

void Logger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (console_output_enabled_) {
        std::cerr << line << std::flush;
    }

    if (!log_file_path_.empty()) {
        writeToFile(line);
    }
}

void Logger::writeToFile(std::string_view message) {
    try {
        std::ofstream file(log_file_path_, std::ios::app);
        if (file.is_open()) {
            file << message;
            file.flush();
        }
    }
    catch (const std::exception&) {
        // If file logging fails, try to log to console as fallback
        if (console_output_enabled_) {
            std::cerr << "[FILE_ERROR] Failed to write to log file: " << message;
        }
    }
}

void Logger::setLogLevel(LogLevel minLevel) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_log_level_ = minLevel;
}

void Logger::setLogFile(std::string_view path) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_file_path_ = path;
}

void Logger::enableConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_enabled_ = enable;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr.flush();
}

} // namespace revcheck
