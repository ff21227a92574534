#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <string>
#include <mutex>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static void Log(LogLevel level, const std::string& message, const std::string& component = "CurlPush") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }

        json log_entry;
        log_entry["timestamp"] = GetTimestamp();
        log_entry["level"] = LevelToString(level);
        log_entry["component"] = component;
        log_entry["message"] = message;

        // Replace invalid UTF-8 coming from server responses instead of throwing.
        std::cout << log_entry.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
    }

    static void Debug(const std::string& message, const std::string& component = "CurlPush") {
        Log(LogLevel::DEBUG, message, component);
    }

    static void Info(const std::string& message, const std::string& component = "CurlPush") {
        Log(LogLevel::INFO, message, component);
    }

    static void Warn(const std::string& message, const std::string& component = "CurlPush") {
        Log(LogLevel::WARN, message, component);
    }

    static void Error(const std::string& message, const std::string& component = "CurlPush") {
        Log(LogLevel::ERROR, message, component);
    }

    static void Fatal(const std::string& message, const std::string& component = "CurlPush") {
        Log(LogLevel::FATAL, message, component);
    }

    static void SetLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    // Unknown names fall back to INFO.
    static LogLevel ParseLevel(const std::string& name) {
        if (name == "DEBUG") return LogLevel::DEBUG;
        if (name == "WARN") return LogLevel::WARN;
        if (name == "ERROR") return LogLevel::ERROR;
        if (name == "FATAL") return LogLevel::FATAL;
        return LogLevel::INFO;
    }

private:
    inline static std::mutex mutex_;
    inline static LogLevel min_level_ = LogLevel::INFO;

    static std::string LevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    static std::string GetTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm gmt{};
        gmtime_r(&time_t_now, &gmt);

        std::stringstream ss;
        ss << std::put_time(&gmt, "%Y-%m-%dT%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << "Z";
        return ss.str();
    }
};

#endif // LOGGER_HPP
