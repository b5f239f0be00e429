#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cctype>
#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <chrono>
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
    static void Log(LogLevel level, const std::string& message, const std::string& component = "Server") {
        if (static_cast<int>(level) < min_level_.load()) {
            return;
        }

        json log_entry;
        log_entry["timestamp"] = GetTimestamp();
        log_entry["level"] = LevelToString(level);
        log_entry["component"] = component;
        log_entry["message"] = message;

        // Replace invalid UTF-8 (object keys come straight from the store)
        std::string line = log_entry.dump(-1, ' ', false, json::error_handler_t::replace);

        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << line << std::endl;
    }

    static void Debug(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::DEBUG, message, component);
    }

    static void Info(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::INFO, message, component);
    }

    static void Warn(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::WARN, message, component);
    }

    static void Error(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::ERROR, message, component);
    }

    static void Fatal(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::FATAL, message, component);
    }

    static void SetLevel(LogLevel level) {
        min_level_.store(static_cast<int>(level));
    }

    // Accepts DEBUG/INFO/WARN/ERROR/FATAL (case-insensitive). Returns false if unknown.
    static bool ParseLevel(const std::string& name, LogLevel& out) {
        std::string upper;
        for (char c : name) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (upper == "DEBUG") out = LogLevel::DEBUG;
        else if (upper == "INFO") out = LogLevel::INFO;
        else if (upper == "WARN" || upper == "WARNING") out = LogLevel::WARN;
        else if (upper == "ERROR") out = LogLevel::ERROR;
        else if (upper == "FATAL") out = LogLevel::FATAL;
        else return false;
        return true;
    }

private:
    inline static std::mutex mutex_;
    inline static std::atomic<int> min_level_{static_cast<int>(LogLevel::INFO)};

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

        std::tm tm_utc{};
        gmtime_r(&time_t_now, &tm_utc);

        std::stringstream ss;
        ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << "Z";
        return ss.str();
    }
};

#endif // LOGGER_HPP
