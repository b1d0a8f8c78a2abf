#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace amtraj {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

class Logger {
  public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void setLevel(LogLevel level) { level_ = level; }

    void log(LogLevel level, const std::string& msg) {
        if (level < level_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm = *std::localtime(&time);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%F %T");
        std::clog << "[" << oss.str() << "]" << levelToString(level) << " amtraj: " << msg << std::endl;
    }

  private:
    LogLevel level_{LogLevel::Warn};
    std::mutex mutex_;

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:
                return "[DEBUG]";
            case LogLevel::Info:
                return "[INFO ]";
            case LogLevel::Warn:
                return "[WARN ]";
            case LogLevel::Error:
                return "[ERROR]";
        }
        return "[INFO ]";
    }
};

// Accepts debug|info|warn|warning|error in any case.
inline LogLevel parseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw std::runtime_error("Unknown log level: " + name);
}

inline void logInfo(const std::string& msg) { Logger::instance().log(LogLevel::Info, msg); }
inline void logWarn(const std::string& msg) { Logger::instance().log(LogLevel::Warn, msg); }
inline void logDebug(const std::string& msg) { Logger::instance().log(LogLevel::Debug, msg); }

}  // namespace amtraj
