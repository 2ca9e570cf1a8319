#include "lpdispatch/logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace lpdispatch {

    std::ofstream Logger::logFile_;
    std::mutex Logger::logMutex_;
    std::string Logger::logsFolder_ = "logs";
    std::string Logger::currentLogPath_;
    std::atomic<size_t> Logger::currentLogSize_{0};
    std::atomic<bool> Logger::fileEnabled_{false};
    std::atomic<int> Logger::minLevel_{static_cast<int>(LogLevel::Info)};

    constexpr size_t MAX_LOG_SIZE = 10 * 1024 * 1024; // 10MB
    constexpr size_t MAX_LOG_FILES = 10;
    constexpr std::chrono::hours LOG_RETENTION{24 * 7}; // 7 days

    void Logger::init(bool fileEnabled, const std::string &logsFolder) {
        std::lock_guard<std::mutex> lock(logMutex_);
        logsFolder_ = logsFolder;
        fileEnabled_ = fileEnabled;
        if (fileEnabled) {
            cleanupOldLogs();
            rotateLogFile();
        }
    }

    void Logger::shutdown() {
        std::lock_guard<std::mutex> lock(logMutex_);
        fileEnabled_ = false;
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    void Logger::setMinLevel(LogLevel level) {
        minLevel_ = static_cast<int>(level);
    }

    LogLevel Logger::parseLevel(const std::string &name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "debug") return LogLevel::Debug;
        if (lower == "warning" || lower == "warn") return LogLevel::Warning;
        if (lower == "error") return LogLevel::Error;
        return LogLevel::Info;
    }

    void Logger::logDebug(const std::string &message) {
        log(LogLevel::Debug, message);
    }

    void Logger::logInfo(const std::string &message) {
        log(LogLevel::Info, message);
    }

    void Logger::logWarning(const std::string &message) {
        log(LogLevel::Warning, message);
    }

    void Logger::logError(const std::string &message) {
        log(LogLevel::Error, message);
    }

    void Logger::log(LogLevel level, const std::string &message) {
        if (static_cast<int>(level) < minLevel_) {
            return;
        }
        if (message.empty() || message.find_first_not_of(" \t\r\n") == std::string::npos) {
            return;
        }

        std::string formatted = "[" + std::string(levelName(level)) + "] [" + currentTimestamp() + "] " + message;

        std::lock_guard<std::mutex> lock(logMutex_);
        if (level == LogLevel::Error) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }

        if (!fileEnabled_) {
            return;
        }

        if (currentLogSize_ > MAX_LOG_SIZE) {
            rotateLogFile();
        }

        if (logFile_.is_open()) {
            logFile_ << formatted << std::endl;
            currentLogSize_ += formatted.length() + 1;
        }
    }

    const char *Logger::levelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Error: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    void Logger::rotateLogFile() {
        if (logFile_.is_open()) {
            logFile_.close();
        }

        try {
            currentLogPath_ = generateLogFilename();
        } catch (const fs::filesystem_error &e) {
            std::cerr << "[Logger] ERROR: Cannot prepare logs folder " << logsFolder_ << ": " << e.what()
                      << std::endl;
            fileEnabled_ = false;
            return;
        }

        logFile_.open(currentLogPath_, std::ios::out | std::ios::app);
        currentLogSize_ = 0;

        if (!logFile_.is_open()) {
            std::cerr << "[Logger] ERROR: Cannot open log file: " << currentLogPath_ << std::endl;
            fileEnabled_ = false;
        }
    }

    void Logger::cleanupOldLogs() {
        try {
            if (!fs::exists(logsFolder_)) return;

            auto cutoffTime = std::chrono::system_clock::now() - LOG_RETENTION;
            std::vector<fs::path> logFiles;

            for (const auto &entry: fs::directory_iterator(logsFolder_)) {
                if (entry.path().extension() != ".log") continue;

                auto writeTime = fs::last_write_time(entry);
                auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    writeTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());

                if (sctp < cutoffTime) {
                    fs::remove(entry);
                } else {
                    logFiles.push_back(entry.path());
                }
            }

            if (logFiles.size() > MAX_LOG_FILES) {
                std::sort(logFiles.begin(), logFiles.end(), [](const fs::path &a, const fs::path &b) {
                    return fs::last_write_time(a) < fs::last_write_time(b);
                });

                for (size_t i = 0; i < logFiles.size() - MAX_LOG_FILES; ++i) {
                    fs::remove(logFiles[i]);
                }
            }
        } catch (const std::exception &e) {
            std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
        }
    }

    std::string Logger::currentTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::stringstream ss;
        ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string Logger::generateLogFilename() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::stringstream ss;
        ss << std::put_time(std::localtime(&in_time_t), "%Y%m%d_%H%M%S");

        if (!fs::exists(logsFolder_)) {
            fs::create_directories(logsFolder_);
        }

        return logsFolder_ + "/lpdispatch_" + ss.str() + ".log";
    }

} // namespace lpdispatch
