#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>

namespace lpdispatch {

    enum class LogLevel {
        Debug = 0,
        Info,
        Warning,
        Error
    };

    class Logger {
    public:
        /**
         * @brief Inizializza il logger.
         * @param fileEnabled Se true scrive anche su file, con rotazione per dimensione.
         * @param logsFolder Cartella dei file di log.
         */
        static void init(bool fileEnabled = false, const std::string &logsFolder = "logs");

        static void shutdown();

        static void setMinLevel(LogLevel level);

        static LogLevel parseLevel(const std::string &name);

        static void logDebug(const std::string &message);

        static void logInfo(const std::string &message);

        static void logWarning(const std::string &message);

        static void logError(const std::string &message);

    private:
        static std::ofstream logFile_;
        static std::mutex logMutex_;
        static std::string logsFolder_;
        static std::string currentLogPath_;
        static std::atomic<size_t> currentLogSize_;
        static std::atomic<bool> fileEnabled_;
        static std::atomic<int> minLevel_;

        static void log(LogLevel level, const std::string &message);

        static const char *levelName(LogLevel level);

        static void rotateLogFile();

        static void cleanupOldLogs();

        static std::string currentTimestamp();

        static std::string generateLogFilename();
    };

} // namespace lpdispatch
