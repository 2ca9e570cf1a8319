#pragma once

#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace lpdispatch::config {
    struct SubmitConfig {
        std::string variant = "lp";
        std::string destination; // empty = default printer
        std::string shell = "/bin/sh";
        bool dryRun = false;
    };

    struct ScratchConfig {
        std::string directory; // empty = system temp directory
        std::string prefix = "lpdispatch";
        std::string extension = "txt";
        bool cleanupAfterSubmit = true;
    };

    struct LoggingConfig {
        std::string level = "info";
        bool fileEnabled = false;
        std::string directory = "logs";
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration
        void loadFromFile(const std::string &configPath = "lpdispatch.json");

        void loadFromEnv();

        bool reload();

        void set(const std::string &key, const std::string &value);

        // Configuration access
        SubmitConfig getSubmitConfig() const;

        ScratchConfig getScratchConfig() const;

        LoggingConfig getLoggingConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        std::string configPath_;

        void setDefaults();
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }

    template<>
    inline double ConfigManager::get<double>(const std::string &key, const double &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stod(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }
} // namespace lpdispatch::config
