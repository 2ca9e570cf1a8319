#include "lpdispatch/config/ConfigManager.hpp"
#include "lpdispatch/job/ToolDialect.hpp"
#include "lpdispatch/logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>

namespace lpdispatch::config {
    namespace {
        constexpr const char *ENV_PREFIX = "LPDISPATCH_";

        constexpr const char *ENV_VARS[] = {
            "LPDISPATCH_SUBMIT_VARIANT", "LPDISPATCH_SUBMIT_DESTINATION", "LPDISPATCH_SUBMIT_SHELL",
            "LPDISPATCH_SUBMIT_DRY_RUN",
            "LPDISPATCH_SCRATCH_DIRECTORY", "LPDISPATCH_SCRATCH_PREFIX", "LPDISPATCH_SCRATCH_EXTENSION",
            "LPDISPATCH_SCRATCH_CLEANUP_AFTER_SUBMIT",
            "LPDISPATCH_LOGGING_LEVEL", "LPDISPATCH_LOGGING_FILE_ENABLED", "LPDISPATCH_LOGGING_DIRECTORY"
        };

        // "submit.dry_run" style keys use underscores inside a section, sections are dot separated
        std::string envToKey(const std::string &envVar) {
            std::string key = envVar.substr(std::char_traits<char>::length(ENV_PREFIX));
            std::transform(key.begin(), key.end(), key.begin(), ::tolower);
            auto pos = key.find('_');
            if (pos != std::string::npos) {
                key[pos] = '.';
            }
            return key;
        }
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_ = configPath;
        setDefaults();

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            // Flatten JSON into key-value pairs
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        config_[key] = it.value().get<std::string>();
                    } else {
                        config_[key] = it.value().dump();
                    }
                }
            };

            if (!json.is_object()) {
                Logger::logError("[ConfigManager] Config root must be an object: " + configPath);
                return;
            }

            flatten(json, "");
            Logger::logInfo(
                "[ConfigManager] Loaded " + std::to_string(config_.size()) + " settings from " + configPath);
        } catch (const nlohmann::json::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config: " + std::string(e.what()));
            setDefaults();
        }
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        int loaded = 0;
        for (const char *envVar: ENV_VARS) {
            const char *value = std::getenv(envVar);
            if (value) {
                config_[envToKey(envVar)] = value;
                loaded++;
            }
        }

        Logger::logDebug("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    bool ConfigManager::reload() {
        std::string path;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            path = configPath_;
        }
        if (path.empty()) return false;

        loadFromFile(path);
        loadFromEnv();
        return true;
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    SubmitConfig ConfigManager::getSubmitConfig() const {
        SubmitConfig config;
        config.variant = get<std::string>("submit.variant", "lp");
        config.destination = get<std::string>("submit.destination", "");
        config.shell = get<std::string>("submit.shell", "/bin/sh");
        config.dryRun = get<bool>("submit.dry_run", false);
        return config;
    }

    ScratchConfig ConfigManager::getScratchConfig() const {
        ScratchConfig config;
        config.directory = get<std::string>("scratch.directory", "");
        config.prefix = get<std::string>("scratch.prefix", "lpdispatch");
        config.extension = get<std::string>("scratch.extension", "txt");
        config.cleanupAfterSubmit = get<bool>("scratch.cleanup_after_submit", true);
        return config;
    }

    LoggingConfig ConfigManager::getLoggingConfig() const {
        LoggingConfig config;
        config.level = get<std::string>("logging.level", "info");
        config.fileEnabled = get<bool>("logging.file_enabled", false);
        config.directory = get<std::string>("logging.directory", "logs");
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        if (!job::toolVariantFromString(get<std::string>("submit.variant", "lp"))) {
            result.errors.push_back("submit.variant must be \"lp\" or \"lpr\"");
        }

        if (get<std::string>("submit.shell", "").empty()) {
            result.errors.push_back("submit.shell must not be empty");
        }

        if (get<std::string>("scratch.prefix", "").empty()) {
            result.errors.push_back("scratch.prefix must not be empty");
        }

        if (get<std::string>("scratch.prefix", "").find('/') != std::string::npos) {
            result.errors.push_back("scratch.prefix must not contain '/'");
        }

        if (get<std::string>("scratch.extension", "").find('/') != std::string::npos) {
            result.errors.push_back("scratch.extension must not contain '/'");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        // Submit defaults
        config_["submit.variant"] = "lp";
        config_["submit.destination"] = "";
        config_["submit.shell"] = "/bin/sh";
        config_["submit.dry_run"] = "false";

        // Scratch defaults
        config_["scratch.directory"] = "";
        config_["scratch.prefix"] = "lpdispatch";
        config_["scratch.extension"] = "txt";
        config_["scratch.cleanup_after_submit"] = "true";

        // Logging defaults
        config_["logging.level"] = "info";
        config_["logging.file_enabled"] = "false";
        config_["logging.directory"] = "logs";
    }
} // namespace lpdispatch::config
