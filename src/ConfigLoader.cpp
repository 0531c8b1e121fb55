#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include <fstream>

ConfigLoader::ConfigLoader() {
    setDefaults();
}

bool ConfigLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file: " + filename);
        return false;
    }
    
    try {
        json j;
        file >> j;
        return loadFromJson(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing config file: " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadFromJson(const json& j) {
    if (!j.is_object()) {
        LOG_ERROR("Configuration root must be a JSON object");
        return false;
    }

    TrackerConfig loaded = config_;
    try {
        if (j.contains("pollIntervalMs")) {
            loaded.pollIntervalMs = j["pollIntervalMs"].get<int>();
        }
        if (j.contains("enrichmentGraceMs")) {
            loaded.enrichmentGraceMs = j["enrichmentGraceMs"].get<int>();
        }
        if (j.contains("maxEnrichmentsPerTick")) {
            loaded.maxEnrichmentsPerTick = j["maxEnrichmentsPerTick"].get<int>();
        }
        if (j.contains("ledgerFile")) {
            loaded.ledgerFile = j["ledgerFile"].get<std::string>();
        }
        if (j.contains("atomicLedgerWrites")) {
            loaded.atomicLedgerWrites = j["atomicLedgerWrites"].get<bool>();
        }
        if (j.contains("logFile")) {
            loaded.logFile = j["logFile"].get<std::string>();
        }
        if (j.contains("logLevel")) {
            loaded.logLevel = j["logLevel"].get<std::string>();
        }
        if (j.contains("logToConsole")) {
            loaded.logToConsole = j["logToConsole"].get<bool>();
        }
        if (j.contains("includeRootHubs")) {
            loaded.includeRootHubs = j["includeRootHubs"].get<bool>();
        }
    } catch (const json::exception& e) {
        LOG_ERROR("Invalid configuration value: " + std::string(e.what()));
        return false;
    }

    if (!validate(loaded)) {
        return false;
    }

    config_ = loaded;
    LOG_INFO("Tracker configuration loaded successfully");
    return true;
}

TrackerConfig ConfigLoader::getConfig() const {
    return config_;
}

void ConfigLoader::setLedgerFile(const std::string& path) {
    config_.ledgerFile = path;
}

void ConfigLoader::setDefaults() {
    config_.pollIntervalMs = 500;
    config_.enrichmentGraceMs = 2000;
    config_.maxEnrichmentsPerTick = 8;
    config_.ledgerFile = "device-history-cache.json";
    config_.atomicLedgerWrites = true;
    config_.logFile = "device-history.log";
    config_.logLevel = "INFO";
    config_.logToConsole = false;
    config_.includeRootHubs = false;
}

bool ConfigLoader::validate(const TrackerConfig& config) const {
    if (config.pollIntervalMs <= 0) {
        LOG_ERROR("pollIntervalMs must be positive");
        return false;
    }
    if (config.enrichmentGraceMs < 0) {
        LOG_ERROR("enrichmentGraceMs must not be negative");
        return false;
    }
    if (config.maxEnrichmentsPerTick <= 0) {
        LOG_ERROR("maxEnrichmentsPerTick must be positive");
        return false;
    }
    if (config.ledgerFile.empty()) {
        LOG_ERROR("ledgerFile must not be empty");
        return false;
    }
    if (config.logLevel != "DEBUG" && config.logLevel != "INFO" &&
        config.logLevel != "WARNING" && config.logLevel != "ERROR") {
        LOG_ERROR("Unknown logLevel: " + config.logLevel);
        return false;
    }
    return true;
}
