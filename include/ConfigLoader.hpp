#pragma once
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct TrackerConfig {
    int pollIntervalMs;
    int enrichmentGraceMs;
    int maxEnrichmentsPerTick;
    std::string ledgerFile;
    bool atomicLedgerWrites;
    std::string logFile;
    std::string logLevel;
    bool logToConsole;
    bool includeRootHubs;
};

class ConfigLoader {
public:
    ConfigLoader();
    bool loadFromFile(const std::string& filename);
    bool loadFromJson(const json& jsonConfig);
    TrackerConfig getConfig() const;
    void setLedgerFile(const std::string& path);
    
private:
    TrackerConfig config_;
    void setDefaults();
    bool validate(const TrackerConfig& config) const;
};
