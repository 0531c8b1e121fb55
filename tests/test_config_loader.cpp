#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include "TestCheck.hpp"
#include <cstdio>
#include <fstream>
#include <unistd.h>

using TestCheck::expect;

int main() {
    Logger::getInstance().setConsoleOutput(false);
    std::cout << "=== Testing ConfigLoader ===" << std::endl;

    TestCheck::section("1. Defaults:");
    {
        ConfigLoader loader;
        TrackerConfig config = loader.getConfig();
        expect(config.pollIntervalMs == 500, "poll interval defaults to 500 ms");
        expect(config.enrichmentGraceMs == 2000, "grace period defaults to 2000 ms");
        expect(config.maxEnrichmentsPerTick == 8, "enrichment bound defaults to 8");
        expect(config.ledgerFile == "device-history-cache.json", "default ledger file");
        expect(config.atomicLedgerWrites, "atomic writes on by default");
        expect(config.logLevel == "INFO", "default log level");
        expect(!config.includeRootHubs, "root hubs hidden by default");

        expect(!loader.loadFromFile("devhistory-missing-config.json"), "missing config file rejected");
        expect(loader.getConfig().pollIntervalMs == 500, "defaults still in place after a missing file");
    }

    TestCheck::section("2. Overrides:");
    {
        ConfigLoader loader;
        json j = {
            {"pollIntervalMs", 250},
            {"ledgerFile", "/tmp/history.json"},
            {"logLevel", "DEBUG"},
            {"includeRootHubs", true}
        };
        expect(loader.loadFromJson(j), "partial config accepted");
        TrackerConfig config = loader.getConfig();
        expect(config.pollIntervalMs == 250, "poll interval overridden");
        expect(config.ledgerFile == "/tmp/history.json", "ledger file overridden");
        expect(config.includeRootHubs, "root hubs enabled");
        expect(config.enrichmentGraceMs == 2000, "unspecified keys keep defaults");

        loader.setLedgerFile("override.json");
        expect(loader.getConfig().ledgerFile == "override.json", "command line override applied");
    }

    TestCheck::section("3. Rejections:");
    {
        ConfigLoader loader;
        expect(!loader.loadFromJson(json{{"pollIntervalMs", 0}}), "zero poll interval rejected");
        expect(!loader.loadFromJson(json{{"logLevel", "VERBOSE"}}), "unknown log level rejected");
        expect(!loader.loadFromJson(json{{"pollIntervalMs", "fast"}}), "wrong value type rejected");
        expect(!loader.loadFromJson(json::array()), "non-object root rejected");
        expect(loader.getConfig().pollIntervalMs == 500, "rejected config leaves previous values");

        const std::string path = "devhistory_config_" + std::to_string(getpid()) + ".json";
        {
            std::ofstream out(path);
            out << "{ \"pollIntervalMs\": ";
        }
        expect(!loader.loadFromFile(path), "unparseable file rejected");
        std::remove(path.c_str());
    }

    return TestCheck::finish("ConfigLoader");
}
