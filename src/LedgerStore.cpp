#include "LedgerStore.hpp"
#include "../devhistory-shared/include/DeviceHistorySerializer.hpp"
#include "Logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

using namespace DevHistoryShared;

LedgerStore::LedgerStore(const std::string& path, bool atomicWrites)
    : path_(path), atomicWrites_(atomicWrites) {}

KnownDeviceLedger LedgerStore::load() const {
    KnownDeviceLedger ledger;

    std::ifstream file(path_);
    if (!file.is_open()) {
        LOG_INFO("No ledger at " + path_ + ", starting with an empty history");
        return ledger;
    }

    try {
        json j;
        file >> j;
        if (!DeviceHistorySerializer::ledgerFromJson(j, ledger)) {
            LOG_WARNING("Ledger " + path_ + " has an unexpected layout, starting with an empty history");
            return KnownDeviceLedger();
        }
    } catch (const json::exception& e) {
        LOG_WARNING("Ledger " + path_ + " is corrupt (" + std::string(e.what()) +
                    "), starting with an empty history");
        return KnownDeviceLedger();
    }

    LOG_INFO("Loaded " + std::to_string(ledger.devices.size()) + " known device(s) from " + path_);
    return ledger;
}

bool LedgerStore::save(const KnownDeviceLedger& ledger) const {
    std::string content;
    try {
        // Mount points and labels come from the system verbatim and need not be UTF-8
        content = DeviceHistorySerializer::ledgerToJson(ledger).dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to serialize ledger: " + std::string(e.what()));
        return false;
    }

    if (!atomicWrites_) {
        return writeFile(path_, content);
    }

    const std::string tmpPath = path_ + ".tmp";
    if (!writeFile(tmpPath, content)) {
        std::remove(tmpPath.c_str());
        return false;
    }

    if (std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
        LOG_ERROR("Failed to replace ledger " + path_ + ": " + std::strerror(errno));
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}

bool LedgerStore::writeFile(const std::string& target, const std::string& content) const {
    std::ofstream out(target, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Failed to open " + target + " for writing");
        return false;
    }

    out << content;
    out.flush();
    if (!out.good()) {
        LOG_ERROR("Failed to write ledger to " + target);
        return false;
    }
    return true;
}
