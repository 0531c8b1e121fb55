#pragma once
#include "../devhistory-shared/include/DeviceHistoryStructs.hpp"
#include <string>

// Whole-document JSON persistence of the known-device ledger
class LedgerStore {
public:
    explicit LedgerStore(const std::string& path, bool atomicWrites = true);

    // Missing, unreadable or corrupt documents yield an empty ledger
    DevHistoryShared::KnownDeviceLedger load() const;

    // Failures are logged; the caller keeps its in-memory copy authoritative
    bool save(const DevHistoryShared::KnownDeviceLedger& ledger) const;

    const std::string& path() const { return path_; }

private:
    bool writeFile(const std::string& target, const std::string& content) const;

    std::string path_;
    bool atomicWrites_;
};
