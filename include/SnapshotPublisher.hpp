#pragma once
#include "../devhistory-shared/include/DeviceHistoryStructs.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

using SnapshotObserver = std::function<void(const DevHistoryShared::SnapshotPtr&)>;

// Edits made through the write API since the tracker last collected them
struct ExternalEdits {
    std::set<std::string> forgotten;
    std::map<std::string, std::optional<std::string>> nicknames;

    bool empty() const { return forgotten.empty() && nicknames.empty(); }
};

// Holds the externally visible state. Readers receive an immutable snapshot;
// the write API replaces it copy-on-write and journals the edit so the
// tracker can fold it back into its authoritative ledger on the next tick.
class SnapshotPublisher {
public:
    SnapshotPublisher();

    DevHistoryShared::SnapshotPtr snapshot() const;
    void registerObserver(SnapshotObserver observer);

    // Trimmed text; empty text clears the nickname. False for an unknown device.
    bool setNickname(const std::string& deviceId, const std::string& text);
    bool forgetDevice(const std::string& deviceId);
    void clearEvents();

    ExternalEdits takeExternalEdits();

    // Appends newEvents to the log and replaces everything else. Edits that
    // arrived after the last takeExternalEdits() stay applied.
    void publish(std::vector<DevHistoryShared::DeviceSnapshot> devices,
                 const std::vector<DevHistoryShared::DeviceEvent>& newEvents,
                 const DevHistoryShared::KnownDeviceMap& knownDevices,
                 const DevHistoryShared::StorageMap& storageInfo);

    void publishError(const std::string& error);

    uint64_t publishCount() const;

private:
    void notifyObservers(const DevHistoryShared::SnapshotPtr& snapshot);
    static void sortByDisplayName(std::vector<DevHistoryShared::DeviceSnapshot>& devices);

    mutable std::mutex mutex_;
    DevHistoryShared::SnapshotPtr current_;
    ExternalEdits pendingEdits_;
    uint64_t publishCount_;

    std::mutex observersMutex_;
    std::vector<SnapshotObserver> observers_;
};
