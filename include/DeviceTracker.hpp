#pragma once
#include "ConfigLoader.hpp"
#include "DeviceLedger.hpp"
#include "DeviceSources.hpp"
#include "EnrichmentScheduler.hpp"
#include "LedgerStore.hpp"
#include "SnapshotPublisher.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Background reconciliation loop. Polls the inventory, merges connect and
// disconnect events into the ledger, drains matured enrichment lookups,
// folds in edits made through the publisher's write API and republishes
// the snapshot when anything changed.
class DeviceTracker {
public:
    using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;
    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    DeviceTracker(const TrackerConfig& config,
                  InventorySource& inventory,
                  EnrichmentSource& enrichment,
                  SnapshotPublisher& publisher,
                  LedgerStore& store);
    ~DeviceTracker();

    DeviceTracker(const DeviceTracker&) = delete;
    DeviceTracker& operator=(const DeviceTracker&) = delete;

    void setClocks(SteadyClock steadyClock, WallClock wallClock);

    // Loads the ledger and merges the initial inventory. On failure the error
    // is published in the snapshot and polling never starts.
    bool initialize();

    // One poll iteration on the calling thread
    void tick();

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // Loop-thread state, for inspection while the loop is not running
    const DeviceLedger& ledger() const { return ledger_; }
    const DevHistoryShared::StorageMap& liveStorage() const { return liveStorage_; }
    const EnrichmentScheduler& scheduler() const { return scheduler_; }

private:
    void runLoop();
    void failStartup(const std::string& error);
    void mergeEvents(const std::vector<DevHistoryShared::DeviceEvent>& events,
                     const DevHistoryShared::DeviceMap& current,
                     const std::string& now,
                     std::chrono::steady_clock::time_point steadyNow);
    bool enrich(const std::string& deviceId, bool connected, const char* phase);
    bool drainEnrichments(const DevHistoryShared::DeviceMap& current,
                          std::chrono::steady_clock::time_point steadyNow);
    bool reconcileExternalEdits(const std::vector<DevHistoryShared::DeviceEvent>& events,
                                const DevHistoryShared::DeviceMap& current,
                                const std::string& now);
    void persist();
    std::vector<DevHistoryShared::DeviceSnapshot> buildDeviceList(const DevHistoryShared::DeviceMap& devices) const;
    std::string formatWallClock(const char* format) const;

    TrackerConfig config_;
    InventorySource& inventory_;
    EnrichmentSource& enrichment_;
    SnapshotPublisher& publisher_;
    LedgerStore& store_;

    SteadyClock steadyClock_;
    WallClock wallClock_;

    DeviceLedger ledger_;
    EnrichmentScheduler scheduler_;
    DevHistoryShared::DeviceMap prev_;
    DevHistoryShared::StorageMap liveStorage_;
    bool initialized_;

    std::atomic<bool> running_;
    std::unique_ptr<std::thread> thread_;
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
};
