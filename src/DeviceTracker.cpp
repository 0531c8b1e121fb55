#include "DeviceTracker.hpp"
#include "DeviceClassifier.hpp"
#include "InventoryDiff.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace DevHistoryShared;

DeviceTracker::DeviceTracker(const TrackerConfig& config,
                             InventorySource& inventory,
                             EnrichmentSource& enrichment,
                             SnapshotPublisher& publisher,
                             LedgerStore& store)
    : config_(config), inventory_(inventory), enrichment_(enrichment),
      publisher_(publisher), store_(store),
      steadyClock_([]() { return std::chrono::steady_clock::now(); }),
      wallClock_([]() { return std::chrono::system_clock::now(); }),
      scheduler_(std::chrono::milliseconds(config.enrichmentGraceMs),
                 static_cast<size_t>(config.maxEnrichmentsPerTick)),
      initialized_(false), running_(false) {}

DeviceTracker::~DeviceTracker() {
    stop();
}

void DeviceTracker::setClocks(SteadyClock steadyClock, WallClock wallClock) {
    steadyClock_ = steadyClock;
    wallClock_ = wallClock;
}

bool DeviceTracker::initialize() {
    std::string error;
    if (!inventory_.initialize(error)) {
        failStartup(error.empty() ? "Device inventory initialization failed" : error);
        return false;
    }

    auto initial = inventory_.queryInventory();
    if (!initial) {
        failStartup("Failed to query USB devices");
        return false;
    }

    ledger_ = DeviceLedger(store_.load());
    ledger_.markAllDisconnected();

    const std::string now = formatWallClock("%Y-%m-%d %H:%M:%S");
    for (const auto& pair : *initial) {
        ledger_.recordPresentAtStartup(pair.second, now);
    }
    persist();

    // Volumes of drives attached before startup are already mounted
    for (const auto& pair : *initial) {
        if (DeviceClassifier::isStorageDevice(pair.second)) {
            enrich(pair.first, true, "startup");
        }
    }

    prev_ = std::move(*initial);
    publisher_.publish(buildDeviceList(prev_), {}, ledger_.devices(), liveStorage_);
    initialized_ = true;

    LOG_INFO("Started monitoring - " + std::to_string(prev_.size()) + " devices, " +
             std::to_string(ledger_.size()) + " known");
    return true;
}

void DeviceTracker::tick() {
    if (!initialized_) {
        LOG_WARNING("Tick requested before initialization");
        return;
    }

    auto queried = inventory_.queryInventory();
    if (!queried) {
        LOG_WARNING("Device inventory query failed, skipping this poll");
        return;
    }
    DeviceMap current = std::move(*queried);

    const auto steadyNow = steadyClock_();
    const std::string eventTime = formatWallClock("%H:%M:%S");
    const std::string now = formatWallClock("%Y-%m-%d %H:%M:%S");

    auto events = InventoryDiff::computeEvents(prev_, current, eventTime);
    if (!events.empty()) {
        mergeEvents(events, current, now, steadyNow);
        persist();
    }

    bool enriched = drainEnrichments(current, steadyNow);
    bool reconciled = reconcileExternalEdits(events, current, now);

    if (!events.empty() || enriched || reconciled || prev_.size() != current.size()) {
        publisher_.publish(buildDeviceList(current), events, ledger_.devices(), liveStorage_);
    }

    prev_ = std::move(current);
}

bool DeviceTracker::start() {
    if (running_) return true;

    if (!initialized_ && !initialize()) {
        return false;
    }

    running_ = true;
    thread_ = std::make_unique<std::thread>(&DeviceTracker::runLoop, this);

    LOG_INFO("Device tracker started, polling every " + std::to_string(config_.pollIntervalMs) + " ms");
    return true;
}

void DeviceTracker::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        if (!running_) return;
        running_ = false;
    }
    waitCv_.notify_all();

    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();

    LOG_INFO("Device tracker stopped");
}

void DeviceTracker::runLoop() {
    const auto interval = std::chrono::milliseconds(config_.pollIntervalMs);

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(waitMutex_);
            waitCv_.wait_for(lock, interval, [this]() { return !running_; });
        }
        if (!running_) break;

        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Exception in tracker loop: " + std::string(e.what()));
        }
    }
}

void DeviceTracker::failStartup(const std::string& error) {
    LOG_ERROR(error);
    publisher_.publishError(error);
}

void DeviceTracker::mergeEvents(const std::vector<DeviceEvent>& events,
                                const DeviceMap& current,
                                const std::string& now,
                                std::chrono::steady_clock::time_point steadyNow) {
    for (const auto& event : events) {
        const std::string vidPid = event.vidPid ? *event.vidPid : "?";

        if (event.kind == EventKind::DISCONNECT) {
            LOG_INFO("DISCONNECT: " + event.name + " [" + vidPid + "] | " + event.deviceId);
            ledger_.recordDisconnect(event.deviceId, now);
            liveStorage_.erase(event.deviceId);
            continue;
        }

        auto it = current.find(event.deviceId);
        if (it == current.end()) {
            continue;
        }

        LOG_INFO("CONNECT: " + event.name + " [" + vidPid + "] | " + event.deviceId);
        ledger_.recordConnect(it->second, now);

        if (DeviceClassifier::isStorageDevice(it->second)) {
            scheduler_.schedule(event.deviceId, steadyNow);
        }
    }
}

bool DeviceTracker::enrich(const std::string& deviceId, bool connected, const char* phase) {
    auto info = enrichment_.queryEnrichment(deviceId);
    if (!info) {
        LOG_DEBUG(std::string("Enrichment (") + phase + ") found no storage for " + deviceId);
        return false;
    }

    std::string letters;
    for (const auto& volume : info->volumes) {
        if (!letters.empty()) letters += ", ";
        letters += volume.driveLetter;
    }
    LOG_INFO(std::string("ENRICHED (") + phase + "): " + deviceId + " -> " + info->model + " [" + letters + "]");

    if (connected) {
        liveStorage_[deviceId] = *info;
    }
    if (ledger_.attachStorageInfo(deviceId, *info)) {
        persist();
    }
    return true;
}

bool DeviceTracker::drainEnrichments(const DeviceMap& current, std::chrono::steady_clock::time_point steadyNow) {
    bool enriched = false;
    for (const auto& deviceId : scheduler_.takeReady(steadyNow)) {
        bool connected = current.find(deviceId) != current.end();
        if (enrich(deviceId, connected, "deferred")) {
            enriched = true;
        }
    }
    return enriched;
}

bool DeviceTracker::reconcileExternalEdits(const std::vector<DeviceEvent>& events,
                                           const DeviceMap& current,
                                           const std::string& now) {
    ExternalEdits edits = publisher_.takeExternalEdits();
    if (edits.empty()) {
        return false;
    }

    bool changed = false;
    for (const auto& deviceId : edits.forgotten) {
        liveStorage_.erase(deviceId);
        if (ledger_.forget(deviceId)) {
            LOG_INFO("Removed forgotten device from ledger: " + deviceId);
            changed = true;
        }

        // A reconnect merged in this tick belongs to the new history, not the forgotten one
        auto reconnected = std::find_if(events.begin(), events.end(), [&deviceId](const DeviceEvent& event) {
            return event.kind == EventKind::CONNECT && event.deviceId == deviceId;
        });
        auto record = current.find(deviceId);
        if (reconnected != events.end() && record != current.end()) {
            ledger_.recordConnect(record->second, now);
            LOG_INFO("Forgotten device reconnected, starting a new history: " + deviceId);
        }
    }

    for (const auto& pair : edits.nicknames) {
        if (ledger_.setNickname(pair.first, pair.second)) {
            changed = true;
        }
    }

    if (changed) {
        persist();
    }
    return changed;
}

void DeviceTracker::persist() {
    if (!store_.save(ledger_.document())) {
        LOG_WARNING("Ledger not persisted; in-memory history remains authoritative");
    }
}

std::vector<DeviceSnapshot> DeviceTracker::buildDeviceList(const DeviceMap& devices) const {
    std::vector<DeviceSnapshot> list;
    list.reserve(devices.size());
    for (const auto& pair : devices) {
        list.emplace_back(pair.second);
    }
    return list;
}

std::string DeviceTracker::formatWallClock(const char* format) const {
    std::time_t time = std::chrono::system_clock::to_time_t(wallClock_());
    std::tm localTm{};
    localtime_r(&time, &localTm);

    std::stringstream ss;
    ss << std::put_time(&localTm, format);
    return ss.str();
}
