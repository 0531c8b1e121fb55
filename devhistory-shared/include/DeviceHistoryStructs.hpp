#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace DevHistoryShared {

constexpr int LEDGER_VERSION = 2;

// One attached device as reported by the inventory source for a single poll
struct DeviceRecord {
    std::string deviceId;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> manufacturer;
    std::optional<std::string> pnpClass;

    DeviceRecord() = default;
    DeviceRecord(const std::string& id, const std::string& displayName, const std::string& cls)
        : deviceId(id), name(displayName), pnpClass(cls) {}

    // Name, falling back to description, then to "Unknown Device"
    std::string displayName() const;

    // "VVVV:PPPP" when the id carries VID_ and PID_ markers
    std::optional<std::string> vendorProductId() const;

    std::string deviceClass() const;
};

using DeviceMap = std::map<std::string, DeviceRecord>;

struct VolumeInfo {
    std::string driveLetter;
    std::string volumeName;
    uint64_t totalBytes{0};
    uint64_t freeBytes{0};
    std::string fileSystem;
    std::string volumeSerial;
};

struct StorageInfo {
    std::string model;
    std::string serialNumber;
    uint64_t totalBytes{0};
    std::string interfaceType;
    std::string mediaType;
    std::string firmware;
    uint32_t partitionCount{0};
    std::string status;
    std::vector<VolumeInfo> volumes;
};

using StorageMap = std::map<std::string, StorageInfo>;

struct KnownDevice {
    std::string deviceId;
    std::string name;
    std::string vidPid;
    std::string deviceClass;
    std::string manufacturer;
    std::string description;
    std::string firstSeen;
    std::string lastSeen;
    uint32_t timesSeen{0};
    bool currentlyConnected{false};
    std::optional<std::string> nickname;
    std::optional<StorageInfo> storageInfo;
};

using KnownDeviceMap = std::map<std::string, KnownDevice>;

struct KnownDeviceLedger {
    int version{LEDGER_VERSION};
    KnownDeviceMap devices;
};

enum class EventKind {
    CONNECT,
    DISCONNECT
};

struct DeviceEvent {
    std::string timestamp;
    EventKind kind{EventKind::CONNECT};
    std::string name;
    std::optional<std::string> vidPid;
    std::optional<std::string> manufacturer;
    std::string deviceClass;
    std::string deviceId;

    DeviceEvent() = default;
    DeviceEvent(EventKind eventKind, const DeviceRecord& record, const std::string& ts)
        : timestamp(ts), kind(eventKind), name(record.displayName()),
          vidPid(record.vendorProductId()), manufacturer(record.manufacturer),
          deviceClass(record.deviceClass()), deviceId(record.deviceId) {}
};

struct DeviceSnapshot {
    std::string deviceId;
    std::string name;
    std::optional<std::string> vidPid;
    std::optional<std::string> manufacturer;
    std::string deviceClass;

    DeviceSnapshot() = default;
    explicit DeviceSnapshot(const DeviceRecord& record)
        : deviceId(record.deviceId), name(record.displayName()),
          vidPid(record.vendorProductId()), manufacturer(record.manufacturer),
          deviceClass(record.deviceClass()) {}
};

// Read-only view handed to observers
struct AppSnapshot {
    std::vector<DeviceSnapshot> devices;
    std::vector<DeviceEvent> events;
    KnownDeviceMap knownDevices;
    StorageMap storageInfo;
    std::optional<std::string> error;
};

using SnapshotPtr = std::shared_ptr<const AppSnapshot>;

struct PendingEnrichment {
    std::string deviceId;
    std::chrono::steady_clock::time_point scheduledAt;
};

} // namespace DevHistoryShared
