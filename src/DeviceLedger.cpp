#include "DeviceLedger.hpp"
#include "Logger.hpp"

using namespace DevHistoryShared;

DeviceLedger::DeviceLedger(KnownDeviceLedger document) : document_(std::move(document)) {
    document_.version = LEDGER_VERSION;
}

void DeviceLedger::markAllDisconnected() {
    for (auto& pair : document_.devices) {
        pair.second.currentlyConnected = false;
    }
}

bool DeviceLedger::recordPresentAtStartup(const DeviceRecord& record, const std::string& now) {
    auto it = document_.devices.find(record.deviceId);
    if (it == document_.devices.end()) {
        insertNew(record, now);
        return true;
    }

    KnownDevice& device = it->second;
    device.lastSeen = now;
    device.currentlyConnected = true;
    refreshDescriptiveFields(device, record);
    return false;
}

bool DeviceLedger::recordConnect(const DeviceRecord& record, const std::string& now) {
    auto it = document_.devices.find(record.deviceId);
    if (it == document_.devices.end()) {
        insertNew(record, now);
        return true;
    }

    KnownDevice& device = it->second;
    device.timesSeen += 1;
    device.lastSeen = now;
    device.currentlyConnected = true;
    refreshDescriptiveFields(device, record);
    return false;
}

bool DeviceLedger::recordDisconnect(const std::string& deviceId, const std::string& now) {
    auto it = document_.devices.find(deviceId);
    if (it == document_.devices.end()) {
        return false;
    }
    it->second.lastSeen = now;
    it->second.currentlyConnected = false;
    return true;
}

bool DeviceLedger::attachStorageInfo(const std::string& deviceId, const StorageInfo& info) {
    auto it = document_.devices.find(deviceId);
    if (it == document_.devices.end()) {
        return false;
    }
    it->second.storageInfo = info;
    return true;
}

bool DeviceLedger::forget(const std::string& deviceId) {
    return document_.devices.erase(deviceId) > 0;
}

bool DeviceLedger::setNickname(const std::string& deviceId, const std::optional<std::string>& nickname) {
    auto it = document_.devices.find(deviceId);
    if (it == document_.devices.end() || it->second.nickname == nickname) {
        return false;
    }
    it->second.nickname = nickname;
    return true;
}

const KnownDevice* DeviceLedger::find(const std::string& deviceId) const {
    auto it = document_.devices.find(deviceId);
    if (it != document_.devices.end()) {
        return &it->second;
    }
    return nullptr;
}

KnownDevice& DeviceLedger::insertNew(const DeviceRecord& record, const std::string& now) {
    KnownDevice device;
    device.deviceId = record.deviceId;
    device.firstSeen = now;
    device.lastSeen = now;
    device.timesSeen = 1;
    device.currentlyConnected = true;
    refreshDescriptiveFields(device, record);

    LOG_DEBUG("New device added to ledger: " + record.deviceId);
    return document_.devices[record.deviceId] = device;
}

void DeviceLedger::refreshDescriptiveFields(KnownDevice& device, const DeviceRecord& record) {
    device.name = record.displayName();
    device.vidPid = record.vendorProductId().value_or("");
    device.deviceClass = record.deviceClass();
    device.manufacturer = record.manufacturer.value_or("");
    device.description = record.description.value_or("");
}
