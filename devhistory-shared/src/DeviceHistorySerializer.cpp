#include "DeviceHistorySerializer.hpp"

namespace DevHistoryShared {

json DeviceHistorySerializer::volumeInfoToJson(const VolumeInfo& volume) {
    json volumeJson;
    volumeJson["drive_letter"] = volume.driveLetter;
    volumeJson["volume_name"] = volume.volumeName;
    volumeJson["total_bytes"] = volume.totalBytes;
    volumeJson["free_bytes"] = volume.freeBytes;
    volumeJson["file_system"] = volume.fileSystem;
    volumeJson["volume_serial"] = volume.volumeSerial;
    return volumeJson;
}

VolumeInfo DeviceHistorySerializer::volumeInfoFromJson(const json& jsonData) {
    VolumeInfo volume;
    volume.driveLetter = safeGetString(jsonData, "drive_letter");
    volume.volumeName = safeGetString(jsonData, "volume_name");
    volume.totalBytes = safeGetUInt(jsonData, "total_bytes");
    volume.freeBytes = safeGetUInt(jsonData, "free_bytes");
    volume.fileSystem = safeGetString(jsonData, "file_system");
    volume.volumeSerial = safeGetString(jsonData, "volume_serial");
    return volume;
}

json DeviceHistorySerializer::storageInfoToJson(const StorageInfo& info) {
    json infoJson;
    infoJson["model"] = info.model;
    infoJson["serial_number"] = info.serialNumber;
    infoJson["total_bytes"] = info.totalBytes;
    infoJson["interface_type"] = info.interfaceType;
    infoJson["media_type"] = info.mediaType;
    infoJson["firmware"] = info.firmware;
    infoJson["partition_count"] = info.partitionCount;
    infoJson["status"] = info.status;

    json volumesJson = json::array();
    for (const auto& volume : info.volumes) {
        volumesJson.push_back(volumeInfoToJson(volume));
    }
    infoJson["volumes"] = volumesJson;
    return infoJson;
}

StorageInfo DeviceHistorySerializer::storageInfoFromJson(const json& jsonData) {
    StorageInfo info;
    info.model = safeGetString(jsonData, "model");
    info.serialNumber = safeGetString(jsonData, "serial_number");
    info.totalBytes = safeGetUInt(jsonData, "total_bytes");
    info.interfaceType = safeGetString(jsonData, "interface_type");
    info.mediaType = safeGetString(jsonData, "media_type");
    info.firmware = safeGetString(jsonData, "firmware");
    info.partitionCount = static_cast<uint32_t>(safeGetUInt(jsonData, "partition_count"));
    info.status = safeGetString(jsonData, "status");

    if (jsonData.contains("volumes") && jsonData["volumes"].is_array()) {
        for (const auto& volumeJson : jsonData["volumes"]) {
            if (volumeJson.is_object()) {
                info.volumes.push_back(volumeInfoFromJson(volumeJson));
            }
        }
    }
    return info;
}

json DeviceHistorySerializer::knownDeviceToJson(const KnownDevice& device) {
    json deviceJson;
    deviceJson["device_id"] = device.deviceId;
    deviceJson["name"] = device.name;
    deviceJson["vid_pid"] = device.vidPid;
    deviceJson["class"] = device.deviceClass;
    deviceJson["manufacturer"] = device.manufacturer;
    deviceJson["description"] = device.description;
    deviceJson["first_seen"] = device.firstSeen;
    deviceJson["last_seen"] = device.lastSeen;
    deviceJson["times_seen"] = device.timesSeen;
    deviceJson["currently_connected"] = device.currentlyConnected;
    deviceJson["nickname"] = device.nickname ? json(*device.nickname) : json(nullptr);
    deviceJson["storage_info"] = device.storageInfo ? storageInfoToJson(*device.storageInfo) : json(nullptr);
    return deviceJson;
}

KnownDevice DeviceHistorySerializer::knownDeviceFromJson(const std::string& deviceId, const json& jsonData) {
    KnownDevice device;
    device.deviceId = safeGetString(jsonData, "device_id", deviceId);
    device.name = safeGetString(jsonData, "name");
    device.vidPid = safeGetString(jsonData, "vid_pid");
    device.deviceClass = safeGetString(jsonData, "class");
    device.manufacturer = safeGetString(jsonData, "manufacturer");
    device.description = safeGetString(jsonData, "description");
    device.firstSeen = safeGetString(jsonData, "first_seen");
    device.lastSeen = safeGetString(jsonData, "last_seen", device.firstSeen);
    device.timesSeen = static_cast<uint32_t>(safeGetUInt(jsonData, "times_seen", 1));
    if (device.timesSeen == 0) {
        device.timesSeen = 1;
    }
    device.currentlyConnected = safeGetBool(jsonData, "currently_connected");
    device.nickname = safeGetOptionalString(jsonData, "nickname");

    if (jsonData.contains("storage_info") && jsonData["storage_info"].is_object()) {
        device.storageInfo = storageInfoFromJson(jsonData["storage_info"]);
    }
    return device;
}

json DeviceHistorySerializer::ledgerToJson(const KnownDeviceLedger& ledger) {
    json ledgerJson;
    ledgerJson["version"] = ledger.version;

    json devicesJson = json::object();
    for (const auto& pair : ledger.devices) {
        devicesJson[pair.first] = knownDeviceToJson(pair.second);
    }
    ledgerJson["devices"] = devicesJson;
    return ledgerJson;
}

bool DeviceHistorySerializer::ledgerFromJson(const json& jsonData, KnownDeviceLedger& ledger) {
    if (!jsonData.is_object() || !jsonData.contains("devices") || !jsonData["devices"].is_object()) {
        return false;
    }

    ledger.version = static_cast<int>(safeGetUInt(jsonData, "version", LEDGER_VERSION));
    ledger.devices.clear();

    const json& devicesJson = jsonData["devices"];
    for (auto it = devicesJson.begin(); it != devicesJson.end(); ++it) {
        if (!it.value().is_object()) {
            continue;
        }
        ledger.devices[it.key()] = knownDeviceFromJson(it.key(), it.value());
    }
    return true;
}

json DeviceHistorySerializer::deviceEventToJson(const DeviceEvent& event) {
    json eventJson;
    eventJson["timestamp"] = event.timestamp;
    eventJson["kind"] = eventKindToString(event.kind);
    eventJson["name"] = event.name;
    eventJson["vid_pid"] = event.vidPid ? json(*event.vidPid) : json(nullptr);
    eventJson["manufacturer"] = event.manufacturer ? json(*event.manufacturer) : json(nullptr);
    eventJson["class"] = event.deviceClass;
    eventJson["device_id"] = event.deviceId;
    return eventJson;
}

json DeviceHistorySerializer::deviceSnapshotToJson(const DeviceSnapshot& device) {
    json deviceJson;
    deviceJson["device_id"] = device.deviceId;
    deviceJson["name"] = device.name;
    deviceJson["vid_pid"] = device.vidPid ? json(*device.vidPid) : json(nullptr);
    deviceJson["manufacturer"] = device.manufacturer ? json(*device.manufacturer) : json(nullptr);
    deviceJson["class"] = device.deviceClass;
    return deviceJson;
}

json DeviceHistorySerializer::appSnapshotToJson(const AppSnapshot& snapshot) {
    json snapshotJson;

    json devicesJson = json::array();
    for (const auto& device : snapshot.devices) {
        devicesJson.push_back(deviceSnapshotToJson(device));
    }
    snapshotJson["devices"] = devicesJson;

    json eventsJson = json::array();
    for (const auto& event : snapshot.events) {
        eventsJson.push_back(deviceEventToJson(event));
    }
    snapshotJson["events"] = eventsJson;

    json knownJson = json::object();
    for (const auto& pair : snapshot.knownDevices) {
        knownJson[pair.first] = knownDeviceToJson(pair.second);
    }
    snapshotJson["known_devices"] = knownJson;

    json storageJson = json::object();
    for (const auto& pair : snapshot.storageInfo) {
        storageJson[pair.first] = storageInfoToJson(pair.second);
    }
    snapshotJson["storage_info"] = storageJson;

    snapshotJson["error"] = snapshot.error ? json(*snapshot.error) : json(nullptr);
    return snapshotJson;
}

std::string DeviceHistorySerializer::eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::CONNECT: return "connect";
        case EventKind::DISCONNECT: return "disconnect";
        default: return "connect";
    }
}

std::string DeviceHistorySerializer::safeGetString(const json& jsonData, const std::string& key, const std::string& defaultValue) {
    if (jsonData.contains(key) && jsonData[key].is_string()) {
        return jsonData[key].get<std::string>();
    }
    return defaultValue;
}

std::optional<std::string> DeviceHistorySerializer::safeGetOptionalString(const json& jsonData, const std::string& key) {
    if (jsonData.contains(key) && jsonData[key].is_string()) {
        return jsonData[key].get<std::string>();
    }
    return std::nullopt;
}

uint64_t DeviceHistorySerializer::safeGetUInt(const json& jsonData, const std::string& key, uint64_t defaultValue) {
    if (jsonData.contains(key) && jsonData[key].is_number_unsigned()) {
        return jsonData[key].get<uint64_t>();
    }
    if (jsonData.contains(key) && jsonData[key].is_number_integer() && jsonData[key].get<int64_t>() >= 0) {
        return static_cast<uint64_t>(jsonData[key].get<int64_t>());
    }
    return defaultValue;
}

bool DeviceHistorySerializer::safeGetBool(const json& jsonData, const std::string& key, bool defaultValue) {
    if (jsonData.contains(key) && jsonData[key].is_boolean()) {
        return jsonData[key].get<bool>();
    }
    return defaultValue;
}

} // namespace DevHistoryShared
