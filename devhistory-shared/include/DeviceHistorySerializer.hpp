#pragma once

#include "DeviceHistoryStructs.hpp"
#include <string>

namespace DevHistoryShared {

// JSON codec for the persisted ledger and the published snapshot
class DeviceHistorySerializer {
public:
    static json volumeInfoToJson(const VolumeInfo& volume);
    static VolumeInfo volumeInfoFromJson(const json& jsonData);

    static json storageInfoToJson(const StorageInfo& info);
    static StorageInfo storageInfoFromJson(const json& jsonData);

    static json knownDeviceToJson(const KnownDevice& device);
    static KnownDevice knownDeviceFromJson(const std::string& deviceId, const json& jsonData);

    static json ledgerToJson(const KnownDeviceLedger& ledger);

    // False when the document is not an object carrying a devices map
    static bool ledgerFromJson(const json& jsonData, KnownDeviceLedger& ledger);

    static json deviceEventToJson(const DeviceEvent& event);

    static json deviceSnapshotToJson(const DeviceSnapshot& device);
    static json appSnapshotToJson(const AppSnapshot& snapshot);

    static std::string eventKindToString(EventKind kind);

private:
    static std::string safeGetString(const json& jsonData, const std::string& key, const std::string& defaultValue = "");
    static std::optional<std::string> safeGetOptionalString(const json& jsonData, const std::string& key);
    static uint64_t safeGetUInt(const json& jsonData, const std::string& key, uint64_t defaultValue = 0);
    static bool safeGetBool(const json& jsonData, const std::string& key, bool defaultValue = false);
};

} // namespace DevHistoryShared
