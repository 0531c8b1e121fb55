#pragma once
#include "../devhistory-shared/include/DeviceHistoryStructs.hpp"
#include <optional>
#include <string>

// In-memory history of every device ever seen. Owned by the tracker thread;
// not synchronized.
class DeviceLedger {
public:
    DeviceLedger() = default;
    explicit DeviceLedger(DevHistoryShared::KnownDeviceLedger document);

    void markAllDisconnected();

    // Startup merge: creates unknown devices, re-marks known ones connected
    // without counting a new sighting. Returns true for a new entry.
    bool recordPresentAtStartup(const DevHistoryShared::DeviceRecord& record, const std::string& now);

    // Returns true when a new entry was created
    bool recordConnect(const DevHistoryShared::DeviceRecord& record, const std::string& now);

    // Returns false when the device is not in the ledger
    bool recordDisconnect(const std::string& deviceId, const std::string& now);

    bool attachStorageInfo(const std::string& deviceId, const DevHistoryShared::StorageInfo& info);
    bool forget(const std::string& deviceId);

    // Returns true only when the stored nickname actually changed
    bool setNickname(const std::string& deviceId, const std::optional<std::string>& nickname);

    const DevHistoryShared::KnownDevice* find(const std::string& deviceId) const;
    const DevHistoryShared::KnownDeviceMap& devices() const { return document_.devices; }
    const DevHistoryShared::KnownDeviceLedger& document() const { return document_; }
    size_t size() const { return document_.devices.size(); }

private:
    DevHistoryShared::KnownDevice& insertNew(const DevHistoryShared::DeviceRecord& record, const std::string& now);
    static void refreshDescriptiveFields(DevHistoryShared::KnownDevice& device,
                                         const DevHistoryShared::DeviceRecord& record);

    DevHistoryShared::KnownDeviceLedger document_;
};
