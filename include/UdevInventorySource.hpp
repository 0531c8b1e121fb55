#pragma once
#include "DeviceSources.hpp"
#include <libudev.h>
#include <string>

// Enumerates usb_device entries of the usb subsystem. Device ids take the
// form USB\VID_xxxx&PID_yyyy\<serial or port path>.
class UdevInventorySource : public InventorySource {
public:
    explicit UdevInventorySource(bool includeRootHubs = false);
    ~UdevInventorySource() override;

    UdevInventorySource(const UdevInventorySource&) = delete;
    UdevInventorySource& operator=(const UdevInventorySource&) = delete;

    bool initialize(std::string& error) override;
    std::optional<DevHistoryShared::DeviceMap> queryInventory() override;

    static std::string buildDeviceId(const std::string& vendorId,
                                     const std::string& productId,
                                     const std::string& instance);

    // Devices sharing vendor, product and serial are told apart by their port path
    static std::string uniqueDeviceId(const DevHistoryShared::DeviceMap& devices,
                                      const std::string& deviceId,
                                      const std::string& portPath);

private:
    std::optional<DevHistoryShared::DeviceRecord> readDevice(struct udev_device* dev) const;
    unsigned int resolveClassCode(struct udev_device* dev) const;

    struct udev* udev_;
    bool includeRootHubs_;
};
