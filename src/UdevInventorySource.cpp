#include "UdevInventorySource.hpp"
#include "DeviceClassifier.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

using namespace DevHistoryShared;

namespace {

const char* LINUX_FOUNDATION_VENDOR = "1d6b";

std::optional<std::string> nonEmpty(const char* value) {
    if (value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

unsigned int parseHex(const char* value) {
    if (!value || !*value) {
        return 0;
    }
    return static_cast<unsigned int>(std::strtoul(value, nullptr, 16));
}

bool isPrintableSerial(const std::string& serial) {
    return !serial.empty() &&
           std::all_of(serial.begin(), serial.end(), [](unsigned char c) {
               return std::isgraph(c) && c != '\\';
           });
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

UdevInventorySource::UdevInventorySource(bool includeRootHubs)
    : udev_(nullptr), includeRootHubs_(includeRootHubs) {}

UdevInventorySource::~UdevInventorySource() {
    if (udev_) {
        udev_unref(udev_);
        udev_ = nullptr;
    }
}

bool UdevInventorySource::initialize(std::string& error) {
    if (udev_) {
        return true;
    }

    udev_ = udev_new();
    if (!udev_) {
        error = "Failed to create udev context";
        return false;
    }

    LOG_DEBUG("udev context created for USB inventory");
    return true;
}

std::optional<DeviceMap> UdevInventorySource::queryInventory() {
    if (!udev_) {
        LOG_ERROR("USB inventory queried before initialization");
        return std::nullopt;
    }

    struct udev_enumerate* enumerate = udev_enumerate_new(udev_);
    if (!enumerate) {
        LOG_ERROR("Failed to create udev enumerate");
        return std::nullopt;
    }

    udev_enumerate_add_match_subsystem(enumerate, "usb");
    udev_enumerate_add_match_property(enumerate, "DEVTYPE", "usb_device");
    if (udev_enumerate_scan_devices(enumerate) < 0) {
        LOG_WARNING("udev scan of USB devices failed");
        udev_enumerate_unref(enumerate);
        return std::nullopt;
    }

    DeviceMap devices;
    struct udev_list_entry* entries = udev_enumerate_get_list_entry(enumerate);
    struct udev_list_entry* entry;

    udev_list_entry_foreach(entry, entries) {
        const char* path = udev_list_entry_get_name(entry);
        struct udev_device* dev = udev_device_new_from_syspath(udev_, path);
        if (!dev) {
            continue;
        }

        auto record = readDevice(dev);
        if (record) {
            const char* sysname = udev_device_get_sysname(dev);
            record->deviceId = uniqueDeviceId(devices, record->deviceId, sysname ? sysname : "");
            devices[record->deviceId] = *record;
        }
        udev_device_unref(dev);
    }

    udev_enumerate_unref(enumerate);
    return devices;
}

std::string UdevInventorySource::buildDeviceId(const std::string& vendorId,
                                               const std::string& productId,
                                               const std::string& instance) {
    return "USB\\VID_" + toUpper(vendorId) + "&PID_" + toUpper(productId) + "\\" + instance;
}

std::string UdevInventorySource::uniqueDeviceId(const DeviceMap& devices,
                                               const std::string& deviceId,
                                               const std::string& portPath) {
    if (devices.find(deviceId) == devices.end() || portPath.empty()) {
        return deviceId;
    }

    std::string candidate = deviceId + "&" + portPath;
    if (devices.find(candidate) != devices.end()) {
        LOG_WARNING("Duplicate USB device id even with port path: " + candidate);
    } else {
        LOG_DEBUG("Duplicate serial, device id extended with port path: " + candidate);
    }
    return candidate;
}

std::optional<DeviceRecord> UdevInventorySource::readDevice(struct udev_device* dev) const {
    const char* idVendor = udev_device_get_sysattr_value(dev, "idVendor");
    const char* idProduct = udev_device_get_sysattr_value(dev, "idProduct");
    if (!idVendor || !idProduct) {
        return std::nullopt;
    }

    if (!includeRootHubs_ && std::string(idVendor) == LINUX_FOUNDATION_VENDOR) {
        return std::nullopt;
    }

    // Serial-less devices fall back to their port path (e.g. 1-2.3), which is stable per port
    std::string instance;
    const char* serial = udev_device_get_sysattr_value(dev, "serial");
    if (serial && isPrintableSerial(serial)) {
        instance = serial;
    } else {
        const char* sysname = udev_device_get_sysname(dev);
        instance = sysname ? sysname : "";
    }
    if (instance.empty()) {
        return std::nullopt;
    }

    DeviceRecord record;
    record.deviceId = buildDeviceId(idVendor, idProduct, instance);

    record.name = nonEmpty(udev_device_get_sysattr_value(dev, "product"));
    auto modelFromDb = nonEmpty(udev_device_get_property_value(dev, "ID_MODEL_FROM_DATABASE"));
    if (!record.name) {
        record.name = modelFromDb;
    }
    record.description = modelFromDb;

    record.manufacturer = nonEmpty(udev_device_get_sysattr_value(dev, "manufacturer"));
    if (!record.manufacturer) {
        record.manufacturer = nonEmpty(udev_device_get_property_value(dev, "ID_VENDOR_FROM_DATABASE"));
    }

    record.pnpClass = DeviceClassifier::usbClassName(resolveClassCode(dev));
    return record;
}

unsigned int UdevInventorySource::resolveClassCode(struct udev_device* dev) const {
    unsigned int deviceClass = parseHex(udev_device_get_sysattr_value(dev, "bDeviceClass"));

    // 0x00 and 0xEF defer the class to the interfaces
    if (deviceClass != 0x00 && deviceClass != 0xEF) {
        return deviceClass;
    }

    struct udev_enumerate* enumerate = udev_enumerate_new(udev_);
    if (!enumerate) {
        return deviceClass;
    }

    udev_enumerate_add_match_parent(enumerate, dev);
    udev_enumerate_add_match_property(enumerate, "DEVTYPE", "usb_interface");
    udev_enumerate_scan_devices(enumerate);

    unsigned int resolved = deviceClass;
    struct udev_list_entry* entries = udev_enumerate_get_list_entry(enumerate);
    struct udev_list_entry* entry;

    udev_list_entry_foreach(entry, entries) {
        struct udev_device* iface = udev_device_new_from_syspath(udev_, udev_list_entry_get_name(entry));
        if (!iface) {
            continue;
        }

        unsigned int ifaceClass = parseHex(udev_device_get_sysattr_value(iface, "bInterfaceClass"));
        udev_device_unref(iface);

        // Mass storage wins over any other interface of a composite device
        if (ifaceClass == 0x08) {
            resolved = ifaceClass;
            break;
        }
        if ((resolved == 0x00 || resolved == 0xEF) && ifaceClass != 0x00) {
            resolved = ifaceClass;
        }
    }

    udev_enumerate_unref(enumerate);
    return resolved;
}
