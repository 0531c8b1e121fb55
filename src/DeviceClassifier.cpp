#include "DeviceClassifier.hpp"
#include <cstdio>

using DevHistoryShared::DeviceRecord;

bool DeviceClassifier::isStorageDevice(const DeviceRecord& record) {
    const std::string cls = record.pnpClass ? *record.pnpClass : "";
    const std::string name = record.name ? *record.name : "";

    return cls.find("SCSIAdapter") != std::string::npos
        || cls.find("DiskDrive") != std::string::npos
        || (cls.find("USB") != std::string::npos && name.find("Storage") != std::string::npos)
        || name.find("Mass Storage") != std::string::npos;
}

std::string DeviceClassifier::usbClassName(unsigned int classCode) {
    switch (classCode) {
        case 0x01: return "AudioEndpoint";
        case 0x02: return "Ports";
        case 0x03: return "HIDClass";
        case 0x05: return "HIDClass";
        case 0x06: return "Image";
        case 0x07: return "Printer";
        case 0x08: return "DiskDrive";
        case 0x09: return "USBHub";
        case 0x0A: return "Ports";
        case 0x0B: return "SmartCardReader";
        case 0x0E: return "Camera";
        case 0x10: return "Media";
        case 0xE0: return "Bluetooth";
        case 0xEF: return "USBDevice";
        case 0xFE: return "USBDevice";
        case 0xFF: return "USBDevice";
        default: return "USB";
    }
}

std::string DeviceClassifier::formatBytes(uint64_t bytes) {
    const uint64_t KB = 1024;
    const uint64_t MB = 1024 * KB;
    const uint64_t GB = 1024 * MB;
    const uint64_t TB = 1024 * GB;

    char buffer[32];
    if (bytes >= TB) {
        std::snprintf(buffer, sizeof(buffer), "%.2f TB", static_cast<double>(bytes) / TB);
    } else if (bytes >= GB) {
        std::snprintf(buffer, sizeof(buffer), "%.2f GB", static_cast<double>(bytes) / GB);
    } else if (bytes >= MB) {
        std::snprintf(buffer, sizeof(buffer), "%.1f MB", static_cast<double>(bytes) / MB);
    } else if (bytes >= KB) {
        std::snprintf(buffer, sizeof(buffer), "%.0f KB", static_cast<double>(bytes) / KB);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    }
    return buffer;
}
