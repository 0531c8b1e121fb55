#pragma once
#include "../devhistory-shared/include/DeviceHistoryStructs.hpp"
#include <cstdint>
#include <string>

class DeviceClassifier {
public:
    // Storage devices get a deferred enrichment lookup after connect
    static bool isStorageDevice(const DevHistoryShared::DeviceRecord& record);

    // Maps a USB base class code (bDeviceClass / bInterfaceClass) to a class tag
    static std::string usbClassName(unsigned int classCode);

    static std::string formatBytes(uint64_t bytes);
};
