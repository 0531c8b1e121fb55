#include "UdevStorageEnricher.hpp"
#include "Logger.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <sys/statvfs.h>

using namespace DevHistoryShared;

namespace {

std::string propertyOrEmpty(struct udev_device* dev, const char* key) {
    const char* value = udev_device_get_property_value(dev, key);
    return value ? value : "";
}

std::string trimmed(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string toUpper(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

} // namespace

UdevStorageEnricher::UdevStorageEnricher(const std::string& mountTablePath)
    : mountTablePath_(mountTablePath) {}

std::optional<StorageInfo> UdevStorageEnricher::queryEnrichment(const std::string& deviceId) {
    const std::string suffix = StorageMatcher::serialSuffix(deviceId);
    if (suffix.empty()) {
        return std::nullopt;
    }

    struct udev* udev = udev_new();
    if (!udev) {
        LOG_WARNING("ENRICH FAIL: failed to create udev context");
        return std::nullopt;
    }

    std::vector<DriveCandidate> drives = enumerateDrives(udev);

    std::string summary;
    for (const auto& drive : drives) {
        if (!summary.empty()) summary += ", ";
        summary += (drive.model.empty() ? "?" : drive.model) + "|" +
                   (drive.serialNumber.empty() ? "?" : trimmed(drive.serialNumber)) + "|" +
                   (drive.bus.empty() ? "?" : drive.bus);
    }
    LOG_DEBUG("ENRICH: usb_serial=" + suffix + ", found " + std::to_string(drives.size()) +
              " drives: [" + summary + "]");

    auto index = StorageMatcher::selectDrive(drives, suffix);
    if (!index) {
        LOG_DEBUG("ENRICH FAIL: no drive matched usb_serial=" + suffix);
        udev_unref(udev);
        return std::nullopt;
    }

    const DriveCandidate& matched = drives[*index];

    StorageInfo info;
    info.model = matched.model;
    info.serialNumber = trimmed(matched.serialNumber);
    info.totalBytes = matched.sizeBytes;
    info.interfaceType = matched.bus.empty() ? "USB" : toUpper(matched.bus);
    info.mediaType = matched.removable ? "Removable Media" : "External hard disk media";
    info.firmware = matched.firmware;
    info.status = "OK";
    info.volumes = queryVolumes(udev, matched, info.partitionCount);

    udev_unref(udev);

    LOG_DEBUG("ENRICH: matched drive=" + info.model + " serial=" + info.serialNumber + " -> " +
              std::to_string(info.volumes.size()) + " volumes");
    return info;
}

std::vector<DriveCandidate> UdevStorageEnricher::enumerateDrives(struct udev* udev) const {
    std::vector<DriveCandidate> drives;

    struct udev_enumerate* enumerate = udev_enumerate_new(udev);
    if (!enumerate) {
        LOG_WARNING("ENRICH FAIL: failed to create udev enumerate");
        return drives;
    }

    udev_enumerate_add_match_subsystem(enumerate, "block");
    udev_enumerate_add_match_property(enumerate, "DEVTYPE", "disk");
    udev_enumerate_scan_devices(enumerate);

    struct udev_list_entry* entries = udev_enumerate_get_list_entry(enumerate);
    struct udev_list_entry* entry;

    udev_list_entry_foreach(entry, entries) {
        const char* path = udev_list_entry_get_name(entry);
        struct udev_device* dev = udev_device_new_from_syspath(udev, path);
        if (!dev) {
            continue;
        }

        DriveCandidate drive;
        drive.syspath = path;
        const char* devnode = udev_device_get_devnode(dev);
        drive.devnode = devnode ? devnode : "";
        drive.model = propertyOrEmpty(dev, "ID_MODEL");
        drive.serialNumber = propertyOrEmpty(dev, "ID_SERIAL_SHORT");
        drive.bus = propertyOrEmpty(dev, "ID_BUS");
        drive.firmware = propertyOrEmpty(dev, "ID_REVISION");

        const char* removable = udev_device_get_sysattr_value(dev, "removable");
        drive.removable = removable && std::string(removable) == "1";

        // size is reported in 512-byte sectors regardless of the logical block size
        const char* size = udev_device_get_sysattr_value(dev, "size");
        if (size) {
            try {
                drive.sizeBytes = std::stoull(size) * 512ULL;
            } catch (const std::exception& e) {
                LOG_DEBUG("ENRICH: unreadable size for " + drive.syspath + ": " + e.what());
            }
        }

        drives.push_back(drive);
        udev_device_unref(dev);
    }

    udev_enumerate_unref(enumerate);
    return drives;
}

std::vector<VolumeInfo> UdevStorageEnricher::queryVolumes(struct udev* udev,
                                                          const DriveCandidate& drive,
                                                          uint32_t& partitionCount) const {
    std::vector<VolumeInfo> volumes;
    partitionCount = 0;

    struct udev_device* disk = udev_device_new_from_syspath(udev, drive.syspath.c_str());
    if (!disk) {
        LOG_DEBUG("ENRICH: disk vanished before volume lookup: " + drive.syspath);
        return volumes;
    }

    const auto mounts = readMountTable();

    struct udev_enumerate* enumerate = udev_enumerate_new(udev);
    if (!enumerate) {
        udev_device_unref(disk);
        return volumes;
    }

    // Parent match includes the disk itself, which covers superfloppy layouts
    udev_enumerate_add_match_parent(enumerate, disk);
    udev_enumerate_add_match_subsystem(enumerate, "block");
    udev_enumerate_scan_devices(enumerate);

    struct udev_list_entry* entries = udev_enumerate_get_list_entry(enumerate);
    struct udev_list_entry* entry;

    udev_list_entry_foreach(entry, entries) {
        struct udev_device* dev = udev_device_new_from_syspath(udev, udev_list_entry_get_name(entry));
        if (!dev) {
            continue;
        }

        const char* devtype = udev_device_get_devtype(dev);
        if (devtype && std::string(devtype) == "partition") {
            ++partitionCount;
        }

        const char* devnode = udev_device_get_devnode(dev);
        auto mountIt = devnode ? mounts.find(devnode) : mounts.end();
        if (mountIt == mounts.end()) {
            udev_device_unref(dev);
            continue;
        }

        VolumeInfo volume;
        volume.driveLetter = mountIt->second.mountPoint;
        volume.volumeName = propertyOrEmpty(dev, "ID_FS_LABEL");
        volume.fileSystem = propertyOrEmpty(dev, "ID_FS_TYPE");
        if (volume.fileSystem.empty()) {
            volume.fileSystem = mountIt->second.fileSystem;
        }
        volume.volumeSerial = propertyOrEmpty(dev, "ID_FS_UUID");

        struct statvfs stats;
        if (statvfs(volume.driveLetter.c_str(), &stats) == 0) {
            volume.totalBytes = static_cast<uint64_t>(stats.f_blocks) * stats.f_frsize;
            volume.freeBytes = static_cast<uint64_t>(stats.f_bavail) * stats.f_frsize;
        } else {
            LOG_DEBUG("ENRICH: statvfs failed for " + volume.driveLetter);
        }

        volumes.push_back(volume);
        udev_device_unref(dev);
    }

    udev_enumerate_unref(enumerate);
    udev_device_unref(disk);

    LOG_DEBUG("ENRICH: " + drive.devnode + " has " + std::to_string(volumes.size()) + " mounted volumes");
    return volumes;
}

std::map<std::string, MountEntry> UdevStorageEnricher::readMountTable() const {
    std::ifstream file(mountTablePath_);
    if (!file.is_open()) {
        LOG_WARNING("ENRICH: cannot read mount table " + mountTablePath_);
        return {};
    }
    return StorageMatcher::parseMountTable(file);
}
