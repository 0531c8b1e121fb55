#pragma once
#include "DeviceSources.hpp"
#include "StorageMatcher.hpp"
#include <libudev.h>
#include <map>
#include <string>
#include <vector>

// Resolves a USB device id to the disk it exposes and its mounted volumes
class UdevStorageEnricher : public EnrichmentSource {
public:
    explicit UdevStorageEnricher(const std::string& mountTablePath = "/proc/mounts");

    std::optional<DevHistoryShared::StorageInfo> queryEnrichment(const std::string& deviceId) override;

private:
    std::vector<DriveCandidate> enumerateDrives(struct udev* udev) const;
    std::vector<DevHistoryShared::VolumeInfo> queryVolumes(struct udev* udev,
                                                           const DriveCandidate& drive,
                                                           uint32_t& partitionCount) const;
    std::map<std::string, MountEntry> readMountTable() const;

    std::string mountTablePath_;
};
