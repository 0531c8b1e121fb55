#pragma once
#include "../devhistory-shared/include/DeviceHistoryStructs.hpp"
#include <optional>
#include <string>

// Point-in-time view of the attached devices, keyed by stable device id
class InventorySource {
public:
    virtual ~InventorySource() = default;

    // Called once before the first query; false is a fatal startup failure
    virtual bool initialize(std::string& error) = 0;

    // std::nullopt signals a failed enumeration for this poll only
    virtual std::optional<DevHistoryShared::DeviceMap> queryInventory() = 0;
};

// Storage metadata lookup for a storage-class device.
// std::nullopt is the routine "not mounted / no match yet" outcome.
class EnrichmentSource {
public:
    virtual ~EnrichmentSource() = default;
    virtual std::optional<DevHistoryShared::StorageInfo> queryEnrichment(const std::string& deviceId) = 0;
};
