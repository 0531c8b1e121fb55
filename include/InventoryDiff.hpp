#pragma once
#include "../devhistory-shared/include/DeviceHistoryStructs.hpp"
#include <string>
#include <vector>

class InventoryDiff {
public:
    // Disconnects for prev \ current, then connects for current \ prev.
    // Membership only: a key present in both snapshots never produces an event.
    static std::vector<DevHistoryShared::DeviceEvent> computeEvents(
        const DevHistoryShared::DeviceMap& prev,
        const DevHistoryShared::DeviceMap& current,
        const std::string& timestamp);
};
