#include "InventoryDiff.hpp"

using namespace DevHistoryShared;

std::vector<DeviceEvent> InventoryDiff::computeEvents(const DeviceMap& prev,
                                                      const DeviceMap& current,
                                                      const std::string& timestamp) {
    std::vector<DeviceEvent> events;

    for (const auto& pair : prev) {
        if (current.find(pair.first) == current.end()) {
            events.emplace_back(EventKind::DISCONNECT, pair.second, timestamp);
        }
    }

    for (const auto& pair : current) {
        if (prev.find(pair.first) == prev.end()) {
            events.emplace_back(EventKind::CONNECT, pair.second, timestamp);
        }
    }

    return events;
}
