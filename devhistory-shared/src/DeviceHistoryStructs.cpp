#include "DeviceHistoryStructs.hpp"

namespace DevHistoryShared {

namespace {

std::optional<std::string> markerValue(const std::string& id, const std::string& marker) {
    size_t pos = id.find(marker);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    size_t start = pos + marker.size();
    if (start + 4 > id.size()) {
        return std::nullopt;
    }
    return id.substr(start, 4);
}

} // namespace

std::string DeviceRecord::displayName() const {
    if (name) {
        return *name;
    }
    if (description) {
        return *description;
    }
    return "Unknown Device";
}

std::optional<std::string> DeviceRecord::vendorProductId() const {
    auto vid = markerValue(deviceId, "VID_");
    if (!vid) {
        return std::nullopt;
    }
    auto pid = markerValue(deviceId, "PID_");
    if (!pid) {
        return std::nullopt;
    }
    return *vid + ":" + *pid;
}

std::string DeviceRecord::deviceClass() const {
    return pnpClass ? *pnpClass : "?";
}

} // namespace DevHistoryShared
