#include "SnapshotPublisher.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>

using namespace DevHistoryShared;

namespace {

std::string trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

std::string toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace

SnapshotPublisher::SnapshotPublisher()
    : current_(std::make_shared<const AppSnapshot>()), publishCount_(0) {}

SnapshotPtr SnapshotPublisher::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void SnapshotPublisher::registerObserver(SnapshotObserver observer) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.push_back(observer);
    LOG_DEBUG("Snapshot observer registered, total observers: " + std::to_string(observers_.size()));
}

bool SnapshotPublisher::setNickname(const std::string& deviceId, const std::string& text) {
    std::string trimmed = trim(text);
    std::optional<std::string> nickname;
    if (!trimmed.empty()) {
        nickname = trimmed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (current_->knownDevices.find(deviceId) == current_->knownDevices.end()) {
        LOG_WARNING("Rename requested for unknown device: " + deviceId);
        return false;
    }

    auto next = std::make_shared<AppSnapshot>(*current_);
    next->knownDevices[deviceId].nickname = nickname;
    current_ = next;
    pendingEdits_.nicknames[deviceId] = nickname;

    LOG_INFO("Nickname for " + deviceId + (nickname ? " set to \"" + *nickname + "\"" : " cleared"));
    return true;
}

bool SnapshotPublisher::forgetDevice(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_->knownDevices.find(deviceId) == current_->knownDevices.end()) {
        LOG_WARNING("Forget requested for unknown device: " + deviceId);
        return false;
    }

    auto next = std::make_shared<AppSnapshot>(*current_);
    next->knownDevices.erase(deviceId);
    next->storageInfo.erase(deviceId);
    current_ = next;
    pendingEdits_.nicknames.erase(deviceId);
    pendingEdits_.forgotten.insert(deviceId);

    LOG_INFO("Device forgotten: " + deviceId);
    return true;
}

void SnapshotPublisher::clearEvents() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_->events.empty()) {
        return;
    }
    auto next = std::make_shared<AppSnapshot>(*current_);
    next->events.clear();
    current_ = next;
    LOG_INFO("Event log cleared");
}

ExternalEdits SnapshotPublisher::takeExternalEdits() {
    std::lock_guard<std::mutex> lock(mutex_);
    ExternalEdits edits;
    std::swap(edits, pendingEdits_);
    return edits;
}

void SnapshotPublisher::publish(std::vector<DeviceSnapshot> devices,
                                const std::vector<DeviceEvent>& newEvents,
                                const KnownDeviceMap& knownDevices,
                                const StorageMap& storageInfo) {
    sortByDisplayName(devices);

    SnapshotPtr published;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = std::make_shared<AppSnapshot>();
        next->devices = std::move(devices);
        next->events = current_->events;
        next->events.insert(next->events.end(), newEvents.begin(), newEvents.end());
        next->knownDevices = knownDevices;
        next->storageInfo = storageInfo;
        next->error = current_->error;

        for (const auto& deviceId : pendingEdits_.forgotten) {
            next->knownDevices.erase(deviceId);
            next->storageInfo.erase(deviceId);
        }
        for (const auto& pair : pendingEdits_.nicknames) {
            auto it = next->knownDevices.find(pair.first);
            if (it != next->knownDevices.end()) {
                it->second.nickname = pair.second;
            }
        }

        current_ = next;
        published = current_;
        ++publishCount_;
    }

    notifyObservers(published);
}

void SnapshotPublisher::publishError(const std::string& error) {
    SnapshotPtr published;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = std::make_shared<AppSnapshot>(*current_);
        next->error = error;
        current_ = next;
        published = current_;
        ++publishCount_;
    }

    notifyObservers(published);
}

uint64_t SnapshotPublisher::publishCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publishCount_;
}

void SnapshotPublisher::notifyObservers(const SnapshotPtr& snapshot) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    for (const auto& observer : observers_) {
        try {
            observer(snapshot);
        } catch (const std::exception& e) {
            LOG_ERROR("Snapshot observer exception: " + std::string(e.what()));
        }
    }
}

void SnapshotPublisher::sortByDisplayName(std::vector<DeviceSnapshot>& devices) {
    std::stable_sort(devices.begin(), devices.end(),
                     [](const DeviceSnapshot& a, const DeviceSnapshot& b) {
                         return toLower(a.name) < toLower(b.name);
                     });
}
