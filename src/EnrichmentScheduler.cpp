#include "EnrichmentScheduler.hpp"
#include "Logger.hpp"
#include <algorithm>

EnrichmentScheduler::EnrichmentScheduler(std::chrono::milliseconds gracePeriod, size_t maxPerTick)
    : gracePeriod_(gracePeriod), maxPerTick_(std::max<size_t>(maxPerTick, 1)) {}

void EnrichmentScheduler::schedule(const std::string& deviceId, TimePoint now) {
    pending_.push_back({deviceId, now});
    LOG_DEBUG("Enrichment scheduled for " + deviceId + " (" +
              std::to_string(gracePeriod_.count()) + " ms grace, " +
              std::to_string(pending_.size()) + " pending)");
}

std::vector<std::string> EnrichmentScheduler::takeReady(TimePoint now) {
    std::vector<std::string> ready;

    // Entries are queued in scheduling order, so the first immature one ends the scan
    while (!pending_.empty() && ready.size() < maxPerTick_) {
        const auto& front = pending_.front();
        if (now - front.scheduledAt < gracePeriod_) {
            break;
        }
        ready.push_back(front.deviceId);
        pending_.pop_front();
    }

    return ready;
}

bool EnrichmentScheduler::isPending(const std::string& deviceId) const {
    return std::any_of(pending_.begin(), pending_.end(),
                       [&deviceId](const DevHistoryShared::PendingEnrichment& entry) {
                           return entry.deviceId == deviceId;
                       });
}
