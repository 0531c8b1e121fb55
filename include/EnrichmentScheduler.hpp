#pragma once
#include "../devhistory-shared/include/DeviceHistoryStructs.hpp"
#include <chrono>
#include <deque>
#include <string>
#include <vector>

// Delay queue for storage lookups: volumes mount asynchronously after attach,
// so a lookup is only attempted once an entry has aged past the grace period.
// One-shot per connect; a failed lookup is not rescheduled.
class EnrichmentScheduler {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit EnrichmentScheduler(std::chrono::milliseconds gracePeriod = std::chrono::milliseconds(2000),
                                 size_t maxPerTick = 8);

    void schedule(const std::string& deviceId, TimePoint now);

    // Removes and returns up to maxPerTick matured entries, oldest first
    std::vector<std::string> takeReady(TimePoint now);

    bool isPending(const std::string& deviceId) const;
    size_t pendingCount() const { return pending_.size(); }
    std::chrono::milliseconds gracePeriod() const { return gracePeriod_; }

private:
    std::chrono::milliseconds gracePeriod_;
    size_t maxPerTick_;
    std::deque<DevHistoryShared::PendingEnrichment> pending_;
};
