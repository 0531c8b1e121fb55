#include "EnrichmentScheduler.hpp"
#include "TestCheck.hpp"

using TestCheck::expect;
using std::chrono::milliseconds;

int main() {
    std::cout << "=== Testing EnrichmentScheduler ===" << std::endl;

    const EnrichmentScheduler::TimePoint t0{};

    TestCheck::section("1. Grace period:");
    {
        EnrichmentScheduler scheduler(milliseconds(2000), 8);
        scheduler.schedule("USB\\VID_0781&PID_5581\\AAA", t0);

        expect(scheduler.isPending("USB\\VID_0781&PID_5581\\AAA"), "entry is pending after schedule");
        expect(scheduler.takeReady(t0 + milliseconds(1999)).empty(), "nothing ready before the grace period");
        expect(scheduler.pendingCount() == 1, "entry still queued");

        auto ready = scheduler.takeReady(t0 + milliseconds(2000));
        expect(ready.size() == 1, "entry ready exactly at the grace period");
        expect(scheduler.pendingCount() == 0, "ready entry removed from the queue");
        expect(scheduler.takeReady(t0 + milliseconds(10000)).empty(), "entries are one-shot");
    }

    TestCheck::section("2. Ordering and partial drain:");
    {
        EnrichmentScheduler scheduler(milliseconds(2000), 8);
        scheduler.schedule("A", t0);
        scheduler.schedule("B", t0 + milliseconds(500));
        scheduler.schedule("C", t0 + milliseconds(3000));

        auto ready = scheduler.takeReady(t0 + milliseconds(2600));
        expect(ready.size() == 2, "two matured entries drained");
        expect(ready.size() == 2 && ready[0] == "A" && ready[1] == "B", "oldest first");
        expect(scheduler.isPending("C"), "immature entry kept");
        expect(!scheduler.isPending("A"), "drained entry no longer pending");
    }

    TestCheck::section("3. Per-tick bound:");
    {
        EnrichmentScheduler scheduler(milliseconds(0), 2);
        scheduler.schedule("A", t0);
        scheduler.schedule("B", t0);
        scheduler.schedule("C", t0);

        expect(scheduler.takeReady(t0).size() == 2, "at most maxPerTick entries per drain");
        auto rest = scheduler.takeReady(t0);
        expect(rest.size() == 1 && rest[0] == "C", "remainder drained on the next tick");
    }

    TestCheck::section("4. Duplicates:");
    {
        EnrichmentScheduler scheduler(milliseconds(100), 8);
        scheduler.schedule("A", t0);
        scheduler.schedule("A", t0 + milliseconds(50));
        expect(scheduler.pendingCount() == 2, "each connect schedules its own lookup");
        expect(scheduler.gracePeriod() == milliseconds(100), "grace period reported");
    }

    return TestCheck::finish("EnrichmentScheduler");
}
