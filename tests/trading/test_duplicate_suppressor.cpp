#include "trading/duplicate_suppressor.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "support/fakes.h"

namespace {

using test_support::Expect;
using Clock = trading::DuplicateSuppressor::Clock;

Clock::time_point At(std::int64_t millis) {
    return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis))};
}

bool TestSameSecondIsDuplicate() {
    trading::DuplicateSuppressor suppressor;
    const bool first = suppressor.checkAndMark("Short 2", At(1'700'000'000'100));
    const bool second = suppressor.checkAndMark("Short 2", At(1'700'000'000'950));
    return Expect(!first, "First sighting must proceed") &&
           Expect(second, "Second sighting in the same second must be flagged");
}

bool TestDifferentSecondsAreNotDuplicates() {
    trading::DuplicateSuppressor suppressor;
    const bool first = suppressor.checkAndMark("Long 1", At(1'700'000'000'999));
    const bool second = suppressor.checkAndMark("Long 1", At(1'700'000'001'000));
    return Expect(!first && !second, "Alerts in adjacent seconds must both proceed");
}

bool TestIdentifiersAreIndependent() {
    trading::DuplicateSuppressor suppressor;
    const auto now = At(1'700'000'000'000);
    const bool a = suppressor.checkAndMark("Long 1", now);
    const bool b = suppressor.checkAndMark("Long 2", now);
    return Expect(!a && !b, "Different identifiers in the same second must both proceed");
}

bool TestKeyFormat() {
    return Expect(trading::DuplicateSuppressor::makeKey("Long 1", 1700000000) == "Long 1_1700000000",
                  "Unexpected deduplication key format");
}

bool TestOldEntriesArePruned() {
    trading::DuplicateSuppressor suppressor(std::chrono::seconds(5));
    for (int i = 0; i < 10; ++i) {
        suppressor.checkAndMark("Long " + std::to_string(i), At(1'000'000));
    }
    if (!Expect(suppressor.size() == 10, "Expected ten live entries before pruning")) {
        return false;
    }

    // Still inside the window: the same-second guarantee is unaffected.
    if (!Expect(suppressor.checkAndMark("Long 3", At(1'000'500)), "Entry vanished inside retention window")) {
        return false;
    }

    suppressor.checkAndMark("Short 1", At(1'010'000));
    return Expect(suppressor.size() == 1, "Entries older than the retention window were not pruned");
}

bool TestConcurrentCallersExecuteOnce() {
    trading::DuplicateSuppressor suppressor;
    const auto now = At(1'700'000'123'456);
    std::atomic<int> proceeded{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (!suppressor.checkAndMark("Short 2", now)) {
                proceeded.fetch_add(1);
            }
        });
    }
    go.store(true);
    for (auto& thread : threads) {
        thread.join();
    }
    return Expect(proceeded.load() == 1, "Exactly one concurrent caller should proceed");
}

bool TestRejectsZeroRetention() {
    try {
        trading::DuplicateSuppressor suppressor(std::chrono::seconds(0));
        std::cerr << "Zero retention was accepted" << std::endl;
        return false;
    } catch (const std::invalid_argument&) {
        return true;
    }
}

}  // namespace

int main() {
    if (!TestSameSecondIsDuplicate()) {
        return 1;
    }
    if (!TestDifferentSecondsAreNotDuplicates()) {
        return 1;
    }
    if (!TestIdentifiersAreIndependent()) {
        return 1;
    }
    if (!TestKeyFormat()) {
        return 1;
    }
    if (!TestOldEntriesArePruned()) {
        return 1;
    }
    if (!TestConcurrentCallersExecuteOnce()) {
        return 1;
    }
    if (!TestRejectsZeroRetention()) {
        return 1;
    }
    return 0;
}
