#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace trading {

// Per-second de-bounce for repeated alerts. An order identifier executes at
// most once per wall-clock second; alerts one second apart are treated as
// distinct. Entries older than the retention window are pruned, at most once
// per second, so the store stays bounded for long-running processes.
class DuplicateSuppressor {
public:
    using Clock = std::chrono::system_clock;

    explicit DuplicateSuppressor(std::chrono::seconds retention = std::chrono::seconds(60));

    // Returns true when (orderId, floor(now)) was already recorded and the
    // alert must be skipped. Otherwise records it and returns false.
    bool checkAndMark(const std::string& orderId, Clock::time_point now = Clock::now());

    std::size_t size() const;

    static std::string makeKey(const std::string& orderId, std::int64_t epochSecond);

private:
    void pruneLocked(std::int64_t currentSecond);

    const std::int64_t retentionSeconds_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::int64_t> seen_;
    std::int64_t lastPruneSecond_{0};
};

}  // namespace trading
