#include "trading/duplicate_suppressor.h"

#include <stdexcept>

namespace trading {

DuplicateSuppressor::DuplicateSuppressor(std::chrono::seconds retention)
    : retentionSeconds_(retention.count()) {
    if (retentionSeconds_ < 1) {
        throw std::invalid_argument("Duplicate suppression retention must be at least one second");
    }
}

std::string DuplicateSuppressor::makeKey(const std::string& orderId, std::int64_t epochSecond) {
    return orderId + "_" + std::to_string(epochSecond);
}

bool DuplicateSuppressor::checkAndMark(const std::string& orderId, Clock::time_point now) {
    const std::int64_t second =
        std::chrono::floor<std::chrono::seconds>(now.time_since_epoch()).count();

    std::lock_guard<std::mutex> lock(mutex_);
    pruneLocked(second);

    const auto inserted = seen_.emplace(makeKey(orderId, second), second);
    return !inserted.second;
}

std::size_t DuplicateSuppressor::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

void DuplicateSuppressor::pruneLocked(std::int64_t currentSecond) {
    if (currentSecond == lastPruneSecond_) {
        return;
    }
    lastPruneSecond_ = currentSecond;

    const std::int64_t oldestKept = currentSecond - retentionSeconds_;
    for (auto it = seen_.begin(); it != seen_.end();) {
        if (it->second < oldestKept) {
            it = seen_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace trading
