// latest_slot.hpp - Single-slot, latest-wins hand-off between two threads
//
// The writer publishes immutable results; a reader either takes the pending
// one (cleared on take) or peeks at the last one ever published. Publishing
// over an untaken value replaces it and counts the overwrite.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

namespace fastdaq {

template <typename T>
class LatestSlot {
public:
    using Ptr = std::shared_ptr<const T>;

    // Returns true if a pending (untaken) value was replaced
    bool publish(Ptr value) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool replaced = static_cast<bool>(pending_);
        if (replaced) overwritten_++;
        pending_ = value;
        latest_ = std::move(value);
        published_++;
        return replaced;
    }

    // Pending value or nullptr; the slot is empty afterwards
    Ptr take() {
        std::lock_guard<std::mutex> lock(mutex_);
        Ptr out = std::move(pending_);
        pending_.reset();
        return out;
    }

    // Most recent value ever published (not cleared by take)
    Ptr latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.reset();
        latest_.reset();
        published_ = 0;
        overwritten_ = 0;
    }

    uint64_t published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    uint64_t overwritten() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return overwritten_;
    }

private:
    mutable std::mutex mutex_;
    Ptr pending_;
    Ptr latest_;
    uint64_t published_ = 0;
    uint64_t overwritten_ = 0;
};

} // namespace fastdaq
