// memory_pool.hpp - Reusable sample storage for the acquisition hot path
//
// Blocks are handed out as move-only PooledBlock handles. A handle returns its
// storage to the pool when released or destroyed; idle storage is reused by the
// next acquire() of the same size instead of allocating again.
//
// Usage:
//   MemoryPool pool(config);
//   PooledBlock block = pool.acquire(channels * samples);
//   device.readBlock(samples, timeout, block.span());
//   ...
//   pool.release(std::move(block));   // or just let it go out of scope
//
// In bypass mode (Standard pipeline mode) every acquire allocates and every
// release frees; only the counters are kept.

#pragma once

#include "fastdaq/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace fastdaq {

class MemoryPool;

class PooledBlock {
public:
    PooledBlock() = default;
    ~PooledBlock();

    PooledBlock(PooledBlock&& other) noexcept;
    PooledBlock& operator=(PooledBlock&& other) noexcept;

    PooledBlock(const PooledBlock&) = delete;
    PooledBlock& operator=(const PooledBlock&) = delete;

    bool valid() const { return !storage_.empty(); }
    size_t size() const { return storage_.size(); }

    double* data() { return storage_.data(); }
    const double* data() const { return storage_.data(); }

    MutableSampleSpan span() { return MutableSampleSpan(storage_.data(), storage_.size()); }
    SampleSpan span() const { return SampleSpan(storage_.data(), storage_.size()); }

    // False for bypass and one-off (exhaustion fallback) blocks
    bool recyclable() const { return origin_ == Origin::POOLED; }

private:
    friend class MemoryPool;

    enum class Origin : uint8_t { POOLED, BYPASS, ONE_OFF };

    PooledBlock(MemoryPool* pool, std::vector<double>&& storage, Origin origin, uint64_t epoch);

    void returnToPool();

    MemoryPool* pool_ = nullptr;
    std::vector<double> storage_;
    Origin origin_ = Origin::POOLED;
    uint64_t epoch_ = 0;
};

class MemoryPool {
public:
    struct Config {
        size_t max_idle_blocks;      // Idle blocks kept for reuse
        size_t max_idle_bytes;       // Idle byte budget
        size_t max_outstanding;      // Checked-out pooled blocks before fallback
        bool bypass;                 // Allocate/free every time (Standard mode)

        Config()
            : max_idle_blocks(32)
            , max_idle_bytes(64 * 1024 * 1024)
            , max_outstanding(64)
            , bypass(false)
        {}
    };

    struct Stats {
        uint64_t acquires = 0;
        uint64_t allocations = 0;        // Fresh storage allocated
        uint64_t pool_hits = 0;          // acquire() served from idle storage
        uint64_t releases = 0;
        uint64_t evictions = 0;          // Idle blocks freed by the ceiling
        uint64_t exhaustion_events = 0;  // One-off fallbacks
        uint64_t forced_releases = 0;    // Blocks written off by forceReleaseAll()
        size_t outstanding = 0;          // Pooled blocks currently checked out
        size_t idle_blocks = 0;
        size_t idle_bytes = 0;
    };

    // Called (outside the pool lock) each time acquire() falls back to a
    // one-off allocation; argument is the outstanding count at that moment.
    using ExhaustionCallback = std::function<void(size_t outstanding)>;

    explicit MemoryPool(const Config& config = Config());
    ~MemoryPool() = default;

    // Non-copyable
    MemoryPool(const MemoryPool&) = delete;
    MemoryPool& operator=(const MemoryPool&) = delete;

    // Storage of exactly `size` doubles (contents unspecified).
    // Throws std::invalid_argument for size 0.
    PooledBlock acquire(size_t size);

    // Return a block early. The handle is left empty. Empty handles are ignored;
    // a handle from another pool throws std::invalid_argument.
    void release(PooledBlock&& block);

    // Write off every outstanding block (shutdown after a timed-out stage).
    // Handles still alive are freed instead of pooled when they come back.
    size_t forceReleaseAll();

    // Drop all idle storage
    void clear();

    void setExhaustionCallback(ExhaustionCallback cb);

    bool isBypass() const { return config_.bypass; }
    Stats getStats() const;

private:
    friend class PooledBlock;

    void giveBack(std::vector<double>&& storage, PooledBlock::Origin origin, uint64_t epoch);

    // Free oldest idle blocks above the ceiling (caller holds mutex)
    void trimIdle();

    Config config_;
    mutable std::mutex mutex_;
    std::deque<std::vector<double>> idle_;   // Oldest first
    size_t idle_bytes_ = 0;
    size_t outstanding_ = 0;
    uint64_t epoch_ = 0;
    Stats stats_;
    ExhaustionCallback exhaustion_cb_;
    std::chrono::steady_clock::time_point last_exhaustion_log_{};
};

} // namespace fastdaq
