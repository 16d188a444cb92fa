// channel_ring_buffer.hpp - Fixed-capacity multi-channel sample history
//
// One circular array per channel plus a parallel timestamp array, all sharing
// a single write cursor. The producer pushes whole blocks; readers either copy
// a window (display/export, cursors untouched) or take a snapshot (processor,
// marks the data as consumed so occupancy falls back to zero).
//
// Invariant: write_cursor - read_cursor <= capacity. When a push would break
// it, the oldest unread rows are overwritten and counted as dropped.
//
// The internal mutex is held only while rows are copied in or out; a push is
// published by bumping the write cursor and sequence number after the copy,
// so no reader ever sees half of a block.

#pragma once

#include "fastdaq/types.hpp"
#include "pool/memory_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>

namespace fastdaq {

// Time-ordered copy of the newest rows, backed by pooled storage.
// Layout: row 0 of the block holds timestamps, then one row per channel.
struct Snapshot {
    PooledBlock storage;
    size_t channels = 0;
    size_t samples = 0;
    uint64_t first_index = 0;    // Absolute sample index of the first row
    uint64_t sequence = 0;       // Buffer sequence number the snapshot reflects

    bool empty() const { return samples == 0; }

    SampleSpan timestampsMs() const {
        return storage.span().subspan(0, samples);
    }

    SampleSpan channel(size_t ch) const {
        return storage.span().subspan((ch + 1) * samples, samples);
    }

    // Channel-major view for code that takes SampleBlock
    SampleBlock view() const {
        SampleBlock block;
        if (samples == 0) return block;
        block.timestamps_ms = timestampsMs();
        block.values = storage.span().subspan(samples, channels * samples);
        block.channels = channels;
        block.samples = samples;
        return block;
    }
};

class ChannelRingBuffer {
public:
    struct Stats {
        size_t capacity = 0;
        size_t channels = 0;
        uint64_t blocks_pushed = 0;
        uint64_t samples_pushed = 0;    // Rows, per channel
        uint64_t samples_dropped = 0;   // Unread rows overwritten
        uint64_t write_cursor = 0;
        uint64_t read_cursor = 0;
        uint64_t snapshots = 0;
    };

    // Throws std::invalid_argument for zero channels or zero capacity
    ChannelRingBuffer(size_t channels, size_t capacity);

    // Non-copyable
    ChannelRingBuffer(const ChannelRingBuffer&) = delete;
    ChannelRingBuffer& operator=(const ChannelRingBuffer&) = delete;

    /**
     * Append a block. Never waits on readers beyond the copy itself.
     * @return Number of unread rows overwritten by this push
     * @throws std::invalid_argument if block.channels differs from channels()
     */
    size_t push(const SampleBlock& block);

    /**
     * Copy of the most recent n rows (fewer if less data exists).
     * Does not move any cursor; safe for display and export.
     */
    TraceWindow readWindow(size_t n) const;

    /**
     * Copy of the most recent n rows into pooled storage. Everything up to the
     * end of the snapshot is marked consumed.
     */
    Snapshot takeSnapshot(size_t n, MemoryPool& pool);

    // Unread-by-processor rows / capacity, in [0, 1]
    double occupancy() const;

    // Incremented once per non-empty push
    uint64_t sequence() const { return sequence_.load(std::memory_order_acquire); }

    /**
     * Wait until sequence() != last_seen, the timeout expires or interrupt()
     * is called. Returns true if new data was published.
     */
    bool waitForData(uint64_t last_seen, std::chrono::milliseconds timeout) const;

    // Wake every waitForData() caller (shutdown)
    void interrupt();

    // Forget all data and counters (only while no producer is running)
    void reset();

    size_t capacity() const { return capacity_; }
    size_t channels() const { return channels_; }

    Stats getStats() const;

private:
    // Copy rows [from, from + count) into a caller layout (caller holds mutex)
    void copyRows(uint64_t from, size_t count, double* ts_out,
                  const std::vector<double*>& channel_out) const;

    const size_t channels_;
    const size_t capacity_;

    std::vector<double> timestamps_;   // [capacity]
    std::vector<double> values_;       // [channel * capacity + slot]

    mutable std::mutex mutex_;
    mutable std::condition_variable data_cv_;

    std::atomic<uint64_t> write_cursor_{0};
    std::atomic<uint64_t> read_cursor_{0};
    std::atomic<uint64_t> sequence_{0};
    uint64_t interrupts_ = 0;          // Guarded by mutex_

    // Counters (guarded by mutex_)
    uint64_t blocks_pushed_ = 0;
    uint64_t samples_dropped_ = 0;
    uint64_t snapshots_ = 0;
};

} // namespace fastdaq
