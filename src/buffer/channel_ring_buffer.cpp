// channel_ring_buffer.cpp - Multi-channel circular buffer implementation

#include "channel_ring_buffer.hpp"
#include "fastdaq/logging.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace fastdaq {

ChannelRingBuffer::ChannelRingBuffer(size_t channels, size_t capacity)
    : channels_(channels)
    , capacity_(capacity)
{
    if (channels == 0) {
        throw std::invalid_argument("ChannelRingBuffer: at least one channel is required");
    }
    if (capacity == 0) {
        throw std::invalid_argument("ChannelRingBuffer: capacity must be positive");
    }
    timestamps_.assign(capacity_, 0.0);
    values_.assign(channels_ * capacity_, 0.0);

    LOG_PIPE(DEBUG, "Ring buffer: %zu channels x %zu samples (%.1f MB)",
             channels_, capacity_,
             (channels_ + 1) * capacity_ * sizeof(double) / (1024.0 * 1024.0));
}

size_t ChannelRingBuffer::push(const SampleBlock& block) {
    if (block.empty()) return 0;
    if (block.channels != channels_) {
        throw std::invalid_argument("ChannelRingBuffer::push: block has " +
                                    std::to_string(block.channels) + " channels, buffer has " +
                                    std::to_string(channels_));
    }

    size_t overwritten = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        uint64_t w = write_cursor_.load(std::memory_order_relaxed);
        uint64_t r = read_cursor_.load(std::memory_order_relaxed);
        uint64_t new_w = w + block.samples;

        // Rows older than the last `capacity_` of this block would be
        // overwritten by the block itself; skip copying them
        size_t skip = block.samples > capacity_ ? block.samples - capacity_ : 0;
        for (size_t i = skip; i < block.samples; ++i) {
            size_t slot = static_cast<size_t>((w + i) % capacity_);
            timestamps_[slot] = block.timestamps_ms[i];
        }
        for (size_t ch = 0; ch < channels_; ++ch) {
            SampleSpan src = block.channel(ch);
            double* dst = values_.data() + ch * capacity_;
            size_t i = skip;
            while (i < block.samples) {
                size_t slot = static_cast<size_t>((w + i) % capacity_);
                size_t run = std::min(block.samples - i, capacity_ - slot);
                std::memcpy(dst + slot, src.data() + i, run * sizeof(double));
                i += run;
            }
        }

        if (new_w - r > capacity_) {
            uint64_t new_r = new_w - capacity_;
            overwritten = static_cast<size_t>(new_r - r);
            samples_dropped_ += overwritten;
            // Write cursor first so a lock-free reader never sees r > w
            write_cursor_.store(new_w, std::memory_order_release);
            read_cursor_.store(new_r, std::memory_order_release);
        } else {
            write_cursor_.store(new_w, std::memory_order_release);
        }

        blocks_pushed_++;
        sequence_.fetch_add(1, std::memory_order_acq_rel);
    }
    data_cv_.notify_all();

    if (overwritten > 0) {
        LOG_PIPE(DEBUG, "Ring buffer overrun: %zu unread samples overwritten", overwritten);
    }
    return overwritten;
}

void ChannelRingBuffer::copyRows(uint64_t from, size_t count, double* ts_out,
                                 const std::vector<double*>& channel_out) const {
    size_t i = 0;
    while (i < count) {
        size_t slot = static_cast<size_t>((from + i) % capacity_);
        size_t run = std::min(count - i, capacity_ - slot);
        std::memcpy(ts_out + i, timestamps_.data() + slot, run * sizeof(double));
        for (size_t ch = 0; ch < channels_; ++ch) {
            std::memcpy(channel_out[ch] + i, values_.data() + ch * capacity_ + slot,
                        run * sizeof(double));
        }
        i += run;
    }
}

TraceWindow ChannelRingBuffer::readWindow(size_t n) const {
    TraceWindow window;
    window.channels.resize(channels_);
    if (n == 0) return window;

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t w = write_cursor_.load(std::memory_order_acquire);
    size_t available = static_cast<size_t>(std::min<uint64_t>(w, capacity_));
    size_t count = std::min(n, available);
    if (count == 0) return window;

    window.first_index = w - count;
    window.timestamps_ms.resize(count);
    std::vector<double*> outs(channels_);
    for (size_t ch = 0; ch < channels_; ++ch) {
        window.channels[ch].resize(count);
        outs[ch] = window.channels[ch].data();
    }
    copyRows(window.first_index, count, window.timestamps_ms.data(), outs);
    return window;
}

Snapshot ChannelRingBuffer::takeSnapshot(size_t n, MemoryPool& pool) {
    Snapshot snap;
    snap.channels = channels_;

    // Rows available can only grow while running, so sizing the storage from
    // this load and copying under the lock below stays in bounds
    uint64_t w_hint = write_cursor_.load(std::memory_order_acquire);
    size_t count = std::min<size_t>(n, static_cast<size_t>(std::min<uint64_t>(w_hint, capacity_)));
    if (count == 0) {
        snap.sequence = sequence();
        return snap;
    }

    // Allocate outside the lock
    snap.storage = pool.acquire((channels_ + 1) * count);

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t w = write_cursor_.load(std::memory_order_acquire);
    size_t available = static_cast<size_t>(std::min<uint64_t>(w, capacity_));
    count = std::min(count, available);   // Only smaller after reset()

    snap.samples = count;
    snap.first_index = w - count;
    snap.sequence = sequence_.load(std::memory_order_acquire);

    double* base = snap.storage.data();
    std::vector<double*> outs(channels_);
    for (size_t ch = 0; ch < channels_; ++ch) {
        outs[ch] = base + (ch + 1) * count;
    }
    copyRows(snap.first_index, count, base, outs);

    read_cursor_.store(w, std::memory_order_release);
    snapshots_++;
    return snap;
}

double ChannelRingBuffer::occupancy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t w = write_cursor_.load(std::memory_order_relaxed);
    uint64_t r = read_cursor_.load(std::memory_order_relaxed);
    double occ = static_cast<double>(w - r) / static_cast<double>(capacity_);
    return std::clamp(occ, 0.0, 1.0);
}

bool ChannelRingBuffer::waitForData(uint64_t last_seen, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    uint64_t interrupts_at_entry = interrupts_;
    data_cv_.wait_for(lock, timeout, [&] {
        return sequence_.load(std::memory_order_acquire) != last_seen ||
               interrupts_ != interrupts_at_entry;
    });
    return sequence_.load(std::memory_order_acquire) != last_seen;
}

void ChannelRingBuffer::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupts_++;
    }
    data_cv_.notify_all();
}

void ChannelRingBuffer::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    write_cursor_.store(0, std::memory_order_release);
    read_cursor_.store(0, std::memory_order_release);
    sequence_.store(0, std::memory_order_release);
    blocks_pushed_ = 0;
    samples_dropped_ = 0;
    snapshots_ = 0;
}

ChannelRingBuffer::Stats ChannelRingBuffer::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s;
    s.capacity = capacity_;
    s.channels = channels_;
    s.blocks_pushed = blocks_pushed_;
    s.write_cursor = write_cursor_.load(std::memory_order_relaxed);
    s.read_cursor = read_cursor_.load(std::memory_order_relaxed);
    s.samples_pushed = s.write_cursor;
    s.samples_dropped = samples_dropped_;
    s.snapshots = snapshots_;
    return s;
}

} // namespace fastdaq
