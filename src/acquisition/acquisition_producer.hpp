// acquisition_producer.hpp - Device-to-ring-buffer acquisition loop
//
// run() owns the producer thread's life: read a block from the device into
// pooled storage, stamp it from the sample clock, push it into the ring
// buffer, give the storage back. Nothing downstream can make it wait longer
// than the ring buffer's copy.
//
// Timeouts are retried with exponential backoff; after max_read_retries
// consecutive timeouts an acquisition stall is reported and reading carries
// on. A device FAULT ends run() with AcquisitionFault.

#pragma once

#include "acquisition/daq_device.hpp"
#include "buffer/channel_ring_buffer.hpp"
#include "config/pipeline_config.hpp"
#include "pool/memory_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace fastdaq {

// acquired / requested as a percentage (0 when nothing was requested)
double rateAccuracyPercent(double requested_samples, double acquired_samples);

class AcquisitionProducer {
public:
    struct Config {
        size_t channels;
        double sample_rate_hz;
        size_t samples_per_block;
        std::chrono::milliseconds read_timeout;
        int max_read_retries;
        int retry_backoff_ms;          // First backoff, doubled per retry
        double rate_window_s;          // Rolling window for achieved rate

        Config()
            : channels(1)
            , sample_rate_hz(1000.0)
            , samples_per_block(50)
            , read_timeout(1000)
            , max_read_retries(3)
            , retry_backoff_ms(10)
            , rate_window_s(2.0)
        {}

        static Config fromPipeline(const PipelineConfig& config);
    };

    struct Stats {
        bool running = false;
        bool rate_valid = false;          // A block completed, or one rate window elapsed
        uint64_t blocks_acquired = 0;
        uint64_t samples_acquired = 0;    // Rows, per channel
        uint64_t timeouts = 0;
        uint64_t stalls = 0;
        uint64_t samples_overwritten = 0; // Reported by ring buffer pushes
        double elapsed_s = 0.0;           // Since run() started
        double achieved_rate_hz = 0.0;    // Over the rolling window ending now
        double rate_accuracy_pct = 0.0;
        double avg_push_ms = 0.0;
        double max_push_ms = 0.0;
    };

    using StallCallback = std::function<void(int consecutive_timeouts, const std::string& error)>;
    using OverrunCallback = std::function<void(size_t overwritten)>;

    AcquisitionProducer(IDaqDevice& device, ChannelRingBuffer& buffer,
                        MemoryPool& pool, const Config& config = Config());

    // Non-copyable
    AcquisitionProducer(const AcquisitionProducer&) = delete;
    AcquisitionProducer& operator=(const AcquisitionProducer&) = delete;

    /**
     * Acquisition loop. Returns once requestStop() was called.
     * The device must already be started.
     * @throws AcquisitionFault when the device reports FAULT
     */
    void run();

    // Ask run() to return; wakes a pending backoff wait
    void requestStop();
    bool stopRequested() const { return stop_.load(std::memory_order_acquire); }

    Stats getStats() const;

    // Callbacks run on the producer thread; keep them short
    void setStallCallback(StallCallback cb) { stall_cb_ = std::move(cb); }
    void setOverrunCallback(OverrunCallback cb) { overrun_cb_ = std::move(cb); }

    const Config& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    // Sleep for the retry backoff; false if a stop arrived meanwhile
    bool backoff(int attempt);

    // Record a completed read for the rolling rate (caller holds stats_mutex_)
    void recordRate(Clock::time_point now, uint64_t total);

    // Achieved rate and accuracy over the window ending at `now` (caller holds stats_mutex_)
    void windowRate(Clock::time_point now, Stats& out) const;

    IDaqDevice& device_;
    ChannelRingBuffer& buffer_;
    MemoryPool& pool_;
    Config config_;

    std::atomic<bool> stop_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    StallCallback stall_cb_;
    OverrunCallback overrun_cb_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
    Clock::time_point start_time_{};
    Clock::time_point last_read_time_{};
    double push_ms_total_ = 0.0;
    std::deque<std::pair<Clock::time_point, uint64_t>> rate_points_;
};

} // namespace fastdaq
