// background_processor.hpp - Processing loop decoupled from acquisition
//
// Runs on its own thread in High-Performance mode. Each cycle takes a ring
// buffer snapshot (pooled storage), runs the SignalProcessor on it and
// publishes the result to a latest-wins slot. A slow cycle only means fewer
// results; the producer keeps pushing and the ring buffer absorbs the backlog.
//
// Usage:
//   BackgroundProcessor proc(buffer, pool, processor, config);
//   std::thread t([&] { proc.run(); });
//   ...
//   auto result = proc.results().latest();
//   proc.requestStop();
//   t.join();

#pragma once

#include "buffer/channel_ring_buffer.hpp"
#include "buffer/latest_slot.hpp"
#include "pool/memory_pool.hpp"
#include "processing/signal_processor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace fastdaq {

class BackgroundProcessor {
public:
    struct Config {
        std::chrono::milliseconds interval;   // Cycle cadence

        Config()
            : interval(50)
        {}
    };

    struct Stats {
        bool running = false;
        uint64_t cycles = 0;              // Cycles that processed data
        uint64_t idle_cycles = 0;         // Nothing new in the buffer
        uint64_t results_published = 0;
        uint64_t results_overwritten = 0; // Published over an untaken result
        uint64_t errors = 0;
        double last_processing_ms = 0.0;
        double avg_processing_ms = 0.0;
        double max_processing_ms = 0.0;
    };

    using ErrorCallback = std::function<void(const std::string& message)>;
    using CycleCallback = std::function<void(double processing_ms)>;

    BackgroundProcessor(ChannelRingBuffer& buffer, MemoryPool& pool,
                        const SignalProcessor& processor, const Config& config = Config());

    // Non-copyable
    BackgroundProcessor(const BackgroundProcessor&) = delete;
    BackgroundProcessor& operator=(const BackgroundProcessor&) = delete;

    // Processing loop; returns after requestStop()
    void run();

    void requestStop();
    bool stopRequested() const { return stop_.load(std::memory_order_acquire); }

    /**
     * One processing cycle, regardless of cadence.
     * Returns false if there was nothing new to process or the cycle failed
     * (failures are counted and reported, never thrown).
     */
    bool runCycle();

    // Artificial per-cycle delay (stress testing); 0 disables
    void setProcessingDelayMs(int ms) { delay_ms_.store(ms); }

    LatestSlot<ProcessingResult>& results() { return results_; }
    const LatestSlot<ProcessingResult>& results() const { return results_; }

    void setErrorCallback(ErrorCallback cb) { error_cb_ = std::move(cb); }
    void setCycleCallback(CycleCallback cb) { cycle_cb_ = std::move(cb); }

    Stats getStats() const;

private:
    // Wait on the stop condition; false if stopped
    bool sleepUntil(std::chrono::steady_clock::time_point deadline);

    ChannelRingBuffer& buffer_;
    MemoryPool& pool_;
    const SignalProcessor& processor_;
    Config config_;

    LatestSlot<ProcessingResult> results_;

    std::atomic<bool> stop_{false};
    std::atomic<int> delay_ms_{0};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    uint64_t last_sequence_ = 0;      // Processor thread only

    ErrorCallback error_cb_;
    CycleCallback cycle_cb_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
    double processing_ms_total_ = 0.0;
};

} // namespace fastdaq
