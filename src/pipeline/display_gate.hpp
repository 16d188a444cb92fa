// display_gate.hpp - Decides when the display collaborator gets a new frame
//
// High-Performance mode: ticks at display_rate_hz on absolute deadlines
// (start + k * period), so a slow callback delays one frame instead of
// drifting the cadence. Each tick reads the newest trace window and the latest
// background result.
//
// Standard mode: refreshes once per newly published block (bounded wait) and
// runs the SignalProcessor inline on a fresh snapshot. A failed inline cycle
// keeps the previous result on screen and is reported to the monitor.
//
// Every frame carries the decimated trace (filtered before decimation when a
// filter is configured), the latest successful processing result, the
// current metrics and the current alert level.

#pragma once

#include "buffer/channel_ring_buffer.hpp"
#include "buffer/latest_slot.hpp"
#include "monitor/performance_monitor.hpp"
#include "pipeline/mode_controller.hpp"
#include "pool/memory_pool.hpp"
#include "processing/signal_processor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace fastdaq {

struct DisplayFrame {
    uint64_t tick = 0;
    PipelineMode mode = PipelineMode::STANDARD;
    double time_s = 0.0;                                  // Since the gate started
    TraceWindow trace;                                    // At most max_display_points rows
    bool trace_filtered = false;                          // Trace went through the configured filter
    std::shared_ptr<const ProcessingResult> result;       // Null until the first success
    PerformanceMetrics metrics;
    AlertLevel alert_level = AlertLevel::INFO;
};

using DisplayCallback = std::function<void(const DisplayFrame&)>;

// Keep every ceil(n / max_points)-th row so at most max_points remain
TraceWindow decimateTrace(const TraceWindow& trace, size_t max_points);

class DisplayGate {
public:
    struct Stats {
        uint64_t ticks = 0;
        uint64_t frames_delivered = 0;
        uint64_t missed_deadlines = 0;   // HP ticks skipped because we fell behind
        uint64_t inline_cycles = 0;      // Standard-mode processing runs
        uint64_t inline_errors = 0;
        uint64_t callback_errors = 0;
        uint64_t trace_filter_errors = 0;   // Frames shown unfiltered
    };

    DisplayGate(const ExecutionPlan& plan, ChannelRingBuffer& buffer,
                PerformanceMonitor& monitor, size_t max_display_points);

    // Non-copyable
    DisplayGate(const DisplayGate&) = delete;
    DisplayGate& operator=(const DisplayGate&) = delete;

    // High-Performance mode: where background results come from. Each tick
    // takes the pending result, so overwrites count results never displayed.
    void setResultSource(LatestSlot<ProcessingResult>* results) { results_ = results; }

    // Standard mode: processor and pool for inline processing
    void setInlineProcessor(const SignalProcessor* processor, MemoryPool* pool) {
        inline_processor_ = processor;
        inline_pool_ = pool;
    }

    // Filter applied to the trace window before decimation; set before run()
    void setTraceFilter(const SignalProcessor* processor) { trace_filter_ = processor; }

    // Called on the gate thread; set before run()
    void setDisplayCallback(DisplayCallback cb) { display_cb_ = std::move(cb); }

    // Gate loop; returns after requestStop()
    void run();
    void requestStop();

    // Produce and deliver one frame now (Standard mode also processes)
    void refresh();

    std::shared_ptr<const ProcessingResult> latestResult() const;
    Stats getStats() const;

private:
    using Clock = std::chrono::steady_clock;

    void runCadence();
    void runPerBlock();

    // Inline processing for Standard mode; keeps the last good result
    void processInline();

    void deliver(std::shared_ptr<const ProcessingResult> result);

    bool sleepUntil(Clock::time_point deadline);

    ExecutionPlan plan_;
    ChannelRingBuffer& buffer_;
    PerformanceMonitor& monitor_;
    size_t max_points_;

    LatestSlot<ProcessingResult>* results_ = nullptr;
    const SignalProcessor* inline_processor_ = nullptr;
    MemoryPool* inline_pool_ = nullptr;
    const SignalProcessor* trace_filter_ = nullptr;
    DisplayCallback display_cb_;

    std::atomic<bool> stop_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    Clock::time_point start_time_;

    mutable std::mutex state_mutex_;
    std::shared_ptr<const ProcessingResult> inline_result_;
    Stats stats_;
};

} // namespace fastdaq
