// display_gate.cpp - Display cadence (High-Performance) and per-block refresh (Standard)

#include "display_gate.hpp"
#include "fastdaq/errors.hpp"
#include "fastdaq/logging.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

namespace fastdaq {

namespace {
constexpr auto PER_BLOCK_WAIT = std::chrono::milliseconds(100);
}

TraceWindow decimateTrace(const TraceWindow& trace, size_t max_points) {
    if (max_points == 0 || trace.size() <= max_points) return trace;

    size_t step = (trace.size() + max_points - 1) / max_points;
    TraceWindow out;
    out.first_index = trace.first_index;
    out.channels.resize(trace.channels.size());
    for (size_t i = 0; i < trace.size(); i += step) {
        out.timestamps_ms.push_back(trace.timestamps_ms[i]);
        for (size_t ch = 0; ch < trace.channels.size(); ++ch) {
            out.channels[ch].push_back(trace.channels[ch][i]);
        }
    }
    return out;
}

DisplayGate::DisplayGate(const ExecutionPlan& plan, ChannelRingBuffer& buffer,
                         PerformanceMonitor& monitor, size_t max_display_points)
    : plan_(plan)
    , buffer_(buffer)
    , monitor_(monitor)
    , max_points_(max_display_points)
    , start_time_(Clock::now())
{
}

void DisplayGate::requestStop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_.store(true, std::memory_order_release);
    }
    wait_cv_.notify_all();
    buffer_.interrupt();
}

bool DisplayGate::sleepUntil(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_until(lock, deadline, [this] { return stop_.load(std::memory_order_acquire); });
    return !stop_.load(std::memory_order_acquire);
}

void DisplayGate::run() {
    start_time_ = Clock::now();
    LOG_PIPE(DEBUG, "Display gate started (%s)",
             plan_.cadence_display ? "fixed cadence" : "per block");
    if (plan_.cadence_display) {
        runCadence();
    } else {
        runPerBlock();
    }
    LOG_PIPE(DEBUG, "Display gate stopped");
}

void DisplayGate::runCadence() {
    const auto period = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / plan_.display_rate_hz));
    const auto origin = Clock::now();
    uint64_t k = 0;

    while (!stop_.load(std::memory_order_acquire)) {
        k++;
        auto deadline = origin + period * static_cast<int64_t>(k);

        // Fell more than a period behind: skip the stale ticks
        auto now = Clock::now();
        if (now > deadline + period) {
            auto behind = static_cast<uint64_t>((now - deadline) / period);
            k += behind;
            deadline = origin + period * static_cast<int64_t>(k);
            std::lock_guard<std::mutex> lock(state_mutex_);
            stats_.missed_deadlines += behind;
        }

        if (!sleepUntil(deadline)) break;
        refresh();
    }
}

void DisplayGate::runPerBlock() {
    uint64_t last_seen = buffer_.sequence();
    while (!stop_.load(std::memory_order_acquire)) {
        if (!buffer_.waitForData(last_seen, PER_BLOCK_WAIT)) continue;
        if (stop_.load(std::memory_order_acquire)) break;
        last_seen = buffer_.sequence();
        refresh();
    }
}

void DisplayGate::processInline() {
    if (!inline_processor_ || !inline_pool_) return;

    auto t_start = Clock::now();
    try {
        Snapshot snap = buffer_.takeSnapshot(inline_processor_->inputSamples(), *inline_pool_);
        if (snap.empty()) return;

        auto result = std::make_shared<ProcessingResult>(
            inline_processor_->process(snap.view(), snap.first_index));
        double elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - t_start).count();

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            result->cycle = ++stats_.inline_cycles;
            result->sequence = snap.sequence;
            result->processing_ms = elapsed_ms;
            inline_result_ = std::move(result);
        }
        monitor_.recordProcessingLatency(elapsed_ms);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            stats_.inline_errors++;
        }
        LOG_PROC(WARN, "Inline processing failed: %s", e.what());
        monitor_.reportProcessingError(e.what());
    }
}

void DisplayGate::refresh() {
    if (!plan_.background_processing) {
        processInline();
    } else if (results_) {
        results_->take();
    }
    deliver(latestResult());
}

void DisplayGate::deliver(std::shared_ptr<const ProcessingResult> result) {
    uint64_t tick;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        tick = ++stats_.ticks;
    }
    if (!display_cb_) return;

    DisplayFrame frame;
    frame.tick = tick;
    frame.mode = plan_.mode;
    frame.time_s = std::chrono::duration<double>(Clock::now() - start_time_).count();
    TraceWindow trace = buffer_.readWindow(plan_.window_samples);
    if (trace_filter_ && trace_filter_->hasFilter() && trace.size() >= 3) {
        try {
            trace_filter_->filterTrace(trace);
            frame.trace_filtered = true;
        } catch (const ProcessingError& e) {
            trace = buffer_.readWindow(plan_.window_samples);
            std::lock_guard<std::mutex> lock(state_mutex_);
            stats_.trace_filter_errors++;
            LOG_PIPE(DEBUG, "Trace shown unfiltered on tick %llu: %s",
                     static_cast<unsigned long long>(tick), e.what());
        }
    }
    frame.trace = decimateTrace(trace, max_points_);
    frame.result = std::move(result);
    frame.metrics = monitor_.getMetrics();
    frame.alert_level = monitor_.currentAlertLevel();

    try {
        display_cb_(frame);
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats_.frames_delivered++;
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats_.callback_errors++;
        LOG_PIPE(WARN, "Display callback failed on tick %llu: %s",
                 static_cast<unsigned long long>(tick), e.what());
    }
}

std::shared_ptr<const ProcessingResult> DisplayGate::latestResult() const {
    if (plan_.background_processing) {
        return results_ ? results_->latest() : nullptr;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    return inline_result_;
}

DisplayGate::Stats DisplayGate::getStats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats_;
}

} // namespace fastdaq
