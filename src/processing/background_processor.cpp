// background_processor.cpp - Processing loop decoupled from acquisition

#include "background_processor.hpp"
#include "fastdaq/logging.hpp"

#include <algorithm>
#include <exception>

namespace fastdaq {

BackgroundProcessor::BackgroundProcessor(ChannelRingBuffer& buffer, MemoryPool& pool,
                                         const SignalProcessor& processor, const Config& config)
    : buffer_(buffer)
    , pool_(pool)
    , processor_(processor)
    , config_(config)
{
}

void BackgroundProcessor::requestStop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_.store(true, std::memory_order_release);
    }
    wait_cv_.notify_all();
    buffer_.interrupt();
}

bool BackgroundProcessor::sleepUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_until(lock, deadline, [this] { return stop_.load(std::memory_order_acquire); });
    return !stop_.load(std::memory_order_acquire);
}

void BackgroundProcessor::run() {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.running = true;
    }
    LOG_PROC(INFO, "Background processor started (interval %lld ms, %zu samples/cycle)",
             static_cast<long long>(config_.interval.count()), processor_.inputSamples());

    auto next = std::chrono::steady_clock::now();
    while (!stop_.load(std::memory_order_acquire)) {
        // Bounded wait for something new, then process at most once per interval
        if (buffer_.sequence() == last_sequence_) {
            buffer_.waitForData(last_sequence_, config_.interval);
            if (stop_.load(std::memory_order_acquire)) break;
        }

        runCycle();

        next += config_.interval;
        auto now = std::chrono::steady_clock::now();
        if (next < now) next = now;   // Fell behind: don't try to catch up
        if (!sleepUntil(next)) break;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.running = false;
    }
    LOG_PROC(INFO, "Background processor stopped");
}

bool BackgroundProcessor::runCycle() {
    if (buffer_.sequence() == last_sequence_) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.idle_cycles++;
        return false;
    }

    auto t_start = std::chrono::steady_clock::now();
    try {
        Snapshot snap = buffer_.takeSnapshot(processor_.inputSamples(), pool_);
        last_sequence_ = snap.sequence;
        if (snap.empty()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.idle_cycles++;
            return false;
        }

        int delay = delay_ms_.load();
        if (delay > 0) {
            sleepUntil(std::chrono::steady_clock::now() + std::chrono::milliseconds(delay));
        }

        auto result = std::make_shared<ProcessingResult>(processor_.process(snap.view(), snap.first_index));
        pool_.release(std::move(snap.storage));

        double elapsed_ms = std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - t_start).count();
        uint64_t cycle;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            cycle = ++stats_.cycles;
        }
        result->cycle = cycle;
        result->sequence = snap.sequence;
        result->processing_ms = elapsed_ms;

        bool overwritten = results_.publish(std::move(result));

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.results_published++;
            if (overwritten) stats_.results_overwritten++;
            stats_.last_processing_ms = elapsed_ms;
            processing_ms_total_ += elapsed_ms;
            stats_.avg_processing_ms = processing_ms_total_ / static_cast<double>(stats_.cycles);
            stats_.max_processing_ms = std::max(stats_.max_processing_ms, elapsed_ms);
        }

        LOG_PROC(TRACE, "Cycle %llu: %.2f ms", static_cast<unsigned long long>(cycle), elapsed_ms);
        if (cycle_cb_) cycle_cb_(elapsed_ms);
        return true;
    } catch (const std::exception& e) {
        uint64_t errors;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            errors = ++stats_.errors;
        }
        LOG_PROC(WARN, "Processing cycle failed (%llu errors so far): %s",
                 static_cast<unsigned long long>(errors), e.what());
        if (error_cb_) error_cb_(e.what());
        return false;
    }
}

BackgroundProcessor::Stats BackgroundProcessor::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace fastdaq
