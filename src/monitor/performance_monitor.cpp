// performance_monitor.cpp - Pipeline health metrics and alerts

#define _USE_MATH_DEFINES
#include <cmath>
#include "performance_monitor.hpp"
#include "fastdaq/logging.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <stdexcept>

namespace fastdaq {

const char* alertLevelToString(AlertLevel level) {
    switch (level) {
        case AlertLevel::INFO:     return "INFO";
        case AlertLevel::WARNING:  return "WARNING";
        case AlertLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

const char* alertCategoryToString(AlertCategory category) {
    switch (category) {
        case AlertCategory::RATE:       return "rate";
        case AlertCategory::OCCUPANCY:  return "occupancy";
        case AlertCategory::LATENCY:    return "latency";
        case AlertCategory::STALL:      return "stall";
        case AlertCategory::FAULT:      return "fault";
        case AlertCategory::POOL:       return "pool";
        case AlertCategory::PROCESSING: return "processing";
        case AlertCategory::OVERRUN:    return "overrun";
        case AlertCategory::COUNT:      break;
    }
    return "unknown";
}

PerformanceMonitor::Config PerformanceMonitor::Config::fromPipeline(const PipelineConfig& config,
                                                                    PipelineMode mode) {
    Config c;
    c.interval = std::chrono::milliseconds(config.monitor_interval_ms);
    c.thresholds = config.thresholds;
    c.sample_rate_hz = config.sample_rate_hz;
    c.block_period_ms = config.blockPeriodMs();
    c.mode = mode;
    return c;
}

PerformanceMonitor::PerformanceMonitor(const Config& config)
    : config_(config)
    , start_time_(Clock::now())
{
    levels_.fill(AlertLevel::INFO);
    metrics_.mode = config_.mode;
    metrics_.requested_rate_hz = config_.sample_rate_hz;
    metrics_.latency_budget_ms = config_.block_period_ms;
}

void PerformanceMonitor::setSources(const Sources& sources) {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_ = sources;
}

void PerformanceMonitor::setAlertCallback(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    alert_cb_ = std::move(cb);
}

double PerformanceMonitor::elapsedSeconds() const {
    return std::chrono::duration<double>(Clock::now() - start_time_).count();
}

// ============================================================================
// TIMER LOOP
// ============================================================================

void PerformanceMonitor::run() {
    LOG_PERF(DEBUG, "Monitor started (interval %lld ms)",
             static_cast<long long>(config_.interval.count()));

    auto next = Clock::now() + config_.interval;
    while (!stop_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_until(lock, next, [this] { return stop_.load(std::memory_order_acquire); });
        }
        if (stop_.load(std::memory_order_acquire)) break;

        sampleNow();

        next += config_.interval;
        auto now = Clock::now();
        if (next <= now) next = now + config_.interval;
    }
    LOG_PERF(DEBUG, "Monitor stopped");
}

void PerformanceMonitor::requestStop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_.store(true, std::memory_order_release);
    }
    wait_cv_.notify_all();
}

PerformanceMetrics PerformanceMonitor::sampleNow() {
    Sources src;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        src = sources_;
    }

    // Stage counters are read through their own locks, outside ours
    AcquisitionProducer::Stats ps;
    ChannelRingBuffer::Stats bs;
    BackgroundProcessor::Stats prs;
    MemoryPool::Stats pls;
    double occupancy = 0.0;
    if (src.producer) ps = src.producer->getStats();
    if (src.buffer) {
        bs = src.buffer->getStats();
        occupancy = src.buffer->occupancy();
    }
    if (src.processor) prs = src.processor->getStats();
    if (src.pool) pls = src.pool->getStats();

    std::vector<Alert> alerts;
    PerformanceMetrics m;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const AlertThresholds& th = config_.thresholds;

        m.time_s = elapsedSeconds();
        m.mode = config_.mode;
        m.requested_rate_hz = config_.sample_rate_hz;

        m.achieved_rate_hz = ps.achieved_rate_hz;
        m.rate_accuracy_pct = ps.rate_accuracy_pct;
        m.rate_valid = ps.rate_valid;
        m.samples_acquired = ps.samples_acquired;
        m.samples_requested = static_cast<uint64_t>(config_.sample_rate_hz * ps.elapsed_s);
        m.read_timeouts = ps.timeouts;
        m.avg_push_ms = ps.avg_push_ms;
        m.max_push_ms = ps.max_push_ms;
        m.samples_dropped = bs.samples_dropped;
        double dt = m.time_s - last_sample_s_;
        if (dt > 0.0 && bs.samples_dropped >= seen_dropped_) {
            m.dropped_rate_hz = static_cast<double>(bs.samples_dropped - seen_dropped_) / dt;
        }
        seen_dropped_ = bs.samples_dropped;
        last_sample_s_ = m.time_s;
        m.occupancy_pct = occupancy * 100.0;

        m.stalls = stalls_;
        m.faults = faults_;
        m.processing_errors = processing_errors_;
        m.processing_cycles = latency_cycles_;
        m.results_overwritten = prs.results_overwritten;
        m.avg_processing_ms = latency_count_ > 0 ? latency_sum_ms_ / static_cast<double>(latency_count_) : 0.0;
        m.max_processing_ms = latency_max_ms_;
        m.latency_budget_ms = config_.block_period_ms;

        m.pool_allocations = pls.allocations;
        m.pool_hits = pls.pool_hits;
        m.pool_exhaustion = pool_exhaustion_;
        m.pool_outstanding = pls.outstanding;

        // Rate accuracy
        if (m.rate_valid) {
            AlertLevel level = AlertLevel::INFO;
            double threshold = th.rate_accuracy_warning_pct;
            if (m.rate_accuracy_pct < th.rate_accuracy_critical_pct) {
                level = AlertLevel::CRITICAL;
                threshold = th.rate_accuracy_critical_pct;
            } else if (m.rate_accuracy_pct < th.rate_accuracy_warning_pct) {
                level = AlertLevel::WARNING;
            }
            char msg[160];
            snprintf(msg, sizeof(msg), "Rate accuracy %.1f%% (%.0f of %.0f Hz)",
                     m.rate_accuracy_pct, m.achieved_rate_hz, m.requested_rate_hz);
            transition(AlertCategory::RATE, level, msg, m.rate_accuracy_pct, threshold, alerts);
        }

        // Buffer occupancy
        {
            AlertLevel level = AlertLevel::INFO;
            double threshold = th.occupancy_warning_pct;
            if (m.occupancy_pct > th.occupancy_critical_pct) {
                level = AlertLevel::CRITICAL;
                threshold = th.occupancy_critical_pct;
            } else if (m.occupancy_pct > th.occupancy_warning_pct) {
                level = AlertLevel::WARNING;
            }
            char msg[160];
            snprintf(msg, sizeof(msg), "Buffer occupancy %.1f%%", m.occupancy_pct);
            transition(AlertCategory::OCCUPANCY, level, msg, m.occupancy_pct, threshold, alerts);
        }

        // Processing latency (only when something was processed this interval)
        if (latency_count_ > 0) {
            double warn_ms = th.latency_warning_factor * config_.block_period_ms;
            double crit_ms = th.latency_critical_factor * config_.block_period_ms;
            AlertLevel level = AlertLevel::INFO;
            double threshold = warn_ms;
            if (m.avg_processing_ms > crit_ms) {
                level = AlertLevel::CRITICAL;
                threshold = crit_ms;
            } else if (m.avg_processing_ms > warn_ms) {
                level = AlertLevel::WARNING;
            }
            char msg[160];
            snprintf(msg, sizeof(msg), "Processing latency %.1f ms (budget %.1f ms)",
                     m.avg_processing_ms, config_.block_period_ms);
            transition(AlertCategory::LATENCY, level, msg, m.avg_processing_ms, threshold, alerts);
        }
        latency_sum_ms_ = 0.0;
        latency_count_ = 0;

        // Event categories: WARNING while new events keep arriving
        auto eventLevel = [](uint64_t now, uint64_t seen) {
            return now > seen ? AlertLevel::WARNING : AlertLevel::INFO;
        };
        {
            char msg[160];
            snprintf(msg, sizeof(msg), "%llu acquisition stalls",
                     static_cast<unsigned long long>(stalls_));
            if (stalls_ == seen_stalls_) {
                transition(AlertCategory::STALL, AlertLevel::INFO, msg,
                           static_cast<double>(stalls_), 0.0, alerts);
            }
            seen_stalls_ = stalls_;
        }
        {
            char msg[160];
            snprintf(msg, sizeof(msg), "Memory pool exhausted %llu times",
                     static_cast<unsigned long long>(pool_exhaustion_));
            transition(AlertCategory::POOL, eventLevel(pool_exhaustion_, seen_pool_exhaustion_),
                       msg, static_cast<double>(pool_exhaustion_), 0.0, alerts);
            seen_pool_exhaustion_ = pool_exhaustion_;
        }
        {
            char msg[160];
            snprintf(msg, sizeof(msg), "%llu processing errors",
                     static_cast<unsigned long long>(processing_errors_));
            transition(AlertCategory::PROCESSING, eventLevel(processing_errors_, seen_processing_errors_),
                       msg, static_cast<double>(processing_errors_), 0.0, alerts);
            seen_processing_errors_ = processing_errors_;
        }

        // Overruns are informational: one alert per interval that saw any
        if (overrun_samples_ > seen_overrun_samples_) {
            Alert a;
            a.level = AlertLevel::INFO;
            a.category = AlertCategory::OVERRUN;
            a.value = static_cast<double>(overrun_samples_ - seen_overrun_samples_);
            a.time_s = m.time_s;
            char msg[160];
            snprintf(msg, sizeof(msg), "%.0f unread samples overwritten (%llu total)",
                     a.value, static_cast<unsigned long long>(overrun_samples_));
            a.message = msg;
            alerts.push_back(a);
            seen_overrun_samples_ = overrun_samples_;
        }

        metrics_ = m;
    }

    emit(alerts);

    LOG_PERF(DEBUG, "rate %.1f%% occ %.1f%% lat %.2f ms drop %llu (%.0f/s)",
             m.rate_accuracy_pct, m.occupancy_pct, m.avg_processing_ms,
             static_cast<unsigned long long>(m.samples_dropped), m.dropped_rate_hz);
    return m;
}

void PerformanceMonitor::transition(AlertCategory category, AlertLevel level, const std::string& message,
                                    double value, double threshold, std::vector<Alert>& out) {
    auto idx = static_cast<size_t>(category);
    AlertLevel prev = levels_[idx];
    if (prev == level) return;
    levels_[idx] = level;

    Alert a;
    a.level = level;
    a.category = category;
    a.value = value;
    a.threshold = threshold;
    a.time_s = elapsedSeconds();
    a.message = level == AlertLevel::INFO ? std::string("Recovered: ") + message : message;
    out.push_back(a);
}

void PerformanceMonitor::emit(const std::vector<Alert>& alerts) {
    if (alerts.empty()) return;

    AlertCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& a : alerts) {
            history_.push_back(a);
            while (history_.size() > config_.history_size) history_.pop_front();
            alert_count_++;
        }
        cb = alert_cb_;
    }

    for (const auto& a : alerts) {
        switch (a.level) {
            case AlertLevel::CRITICAL:
                LOG_PERF(ERROR, "[%s] %s", alertCategoryToString(a.category), a.message.c_str());
                break;
            case AlertLevel::WARNING:
                LOG_PERF(WARN, "[%s] %s", alertCategoryToString(a.category), a.message.c_str());
                break;
            case AlertLevel::INFO:
                LOG_PERF(INFO, "[%s] %s", alertCategoryToString(a.category), a.message.c_str());
                break;
        }
        if (cb) cb(a);
    }
}

// ============================================================================
// EVENT REPORTS
// ============================================================================

void PerformanceMonitor::reportStall(int consecutive_timeouts, const std::string& error) {
    std::vector<Alert> alerts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stalls_++;
        levels_[static_cast<size_t>(AlertCategory::STALL)] = AlertLevel::WARNING;

        Alert a;
        a.level = AlertLevel::WARNING;
        a.category = AlertCategory::STALL;
        a.value = static_cast<double>(consecutive_timeouts);
        a.time_s = elapsedSeconds();
        a.message = "Acquisition stall after " + std::to_string(consecutive_timeouts) +
                    " timeouts: " + error;
        alerts.push_back(a);
    }
    emit(alerts);
}

void PerformanceMonitor::reportFault(const std::string& error) {
    std::vector<Alert> alerts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        faults_++;
        levels_[static_cast<size_t>(AlertCategory::FAULT)] = AlertLevel::CRITICAL;

        Alert a;
        a.level = AlertLevel::CRITICAL;
        a.category = AlertCategory::FAULT;
        a.value = static_cast<double>(faults_);
        a.time_s = elapsedSeconds();
        a.message = "Acquisition fault: " + error;
        alerts.push_back(a);
        metrics_.faults = faults_;
    }
    emit(alerts);
}

void PerformanceMonitor::reportPoolExhaustion(size_t /*outstanding*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_exhaustion_++;
}

void PerformanceMonitor::reportProcessingError(const std::string& /*error*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    processing_errors_++;
}

void PerformanceMonitor::reportOverrun(size_t overwritten) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrun_samples_ += overwritten;
}

void PerformanceMonitor::recordProcessingLatency(double ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_sum_ms_ += ms;
    latency_count_++;
    latency_cycles_++;
    latency_max_ms_ = std::max(latency_max_ms_, ms);
}

// ============================================================================
// QUERIES
// ============================================================================

PerformanceMetrics PerformanceMonitor::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

AlertLevel PerformanceMonitor::currentAlertLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AlertLevel worst = AlertLevel::INFO;
    for (AlertLevel l : levels_) {
        if (static_cast<int>(l) > static_cast<int>(worst)) worst = l;
    }
    return worst;
}

std::vector<Alert> PerformanceMonitor::getAlertHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Alert>(history_.begin(), history_.end());
}

uint64_t PerformanceMonitor::alertCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return alert_count_;
}

// ============================================================================
// BENCHMARKS
// ============================================================================

BenchmarkResult PerformanceMonitor::benchmarkRingBuffer(size_t channels, size_t capacity,
                                                        size_t block_size, size_t blocks) {
    BenchmarkResult result;
    result.name = "ring_buffer";

    try {
        ChannelRingBuffer buffer(channels, capacity);
        std::vector<double> timestamps(block_size);
        std::vector<double> values(channels * block_size);
        for (size_t i = 0; i < values.size(); ++i) {
            values[i] = std::sin(static_cast<double>(i) * 0.01);
        }

        auto t0 = Clock::now();
        uint64_t index = 0;
        for (size_t b = 0; b < blocks; ++b) {
            for (size_t i = 0; i < block_size; ++i) {
                timestamps[i] = static_cast<double>(index + i);
            }
            SampleBlock block;
            block.timestamps_ms = timestamps;
            block.values = values;
            block.channels = channels;
            block.samples = block_size;
            buffer.push(block);
            index += block_size;

            TraceWindow w = buffer.readWindow(block_size);
            if (w.size() != std::min(block_size, capacity)) {
                throw std::runtime_error("window size mismatch");
            }
        }
        result.duration_s = std::chrono::duration<double>(Clock::now() - t0).count();
        result.samples_processed = index * channels;
        result.throughput = result.duration_s > 0.0
                                ? static_cast<double>(result.samples_processed) / result.duration_s
                                : 0.0;
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }

    LOG_PERF(INFO, "Benchmark %s: %.3f s, %.2f Msamples/s%s%s", result.name.c_str(),
             result.duration_s, result.throughput / 1e6,
             result.success ? "" : ", failed: ", result.error.c_str());
    return result;
}

BenchmarkResult PerformanceMonitor::benchmarkProcessor(const SignalProcessor::Config& config,
                                                       size_t channels, size_t iterations) {
    BenchmarkResult result;
    result.name = "processor";

    try {
        SignalProcessor processor(config);
        const size_t n = processor.inputSamples();
        std::vector<double> timestamps(n);
        std::vector<double> values(channels * n);
        for (size_t i = 0; i < n; ++i) {
            timestamps[i] = static_cast<double>(i) * 1000.0 / config.sample_rate_hz;
        }
        for (size_t ch = 0; ch < channels; ++ch) {
            double f = 50.0 * static_cast<double>(ch + 1);
            for (size_t i = 0; i < n; ++i) {
                values[ch * n + i] = std::sin(2.0 * M_PI * f * static_cast<double>(i) / config.sample_rate_hz);
            }
        }

        SampleBlock block;
        block.timestamps_ms = timestamps;
        block.values = values;
        block.channels = channels;
        block.samples = n;

        auto t0 = Clock::now();
        for (size_t it = 0; it < iterations; ++it) {
            ProcessingResult r = processor.process(block, it * n);
            if (r.statistics.size() != channels) {
                throw std::runtime_error("statistics missing");
            }
        }
        result.duration_s = std::chrono::duration<double>(Clock::now() - t0).count();
        result.samples_processed = static_cast<uint64_t>(iterations) * n * channels;
        result.throughput = result.duration_s > 0.0
                                ? static_cast<double>(result.samples_processed) / result.duration_s
                                : 0.0;
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }

    LOG_PERF(INFO, "Benchmark %s: %.3f s, %.2f Msamples/s%s%s", result.name.c_str(),
             result.duration_s, result.throughput / 1e6,
             result.success ? "" : ", failed: ", result.error.c_str());
    return result;
}

} // namespace fastdaq
