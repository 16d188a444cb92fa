// performance_monitor.hpp - Pipeline health metrics and alerts
//
// Samples producer, ring buffer, processor and pool counters on a fixed timer
// (independent of the sample rate), keeps the latest PerformanceMetrics and
// raises alerts when thresholds are crossed. It only reads; nothing it does
// feeds back into the data path.
//
// Alerts are edge-triggered per category: one alert when a category enters
// WARNING or CRITICAL (or moves between them), one INFO when it recovers.
//
// Default thresholds:
//   rate accuracy   WARNING < 95 %    CRITICAL < 90 %
//   occupancy       WARNING > 80 %    CRITICAL > 95 %
//   latency         WARNING > 1x block period, CRITICAL > 2x

#pragma once

#include "acquisition/acquisition_producer.hpp"
#include "buffer/channel_ring_buffer.hpp"
#include "config/pipeline_config.hpp"
#include "pool/memory_pool.hpp"
#include "processing/background_processor.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace fastdaq {

enum class AlertLevel : uint8_t {
    INFO = 0,        // Also the "all clear" level
    WARNING = 1,
    CRITICAL = 2,
};

enum class AlertCategory : uint8_t {
    RATE = 0,
    OCCUPANCY,
    LATENCY,
    STALL,
    FAULT,
    POOL,
    PROCESSING,
    OVERRUN,
    COUNT
};

const char* alertLevelToString(AlertLevel level);
const char* alertCategoryToString(AlertCategory category);

struct Alert {
    AlertLevel level = AlertLevel::INFO;
    AlertCategory category = AlertCategory::RATE;
    std::string message;
    double value = 0.0;
    double threshold = 0.0;
    double time_s = 0.0;         // Since the monitor started
};

struct PerformanceMetrics {
    double time_s = 0.0;
    PipelineMode mode = PipelineMode::STANDARD;

    // Acquisition
    double requested_rate_hz = 0.0;
    double achieved_rate_hz = 0.0;
    double rate_accuracy_pct = 0.0;
    bool rate_valid = false;
    uint64_t samples_requested = 0;   // Configured rate x elapsed time
    uint64_t samples_acquired = 0;
    uint64_t samples_dropped = 0;     // Overwritten unread in the ring buffer
    double dropped_rate_hz = 0.0;     // Drops per second since the previous sample
    uint64_t read_timeouts = 0;
    uint64_t stalls = 0;
    uint64_t faults = 0;
    double avg_push_ms = 0.0;
    double max_push_ms = 0.0;

    // Buffer
    double occupancy_pct = 0.0;

    // Processing
    uint64_t processing_cycles = 0;
    uint64_t processing_errors = 0;
    uint64_t results_overwritten = 0;
    double avg_processing_ms = 0.0;   // Over the last monitor interval
    double max_processing_ms = 0.0;   // Since start
    double latency_budget_ms = 0.0;   // One producer block period

    // Memory
    uint64_t pool_allocations = 0;
    uint64_t pool_hits = 0;
    uint64_t pool_exhaustion = 0;
    size_t pool_outstanding = 0;
};

struct BenchmarkResult {
    std::string name;
    double duration_s = 0.0;
    uint64_t samples_processed = 0;
    double throughput = 0.0;          // Samples per second
    bool success = false;
    std::string error;
};

class PerformanceMonitor {
public:
    struct Config {
        std::chrono::milliseconds interval;
        AlertThresholds thresholds;
        double sample_rate_hz;
        double block_period_ms;       // Latency budget
        size_t history_size;
        PipelineMode mode;

        Config()
            : interval(1000)
            , sample_rate_hz(1000.0)
            , block_period_ms(50.0)
            , history_size(100)
            , mode(PipelineMode::STANDARD)
        {}

        static Config fromPipeline(const PipelineConfig& config, PipelineMode mode);
    };

    // Read-only views of the stages; any may be null
    struct Sources {
        const AcquisitionProducer* producer = nullptr;
        const ChannelRingBuffer* buffer = nullptr;
        const BackgroundProcessor* processor = nullptr;
        const MemoryPool* pool = nullptr;
    };

    using AlertCallback = std::function<void(const Alert&)>;

    explicit PerformanceMonitor(const Config& config = Config());

    // Non-copyable
    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    void setSources(const Sources& sources);

    // Called on the thread that raised the alert; keep it short
    void setAlertCallback(AlertCallback cb);

    // ========================================================================
    // TIMER LOOP
    // ========================================================================

    // Sample every interval until requestStop()
    void run();
    void requestStop();

    // One sample + alert evaluation (the timer loop calls this)
    PerformanceMetrics sampleNow();

    // ========================================================================
    // EVENT REPORTS (any thread)
    // ========================================================================

    void reportStall(int consecutive_timeouts, const std::string& error);
    void reportFault(const std::string& error);
    void reportPoolExhaustion(size_t outstanding);
    void reportProcessingError(const std::string& error);
    void reportOverrun(size_t overwritten);
    void recordProcessingLatency(double ms);

    // ========================================================================
    // QUERIES
    // ========================================================================

    PerformanceMetrics getMetrics() const;
    AlertLevel currentAlertLevel() const;
    std::vector<Alert> getAlertHistory() const;
    uint64_t alertCount() const;

    // ========================================================================
    // BENCHMARKS
    // ========================================================================

    // Push `blocks` blocks of `block_size` rows and take a window after each
    static BenchmarkResult benchmarkRingBuffer(size_t channels, size_t capacity,
                                               size_t block_size, size_t blocks);

    // Run the processor `iterations` times over a synthetic multi-tone window
    static BenchmarkResult benchmarkProcessor(const SignalProcessor::Config& config,
                                              size_t channels, size_t iterations);

private:
    using Clock = std::chrono::steady_clock;
    static constexpr size_t NUM_CATEGORIES = static_cast<size_t>(AlertCategory::COUNT);

    double elapsedSeconds() const;

    // Update one category's level; appends to `out` on an edge (caller holds mutex)
    void transition(AlertCategory category, AlertLevel level, const std::string& message,
                    double value, double threshold, std::vector<Alert>& out);

    // Record and deliver (without holding the mutex)
    void emit(const std::vector<Alert>& alerts);

    Config config_;
    Sources sources_;
    AlertCallback alert_cb_;

    std::atomic<bool> stop_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    mutable std::mutex mutex_;
    Clock::time_point start_time_;
    PerformanceMetrics metrics_;
    std::array<AlertLevel, NUM_CATEGORIES> levels_{};
    std::deque<Alert> history_;
    uint64_t alert_count_ = 0;

    // Event counters
    uint64_t stalls_ = 0;
    uint64_t faults_ = 0;
    uint64_t pool_exhaustion_ = 0;
    uint64_t processing_errors_ = 0;
    uint64_t overrun_samples_ = 0;

    // Values at the previous sample, for "new since last tick"
    uint64_t seen_stalls_ = 0;
    uint64_t seen_pool_exhaustion_ = 0;
    uint64_t seen_processing_errors_ = 0;
    uint64_t seen_overrun_samples_ = 0;
    uint64_t seen_dropped_ = 0;
    double last_sample_s_ = 0.0;

    // Latency accumulated since the previous sample
    double latency_sum_ms_ = 0.0;
    uint64_t latency_count_ = 0;
    double latency_max_ms_ = 0.0;
    uint64_t latency_cycles_ = 0;
};

} // namespace fastdaq
