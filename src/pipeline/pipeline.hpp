// pipeline.hpp - Owns and wires one acquisition run
//
//   device -> AcquisitionProducer -> ChannelRingBuffer -> { BackgroundProcessor,
//                                                           DisplayGate } -> display
//   PerformanceMonitor watches every stage.
//
// start() fixes the mode from the sample rate, builds the ring buffer and pool
// for that plan, starts the device and launches the producer, processor (High-
// Performance only), display gate and monitor threads. stop() asks each loop
// to finish, waits up to shutdown_timeout_ms for each and, if one hangs,
// stops the device to unblock it and writes off outstanding pool blocks
// before joining. A loop still blocked one more timeout later is logged as
// hung and counted, but stop() keeps waiting for it: its thread uses the
// run's buffer and pool, so stop() can only return once a device that
// ignores stop() finally returns from readBlock().
//
// A device fault ends the run: the fault is recorded, a CRITICAL alert is
// raised and rethrowIfFaulted() rethrows the AcquisitionFault to the caller.
//
// Usage:
//   Pipeline pipeline(config, device);
//   pipeline.setDisplayCallback([](const DisplayFrame& f) { ... });
//   pipeline.start();
//   ...
//   pipeline.stop();
//   pipeline.rethrowIfFaulted();

#pragma once

#include "acquisition/acquisition_producer.hpp"
#include "acquisition/daq_device.hpp"
#include "buffer/channel_ring_buffer.hpp"
#include "config/pipeline_config.hpp"
#include "monitor/performance_monitor.hpp"
#include "pipeline/display_gate.hpp"
#include "pipeline/mode_controller.hpp"
#include "pool/memory_pool.hpp"
#include "processing/background_processor.hpp"
#include "processing/signal_processor.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fastdaq {

class Pipeline {
public:
    struct Stats {
        uint64_t runs = 0;
        uint64_t forced_shutdowns = 0;   // Loops that missed the shutdown timeout
        uint64_t hung_workers = 0;       // Still blocked after the device was stopped
        bool faulted = false;
        std::string fault_message;
    };

    // Validates the config (std::invalid_argument on error). The device must
    // outlive the pipeline.
    Pipeline(const PipelineConfig& config, IDaqDevice& device);
    ~Pipeline();

    // Non-copyable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    /**
     * Begin a run. Throws std::logic_error if already running and
     * AcquisitionFault if the device cannot be started.
     */
    void start();

    // End the run (no-op when idle). Results and metrics stay readable.
    void stop();

    // True between start() and stop() unless the device faulted
    bool isRunning() const;

    bool hasFaulted() const;

    // Rethrow the recorded AcquisitionFault, if any
    void rethrowIfFaulted() const;

    // ========================================================================
    // COLLABORATORS (set before start)
    // ========================================================================

    void setDisplayCallback(DisplayCallback cb);
    void setAlertCallback(PerformanceMonitor::AlertCallback cb);

    // Stress knob for the background processor (High-Performance mode)
    void setProcessingDelayMs(int ms);

    // ========================================================================
    // QUERIES
    // ========================================================================

    // Newest n rows; cursors untouched. Empty before the first start().
    TraceWindow exportWindow(size_t n) const;

    std::shared_ptr<const ProcessingResult> latestResult() const;

    // Metrics from the most recent monitor sample (final sample after stop)
    PerformanceMetrics getMetrics() const;
    AlertLevel currentAlertLevel() const;
    std::vector<Alert> getAlertHistory() const;

    // Mode of the active run; empty when stopped
    std::optional<PipelineMode> currentMode() const { return mode_controller_.currentMode(); }

    // Plan of the current or most recent run
    ExecutionPlan plan() const;

    const PipelineConfig& config() const { return config_; }
    Stats getStats() const;

    // Stage views for diagnostics; null before the first start()
    const ChannelRingBuffer* buffer() const;
    const MemoryPool* pool() const;
    const AcquisitionProducer* producer() const;
    const BackgroundProcessor* processor() const;
    const DisplayGate* displayGate() const;
    const PerformanceMonitor* monitor() const;

private:
    struct Worker {
        const char* name = "";
        std::thread thread;
        std::future<void> done;
    };

    // Everything built per run. Declaration order is teardown order reversed:
    // the pool outlives every stage that holds pooled blocks.
    struct Run {
        ExecutionPlan plan;
        std::unique_ptr<MemoryPool> pool;
        std::unique_ptr<ChannelRingBuffer> buffer;
        std::unique_ptr<SignalProcessor> signal_processor;
        std::unique_ptr<PerformanceMonitor> monitor;
        std::unique_ptr<AcquisitionProducer> producer;
        std::unique_ptr<BackgroundProcessor> processor;   // High-Performance only
        std::unique_ptr<DisplayGate> gate;
        std::vector<Worker> workers;
    };

    template <typename Fn>
    void launch(Run& run, const char* name, Fn fn);

    // Producer thread body: run, and turn a fault into a stopped run
    void producerMain(Run& run);
    void onFault(Run& run, std::exception_ptr ep, const std::string& message);

    void requestStopAll(Run& run);

    // Caller holds lifecycle_mutex_
    void stopLocked();

    PipelineConfig config_;
    IDaqDevice& device_;
    ModeController mode_controller_;

    DisplayCallback display_cb_;
    PerformanceMonitor::AlertCallback alert_cb_;
    std::atomic<int> processing_delay_ms_{0};

    std::mutex lifecycle_mutex_;            // Serialises start/stop
    mutable std::mutex run_mutex_;          // Guards run_ replacement against queries
    std::unique_ptr<Run> run_;
    std::atomic<bool> running_{false};

    mutable std::mutex fault_mutex_;
    std::exception_ptr fault_;
    Stats stats_;
};

} // namespace fastdaq
