// pipeline.cpp - Owns and wires one acquisition run

#include "pipeline.hpp"
#include "fastdaq/errors.hpp"
#include "fastdaq/logging.hpp"

#include <chrono>
#include <stdexcept>

namespace fastdaq {

Pipeline::Pipeline(const PipelineConfig& config, IDaqDevice& device)
    : config_(config)
    , device_(device)
{
    config_.validate();
}

Pipeline::~Pipeline() {
    stop();
}

template <typename Fn>
void Pipeline::launch(Run& run, const char* name, Fn fn) {
    std::promise<void> finished;
    Worker worker;
    worker.name = name;
    worker.done = finished.get_future();
    worker.thread = std::thread([fn = std::move(fn), finished = std::move(finished)]() mutable {
        fn();
        finished.set_value();
    });
    run.workers.push_back(std::move(worker));
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void Pipeline::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) {
        throw std::logic_error("Pipeline::start: already running");
    }
    // A faulted run still has threads to join
    stopLocked();

    ExecutionPlan plan = ModeController::buildPlan(config_);
    auto run = std::make_unique<Run>();
    run->plan = plan;

    MemoryPool::Config pool_cfg;
    pool_cfg.max_idle_blocks = config_.pool.max_idle_blocks;
    pool_cfg.max_idle_bytes = config_.pool.max_idle_bytes;
    pool_cfg.max_outstanding = config_.pool.max_outstanding;
    pool_cfg.bypass = !plan.use_pool;
    run->pool = std::make_unique<MemoryPool>(pool_cfg);

    run->buffer = std::make_unique<ChannelRingBuffer>(config_.numChannels(), plan.buffer_capacity);
    run->signal_processor = std::make_unique<SignalProcessor>(SignalProcessor::Config::fromPipeline(config_));
    run->monitor = std::make_unique<PerformanceMonitor>(PerformanceMonitor::Config::fromPipeline(config_, plan.mode));
    run->producer = std::make_unique<AcquisitionProducer>(device_, *run->buffer, *run->pool,
                                                          AcquisitionProducer::Config::fromPipeline(config_));

    if (plan.background_processing) {
        BackgroundProcessor::Config proc_cfg;
        proc_cfg.interval = std::chrono::milliseconds(config_.processor_interval_ms);
        run->processor = std::make_unique<BackgroundProcessor>(*run->buffer, *run->pool,
                                                               *run->signal_processor, proc_cfg);
        run->processor->setProcessingDelayMs(processing_delay_ms_.load());
    }

    run->gate = std::make_unique<DisplayGate>(plan, *run->buffer, *run->monitor, config_.max_display_points);
    if (run->processor) {
        run->gate->setResultSource(&run->processor->results());
    } else {
        run->gate->setInlineProcessor(run->signal_processor.get(), run->pool.get());
    }
    run->gate->setTraceFilter(run->signal_processor.get());
    run->gate->setDisplayCallback(display_cb_);

    // Every stage reports into the monitor; the monitor only reads them back
    PerformanceMonitor* monitor = run->monitor.get();
    PerformanceMonitor::Sources sources;
    sources.producer = run->producer.get();
    sources.buffer = run->buffer.get();
    sources.processor = run->processor.get();
    sources.pool = run->pool.get();
    monitor->setSources(sources);
    monitor->setAlertCallback(alert_cb_);

    run->pool->setExhaustionCallback([monitor](size_t outstanding) {
        monitor->reportPoolExhaustion(outstanding);
    });
    run->producer->setStallCallback([monitor](int timeouts, const std::string& error) {
        monitor->reportStall(timeouts, error);
    });
    run->producer->setOverrunCallback([monitor](size_t overwritten) {
        monitor->reportOverrun(overwritten);
    });
    if (run->processor) {
        run->processor->setErrorCallback([monitor](const std::string& error) {
            monitor->reportProcessingError(error);
        });
        run->processor->setCycleCallback([monitor](double ms) {
            monitor->recordProcessingLatency(ms);
        });
    }

    {
        std::lock_guard<std::mutex> lock(fault_mutex_);
        fault_ = nullptr;
        stats_.faulted = false;
        stats_.fault_message.clear();
        stats_.runs++;
    }

    mode_controller_.activate(plan);
    try {
        device_.start(DeviceConfig::fromPipeline(config_));
    } catch (const std::exception& e) {
        LOG_PIPE(ERROR, "Device %s failed to start: %s", config_.device_name.c_str(), e.what());
        mode_controller_.clear();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        run_ = std::move(run);
    }
    Run& r = *run_;
    running_.store(true);

    launch(r, "monitor", [&r] { r.monitor->run(); });
    if (r.processor) {
        launch(r, "processor", [&r] { r.processor->run(); });
    }
    launch(r, "display", [&r] { r.gate->run(); });
    launch(r, "producer", [this, &r] { producerMain(r); });

    LOG_PIPE(INFO, "Pipeline started: %zu ch @ %.0f Hz, %s",
             config_.numChannels(), config_.sample_rate_hz, pipelineModeToString(plan.mode));
}

void Pipeline::producerMain(Run& run) {
    try {
        run.producer->run();
    } catch (const AcquisitionFault& e) {
        onFault(run, std::current_exception(), e.what());
    } catch (const std::exception& e) {
        // Anything else escaping the producer ends the run the same way
        onFault(run, std::make_exception_ptr(AcquisitionFault(e.what())), e.what());
    }
}

void Pipeline::onFault(Run& run, std::exception_ptr ep, const std::string& message) {
    // Not running by the time hasFaulted() reports true
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(fault_mutex_);
        fault_ = ep;
        stats_.faulted = true;
        stats_.fault_message = message;
    }

    LOG_PIPE(ERROR, "Acquisition fault, stopping run: %s", message.c_str());
    run.monitor->reportFault(message);

    if (run.processor) run.processor->requestStop();
    run.gate->requestStop();
    run.monitor->requestStop();
    device_.stop();
}

void Pipeline::requestStopAll(Run& run) {
    run.producer->requestStop();
    if (run.processor) run.processor->requestStop();
    run.gate->requestStop();
    run.monitor->requestStop();
    run.buffer->interrupt();
}

void Pipeline::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    stopLocked();
}

void Pipeline::stopLocked() {
    running_.store(false);
    if (!run_ || run_->workers.empty()) {
        mode_controller_.clear();
        return;
    }

    Run& r = *run_;
    requestStopAll(r);

    const auto timeout = std::chrono::milliseconds(config_.shutdown_timeout_ms);
    bool forced = false;
    for (auto& w : r.workers) {
        if (w.done.wait_for(timeout) != std::future_status::ready) {
            LOG_PIPE(WARN, "%s loop did not finish within %d ms, forcing shutdown",
                     w.name, config_.shutdown_timeout_ms);
            forced = true;
            device_.stop();           // Unblocks a read stuck in the driver
            r.buffer->interrupt();
            {
                std::lock_guard<std::mutex> lock(fault_mutex_);
                stats_.forced_shutdowns++;
            }

            // The thread still uses this run's buffer and pool, so it is
            // joined below however long the device holds it
            if (w.done.wait_for(timeout) != std::future_status::ready) {
                LOG_PIPE(ERROR, "%s loop still blocked %d ms after the device was stopped; "
                         "waiting for the device call to return",
                         w.name, config_.shutdown_timeout_ms);
                std::lock_guard<std::mutex> lock(fault_mutex_);
                stats_.hung_workers++;
            }
        }
    }

    device_.stop();
    if (forced) {
        size_t written_off = r.pool->forceReleaseAll();
        LOG_PIPE(WARN, "Released %zu pooled blocks still held by stopped stages", written_off);
    }

    for (auto& w : r.workers) {
        if (w.thread.joinable()) w.thread.join();
    }
    r.workers.clear();

    // Final sample so metrics reflect the whole run
    PerformanceMetrics m = r.monitor->sampleNow();
    mode_controller_.clear();

    LOG_PIPE(INFO, "Pipeline stopped: %llu samples acquired, %llu dropped, accuracy %.1f%%",
             static_cast<unsigned long long>(m.samples_acquired),
             static_cast<unsigned long long>(m.samples_dropped), m.rate_accuracy_pct);
}

bool Pipeline::isRunning() const {
    return running_.load();
}

bool Pipeline::hasFaulted() const {
    std::lock_guard<std::mutex> lock(fault_mutex_);
    return static_cast<bool>(fault_);
}

void Pipeline::rethrowIfFaulted() const {
    std::exception_ptr ep;
    {
        std::lock_guard<std::mutex> lock(fault_mutex_);
        ep = fault_;
    }
    if (ep) std::rethrow_exception(ep);
}

// ============================================================================
// COLLABORATORS
// ============================================================================

void Pipeline::setDisplayCallback(DisplayCallback cb) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    display_cb_ = std::move(cb);
}

void Pipeline::setAlertCallback(PerformanceMonitor::AlertCallback cb) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    alert_cb_ = std::move(cb);
}

void Pipeline::setProcessingDelayMs(int ms) {
    processing_delay_ms_.store(ms);
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (run_ && run_->processor) run_->processor->setProcessingDelayMs(ms);
}

// ============================================================================
// QUERIES
// ============================================================================

TraceWindow Pipeline::exportWindow(size_t n) const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!run_) return TraceWindow{};
    return run_->buffer->readWindow(n);
}

std::shared_ptr<const ProcessingResult> Pipeline::latestResult() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!run_) return nullptr;
    return run_->gate->latestResult();
}

PerformanceMetrics Pipeline::getMetrics() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!run_) return PerformanceMetrics{};
    return run_->monitor->getMetrics();
}

AlertLevel Pipeline::currentAlertLevel() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!run_) return AlertLevel::INFO;
    return run_->monitor->currentAlertLevel();
}

std::vector<Alert> Pipeline::getAlertHistory() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!run_) return {};
    return run_->monitor->getAlertHistory();
}

ExecutionPlan Pipeline::plan() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!run_) return ModeController::buildPlan(config_);
    return run_->plan;
}

Pipeline::Stats Pipeline::getStats() const {
    std::lock_guard<std::mutex> lock(fault_mutex_);
    return stats_;
}

const ChannelRingBuffer* Pipeline::buffer() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return run_ ? run_->buffer.get() : nullptr;
}

const MemoryPool* Pipeline::pool() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return run_ ? run_->pool.get() : nullptr;
}

const AcquisitionProducer* Pipeline::producer() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return run_ ? run_->producer.get() : nullptr;
}

const BackgroundProcessor* Pipeline::processor() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return run_ ? run_->processor.get() : nullptr;
}

const DisplayGate* Pipeline::displayGate() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return run_ ? run_->gate.get() : nullptr;
}

const PerformanceMonitor* Pipeline::monitor() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return run_ ? run_->monitor.get() : nullptr;
}

} // namespace fastdaq
