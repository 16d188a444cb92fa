// mode_controller.cpp - Standard vs High-Performance selection

#include "mode_controller.hpp"
#include "fastdaq/logging.hpp"

#include <cstdio>
#include <stdexcept>

namespace fastdaq {

std::string ExecutionPlan::describe() const {
    char display[32];
    if (cadence_display) {
        snprintf(display, sizeof(display), "%.0f Hz", display_rate_hz);
    } else {
        snprintf(display, sizeof(display), "per block");
    }

    char buf[256];
    snprintf(buf, sizeof(buf),
             "%s: pool=%s processing=%s display=%s block=%zu capacity=%zu window=%zu",
             pipelineModeToString(mode),
             use_pool ? "pooled" : "bypass",
             background_processing ? "background" : "inline",
             display, block_size, buffer_capacity, window_samples);
    return buf;
}

PipelineMode ModeController::selectMode(double sample_rate_hz, double threshold_hz) {
    return sample_rate_hz >= threshold_hz ? PipelineMode::HIGH_PERFORMANCE : PipelineMode::STANDARD;
}

ExecutionPlan ModeController::buildPlan(const PipelineConfig& config) {
    ExecutionPlan plan;
    plan.mode = selectMode(config.sample_rate_hz, config.mode_threshold_hz);

    bool hp = plan.mode == PipelineMode::HIGH_PERFORMANCE;
    plan.use_pool = hp;
    plan.background_processing = hp;
    plan.cadence_display = hp;
    plan.display_rate_hz = config.display_rate_hz;
    plan.block_size = config.blockSize();
    plan.buffer_capacity = config.bufferCapacity();
    plan.window_samples = config.windowSamples();
    return plan;
}

void ModeController::activate(const ExecutionPlan& plan) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        throw std::logic_error("ModeController: mode already fixed for the current run");
    }
    active_ = plan;
    LOG_PIPE(INFO, "Mode %s", plan.describe().c_str());
}

void ModeController::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.reset();
}

bool ModeController::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.has_value();
}

std::optional<PipelineMode> ModeController::currentMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return std::nullopt;
    return active_->mode;
}

std::optional<ExecutionPlan> ModeController::activePlan() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

} // namespace fastdaq
