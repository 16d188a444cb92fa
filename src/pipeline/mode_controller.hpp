// mode_controller.hpp - Standard vs High-Performance selection
//
// The mode is decided once, before acquisition starts, from the configured
// sample rate: below the threshold (10 kHz by default) the pipeline runs in
// Standard mode, at or above it in High-Performance mode. The resulting
// ExecutionPlan is fixed for the whole run; there is no re-mode while running.
//
//                     STANDARD                HIGH_PERFORMANCE
//   memory pool       bypass                  pooled reuse
//   processing        inline in display gate  background thread
//   display           every new block         fixed cadence (30 Hz)

#pragma once

#include "config/pipeline_config.hpp"
#include "fastdaq/types.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace fastdaq {

struct ExecutionPlan {
    PipelineMode mode = PipelineMode::STANDARD;
    bool use_pool = false;                 // Pooled reuse (false = bypass)
    bool background_processing = false;    // Dedicated processor thread
    bool cadence_display = false;          // Display on fixed ticks
    double display_rate_hz = 30.0;
    size_t block_size = 0;                 // Rows per device read
    size_t buffer_capacity = 0;            // Rows per channel
    size_t window_samples = 0;             // Display/statistics window

    std::string describe() const;
};

class ModeController {
public:
    static constexpr double DEFAULT_THRESHOLD_HZ = 10000.0;

    static PipelineMode selectMode(double sample_rate_hz,
                                   double threshold_hz = DEFAULT_THRESHOLD_HZ);

    // Plan for a validated config
    static ExecutionPlan buildPlan(const PipelineConfig& config);

    /**
     * Fix the plan for a run. Throws std::logic_error if a run is already
     * active; the plan cannot change until clear().
     */
    void activate(const ExecutionPlan& plan);

    // End of run
    void clear();

    bool isActive() const;
    std::optional<PipelineMode> currentMode() const;
    std::optional<ExecutionPlan> activePlan() const;

private:
    mutable std::mutex mutex_;
    std::optional<ExecutionPlan> active_;
};

} // namespace fastdaq
