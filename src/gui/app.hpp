#pragma once

// Live view for the acquisition pipeline.
//
// Owns a simulated device and one Pipeline at a time. The display gate hands
// frames over on its own thread; render() runs on the UI thread and only
// reads the newest frame, so a slow UI never holds up acquisition.

#include "config/pipeline_config.hpp"
#include "monitor/performance_monitor.hpp"
#include "pipeline/pipeline.hpp"
#include "sim/simulated_daq_device.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fastdaq {
namespace gui {

class App {
public:
    struct Options {
        std::string config_path;      // --config: key=value file applied at startup
        bool autostart = false;       // --start: begin acquiring immediately
    };

    App();
    explicit App(const Options& opts);
    ~App();

    void render();

private:
    void startPipeline();
    void stopPipeline();

    void onFrame(const DisplayFrame& frame);
    void onAlert(const Alert& alert);

    void renderControls();
    void renderTraces(const DisplayFrame& frame);
    void renderSpectrum(const DisplayFrame& frame);
    void renderStatistics(const DisplayFrame& frame);
    void renderMetrics(const DisplayFrame& frame);
    void renderAlertLog();

    Options options_;

    // Settings edited in the UI; copied into the pipeline on start
    PipelineConfig config_;
    char channels_text_[256] = "ai0,ai1";
    int filter_index_ = 0;
    int window_index_ = 0;
    int fft_log2_ = 13;
    float throughput_ = 1.0f;
    int processing_delay_ms_ = 0;

    std::unique_ptr<sim::SimulatedDaqDevice> device_;
    std::unique_ptr<Pipeline> pipeline_;
    std::string last_error_;

    // Written on the gate thread, read on the UI thread
    std::mutex frame_mutex_;
    std::shared_ptr<const DisplayFrame> frame_;

    std::mutex alert_mutex_;
    std::deque<std::string> alert_log_;
    static const size_t MAX_ALERT_LOG = 200;

    // Plot scratch
    std::vector<float> plot_buf_;
};

} // namespace gui
} // namespace fastdaq
