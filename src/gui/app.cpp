#include "app.hpp"
#include "fastdaq/errors.hpp"
#include "fastdaq/logging.hpp"

#include "imgui.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>

namespace fastdaq {
namespace gui {

namespace {

const char* const FILTER_ITEMS[] = {"none", "lowpass", "highpass", "bandpass", "bandstop"};
const FilterType FILTER_TYPES[] = {FilterType::NONE, FilterType::LOWPASS, FilterType::HIGHPASS,
                                   FilterType::BANDPASS, FilterType::BANDSTOP};

const char* const WINDOW_ITEMS[] = {"hann", "hamming", "blackman", "rectangular"};
const WindowType WINDOW_TYPES[] = {WindowType::HANN, WindowType::HAMMING, WindowType::BLACKMAN,
                                   WindowType::RECTANGULAR};

ImVec4 alertColor(AlertLevel level) {
    switch (level) {
        case AlertLevel::CRITICAL: return ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
        case AlertLevel::WARNING:  return ImVec4(1.0f, 0.8f, 0.2f, 1.0f);
        case AlertLevel::INFO:     break;
    }
    return ImVec4(0.4f, 1.0f, 0.4f, 1.0f);
}

template <typename T, size_t N>
int indexOf(const T (&values)[N], T value) {
    for (size_t i = 0; i < N; ++i) {
        if (values[i] == value) return static_cast<int>(i);
    }
    return 0;
}

} // namespace

App::App() : App(Options()) {}

App::App(const Options& opts)
    : options_(opts)
{
    config_.channels = {"ai0", "ai1"};
    config_.sample_rate_hz = 50000.0;

    if (!options_.config_path.empty()) {
        if (loadConfigFile(config_, options_.config_path)) {
            LOG_GUI(INFO, "Loaded config %s", options_.config_path.c_str());
        } else {
            last_error_ = "Could not load " + options_.config_path;
        }
    }

    std::string joined;
    for (const auto& name : config_.channels) {
        if (!joined.empty()) joined += ",";
        joined += name;
    }
    std::snprintf(channels_text_, sizeof(channels_text_), "%s", joined.c_str());
    filter_index_ = indexOf(FILTER_TYPES, config_.filter.type);
    window_index_ = indexOf(WINDOW_TYPES, config_.spectrum.window);
    fft_log2_ = static_cast<int>(std::lround(std::log2(static_cast<double>(config_.spectrum.fft_length))));

    if (options_.autostart) {
        startPipeline();
    }
}

App::~App() {
    stopPipeline();
}

// ============================================================================
// PIPELINE CONTROL
// ============================================================================

void App::startPipeline() {
    stopPipeline();
    pipeline_.reset();   // Before the device it refers to
    last_error_.clear();

    PipelineConfig cfg = config_;
    cfg.channels = parseChannelList(channels_text_);
    cfg.filter.type = FILTER_TYPES[filter_index_];
    cfg.spectrum.window = WINDOW_TYPES[window_index_];
    cfg.spectrum.fft_length = size_t(1) << fft_log2_;

    try {
        sim::SimulatedDaqDevice::Config sim_cfg;
        sim_cfg.throughput_factor = throughput_;
        device_ = std::make_unique<sim::SimulatedDaqDevice>(sim_cfg);

        pipeline_ = std::make_unique<Pipeline>(cfg, *device_);
        pipeline_->setDisplayCallback([this](const DisplayFrame& f) { onFrame(f); });
        pipeline_->setAlertCallback([this](const Alert& a) { onAlert(a); });
        pipeline_->setProcessingDelayMs(processing_delay_ms_);
        pipeline_->start();
        config_ = cfg;
        LOG_GUI(INFO, "Started: %s", pipeline_->plan().describe().c_str());
    } catch (const std::exception& e) {
        last_error_ = e.what();
        LOG_GUI(ERROR, "Start failed: %s", e.what());
        pipeline_.reset();
        device_.reset();
    }
}

void App::stopPipeline() {
    if (!pipeline_) return;
    pipeline_->stop();
    try {
        pipeline_->rethrowIfFaulted();
    } catch (const AcquisitionFault& e) {
        last_error_ = std::string("Acquisition fault: ") + e.what();
    }
}

void App::onFrame(const DisplayFrame& frame) {
    auto copy = std::make_shared<const DisplayFrame>(frame);
    std::lock_guard<std::mutex> lock(frame_mutex_);
    frame_ = std::move(copy);
}

void App::onAlert(const Alert& alert) {
    char line[320];
    std::snprintf(line, sizeof(line), "[%7.1fs] %-8s %-10s %s", alert.time_s,
                  alertLevelToString(alert.level), alertCategoryToString(alert.category),
                  alert.message.c_str());
    std::lock_guard<std::mutex> lock(alert_mutex_);
    alert_log_.push_back(line);
    while (alert_log_.size() > MAX_ALERT_LOG) alert_log_.pop_front();
}

// ============================================================================
// RENDER
// ============================================================================

void App::render() {
    // A faulted run stops itself; surface the fault once
    if (pipeline_ && !pipeline_->isRunning() && pipeline_->hasFaulted() && last_error_.empty()) {
        stopPipeline();
    }

    std::shared_ptr<const DisplayFrame> frame;
    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        frame = frame_;
    }

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags window_flags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoBringToFrontOnFocus;

    ImGui::Begin("MainWindow", nullptr, window_flags);

    ImGui::TextColored(ImVec4(0.4f, 0.8f, 1.0f, 1.0f), "FastDAQ");
    ImGui::SameLine();
    ImGui::TextDisabled("Multi-channel acquisition");
    if (frame) {
        ImGui::SameLine(ImGui::GetWindowWidth() - 260);
        ImGui::TextDisabled("%s", pipelineModeToString(frame->mode));
        ImGui::SameLine();
        ImGui::TextColored(alertColor(frame->alert_level), "%s", alertLevelToString(frame->alert_level));
    }
    ImGui::Separator();

    float total_width = ImGui::GetContentRegionAvail().x;
    ImGui::BeginChild("LeftPanel", ImVec2(total_width * 0.65f, 0), true);
    if (frame) {
        if (ImGui::BeginTabBar("Views")) {
            if (ImGui::BeginTabItem("Traces")) {
                renderTraces(*frame);
                ImGui::EndTabItem();
            }
            if (ImGui::BeginTabItem("Spectrum")) {
                renderSpectrum(*frame);
                ImGui::EndTabItem();
            }
            ImGui::EndTabBar();
        }
    } else {
        ImGui::TextDisabled("No data - press Start");
    }
    ImGui::EndChild();
    ImGui::SameLine();

    ImGui::BeginChild("RightPanel", ImVec2(0, 0), true);
    renderControls();
    if (frame) {
        ImGui::Separator();
        renderMetrics(*frame);
        ImGui::Separator();
        renderStatistics(*frame);
    }
    ImGui::Separator();
    renderAlertLog();
    ImGui::EndChild();

    ImGui::End();
}

void App::renderControls() {
    bool running = pipeline_ && pipeline_->isRunning();

    ImGui::BeginDisabled(running);
    ImGui::SetNextItemWidth(160);
    ImGui::InputDouble("Rate (Hz)", &config_.sample_rate_hz, 1000.0, 10000.0, "%.0f");
    ImGui::SetNextItemWidth(160);
    ImGui::InputText("Channels", channels_text_, sizeof(channels_text_));
    ImGui::SetNextItemWidth(160);
    ImGui::Combo("Filter", &filter_index_, FILTER_ITEMS, IM_ARRAYSIZE(FILTER_ITEMS));
    for (const char* preset : {"notch50", "notch60"}) {
        ImGui::SameLine();
        if (ImGui::SmallButton(preset) && parseFilterSetting(preset, config_.filter)) {
            filter_index_ = 4;   // bandstop
        }
    }
    if (filter_index_ != 0) {
        ImGui::SetNextItemWidth(160);
        ImGui::InputDouble("Low (Hz)", &config_.filter.low_hz, 10.0, 100.0, "%.1f");
        if (FILTER_TYPES[filter_index_] == FilterType::BANDPASS ||
            FILTER_TYPES[filter_index_] == FilterType::BANDSTOP) {
            ImGui::SetNextItemWidth(160);
            ImGui::InputDouble("High (Hz)", &config_.filter.high_hz, 10.0, 100.0, "%.1f");
        }
        ImGui::SetNextItemWidth(160);
        ImGui::SliderInt("Order", &config_.filter.order, 1, 8);
    }
    ImGui::SetNextItemWidth(160);
    ImGui::Combo("Window", &window_index_, WINDOW_ITEMS, IM_ARRAYSIZE(WINDOW_ITEMS));
    ImGui::SetNextItemWidth(160);
    ImGui::SliderInt("FFT (log2)", &fft_log2_, 8, 16);
    ImGui::SameLine();
    ImGui::TextDisabled("%d", 1 << fft_log2_);
    ImGui::SetNextItemWidth(160);
    ImGui::SliderFloat("Throughput", &throughput_, 0.5f, 1.0f, "%.3f");
    ImGui::EndDisabled();

    ImGui::SetNextItemWidth(160);
    if (ImGui::SliderInt("Proc delay (ms)", &processing_delay_ms_, 0, 500) && pipeline_) {
        pipeline_->setProcessingDelayMs(processing_delay_ms_);
    }
    if (running && device_) {
        ImGui::SetNextItemWidth(160);
        float live = static_cast<float>(device_->getThroughputFactor());
        if (ImGui::SliderFloat("Live throughput", &live, 0.5f, 1.0f, "%.3f")) {
            device_->setThroughputFactor(live);
        }
    }

    ImGui::Spacing();
    if (!running) {
        if (ImGui::Button("Start", ImVec2(120, 0))) startPipeline();
    } else {
        if (ImGui::Button("Stop", ImVec2(120, 0))) stopPipeline();
    }
    if (!last_error_.empty()) {
        ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s", last_error_.c_str());
    }
}

void App::renderTraces(const DisplayFrame& frame) {
    const TraceWindow& trace = frame.trace;
    if (trace.size() == 0) {
        ImGui::TextDisabled("Waiting for samples");
        return;
    }

    float height = std::max(80.0f, ImGui::GetContentRegionAvail().y /
                                       static_cast<float>(std::max<size_t>(trace.channels.size(), 1)) - 8.0f);
    const auto& names = config_.channels;
    for (size_t ch = 0; ch < trace.channels.size(); ++ch) {
        const auto& data = trace.channels[ch];
        plot_buf_.assign(data.begin(), data.end());
        auto mm = std::minmax_element(plot_buf_.begin(), plot_buf_.end());

        char overlay[64];
        std::snprintf(overlay, sizeof(overlay), "%s%s  [%.3f, %.3f] V",
                      ch < names.size() ? names[ch].c_str() : "?",
                      frame.trace_filtered ? " (filtered)" : "", *mm.first, *mm.second);
        ImGui::PushID(static_cast<int>(ch));
        ImGui::PlotLines("##trace", plot_buf_.data(), static_cast<int>(plot_buf_.size()), 0,
                         overlay, *mm.first, *mm.second,
                         ImVec2(ImGui::GetContentRegionAvail().x, height));
        ImGui::PopID();
    }
}

void App::renderSpectrum(const DisplayFrame& frame) {
    if (!frame.result) {
        ImGui::TextDisabled("No processing result yet");
        return;
    }
    const Spectrum& sp = frame.result->spectrum;
    if (sp.status != SpectrumStatus::OK) {
        ImGui::TextDisabled("Spectrum %s", spectrumStatusToString(sp.status));
        return;
    }

    ImGui::TextDisabled("%s window, %zu points, %.2f Hz/bin", windowTypeToString(sp.window),
                        sp.fft_length, sp.resolution_hz);
    float height = std::max(80.0f, ImGui::GetContentRegionAvail().y /
                                       static_cast<float>(std::max<size_t>(sp.psd_db.size(), 1)) - 8.0f);
    for (size_t ch = 0; ch < sp.psd_db.size(); ++ch) {
        const auto& psd = sp.psd_db[ch];
        if (psd.empty()) continue;
        plot_buf_.assign(psd.begin(), psd.end());

        size_t peak = psd.size() > 1 ? 1 : 0;
        for (size_t k = peak; k < psd.size(); ++k) {
            if (psd[k] > psd[peak]) peak = k;
        }
        char overlay[64];
        std::snprintf(overlay, sizeof(overlay), "ch%zu  peak %.1f Hz (%.1f dB)", ch,
                      sp.frequencies_hz[peak], psd[peak]);
        ImGui::PushID(static_cast<int>(ch));
        ImGui::PlotLines("##psd", plot_buf_.data(), static_cast<int>(plot_buf_.size()), 0,
                         overlay, -140.0f, static_cast<float>(psd[peak]) + 10.0f,
                         ImVec2(ImGui::GetContentRegionAvail().x, height));
        ImGui::PopID();
    }
}

void App::renderStatistics(const DisplayFrame& frame) {
    if (!frame.result) return;
    const ProcessingResult& r = *frame.result;
    ImGui::Text("Statistics (cycle %llu, %zu samples%s)",
                static_cast<unsigned long long>(r.cycle), r.samples, r.filtered ? ", filtered" : "");

    if (ImGui::BeginTable("stats", 6, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
        ImGui::TableSetupColumn("Ch");
        ImGui::TableSetupColumn("Min");
        ImGui::TableSetupColumn("Max");
        ImGui::TableSetupColumn("Mean");
        ImGui::TableSetupColumn("Std");
        ImGui::TableSetupColumn("RMS");
        ImGui::TableHeadersRow();
        for (size_t ch = 0; ch < r.statistics.size(); ++ch) {
            const ChannelStatistics& s = r.statistics[ch];
            ImGui::TableNextRow();
            ImGui::TableNextColumn(); ImGui::Text("%zu", ch);
            ImGui::TableNextColumn(); ImGui::Text("%.4f", s.min);
            ImGui::TableNextColumn(); ImGui::Text("%.4f", s.max);
            ImGui::TableNextColumn(); ImGui::Text("%.4f", s.mean);
            ImGui::TableNextColumn(); ImGui::Text("%.4f", s.std_dev);
            ImGui::TableNextColumn(); ImGui::Text("%.4f", s.rms);
        }
        ImGui::EndTable();
    }
}

void App::renderMetrics(const DisplayFrame& frame) {
    const PerformanceMetrics& m = frame.metrics;

    ImGui::Text("Rate: %.0f / %.0f Hz", m.achieved_rate_hz, m.requested_rate_hz);
    ImGui::SameLine();
    if (m.rate_valid) {
        ImVec4 color = m.rate_accuracy_pct >= 95.0 ? ImVec4(0.4f, 1.0f, 0.4f, 1.0f)
                                                   : ImVec4(1.0f, 0.6f, 0.2f, 1.0f);
        ImGui::TextColored(color, "(%.1f%%)", m.rate_accuracy_pct);
    } else {
        ImGui::TextDisabled("(measuring)");
    }

    char occ[32];
    std::snprintf(occ, sizeof(occ), "Buffer %.1f%%", m.occupancy_pct);
    ImGui::ProgressBar(static_cast<float>(m.occupancy_pct / 100.0), ImVec2(-1, 0), occ);

    ImGui::Text("Acquired %llu  dropped %llu (%.0f/s)  timeouts %llu",
                static_cast<unsigned long long>(m.samples_acquired),
                static_cast<unsigned long long>(m.samples_dropped), m.dropped_rate_hz,
                static_cast<unsigned long long>(m.read_timeouts));
    ImGui::Text("Processing %.2f ms avg, %.2f ms max (budget %.1f ms)",
                m.avg_processing_ms, m.max_processing_ms, m.latency_budget_ms);
    ImGui::Text("Cycles %llu  errors %llu  overwritten %llu",
                static_cast<unsigned long long>(m.processing_cycles),
                static_cast<unsigned long long>(m.processing_errors),
                static_cast<unsigned long long>(m.results_overwritten));
    ImGui::TextDisabled("Pool: %llu alloc, %llu hits, %zu out, %llu exhausted",
                        static_cast<unsigned long long>(m.pool_allocations),
                        static_cast<unsigned long long>(m.pool_hits), m.pool_outstanding,
                        static_cast<unsigned long long>(m.pool_exhaustion));
    ImGui::TextDisabled("Frame %llu at %.1f s", static_cast<unsigned long long>(frame.tick), frame.time_s);
}

void App::renderAlertLog() {
    ImGui::Text("Alerts");
    ImGui::SameLine();
    if (ImGui::SmallButton("Clear")) {
        std::lock_guard<std::mutex> lock(alert_mutex_);
        alert_log_.clear();
    }

    std::deque<std::string> snapshot;
    {
        std::lock_guard<std::mutex> lock(alert_mutex_);
        snapshot = alert_log_;
    }
    ImGui::BeginChild("AlertLog", ImVec2(0, 0), false);
    for (const auto& line : snapshot) {
        ImGui::TextWrapped("%s", line.c_str());
    }
    if (!snapshot.empty()) ImGui::SetScrollHereY(1.0f);
    ImGui::EndChild();
}

} // namespace gui
} // namespace fastdaq
