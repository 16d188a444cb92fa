// test_pipeline_e2e.cpp - Full pipeline runs against the simulated device
//
// Tests:
// 1. High-Performance run: 2 channels at 50 kHz for 1 s
// 2. Standard run: per-block display with inline processing
// 3. Device fault stops the run and is rethrown
// 4. Lifecycle misuse
// 5. The display trace is filtered when a filter is configured
// 6. A device that ignores stop() delays shutdown but is still joined

#include "fastdaq/errors.hpp"
#include "fastdaq/logging.hpp"
#include "pipeline/pipeline.hpp"
#include "sim/simulated_daq_device.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

using namespace fastdaq;

namespace {

// A driver that ignores stop(): every read blocks until 500 ms after the
// first stop() call, then times out
class StuckDevice : public IDaqDevice {
public:
    void start(const DeviceConfig&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }

    ReadResult readBlock(size_t, std::chrono::milliseconds, MutableSampleSpan) override {
        for (;;) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopped_ && std::chrono::steady_clock::now() >= release_at_) break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return ReadResult::timeout("driver released");
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        release_at_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
    }

    std::string name() const override { return "Stuck"; }

private:
    std::mutex mutex_;
    bool stopped_ = false;
    std::chrono::steady_clock::time_point release_at_{};
};

} // namespace

int main() {
    std::cout << "=== Pipeline End-to-End Test ===\n\n";
    setLogLevel(LogLevel::ERROR);

    int pass = 0, fail = 0;

    // ========================================================================
    // TEST 1: High-Performance
    // ========================================================================
    std::cout << "TEST 1: High-Performance run (~1 s)\n";
    {
        PipelineConfig cfg;
        cfg.channels = {"ai0", "ai1"};
        cfg.sample_rate_hz = 50000.0;
        cfg.filter.type = FilterType::LOWPASS;
        cfg.filter.low_hz = 1000.0;

        sim::SimulatedDaqDevice device;
        Pipeline pipeline(cfg, device);

        std::atomic<int> frames{0};
        std::atomic<int> frames_with_result{0};
        pipeline.setDisplayCallback([&](const DisplayFrame& f) {
            frames++;
            if (f.result) frames_with_result++;
        });

        pipeline.start();
        bool hp = pipeline.currentMode() == PipelineMode::HIGH_PERFORMANCE;
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));
        pipeline.stop();

        PerformanceMetrics m = pipeline.getMetrics();
        if (hp && !pipeline.currentMode() && !pipeline.isRunning()) {
            std::cout << "  [PASS] Ran in High-Performance mode, mode cleared on stop\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Mode handling wrong\n";
            fail++;
        }

        if (m.samples_dropped == 0 && m.rate_valid && m.rate_accuracy_pct >= 99.0) {
            std::cout << "  [PASS] Accuracy " << m.rate_accuracy_pct << "%, no drops\n";
            pass++;
        } else {
            std::cout << "  [FAIL] accuracy=" << m.rate_accuracy_pct << "% dropped=" << m.samples_dropped << "\n";
            fail++;
        }

        int n = frames.load();
        if (n >= 29 && n <= 31) {
            std::cout << "  [PASS] " << n << " display frames at a 30 Hz cadence\n";
            pass++;
        } else {
            std::cout << "  [FAIL] " << n << " display frames\n";
            fail++;
        }

        auto result = pipeline.latestResult();
        if (result && result->filtered && result->statistics.size() == 2 && frames_with_result.load() > 0) {
            std::cout << "  [PASS] Filtered background results reached the display\n";
            pass++;
        } else {
            std::cout << "  [FAIL] No background result displayed\n";
            fail++;
        }

        const MemoryPool* pool = pipeline.pool();
        if (pool && !pool->isBypass() && pool->getStats().pool_hits > 0 &&
            pool->getStats().outstanding == 0) {
            std::cout << "  [PASS] Pool reused storage, nothing left outstanding\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Pool not used as planned\n";
            fail++;
        }

        TraceWindow w = pipeline.exportWindow(500);
        bool ordered = w.size() == 500 && w.channels.size() == 2;
        for (size_t i = 1; ordered && i < w.size(); ++i) {
            if (!(w.timestamps_ms[i] > w.timestamps_ms[i - 1])) ordered = false;
        }
        if (ordered && pipeline.getStats().forced_shutdowns == 0) {
            std::cout << "  [PASS] Exported window ordered; clean shutdown\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Export or shutdown wrong\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 2: Standard
    // ========================================================================
    std::cout << "\nTEST 2: Standard run (~1 s)\n";
    {
        PipelineConfig cfg;
        cfg.sample_rate_hz = 2000.0;
        cfg.spectrum.fft_length = 1024;

        sim::SimulatedDaqDevice device;
        Pipeline pipeline(cfg, device);

        std::atomic<int> frames{0};
        pipeline.setDisplayCallback([&](const DisplayFrame&) { frames++; });

        pipeline.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));
        pipeline.stop();

        const DisplayGate* gate = pipeline.displayGate();
        ExecutionPlan plan = pipeline.plan();
        if (plan.mode == PipelineMode::STANDARD && !pipeline.processor() && pipeline.pool()->isBypass()) {
            std::cout << "  [PASS] No background thread, pool bypassed\n";
            pass++;
        } else {
            std::cout << "  [FAIL] " << plan.describe() << "\n";
            fail++;
        }

        // 2 kHz in 50-sample blocks: 40 blocks/s
        if (gate && gate->getStats().inline_cycles >= 20 && frames.load() >= 20) {
            std::cout << "  [PASS] " << frames.load() << " frames, "
                      << gate->getStats().inline_cycles << " inline cycles\n";
            pass++;
        } else {
            std::cout << "  [FAIL] frames=" << frames.load() << "\n";
            fail++;
        }

        auto result = pipeline.latestResult();
        if (result && result->spectrum.status == SpectrumStatus::OK && result->spectrum.psd_db.size() == 1) {
            std::cout << "  [PASS] Spectrum ready after 1024 samples\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Spectrum not ready\n";
            fail++;
        }

        // Restart with the same pipeline
        pipeline.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        pipeline.stop();
        if (pipeline.getStats().runs == 2 && !pipeline.hasFaulted()) {
            std::cout << "  [PASS] Second run on the same pipeline\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Restart failed\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 3: Fault
    // ========================================================================
    std::cout << "\nTEST 3: Device fault\n";
    {
        PipelineConfig cfg;
        cfg.sample_rate_hz = 1000.0;

        sim::SimulatedDaqDevice::Config sim_cfg;
        sim_cfg.fault_after_reads = 5;
        sim::SimulatedDaqDevice device(sim_cfg);
        Pipeline pipeline(cfg, device);

        std::atomic<int> critical{0};
        pipeline.setAlertCallback([&](const Alert& a) {
            if (a.category == AlertCategory::FAULT && a.level == AlertLevel::CRITICAL) critical++;
        });

        pipeline.start();
        for (int i = 0; i < 300 && !pipeline.hasFaulted(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        bool stopped_itself = pipeline.hasFaulted() && !pipeline.isRunning();
        pipeline.stop();

        if (stopped_itself && critical.load() == 1) {
            std::cout << "  [PASS] Fault ended the run with one CRITICAL alert\n";
            pass++;
        } else {
            std::cout << "  [FAIL] faulted=" << pipeline.hasFaulted() << " alerts=" << critical.load() << "\n";
            fail++;
        }

        bool rethrown = false;
        try {
            pipeline.rethrowIfFaulted();
        } catch (const AcquisitionFault& e) {
            rethrown = std::string(e.what()).find("disconnected") != std::string::npos;
        }
        if (rethrown && pipeline.getStats().faulted) {
            std::cout << "  [PASS] AcquisitionFault rethrown to the caller\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Fault not rethrown\n";
            fail++;
        }

        if (pipeline.currentAlertLevel() == AlertLevel::CRITICAL &&
            pipeline.exportWindow(1000).size() == 250) {
            std::cout << "  [PASS] Data acquired before the fault still readable\n";
            pass++;
        } else {
            std::cout << "  [FAIL] exported " << pipeline.exportWindow(1000).size() << " rows\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 4: Misuse
    // ========================================================================
    std::cout << "\nTEST 4: Lifecycle misuse\n";
    {
        PipelineConfig bad;
        bad.channels.clear();
        sim::SimulatedDaqDevice device;
        bool threw = false;
        try {
            Pipeline p(bad, device);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (threw) {
            std::cout << "  [PASS] Invalid config rejected at construction\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Invalid config accepted\n";
            fail++;
        }

        PipelineConfig cfg;
        Pipeline p(cfg, device);
        p.start();
        bool double_start = false;
        try {
            p.start();
        } catch (const std::logic_error&) {
            double_start = true;
        }
        p.stop();
        p.stop();
        if (double_start && !p.isRunning()) {
            std::cout << "  [PASS] Double start rejected, repeated stop harmless\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Lifecycle misuse not handled\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 5: Filtered trace
    // ========================================================================
    std::cout << "\nTEST 5: Display trace follows the filter (~1.2 s)\n";
    {
        // 400 Hz tone, no noise; peak of the middle half of the last trace
        auto runTone = [](FilterType type, bool& filtered) {
            PipelineConfig cfg;
            cfg.sample_rate_hz = 2000.0;
            cfg.spectrum.enabled = false;
            cfg.max_display_points = 4000;   // No decimation
            cfg.filter.type = type;
            cfg.filter.low_hz = 50.0;

            sim::SimulatedDaqDevice::Config sim_cfg;
            sim::ChannelSignal tone;
            tone.frequency_hz = 400.0;
            tone.noise_std = 0.0;
            sim_cfg.signals = {tone};
            sim::SimulatedDaqDevice device(sim_cfg);
            Pipeline pipeline(cfg, device);

            std::mutex m;
            DisplayFrame last;
            pipeline.setDisplayCallback([&](const DisplayFrame& f) {
                std::lock_guard<std::mutex> lock(m);
                last = f;
            });
            pipeline.start();
            std::this_thread::sleep_for(std::chrono::milliseconds(600));
            pipeline.stop();

            std::lock_guard<std::mutex> lock(m);
            filtered = last.trace_filtered;
            double peak = 0.0;
            if (last.trace.channels.empty()) return peak;
            const auto& y = last.trace.channels[0];
            for (size_t i = y.size() / 4; i < 3 * y.size() / 4; ++i) peak = std::max(peak, std::abs(y[i]));
            return peak;
        };

        bool raw_flag = true, lp_flag = false;
        double raw_peak = runTone(FilterType::NONE, raw_flag);
        double lp_peak = runTone(FilterType::LOWPASS, lp_flag);

        if (!raw_flag && raw_peak > 0.9) {
            std::cout << "  [PASS] Unfiltered trace peak " << raw_peak << "\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Unfiltered trace peak " << raw_peak << " (flag " << raw_flag << ")\n";
            fail++;
        }
        if (lp_flag && lp_peak < 0.05) {
            std::cout << "  [PASS] 50 Hz lowpass removes the 400 Hz tone from the trace (peak "
                      << lp_peak << ")\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Filtered trace peak " << lp_peak << " (flag " << lp_flag << ")\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 6: Device that ignores stop()
    // ========================================================================
    std::cout << "\nTEST 6: Shutdown with a stuck device (~0.6 s)\n";
    {
        PipelineConfig cfg;
        cfg.shutdown_timeout_ms = 100;
        StuckDevice device;
        Pipeline pipeline(cfg, device);

        pipeline.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        auto t0 = std::chrono::steady_clock::now();
        pipeline.stop();
        double stop_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

        Pipeline::Stats st = pipeline.getStats();
        if (st.forced_shutdowns == 1 && st.hung_workers == 1) {
            std::cout << "  [PASS] Producer forced, then reported hung\n";
            pass++;
        } else {
            std::cout << "  [FAIL] forced=" << st.forced_shutdowns << " hung=" << st.hung_workers << "\n";
            fail++;
        }
        if (stop_ms >= 400.0 && !pipeline.isRunning() && !pipeline.currentMode()) {
            std::cout << "  [PASS] stop() waited " << stop_ms << " ms for the driver, then cleaned up\n";
            pass++;
        } else {
            std::cout << "  [FAIL] stop() returned after " << stop_ms << " ms\n";
            fail++;
        }
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All pipeline tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
