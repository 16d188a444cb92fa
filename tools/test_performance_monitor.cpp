// test_performance_monitor.cpp - Metrics, thresholds and edge-triggered alerts
//
// Tests:
// 1. Occupancy thresholds, one alert per edge, recovery
// 2. Processing latency against the block period
// 3. Event reports (stall, processing error, overrun, fault)
// 4. Alert history is bounded
// 5. Rate accuracy alert from a device delivering 2/3 of its clock
// 6. Benchmarks
// 7. Dropped samples as a count and a rate

#include "acquisition/acquisition_producer.hpp"
#include "buffer/channel_ring_buffer.hpp"
#include "fastdaq/logging.hpp"
#include "monitor/performance_monitor.hpp"
#include "pool/memory_pool.hpp"
#include "sim/simulated_daq_device.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace fastdaq;

namespace {

void pushRows(ChannelRingBuffer& buffer, size_t samples) {
    std::vector<double> ts(samples, 0.0);
    std::vector<double> values(buffer.channels() * samples, 0.0);
    SampleBlock b;
    b.timestamps_ms = ts;
    b.values = values;
    b.channels = buffer.channels();
    b.samples = samples;
    buffer.push(b);
}

// Collects alerts delivered through the callback
struct AlertSink {
    std::vector<Alert> alerts;

    size_t count(AlertCategory c, AlertLevel l) const {
        size_t n = 0;
        for (const auto& a : alerts) {
            if (a.category == c && a.level == l) n++;
        }
        return n;
    }
};

} // namespace

int main() {
    std::cout << "=== Performance Monitor Test ===\n\n";
    setLogLevel(LogLevel::ERROR);

    int pass = 0, fail = 0;
    auto check = [&](bool ok, const std::string& what) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << what << "\n";
        ok ? pass++ : fail++;
    };

    // ========================================================================
    // TEST 1: Occupancy
    // ========================================================================
    std::cout << "TEST 1: Buffer occupancy\n";
    {
        ChannelRingBuffer buffer(1, 1000);
        MemoryPool pool;
        PerformanceMonitor monitor;
        PerformanceMonitor::Sources src;
        src.buffer = &buffer;
        monitor.setSources(src);
        AlertSink sink;
        monitor.setAlertCallback([&sink](const Alert& a) { sink.alerts.push_back(a); });

        pushRows(buffer, 500);
        PerformanceMetrics m = monitor.sampleNow();
        check(sink.alerts.empty() && std::abs(m.occupancy_pct - 50.0) < 1e-9, "50%: no alert");

        pushRows(buffer, 350);
        monitor.sampleNow();
        monitor.sampleNow();
        check(sink.count(AlertCategory::OCCUPANCY, AlertLevel::WARNING) == 1 && sink.alerts.size() == 1,
              "85%: exactly one WARNING over two samples");
        check(monitor.currentAlertLevel() == AlertLevel::WARNING, "Current level WARNING");

        pushRows(buffer, 120);
        monitor.sampleNow();
        check(sink.count(AlertCategory::OCCUPANCY, AlertLevel::CRITICAL) == 1 &&
              sink.alerts.back().threshold == 95.0, "97%: CRITICAL with the 95% threshold");

        Snapshot s = buffer.takeSnapshot(10, pool);
        monitor.sampleNow();
        const Alert& last = sink.alerts.back();
        check(last.level == AlertLevel::INFO && last.category == AlertCategory::OCCUPANCY &&
              last.message.rfind("Recovered: ", 0) == 0, "Drained: INFO recovery alert");
        check(monitor.currentAlertLevel() == AlertLevel::INFO && sink.alerts.size() == 3,
              "All clear after recovery");
    }

    // ========================================================================
    // TEST 2: Latency
    // ========================================================================
    std::cout << "\nTEST 2: Processing latency\n";
    {
        PerformanceMonitor::Config cfg;
        cfg.block_period_ms = 20.0;
        PerformanceMonitor monitor(cfg);
        AlertSink sink;
        monitor.setAlertCallback([&sink](const Alert& a) { sink.alerts.push_back(a); });

        monitor.recordProcessingLatency(10.0);
        PerformanceMetrics m = monitor.sampleNow();
        check(sink.alerts.empty() && m.avg_processing_ms == 10.0 && m.latency_budget_ms == 20.0,
              "10 ms within a 20 ms budget");

        monitor.recordProcessingLatency(25.0);
        monitor.recordProcessingLatency(35.0);
        m = monitor.sampleNow();
        check(sink.count(AlertCategory::LATENCY, AlertLevel::WARNING) == 1 && m.avg_processing_ms == 30.0,
              "30 ms average: WARNING");

        monitor.recordProcessingLatency(50.0);
        monitor.sampleNow();
        check(sink.count(AlertCategory::LATENCY, AlertLevel::CRITICAL) == 1, "50 ms: CRITICAL");

        monitor.sampleNow();
        check(sink.alerts.size() == 2 && monitor.currentAlertLevel() == AlertLevel::CRITICAL,
              "No new cycles: level unchanged, no alert");

        monitor.recordProcessingLatency(5.0);
        m = monitor.sampleNow();
        check(sink.alerts.back().level == AlertLevel::INFO && m.max_processing_ms == 50.0 &&
              m.processing_cycles == 5, "Recovery keeps max and cycle count");
    }

    // ========================================================================
    // TEST 3: Events
    // ========================================================================
    std::cout << "\nTEST 3: Event reports\n";
    {
        PerformanceMonitor monitor;
        AlertSink sink;
        monitor.setAlertCallback([&sink](const Alert& a) { sink.alerts.push_back(a); });

        monitor.reportStall(4, "read timed out");
        check(sink.count(AlertCategory::STALL, AlertLevel::WARNING) == 1 &&
              sink.alerts.back().message.find("read timed out") != std::string::npos,
              "Stall alert raised immediately");
        monitor.sampleNow();
        monitor.sampleNow();
        check(sink.count(AlertCategory::STALL, AlertLevel::INFO) == 1, "Stall recovers when no new stalls");

        for (int i = 0; i < 3; ++i) monitor.reportProcessingError("bad window");
        size_t before = sink.alerts.size();
        PerformanceMetrics m = monitor.sampleNow();
        check(sink.alerts.size() == before + 1 &&
              sink.count(AlertCategory::PROCESSING, AlertLevel::WARNING) == 1 && m.processing_errors == 3,
              "Three errors aggregated into one WARNING");

        monitor.reportOverrun(100);
        monitor.reportOverrun(50);
        monitor.sampleNow();
        bool overrun_seen = false;
        for (const auto& a : sink.alerts) {
            if (a.category == AlertCategory::OVERRUN && a.value == 150.0) overrun_seen = true;
        }
        check(overrun_seen, "Overruns summarised per interval");

        monitor.reportPoolExhaustion(64);
        monitor.sampleNow();
        check(sink.count(AlertCategory::POOL, AlertLevel::WARNING) == 1 &&
              monitor.getMetrics().pool_exhaustion == 1, "Pool exhaustion reported");

        monitor.reportFault("device disconnected");
        monitor.sampleNow();
        monitor.sampleNow();
        check(sink.count(AlertCategory::FAULT, AlertLevel::CRITICAL) == 1 &&
              monitor.currentAlertLevel() == AlertLevel::CRITICAL && monitor.getMetrics().faults == 1,
              "Fault stays CRITICAL");
    }

    // ========================================================================
    // TEST 4: History bound
    // ========================================================================
    std::cout << "\nTEST 4: Alert history\n";
    {
        PerformanceMonitor monitor;
        for (int i = 0; i < 60; ++i) {
            monitor.reportProcessingError("x");
            monitor.sampleNow();   // WARNING
            monitor.sampleNow();   // Recovered
        }
        auto history = monitor.getAlertHistory();
        check(monitor.alertCount() == 120 && history.size() == 100, "120 alerts, newest 100 kept");
        check(history.back().level == AlertLevel::INFO && history.front().level == AlertLevel::WARNING,
              "History is oldest-first");
    }

    // ========================================================================
    // TEST 5: Rate accuracy
    // ========================================================================
    std::cout << "\nTEST 5: Rate accuracy (real time, ~1.5 s)\n";
    {
        sim::SimulatedDaqDevice::Config sim_cfg;
        sim_cfg.throughput_factor = 0.667;
        sim::SimulatedDaqDevice device(sim_cfg);
        ChannelRingBuffer buffer(1, 10000);
        MemoryPool pool;
        AcquisitionProducer::Config pc;
        pc.sample_rate_hz = 1000.0;
        pc.samples_per_block = 50;
        AcquisitionProducer producer(device, buffer, pool, pc);

        PerformanceMonitor::Config mc;
        mc.sample_rate_hz = 1000.0;
        mc.block_period_ms = 50.0;
        PerformanceMonitor monitor(mc);
        PerformanceMonitor::Sources src;
        src.producer = &producer;
        src.buffer = &buffer;
        src.pool = &pool;
        monitor.setSources(src);
        AlertSink sink;
        monitor.setAlertCallback([&sink](const Alert& a) { sink.alerts.push_back(a); });

        DeviceConfig dc;
        dc.channels = {"ai0"};
        dc.ranges = {ChannelRange{}};
        dc.sample_rate_hz = 1000.0;
        device.start(dc);
        std::thread t([&producer] { producer.run(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        PerformanceMetrics m = monitor.sampleNow();
        producer.requestStop();
        device.stop();
        t.join();

        check(m.rate_valid && m.rate_accuracy_pct > 62.0 && m.rate_accuracy_pct < 71.0,
              "Accuracy ~66.7% (got " + std::to_string(m.rate_accuracy_pct) + ")");
        check(sink.count(AlertCategory::RATE, AlertLevel::CRITICAL) == 1, "Below 90%: CRITICAL rate alert");
        check(m.samples_requested > m.samples_acquired && m.samples_acquired > 0,
              "Requested vs acquired sample counts");
    }

    // ========================================================================
    // TEST 6: Benchmarks
    // ========================================================================
    std::cout << "\nTEST 6: Benchmarks\n";
    {
        BenchmarkResult ring = PerformanceMonitor::benchmarkRingBuffer(4, 100000, 1000, 200);
        check(ring.success && ring.samples_processed == 800000 && ring.throughput > 0.0,
              "Ring buffer benchmark");

        SignalProcessor::Config pc;
        pc.sample_rate_hz = 10000.0;
        pc.window_samples = 10000;
        pc.spectrum.fft_length = 8192;
        BenchmarkResult proc = PerformanceMonitor::benchmarkProcessor(pc, 2, 5);
        check(proc.success && proc.samples_processed == 5u * 10000u * 2u, "Processor benchmark");

        SignalProcessor::Config bad = pc;
        bad.spectrum.fft_length = 1000;
        BenchmarkResult failed = PerformanceMonitor::benchmarkProcessor(bad, 2, 5);
        check(!failed.success && !failed.error.empty(), "Bad config reported, not thrown");
    }

    // ========================================================================
    // TEST 7: Dropped samples
    // ========================================================================
    std::cout << "\nTEST 7: Dropped samples, cumulative and rate\n";
    {
        ChannelRingBuffer buffer(1, 1000);
        PerformanceMonitor monitor;
        PerformanceMonitor::Sources src;
        src.buffer = &buffer;
        monitor.setSources(src);

        PerformanceMetrics m = monitor.sampleNow();
        check(m.samples_dropped == 0 && m.dropped_rate_hz == 0.0, "No drops yet");

        pushRows(buffer, 1500);   // 500 unread rows overwritten
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        m = monitor.sampleNow();
        check(m.samples_dropped == 500 && m.dropped_rate_hz > 1500.0 && m.dropped_rate_hz <= 2500.0,
              "500 drops over ~0.2 s (" + std::to_string(m.dropped_rate_hz) + "/s)");

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        m = monitor.sampleNow();
        check(m.samples_dropped == 500 && m.dropped_rate_hz == 0.0,
              "Rate returns to zero, count is cumulative");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All performance monitor tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
