// test_acquisition.cpp - Acquisition producer against simulated and scripted devices
//
// Tests:
// 1. Rate accuracy arithmetic
// 2. Sample-clock timestamps and block accounting
// 3. Achieved rate tracks a device that delivers 2/3 of its clock
// 4. Timeout retries, then a stall report
// 5. Device fault ends run() with AcquisitionFault
// 6. Accuracy falls once a device stops delivering

#include "acquisition/acquisition_producer.hpp"
#include "buffer/channel_ring_buffer.hpp"
#include "fastdaq/errors.hpp"
#include "fastdaq/logging.hpp"
#include "monitor/performance_monitor.hpp"
#include "pool/memory_pool.hpp"
#include "sim/simulated_daq_device.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <deque>
#include <iostream>
#include <string>
#include <thread>

using namespace fastdaq;

namespace {

// Replays a fixed sequence of read outcomes, then returns OK forever
class ScriptedDevice : public IDaqDevice {
public:
    explicit ScriptedDevice(std::deque<ReadStatus> script) : script_(std::move(script)) {}

    void start(const DeviceConfig& config) override { channels_ = config.channels.size(); }

    ReadResult readBlock(size_t samples, std::chrono::milliseconds, MutableSampleSpan out) override {
        reads_++;
        ReadStatus next = ReadStatus::OK;
        if (!script_.empty()) {
            next = script_.front();
            script_.pop_front();
        }
        if (next == ReadStatus::TIMEOUT) return ReadResult::timeout("scripted timeout");
        if (next == ReadStatus::FAULT) return ReadResult::fault("scripted fault");
        for (size_t i = 0; i < channels_ * samples; ++i) out[i] = 1.0;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return ReadResult::success();
    }

    void stop() override {}
    std::string name() const override { return "Scripted"; }

    int reads() const { return reads_.load(); }

private:
    std::deque<ReadStatus> script_;
    size_t channels_ = 1;
    std::atomic<int> reads_{0};
};

// Delivers `blocks` blocks in real time, then only times out
class FallsSilentDevice : public IDaqDevice {
public:
    FallsSilentDevice(int blocks, double rate_hz) : blocks_(blocks), rate_hz_(rate_hz) {}

    void start(const DeviceConfig& config) override { channels_ = config.channels.size(); }

    ReadResult readBlock(size_t samples, std::chrono::milliseconds, MutableSampleSpan out) override {
        if (delivered_ >= blocks_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return ReadResult::timeout("no data");
        }
        std::this_thread::sleep_for(std::chrono::duration<double>(static_cast<double>(samples) / rate_hz_));
        for (size_t i = 0; i < channels_ * samples; ++i) out[i] = 0.5;
        delivered_++;
        return ReadResult::success();
    }

    void stop() override {}
    std::string name() const override { return "FallsSilent"; }

private:
    int blocks_;
    double rate_hz_;
    size_t channels_ = 1;
    int delivered_ = 0;
};

AcquisitionProducer::Config producerConfig(size_t channels, double rate, size_t block) {
    AcquisitionProducer::Config c;
    c.channels = channels;
    c.sample_rate_hz = rate;
    c.samples_per_block = block;
    c.read_timeout = std::chrono::milliseconds(500);
    c.max_read_retries = 3;
    c.retry_backoff_ms = 1;
    c.rate_window_s = 2.0;
    return c;
}

DeviceConfig deviceConfig(size_t channels, double rate, size_t block) {
    DeviceConfig dc;
    dc.device_name = "SimDev1";
    for (size_t ch = 0; ch < channels; ++ch) {
        dc.channels.push_back("ai" + std::to_string(ch));
        dc.ranges.push_back(ChannelRange{});
    }
    dc.sample_rate_hz = rate;
    dc.samples_per_block = block;
    return dc;
}

} // namespace

int main() {
    std::cout << "=== Acquisition Producer Test ===\n\n";
    setLogLevel(LogLevel::WARN);

    int pass = 0, fail = 0;

    // ========================================================================
    // TEST 1: Accuracy arithmetic
    // ========================================================================
    std::cout << "TEST 1: Rate accuracy\n";
    {
        double acc = rateAccuracyPercent(50000.0, 33333.0);
        if (std::abs(acc - 66.7) < 0.1) {
            std::cout << "  [PASS] 33,333 of 50,000 samples = " << acc << "%\n";
            pass++;
        } else {
            std::cout << "  [FAIL] rateAccuracyPercent(50000, 33333) = " << acc << "\n";
            fail++;
        }
        if (rateAccuracyPercent(0.0, 10.0) == 0.0 && rateAccuracyPercent(1000.0, 1000.0) == 100.0) {
            std::cout << "  [PASS] Edge values\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Edge values wrong\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 2: Timestamps
    // ========================================================================
    std::cout << "\nTEST 2: Sample-clock timestamps\n";
    {
        const double rate = 20000.0;
        const size_t block = 200;
        sim::SimulatedDaqDevice::Config sim_cfg;
        sim_cfg.max_speedup = 0;   // Unpaced
        sim_cfg.fault_after_reads = 10;
        sim::SimulatedDaqDevice device(sim_cfg);
        ChannelRingBuffer buffer(2, 4000);
        MemoryPool pool;
        AcquisitionProducer producer(device, buffer, pool, producerConfig(2, rate, block));

        device.start(deviceConfig(2, rate, block));
        bool faulted = false;
        try {
            producer.run();
        } catch (const AcquisitionFault&) {
            faulted = true;
        }

        auto stats = producer.getStats();
        TraceWindow w = buffer.readWindow(2000);
        bool ts_ok = w.size() == 2000 && w.first_index == 0;
        for (size_t i = 0; ts_ok && i < w.size(); ++i) {
            if (std::abs(w.timestamps_ms[i] - static_cast<double>(i) * 1000.0 / rate) > 1e-9) ts_ok = false;
        }
        if (faulted && stats.blocks_acquired == 10 && stats.samples_acquired == 2000) {
            std::cout << "  [PASS] 10 blocks of 200 before the scripted disconnect\n";
            pass++;
        } else {
            std::cout << "  [FAIL] blocks=" << stats.blocks_acquired << " samples=" << stats.samples_acquired << "\n";
            fail++;
        }
        if (ts_ok) {
            std::cout << "  [PASS] Timestamps are index * 1000 / rate\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Timestamps do not follow the sample clock\n";
            fail++;
        }

        // Producer storage recycled through the pool
        auto ps = pool.getStats();
        if (ps.outstanding == 0 && ps.pool_hits >= 9) {
            std::cout << "  [PASS] Block storage reused (" << ps.pool_hits << " hits)\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Pool hits " << ps.pool_hits << ", outstanding " << ps.outstanding << "\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 3: Rate accuracy of a slow device
    // ========================================================================
    std::cout << "\nTEST 3: Achieved rate (real time, ~3 s)\n";
    {
        const double rate = 1000.0;
        const size_t block = 50;
        sim::SimulatedDaqDevice::Config sim_cfg;
        sim_cfg.throughput_factor = 0.667;
        sim::SimulatedDaqDevice device(sim_cfg);
        ChannelRingBuffer buffer(1, 5000);
        MemoryPool pool;
        AcquisitionProducer producer(device, buffer, pool, producerConfig(1, rate, block));

        device.start(deviceConfig(1, rate, block));
        std::thread t([&producer] { producer.run(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(3000));
        auto stats = producer.getStats();
        producer.requestStop();
        device.stop();
        t.join();

        if (stats.rate_valid && std::abs(stats.rate_accuracy_pct - 66.7) < 3.0) {
            std::cout << "  [PASS] Rate accuracy " << stats.rate_accuracy_pct << "% (expected ~66.7%)\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Rate accuracy " << stats.rate_accuracy_pct << "% (expected ~66.7%)\n";
            fail++;
        }
        if (std::abs(stats.achieved_rate_hz - 667.0) < 30.0) {
            std::cout << "  [PASS] Achieved rate " << stats.achieved_rate_hz << " Hz\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Achieved rate " << stats.achieved_rate_hz << " Hz\n";
            fail++;
        }
        if (!producer.getStats().running) {
            std::cout << "  [PASS] run() returned after requestStop()\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Producer still marked running\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 4: Timeouts and stalls
    // ========================================================================
    std::cout << "\nTEST 4: Retry and stall\n";
    {
        // Two timeouts are retried without a stall
        ScriptedDevice recovering({ReadStatus::TIMEOUT, ReadStatus::TIMEOUT});
        ChannelRingBuffer buffer(1, 1000);
        MemoryPool pool;
        AcquisitionProducer producer(recovering, buffer, pool, producerConfig(1, 1000.0, 10));
        int stalls_seen = 0;
        producer.setStallCallback([&](int, const std::string&) { stalls_seen++; });

        recovering.start(deviceConfig(1, 1000.0, 10));
        std::thread t([&producer] { producer.run(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        producer.requestStop();
        t.join();

        auto stats = producer.getStats();
        if (stats.timeouts == 2 && stats.stalls == 0 && stalls_seen == 0 && stats.blocks_acquired > 0) {
            std::cout << "  [PASS] 2 timeouts retried, acquisition continued\n";
            pass++;
        } else {
            std::cout << "  [FAIL] timeouts=" << stats.timeouts << " stalls=" << stats.stalls << "\n";
            fail++;
        }

        // Every read times out: a stall after max_read_retries + 1 in a row
        sim::SimulatedDaqDevice::Config sim_cfg;
        sim_cfg.timeout_every_n_reads = 1;
        sim::SimulatedDaqDevice dead(sim_cfg);
        ChannelRingBuffer buffer2(1, 1000);
        AcquisitionProducer stalled(dead, buffer2, pool, producerConfig(1, 1000.0, 10));
        std::atomic<int> stall_reports{0};
        int first_report_timeouts = 0;
        std::string first_error;
        stalled.setStallCallback([&](int timeouts, const std::string& error) {
            if (stall_reports.fetch_add(1) == 0) {
                first_report_timeouts = timeouts;
                first_error = error;
            }
        });

        dead.start(deviceConfig(1, 1000.0, 10));
        std::thread t2([&stalled] { stalled.run(); });
        for (int i = 0; i < 200 && stall_reports.load() == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        stalled.requestStop();
        dead.stop();
        t2.join();

        auto s2 = stalled.getStats();
        if (stall_reports.load() >= 1 && first_report_timeouts == 4 && first_error == "injected timeout") {
            std::cout << "  [PASS] Stall reported after 4 consecutive timeouts\n";
            pass++;
        } else {
            std::cout << "  [FAIL] stall reports=" << stall_reports.load()
                      << " timeouts at report=" << first_report_timeouts << "\n";
            fail++;
        }
        if (s2.samples_acquired == 0 && s2.stalls >= 1 && s2.timeouts >= 4) {
            std::cout << "  [PASS] Stall is not fatal and nothing was pushed\n";
            pass++;
        } else {
            std::cout << "  [FAIL] samples=" << s2.samples_acquired << " stalls=" << s2.stalls << "\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 5: Fault
    // ========================================================================
    std::cout << "\nTEST 5: Device fault\n";
    {
        ScriptedDevice device({ReadStatus::OK, ReadStatus::OK, ReadStatus::FAULT});
        ChannelRingBuffer buffer(1, 1000);
        MemoryPool pool;
        AcquisitionProducer producer(device, buffer, pool, producerConfig(1, 1000.0, 10));
        device.start(deviceConfig(1, 1000.0, 10));

        std::string message;
        try {
            producer.run();
        } catch (const AcquisitionFault& e) {
            message = e.what();
        }
        if (message.find("scripted fault") != std::string::npos) {
            std::cout << "  [PASS] AcquisitionFault carries the device message\n";
            pass++;
        } else {
            std::cout << "  [FAIL] No AcquisitionFault (message '" << message << "')\n";
            fail++;
        }

        auto stats = producer.getStats();
        if (stats.blocks_acquired == 2 && buffer.sequence() == 2 && !stats.running) {
            std::cout << "  [PASS] Blocks before the fault were kept\n";
            pass++;
        } else {
            std::cout << "  [FAIL] blocks=" << stats.blocks_acquired << "\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 6: Device goes silent
    // ========================================================================
    std::cout << "\nTEST 6: Silent device (real time, ~2.5 s)\n";
    {
        const double rate = 10000.0;
        const size_t block = 100;
        FallsSilentDevice device(100, rate);   // 1 s of data
        ChannelRingBuffer buffer(1, 20000);
        MemoryPool pool;
        AcquisitionProducer::Config pc = producerConfig(1, rate, block);
        pc.rate_window_s = 1.0;
        AcquisitionProducer producer(device, buffer, pool, pc);

        PerformanceMonitor::Config mc;
        mc.sample_rate_hz = rate;
        mc.block_period_ms = 50.0;
        PerformanceMonitor monitor(mc);
        PerformanceMonitor::Sources src;
        src.producer = &producer;
        monitor.setSources(src);
        int rate_critical = 0;
        monitor.setAlertCallback([&](const Alert& a) {
            if (a.category == AlertCategory::RATE && a.level == AlertLevel::CRITICAL) rate_critical++;
        });

        device.start(deviceConfig(1, rate, block));
        std::thread t([&producer] { producer.run(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(900));
        PerformanceMetrics live = monitor.sampleNow();
        int critical_while_live = rate_critical;
        std::this_thread::sleep_for(std::chrono::milliseconds(1600));
        PerformanceMetrics silent = monitor.sampleNow();
        producer.requestStop();
        t.join();

        if (live.rate_valid && live.rate_accuracy_pct > 90.0 && critical_while_live == 0) {
            std::cout << "  [PASS] Accuracy " << live.rate_accuracy_pct << "% while data flows\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Accuracy " << live.rate_accuracy_pct << "% while data flows\n";
            fail++;
        }
        if (silent.rate_valid && silent.rate_accuracy_pct < 90.0 && silent.achieved_rate_hz < 1000.0) {
            std::cout << "  [PASS] Accuracy fell to " << silent.rate_accuracy_pct << "% after the device went silent\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Accuracy stuck at " << silent.rate_accuracy_pct << "% ("
                      << silent.achieved_rate_hz << " Hz)\n";
            fail++;
        }
        if (rate_critical == 1 && silent.samples_acquired == 100 * block) {
            std::cout << "  [PASS] One CRITICAL rate alert, 10000 samples acquired\n";
            pass++;
        } else {
            std::cout << "  [FAIL] rate alerts=" << rate_critical << " samples=" << silent.samples_acquired << "\n";
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
        std::cout << "\n[SUCCESS] All acquisition tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
