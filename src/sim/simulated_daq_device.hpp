/**
 * SimulatedDaqDevice - Software stand-in for a multi-channel analog input card
 *
 * Models a hardware sample clock:
 * - Samples become available at exactly sample_rate per second (time-based)
 * - Each channel carries a tone + DC offset + Gaussian noise, clipped to its range
 * - readBlock() waits until the requested rows exist, or times out
 *
 * Fault injection for tests and the CLI:
 * - throughput_factor < 1 models a device that cannot keep up with its clock
 * - timeout_every_n_reads makes every Nth read time out
 * - fault_after_reads disconnects the device after N good reads
 * - nan_every_n_reads corrupts one sample in every Nth block
 *
 * Usage:
 *   sim::SimulatedDaqDevice::Config cfg;
 *   cfg.max_speedup = 0;                 // as fast as the reader can go
 *   sim::SimulatedDaqDevice device(cfg);
 *   device.start(DeviceConfig::fromPipeline(pipeline_config));
 *   device.readBlock(n, std::chrono::milliseconds(100), out);
 */

#pragma once

#include "acquisition/daq_device.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace fastdaq {
namespace sim {

struct ChannelSignal {
    double amplitude = 1.0;        // Volts peak
    double frequency_hz = 50.0;
    double offset = 0.0;           // Volts DC
    double noise_std = 0.01;       // Volts RMS
};

class SimulatedDaqDevice : public IDaqDevice {
public:
    struct Config {
        std::vector<ChannelSignal> signals;   // Per channel; missing entries use defaults
        uint32_t seed;
        float max_speedup;                    // 1.0 = real-time, 0 = unlimited
        double throughput_factor;             // Fraction of the sample clock actually delivered
        int timeout_every_n_reads;            // 0 = never
        int fault_after_reads;                // 0 = never
        int nan_every_n_reads;                // 0 = never

        Config()
            : seed(42)
            , max_speedup(1.0f)
            , throughput_factor(1.0)
            , timeout_every_n_reads(0)
            , fault_after_reads(0)
            , nan_every_n_reads(0)
        {}
    };

    explicit SimulatedDaqDevice(const Config& config = Config());
    ~SimulatedDaqDevice() override = default;

    // ========================================================================
    // IDaqDevice
    // ========================================================================

    void start(const DeviceConfig& config) override;
    ReadResult readBlock(size_t samples, std::chrono::milliseconds timeout,
                         MutableSampleSpan out) override;
    void stop() override;
    std::string name() const override;

    // ========================================================================
    // SIMULATION CONTROL
    // ========================================================================

    // May be changed while running
    void setThroughputFactor(double factor);
    double getThroughputFactor() const { return throughput_factor_.load(); }

    // Default signal for channel ch when none is configured
    static ChannelSignal defaultSignal(size_t ch);

    // ========================================================================
    // STATISTICS
    // ========================================================================

    uint64_t getSamplesProduced() const { return samples_produced_.load(); }
    uint64_t getReadCount() const { return reads_.load(); }
    bool isRunning() const { return running_.load(); }

private:
    using Clock = std::chrono::steady_clock;

    // Wait until deadline or stop(); false if stopped
    bool waitUntil(Clock::time_point deadline);

    void generate(size_t samples, MutableSampleSpan out);

    Config config_;
    DeviceConfig device_config_;
    std::vector<ChannelSignal> signals_;
    std::vector<double> phases_;           // Per-channel oscillator phase
    std::mt19937 rng_;

    std::atomic<bool> running_{false};
    std::atomic<double> throughput_factor_{1.0};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    // Sample clock: time at which `clock_base_samples_` had been produced
    Clock::time_point clock_base_time_{};
    uint64_t clock_base_samples_ = 0;

    std::atomic<uint64_t> samples_produced_{0};
    std::atomic<uint64_t> reads_{0};
    uint64_t good_reads_ = 0;
};

} // namespace sim
} // namespace fastdaq
