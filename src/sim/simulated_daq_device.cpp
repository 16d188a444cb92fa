/**
 * SimulatedDaqDevice - Implementation
 *
 * Sample availability follows a virtual clock started in start(): at time t,
 * (t - t0) * rate * throughput_factor * speedup rows exist. Changing the
 * throughput factor rebases the clock so already-produced rows stay put.
 */

#define _USE_MATH_DEFINES
#include <cmath>
#include "simulated_daq_device.hpp"
#include "fastdaq/errors.hpp"
#include "fastdaq/logging.hpp"

#include <algorithm>
#include <limits>

namespace fastdaq {
namespace sim {

SimulatedDaqDevice::SimulatedDaqDevice(const Config& config)
    : config_(config)
    , rng_(config.seed)
    , throughput_factor_(config.throughput_factor)
{
}

ChannelSignal SimulatedDaqDevice::defaultSignal(size_t ch) {
    ChannelSignal s;
    s.amplitude = 1.0;
    s.frequency_hz = 50.0 * static_cast<double>(ch + 1);
    s.offset = 0.0;
    s.noise_std = 0.01;
    return s;
}

void SimulatedDaqDevice::start(const DeviceConfig& config) {
    if (config.channels.empty()) {
        throw AcquisitionFault("simulated device: no channels configured");
    }
    if (!(config.sample_rate_hz > 0.0)) {
        throw AcquisitionFault("simulated device: invalid sample rate");
    }

    device_config_ = config;
    if (device_config_.ranges.size() < config.channels.size()) {
        device_config_.ranges.resize(config.channels.size());
    }

    signals_.clear();
    for (size_t ch = 0; ch < config.channels.size(); ++ch) {
        signals_.push_back(ch < config_.signals.size() ? config_.signals[ch] : defaultSignal(ch));
    }

    phases_.assign(signals_.size(), 0.0);
    rng_.seed(config_.seed);
    samples_produced_ = 0;
    reads_ = 0;
    good_reads_ = 0;
    clock_base_time_ = Clock::now();
    clock_base_samples_ = 0;
    running_ = true;

    LOG_ACQ(INFO, "SimDevice %s started: %zu ch @ %.0f Hz (throughput %.3f, speedup %.1f)",
            config.device_name.c_str(), config.channels.size(), config.sample_rate_hz,
            throughput_factor_.load(), config_.max_speedup);
}

void SimulatedDaqDevice::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wait_cv_.notify_all();
}

std::string SimulatedDaqDevice::name() const {
    return device_config_.device_name.empty() ? "SimDev" : device_config_.device_name;
}

void SimulatedDaqDevice::setThroughputFactor(double factor) {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    // Rebase so the rows already produced keep their place on the clock
    clock_base_time_ = Clock::now();
    clock_base_samples_ = samples_produced_.load();
    throughput_factor_ = std::max(factor, 1e-6);
}

bool SimulatedDaqDevice::waitUntil(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_until(lock, deadline, [this] { return !running_.load(); });
    return running_.load();
}

void SimulatedDaqDevice::generate(size_t samples, MutableSampleSpan out) {
    const double rate = device_config_.sample_rate_hz;
    const size_t channels = signals_.size();
    std::normal_distribution<double> gauss(0.0, 1.0);

    for (size_t ch = 0; ch < channels; ++ch) {
        const ChannelSignal& sig = signals_[ch];
        const ChannelRange& range = device_config_.ranges[ch];
        const double phase_inc = 2.0 * M_PI * sig.frequency_hz / rate;
        double phase = phases_[ch];
        double* dst = out.data() + ch * samples;
        for (size_t i = 0; i < samples; ++i) {
            double v = sig.offset + sig.amplitude * std::sin(phase) + sig.noise_std * gauss(rng_);
            dst[i] = std::clamp(v, range.v_min, range.v_max);
            phase += phase_inc;
            if (phase > 2.0 * M_PI) phase -= 2.0 * M_PI;
        }
        phases_[ch] = phase;
    }
}

ReadResult SimulatedDaqDevice::readBlock(size_t samples, std::chrono::milliseconds timeout,
                                         MutableSampleSpan out) {
    if (!running_) {
        return ReadResult::timeout("device not running");
    }
    if (out.size() < samples * signals_.size()) {
        return ReadResult::fault("output buffer too small");
    }

    uint64_t read_no = ++reads_;

    if (config_.fault_after_reads > 0 && good_reads_ >= static_cast<uint64_t>(config_.fault_after_reads)) {
        running_ = false;
        return ReadResult::fault("device disconnected");
    }
    if (config_.timeout_every_n_reads > 0 && read_no % config_.timeout_every_n_reads == 0) {
        return ReadResult::timeout("injected timeout");
    }

    // When will the requested rows exist?
    Clock::time_point ready;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        double speed = config_.max_speedup > 0.0f ? static_cast<double>(config_.max_speedup) : 0.0;
        if (speed > 0.0) {
            double effective_rate = device_config_.sample_rate_hz * throughput_factor_.load() * speed;
            uint64_t target = samples_produced_.load() + samples;
            double seconds = static_cast<double>(target - clock_base_samples_) / effective_rate;
            ready = clock_base_time_ + std::chrono::duration_cast<Clock::duration>(
                                           std::chrono::duration<double>(seconds));
        } else {
            ready = Clock::now();
        }
    }

    auto deadline = Clock::now() + timeout;
    if (ready > deadline) {
        if (!waitUntil(deadline)) return ReadResult::timeout("device stopped");
        return ReadResult::timeout("read timed out");
    }
    if (!waitUntil(ready)) return ReadResult::timeout("device stopped");

    generate(samples, out);
    samples_produced_ += samples;
    good_reads_++;

    if (config_.nan_every_n_reads > 0 && good_reads_ % config_.nan_every_n_reads == 0) {
        out[samples / 2] = std::numeric_limits<double>::quiet_NaN();
    }

    return ReadResult::success();
}

} // namespace sim
} // namespace fastdaq
