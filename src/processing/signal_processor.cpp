// signal_processor.cpp - Per-window filtering, statistics and power spectrum

#include "signal_processor.hpp"
#include "fastdaq/errors.hpp"
#include "fastdaq/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>

namespace fastdaq {

namespace {
constexpr double PSD_FLOOR = 1e-12;
}

SignalProcessor::Config SignalProcessor::Config::fromPipeline(const PipelineConfig& config) {
    Config c;
    c.sample_rate_hz = config.sample_rate_hz;
    c.window_samples = config.windowSamples();
    c.filter = config.filter;
    c.spectrum = config.spectrum;
    return c;
}

SignalProcessor::SignalProcessor(const Config& config)
    : config_(config)
{
    if (config_.window_samples == 0) {
        throw std::invalid_argument("SignalProcessor: window_samples must be positive");
    }

    if (config_.filter.type != FilterType::NONE) {
        sos_ = designButterworth(config_.filter.type, config_.filter.order,
                                 config_.sample_rate_hz, config_.filter.low_hz,
                                 config_.filter.high_hz);
        LOG_PROC(DEBUG, "Filter: %s order %d, %zu sections",
                 filterTypeToString(config_.filter.type), config_.filter.order, sos_.size());
    }

    if (config_.spectrum.enabled) {
        const size_t n = config_.spectrum.fft_length;
        if (!isPowerOfTwo(n) || n < 2) {
            throw std::invalid_argument("SignalProcessor: fft_length must be a power of two");
        }
        fft_ = std::make_unique<FFT>(n);
        window_ = makeWindow(config_.spectrum.window, n);
        window_power_ = 0.0;
        for (double w : window_) window_power_ += w * w;

        double resolution = config_.sample_rate_hz / static_cast<double>(n);
        double max_freq = config_.spectrum.max_freq_hz > 0.0
                              ? config_.spectrum.max_freq_hz
                              : config_.sample_rate_hz / 2.0;
        for (size_t k = 0; k <= n / 2; ++k) {
            double f = static_cast<double>(k) * resolution;
            if (f > max_freq) break;
            freqs_.push_back(f);
        }
    }
}

size_t SignalProcessor::inputSamples() const {
    size_t n = config_.window_samples;
    if (config_.spectrum.enabled) n = std::max(n, config_.spectrum.fft_length);
    return n;
}

ChannelStatistics SignalProcessor::computeStatistics(SampleSpan data) {
    ChannelStatistics st;
    st.count = data.size();
    if (data.empty()) return st;

    double sum = 0.0;
    double sum_sq = 0.0;
    st.min = data[0];
    st.max = data[0];
    for (double v : data) {
        sum += v;
        sum_sq += v * v;
        st.min = std::min(st.min, v);
        st.max = std::max(st.max, v);
    }
    double n = static_cast<double>(data.size());
    st.mean = sum / n;
    st.rms = std::sqrt(sum_sq / n);

    // Second pass for the deviation (numerically kinder than sum_sq - mean^2)
    double var = 0.0;
    for (double v : data) {
        double d = v - st.mean;
        var += d * d;
    }
    st.std_dev = std::sqrt(var / n);
    return st;
}

SpectrumStatus SignalProcessor::computeSpectrum(SampleSpan data, std::vector<double>& psd_db) const {
    psd_db.clear();
    if (!fft_) return SpectrumStatus::DISABLED;

    const size_t n = fft_->size();
    if (data.size() < n) return SpectrumStatus::NOT_READY;

    SampleSpan recent = data.subspan(data.size() - n, n);
    std::vector<Complex> buf(n);
    for (size_t i = 0; i < n; ++i) {
        buf[i] = Complex(recent[i] * window_[i], 0.0);
    }
    fft_->forward(buf);

    const double scale = 1.0 / (config_.sample_rate_hz * window_power_);
    psd_db.resize(freqs_.size());
    for (size_t k = 0; k < freqs_.size(); ++k) {
        double psd = std::norm(buf[k]) * scale;
        psd_db[k] = 10.0 * std::log10(std::max(psd, PSD_FLOOR));
    }
    return SpectrumStatus::OK;
}

void SignalProcessor::filterTrace(TraceWindow& trace) const {
    if (!hasFilter() || trace.empty()) return;
    for (auto& channel : trace.channels) {
        sosFiltFilt(sos_, channel);
    }
}

ProcessingResult SignalProcessor::process(const SampleBlock& window, uint64_t first_index) const {
    auto t_start = std::chrono::steady_clock::now();

    ProcessingResult result;
    result.first_index = first_index;
    result.samples = window.samples;
    result.filtered = hasFilter();
    if (!window.timestamps_ms.empty()) {
        result.window_end_ms = window.timestamps_ms[window.timestamps_ms.size() - 1];
    }

    result.spectrum.window = config_.spectrum.window;
    result.spectrum.fft_length = config_.spectrum.enabled ? config_.spectrum.fft_length : 0;
    result.spectrum.status = config_.spectrum.enabled ? SpectrumStatus::OK : SpectrumStatus::DISABLED;
    if (config_.spectrum.enabled) {
        result.spectrum.resolution_hz = config_.sample_rate_hz / static_cast<double>(config_.spectrum.fft_length);
        result.spectrum.frequencies_hz = freqs_;
    }

    std::vector<double> channel_data;
    for (size_t ch = 0; ch < window.channels; ++ch) {
        SampleSpan raw = window.channel(ch);
        for (size_t i = 0; i < raw.size(); ++i) {
            if (!std::isfinite(raw[i])) {
                throw ProcessingError("non-finite sample in channel " + std::to_string(ch) +
                                      " at index " + std::to_string(first_index + i));
            }
        }

        channel_data.assign(raw.begin(), raw.end());
        if (hasFilter() && !channel_data.empty()) {
            sosFiltFilt(sos_, channel_data);
        }

        SampleSpan all(channel_data.data(), channel_data.size());
        size_t stat_n = std::min(config_.window_samples, all.size());
        result.statistics.push_back(computeStatistics(all.subspan(all.size() - stat_n, stat_n)));

        if (config_.spectrum.enabled) {
            std::vector<double> psd;
            SpectrumStatus status = computeSpectrum(all, psd);
            if (status != SpectrumStatus::OK) {
                result.spectrum.status = status;
                result.spectrum.psd_db.clear();
            } else if (result.spectrum.status == SpectrumStatus::OK) {
                result.spectrum.psd_db.push_back(std::move(psd));
            }
        }
    }

    result.processing_ms = std::chrono::duration<double, std::milli>(
                               std::chrono::steady_clock::now() - t_start).count();
    return result;
}

} // namespace fastdaq
