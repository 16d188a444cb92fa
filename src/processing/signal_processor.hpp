// signal_processor.hpp - Per-window filtering, statistics and power spectrum
//
// Stateless with respect to the stream: process() takes one time-ordered window
// (a ring buffer snapshot) and returns a complete ProcessingResult. Shared by
// the background processor (High-Performance mode) and the display gate's
// inline path (Standard mode).
//
// Per channel:
//   1. optional zero-phase Butterworth filter over the whole window
//   2. min / max / mean / std / RMS over the newest window_samples rows
//   3. windowed PSD over exactly the newest fft_length rows:
//        psd = |FFT(x * w)|^2 / (fs * sum(w^2)),  dB with a 1e-12 floor
//      bins above max_freq_hz are dropped. With fewer than fft_length rows the
//      spectrum is NOT_READY (no zero padding).

#pragma once

#include "config/pipeline_config.hpp"
#include "fastdaq/dsp.hpp"
#include "fastdaq/types.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace fastdaq {

struct ChannelStatistics {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double std_dev = 0.0;    // Population standard deviation
    double rms = 0.0;
    size_t count = 0;
};

enum class SpectrumStatus : uint8_t {
    OK = 0,
    NOT_READY = 1,   // Fewer than fft_length samples available
    DISABLED = 2,
};

inline const char* spectrumStatusToString(SpectrumStatus status) {
    switch (status) {
        case SpectrumStatus::OK:        return "OK";
        case SpectrumStatus::NOT_READY: return "NOT_READY";
        case SpectrumStatus::DISABLED:  return "DISABLED";
    }
    return "UNKNOWN";
}

struct Spectrum {
    SpectrumStatus status = SpectrumStatus::DISABLED;
    WindowType window = WindowType::HANN;
    size_t fft_length = 0;
    double resolution_hz = 0.0;
    std::vector<double> frequencies_hz;
    std::vector<std::vector<double>> psd_db;   // [channel][bin]
};

struct ProcessingResult {
    uint64_t cycle = 0;
    uint64_t sequence = 0;          // Ring buffer sequence the input reflects
    uint64_t first_index = 0;       // Absolute index of the first input row
    size_t samples = 0;             // Rows in the input window
    double window_end_ms = 0.0;     // Timestamp of the newest row
    bool filtered = false;
    std::vector<ChannelStatistics> statistics;
    Spectrum spectrum;
    double processing_ms = 0.0;
};

class SignalProcessor {
public:
    struct Config {
        double sample_rate_hz;
        size_t window_samples;     // Statistics window
        FilterConfig filter;
        SpectrumConfig spectrum;

        Config()
            : sample_rate_hz(1000.0)
            , window_samples(1000)
        {}

        static Config fromPipeline(const PipelineConfig& config);
    };

    // Designs the filter and FFT up front; throws std::invalid_argument on
    // an unusable filter or FFT length
    explicit SignalProcessor(const Config& config);

    /**
     * Process one time-ordered window.
     * @throws ProcessingError on non-finite input or a numerical failure
     */
    ProcessingResult process(const SampleBlock& window, uint64_t first_index = 0) const;

    static ChannelStatistics computeStatistics(SampleSpan data);

    // PSD of the newest fft_length samples of `data` into psd_db
    SpectrumStatus computeSpectrum(SampleSpan data, std::vector<double>& psd_db) const;

    /**
     * Zero-phase filter every channel of a display trace in place.
     * No-op without a filter.
     * @throws ProcessingError for fewer than three rows or non-finite output
     */
    void filterTrace(TraceWindow& trace) const;

    // Bin frequencies reported by computeSpectrum()
    const std::vector<double>& frequencies() const { return freqs_; }

    // Rows a caller should hand to process(): max(window, fft_length)
    size_t inputSamples() const;

    const Config& config() const { return config_; }
    bool hasFilter() const { return !sos_.empty(); }

private:
    Config config_;
    SosCascade sos_;
    std::unique_ptr<FFT> fft_;
    std::vector<double> window_;
    double window_power_ = 0.0;     // sum(w^2)
    std::vector<double> freqs_;
};

} // namespace fastdaq
