#pragma once

// PipelineConfig - everything the pipeline needs, fixed for one acquisition run.
//
// Loaded from a key=value file (see loadConfigFile) or filled in directly.
// Call validate() before constructing a Pipeline; it throws
// std::invalid_argument with a readable message on the first problem found.
//
// Example file:
//   # two channels at 50 kHz with a 1 kHz low-pass
//   channels=ai0,ai1
//   sample_rate_hz=50000
//   filter_type=lowpass
//   filter_low_hz=1000
//   fft_length=8192
//   window=hann

#include "fastdaq/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fastdaq {

// Input range for one channel (passed to the device, which clips to it)
struct ChannelRange {
    double v_min = -10.0;
    double v_max = 10.0;
};

struct FilterConfig {
    FilterType type = FilterType::NONE;
    double low_hz = 100.0;     // Cutoff for LOWPASS/HIGHPASS, lower edge for band types
    double high_hz = 1000.0;   // Upper edge for BANDPASS/BANDSTOP
    int order = 4;
};

struct SpectrumConfig {
    bool enabled = true;
    WindowType window = WindowType::HANN;
    size_t fft_length = 8192;       // Power of two
    double max_freq_hz = 0.0;       // 0 = up to Nyquist
};

struct PoolConfig {
    size_t max_idle_blocks = 32;                 // Idle blocks kept for reuse
    size_t max_idle_bytes = 64 * 1024 * 1024;    // Idle byte budget
    size_t max_outstanding = 64;                 // Checked-out blocks before one-off fallback
};

struct AlertThresholds {
    double rate_accuracy_warning_pct = 95.0;
    double rate_accuracy_critical_pct = 90.0;
    double occupancy_warning_pct = 80.0;
    double occupancy_critical_pct = 95.0;
    double latency_warning_factor = 1.0;    // x producer block period
    double latency_critical_factor = 2.0;
};

struct PipelineConfig {
    // Acquisition
    std::string device_name = "SimDev1";
    std::vector<std::string> channels = {"ai0"};
    std::vector<ChannelRange> channel_ranges;   // Empty or one entry per channel
    double sample_rate_hz = 1000.0;
    size_t samples_per_block = 0;               // 0 = derive from sample rate
    int read_timeout_ms = 1000;
    int max_read_retries = 3;
    int retry_backoff_ms = 10;

    // Buffering
    double retention_s = 5.0;                   // Ring buffer capacity in seconds
    double display_window_s = 1.0;              // Trace and statistics window

    // Processing
    FilterConfig filter;
    SpectrumConfig spectrum;
    int processor_interval_ms = 50;

    // Display
    double display_rate_hz = 30.0;
    size_t max_display_points = 2000;

    // Mode selection
    double mode_threshold_hz = 10000.0;

    // Monitoring
    int monitor_interval_ms = 1000;
    double rate_window_s = 2.0;
    AlertThresholds thresholds;

    // Memory
    PoolConfig pool;

    // Lifecycle
    int shutdown_timeout_ms = 2000;

    size_t numChannels() const { return channels.size(); }

    // Range for channel ch (default ±10 V when not configured)
    ChannelRange rangeFor(size_t ch) const;

    // Samples per device read: explicit value or the rate-based default
    size_t blockSize() const;

    // Ring buffer capacity in samples per channel (at least one block and,
    // with the spectrum on, one FFT frame)
    size_t bufferCapacity() const;

    // Samples in the display/statistics window
    size_t windowSamples() const;

    // Producer block period in milliseconds
    double blockPeriodMs() const;

    // Throws std::invalid_argument describing the first invalid field
    void validate() const;
};

// Rate-based block size: 20 ms at >= 50 kHz, 15 ms at >= 25 kHz,
// 10 ms at >= 10 kHz, otherwise 5 ms; clamped to [50, 5000] samples.
size_t defaultBlockSize(double sample_rate_hz);

// A filter type name, or a mains notch preset that also sets the band:
// "notch50" = bandstop 48-52 Hz, "notch60" = bandstop 58-62 Hz
bool parseFilterSetting(const std::string& text, FilterConfig& out);

// Apply one "key=value" line. Blank lines and '#' comments are accepted.
// Returns false (and fills `error`) for unknown keys or unparsable values.
bool applyConfigLine(PipelineConfig& config, const std::string& line, std::string& error);

// Load a config file on top of the existing values. Returns false if the file
// cannot be opened or a line is rejected; problems are logged.
bool loadConfigFile(PipelineConfig& config, const std::string& path);

// Split "ai0,ai1" into names, trimming blanks
std::vector<std::string> parseChannelList(const std::string& text);

} // namespace fastdaq
