#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace fastdaq {

// Core types
using Sample = double;                         // Voltage reading
using Samples = std::vector<Sample>;
using SampleSpan = std::span<const Sample>;
using MutableSampleSpan = std::span<Sample>;

// One acquisition cycle across all active channels.
// Storage is channel-major: values[ch * samples + i]. All channels of row i share
// timestamps_ms[i]. The block only views memory owned by the producer's pooled block.
struct SampleBlock {
    SampleSpan timestamps_ms;
    SampleSpan values;
    size_t channels = 0;
    size_t samples = 0;

    bool empty() const { return samples == 0 || channels == 0; }

    SampleSpan channel(size_t ch) const {
        return values.subspan(ch * samples, samples);
    }
};

// Owned copy of the most recent rows of the ring buffer (display and export reads)
struct TraceWindow {
    std::vector<double> timestamps_ms;
    std::vector<Samples> channels;     // [channel][row]
    uint64_t first_index = 0;          // Absolute sample index of row 0

    size_t size() const { return timestamps_ms.size(); }
    bool empty() const { return timestamps_ms.empty(); }
};

// Operating mode, selected once per acquisition run
enum class PipelineMode : uint8_t {
    STANDARD = 0,           // Direct refresh, inline processing
    HIGH_PERFORMANCE = 1,   // Pooled memory, background processor, cadence-limited display
};

inline const char* pipelineModeToString(PipelineMode mode) {
    switch (mode) {
        case PipelineMode::STANDARD:         return "Standard";
        case PipelineMode::HIGH_PERFORMANCE: return "HighPerformance";
    }
    return "Unknown";
}

// FFT window functions
enum class WindowType : uint8_t {
    HANN = 0,
    HAMMING = 1,
    BLACKMAN = 2,
    RECTANGULAR = 3,
};

inline const char* windowTypeToString(WindowType type) {
    switch (type) {
        case WindowType::HANN:        return "hann";
        case WindowType::HAMMING:     return "hamming";
        case WindowType::BLACKMAN:    return "blackman";
        case WindowType::RECTANGULAR: return "rectangular";
    }
    return "unknown";
}

// Butterworth filter response
enum class FilterType : uint8_t {
    NONE = 0,
    LOWPASS = 1,
    HIGHPASS = 2,
    BANDPASS = 3,
    BANDSTOP = 4,
};

inline const char* filterTypeToString(FilterType type) {
    switch (type) {
        case FilterType::NONE:     return "none";
        case FilterType::LOWPASS:  return "lowpass";
        case FilterType::HIGHPASS: return "highpass";
        case FilterType::BANDPASS: return "bandpass";
        case FilterType::BANDSTOP: return "bandstop";
    }
    return "unknown";
}

// Parse helpers for config files and command lines (case sensitive, lower case)
bool parseWindowType(const std::string& text, WindowType& out);
bool parseFilterType(const std::string& text, FilterType& out);

} // namespace fastdaq
