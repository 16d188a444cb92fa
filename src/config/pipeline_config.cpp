#include "pipeline_config.hpp"
#include "fastdaq/dsp.hpp"
#include "fastdaq/logging.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fastdaq {

bool parseWindowType(const std::string& text, WindowType& out) {
    if (text == "hann" || text == "hanning") { out = WindowType::HANN; return true; }
    if (text == "hamming") { out = WindowType::HAMMING; return true; }
    if (text == "blackman") { out = WindowType::BLACKMAN; return true; }
    if (text == "rectangular" || text == "rectangle" || text == "none") {
        out = WindowType::RECTANGULAR;
        return true;
    }
    return false;
}

bool parseFilterType(const std::string& text, FilterType& out) {
    if (text == "none" || text == "off") { out = FilterType::NONE; return true; }
    if (text == "lowpass") { out = FilterType::LOWPASS; return true; }
    if (text == "highpass") { out = FilterType::HIGHPASS; return true; }
    if (text == "bandpass") { out = FilterType::BANDPASS; return true; }
    if (text == "bandstop" || text == "notch") { out = FilterType::BANDSTOP; return true; }
    return false;
}

bool parseFilterSetting(const std::string& text, FilterConfig& out) {
    if (text == "notch50" || text == "notch60") {
        double mains = text == "notch50" ? 50.0 : 60.0;
        out.type = FilterType::BANDSTOP;
        out.low_hz = mains - 2.0;
        out.high_hz = mains + 2.0;
        return true;
    }
    return parseFilterType(text, out.type);
}

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool toDouble(const std::string& text, double& out) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool toInt(const std::string& text, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool toSize(const std::string& text, size_t& out) {
    if (!text.empty() && text[0] == '-') return false;
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(text, &used);
        if (used != text.size()) return false;
        out = static_cast<size_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool toBool(const std::string& text, bool& out) {
    if (text == "1" || text == "true" || text == "yes" || text == "on") { out = true; return true; }
    if (text == "0" || text == "false" || text == "no" || text == "off") { out = false; return true; }
    return false;
}

// "-5:5,-1:1" -> ranges
bool toRanges(const std::string& text, std::vector<ChannelRange>& out) {
    std::vector<ChannelRange> ranges;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        size_t colon = item.find(':');
        if (colon == std::string::npos) return false;
        ChannelRange r;
        if (!toDouble(trim(item.substr(0, colon)), r.v_min)) return false;
        if (!toDouble(trim(item.substr(colon + 1)), r.v_max)) return false;
        ranges.push_back(r);
    }
    out = ranges;
    return true;
}

} // namespace

std::vector<std::string> parseChannelList(const std::string& text) {
    std::vector<std::string> names;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) names.push_back(item);
    }
    return names;
}

size_t defaultBlockSize(double sample_rate_hz) {
    double seconds;
    if (sample_rate_hz >= 50000.0) {
        seconds = 0.020;
    } else if (sample_rate_hz >= 25000.0) {
        seconds = 0.015;
    } else if (sample_rate_hz >= 10000.0) {
        seconds = 0.010;
    } else {
        seconds = 0.005;
    }
    auto samples = static_cast<size_t>(std::lround(sample_rate_hz * seconds));
    return std::clamp<size_t>(samples, 50, 5000);
}

ChannelRange PipelineConfig::rangeFor(size_t ch) const {
    if (ch < channel_ranges.size()) return channel_ranges[ch];
    return ChannelRange{};
}

size_t PipelineConfig::blockSize() const {
    return samples_per_block > 0 ? samples_per_block : defaultBlockSize(sample_rate_hz);
}

size_t PipelineConfig::bufferCapacity() const {
    auto cap = static_cast<size_t>(std::ceil(sample_rate_hz * retention_s));
    cap = std::max(cap, blockSize());
    // Room for one full FFT frame even with a short retention
    if (spectrum.enabled) cap = std::max(cap, spectrum.fft_length);
    return cap;
}

size_t PipelineConfig::windowSamples() const {
    auto n = static_cast<size_t>(std::ceil(sample_rate_hz * display_window_s));
    return std::clamp<size_t>(n, 1, bufferCapacity());
}

double PipelineConfig::blockPeriodMs() const {
    return 1000.0 * static_cast<double>(blockSize()) / sample_rate_hz;
}

void PipelineConfig::validate() const {
    if (channels.empty()) {
        throw std::invalid_argument("at least one channel is required");
    }
    if (!channel_ranges.empty() && channel_ranges.size() != channels.size()) {
        throw std::invalid_argument("channel_ranges must have one entry per channel");
    }
    for (const auto& r : channel_ranges) {
        if (!(r.v_min < r.v_max)) {
            throw std::invalid_argument("channel range needs v_min < v_max");
        }
    }
    if (!(sample_rate_hz > 0.0) || !std::isfinite(sample_rate_hz)) {
        throw std::invalid_argument("sample_rate_hz must be positive");
    }
    if (read_timeout_ms <= 0) {
        throw std::invalid_argument("read_timeout_ms must be positive");
    }
    if (max_read_retries < 0 || retry_backoff_ms < 0) {
        throw std::invalid_argument("retry settings must not be negative");
    }
    if (!(retention_s > 0.0)) {
        throw std::invalid_argument("retention_s must be positive");
    }
    if (!(display_window_s > 0.0) || display_window_s > retention_s) {
        throw std::invalid_argument("display_window_s must be in (0, retention_s]");
    }
    if (spectrum.enabled) {
        if (!isPowerOfTwo(spectrum.fft_length) || spectrum.fft_length < 32) {
            throw std::invalid_argument("fft_length must be a power of two >= 32");
        }
        if (spectrum.max_freq_hz < 0.0) {
            throw std::invalid_argument("max_freq_hz must not be negative");
        }
    }
    if (filter.type != FilterType::NONE) {
        // Throws with the design's own message
        designButterworth(filter.type, filter.order, sample_rate_hz, filter.low_hz, filter.high_hz);
    }
    if (processor_interval_ms <= 0 || monitor_interval_ms <= 0) {
        throw std::invalid_argument("processor and monitor intervals must be positive");
    }
    if (!(display_rate_hz > 0.0) || display_rate_hz > 1000.0) {
        throw std::invalid_argument("display_rate_hz must be in (0, 1000]");
    }
    if (max_display_points < 2) {
        throw std::invalid_argument("max_display_points must be at least 2");
    }
    if (!(mode_threshold_hz > 0.0)) {
        throw std::invalid_argument("mode_threshold_hz must be positive");
    }
    if (!(rate_window_s > 0.0)) {
        throw std::invalid_argument("rate_window_s must be positive");
    }
    if (pool.max_outstanding == 0) {
        throw std::invalid_argument("pool max_outstanding must be at least 1");
    }
    if (shutdown_timeout_ms <= 0) {
        throw std::invalid_argument("shutdown_timeout_ms must be positive");
    }
}

bool applyConfigLine(PipelineConfig& config, const std::string& raw_line, std::string& error) {
    std::string line = trim(raw_line);
    if (line.empty() || line[0] == '#') return true;

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        error = "expected key=value: " + line;
        return false;
    }
    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));

    bool ok = true;
    if (key == "device_name") {
        config.device_name = value;
    } else if (key == "channels") {
        config.channels = parseChannelList(value);
        ok = !config.channels.empty();
    } else if (key == "channel_ranges") {
        ok = toRanges(value, config.channel_ranges);
    } else if (key == "sample_rate_hz") {
        ok = toDouble(value, config.sample_rate_hz);
    } else if (key == "samples_per_block") {
        ok = toSize(value, config.samples_per_block);
    } else if (key == "read_timeout_ms") {
        ok = toInt(value, config.read_timeout_ms);
    } else if (key == "max_read_retries") {
        ok = toInt(value, config.max_read_retries);
    } else if (key == "retry_backoff_ms") {
        ok = toInt(value, config.retry_backoff_ms);
    } else if (key == "retention_s") {
        ok = toDouble(value, config.retention_s);
    } else if (key == "display_window_s") {
        ok = toDouble(value, config.display_window_s);
    } else if (key == "filter_type") {
        ok = parseFilterSetting(value, config.filter);
    } else if (key == "filter_low_hz") {
        ok = toDouble(value, config.filter.low_hz);
    } else if (key == "filter_high_hz") {
        ok = toDouble(value, config.filter.high_hz);
    } else if (key == "filter_order") {
        ok = toInt(value, config.filter.order);
    } else if (key == "spectrum_enabled") {
        ok = toBool(value, config.spectrum.enabled);
    } else if (key == "window") {
        ok = parseWindowType(value, config.spectrum.window);
    } else if (key == "fft_length") {
        ok = toSize(value, config.spectrum.fft_length);
    } else if (key == "max_freq_hz") {
        ok = toDouble(value, config.spectrum.max_freq_hz);
    } else if (key == "processor_interval_ms") {
        ok = toInt(value, config.processor_interval_ms);
    } else if (key == "display_rate_hz") {
        ok = toDouble(value, config.display_rate_hz);
    } else if (key == "max_display_points") {
        ok = toSize(value, config.max_display_points);
    } else if (key == "mode_threshold_hz") {
        ok = toDouble(value, config.mode_threshold_hz);
    } else if (key == "monitor_interval_ms") {
        ok = toInt(value, config.monitor_interval_ms);
    } else if (key == "rate_window_s") {
        ok = toDouble(value, config.rate_window_s);
    } else if (key == "rate_accuracy_warning_pct") {
        ok = toDouble(value, config.thresholds.rate_accuracy_warning_pct);
    } else if (key == "rate_accuracy_critical_pct") {
        ok = toDouble(value, config.thresholds.rate_accuracy_critical_pct);
    } else if (key == "occupancy_warning_pct") {
        ok = toDouble(value, config.thresholds.occupancy_warning_pct);
    } else if (key == "occupancy_critical_pct") {
        ok = toDouble(value, config.thresholds.occupancy_critical_pct);
    } else if (key == "latency_warning_factor") {
        ok = toDouble(value, config.thresholds.latency_warning_factor);
    } else if (key == "latency_critical_factor") {
        ok = toDouble(value, config.thresholds.latency_critical_factor);
    } else if (key == "pool_max_idle_blocks") {
        ok = toSize(value, config.pool.max_idle_blocks);
    } else if (key == "pool_max_idle_bytes") {
        ok = toSize(value, config.pool.max_idle_bytes);
    } else if (key == "pool_max_outstanding") {
        ok = toSize(value, config.pool.max_outstanding);
    } else if (key == "shutdown_timeout_ms") {
        ok = toInt(value, config.shutdown_timeout_ms);
    } else {
        error = "unknown key: " + key;
        return false;
    }

    if (!ok) {
        error = "bad value for " + key + ": " + value;
        return false;
    }
    return true;
}

bool loadConfigFile(PipelineConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_PIPE(ERROR, "Cannot open config file: %s", path.c_str());
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        std::string error;
        if (!applyConfigLine(config, line, error)) {
            LOG_PIPE(ERROR, "%s:%d: %s", path.c_str(), line_no, error.c_str());
            return false;
        }
    }

    LOG_PIPE(INFO, "Loaded config %s (%d lines)", path.c_str(), line_no);
    return true;
}

} // namespace fastdaq
