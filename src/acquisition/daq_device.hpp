// daq_device.hpp - Boundary to the measurement hardware
//
// Anything that can deliver multi-channel analog samples implements IDaqDevice:
// the simulated device in sim/, or a binding to a vendor driver.

#pragma once

#include "fastdaq/types.hpp"
#include "config/pipeline_config.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace fastdaq {

struct DeviceConfig {
    std::string device_name;
    std::vector<std::string> channels;
    std::vector<ChannelRange> ranges;    // One per channel
    double sample_rate_hz = 1000.0;
    size_t samples_per_block = 50;

    static DeviceConfig fromPipeline(const PipelineConfig& config) {
        DeviceConfig dc;
        dc.device_name = config.device_name;
        dc.channels = config.channels;
        for (size_t ch = 0; ch < config.numChannels(); ++ch) {
            dc.ranges.push_back(config.rangeFor(ch));
        }
        dc.sample_rate_hz = config.sample_rate_hz;
        dc.samples_per_block = config.blockSize();
        return dc;
    }
};

enum class ReadStatus : uint8_t {
    OK = 0,        // Exactly the requested rows were written
    TIMEOUT = 1,   // Nothing available in time; retry
    FAULT = 2,     // Device lost (disconnect, driver error); fatal
};

inline const char* readStatusToString(ReadStatus status) {
    switch (status) {
        case ReadStatus::OK:      return "OK";
        case ReadStatus::TIMEOUT: return "TIMEOUT";
        case ReadStatus::FAULT:   return "FAULT";
    }
    return "UNKNOWN";
}

struct ReadResult {
    ReadStatus status = ReadStatus::OK;
    std::string error;      // Driver message for TIMEOUT/FAULT

    bool ok() const { return status == ReadStatus::OK; }

    static ReadResult success() { return ReadResult{}; }
    static ReadResult timeout(const std::string& msg = "read timed out") {
        return ReadResult{ReadStatus::TIMEOUT, msg};
    }
    static ReadResult fault(const std::string& msg) {
        return ReadResult{ReadStatus::FAULT, msg};
    }
};

class IDaqDevice {
public:
    virtual ~IDaqDevice() = default;

    // Configure channels and sample clock and begin acquiring.
    // Throws AcquisitionFault if the device cannot be started.
    virtual void start(const DeviceConfig& config) = 0;

    /**
     * Read `samples` rows for every started channel.
     * @param out Channel-major destination, size >= channels * samples:
     *            out[ch * samples + i]
     * On OK all rows were written; on TIMEOUT/FAULT `out` is unspecified.
     */
    virtual ReadResult readBlock(size_t samples, std::chrono::milliseconds timeout,
                                 MutableSampleSpan out) = 0;

    // Stop acquiring. Safe to call from another thread to unblock readBlock().
    virtual void stop() = 0;

    virtual std::string name() const = 0;
};

} // namespace fastdaq
