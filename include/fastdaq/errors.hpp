#pragma once

#include <stdexcept>
#include <string>

namespace fastdaq {

// Device-level failure (disconnect, driver error). Fatal to the current run:
// the producer stops and the pipeline reports it through rethrowIfFaulted().
class AcquisitionFault : public std::runtime_error {
public:
    explicit AcquisitionFault(const std::string& what)
        : std::runtime_error(what) {}
};

// Failure inside one processing cycle (filter, FFT, statistics).
// Caught by the processing loop, counted and skipped.
class ProcessingError : public std::runtime_error {
public:
    explicit ProcessingError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace fastdaq
