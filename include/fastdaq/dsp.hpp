#pragma once

#include "fastdaq/types.hpp"

#include <complex>
#include <cstddef>
#include <vector>

namespace fastdaq {

using Complex = std::complex<double>;

// Radix-2 FFT with precomputed twiddles. Size must be a power of two.
class FFT {
public:
    explicit FFT(size_t size);

    size_t size() const { return size_; }

    // In-place forward transform; data.size() must equal size()
    void forward(std::vector<Complex>& data) const;
    void inverse(std::vector<Complex>& data) const;

private:
    size_t size_;
    std::vector<Complex> twiddles_;   // e^{-j2πk/N}, k < N/2
    std::vector<size_t> bitrev_;

    void transform(std::vector<Complex>& data, bool inverse) const;
};

bool isPowerOfTwo(size_t n);

// Symmetric window of length n (matches the usual numpy definitions)
std::vector<double> makeWindow(WindowType type, size_t n);

// One second-order section, direct form II transposed.
// y = b0*x + s1; s1 = b1*x - a1*y + s2; s2 = b2*x - a2*y  (a0 normalised to 1)
struct Biquad {
    double b0 = 1.0, b1 = 0.0, b2 = 0.0;
    double a1 = 0.0, a2 = 0.0;

    double dcGain() const {
        double den = 1.0 + a1 + a2;
        return den != 0.0 ? (b0 + b1 + b2) / den : 0.0;
    }
};

using SosCascade = std::vector<Biquad>;

// Butterworth design by bilinear transform with frequency prewarping.
// LOWPASS/HIGHPASS use low_hz; BANDPASS/BANDSTOP use [low_hz, high_hz] and
// produce a filter of order 2*order. Throws std::invalid_argument when a
// cutoff is not strictly inside (0, fs/2) or order is outside [1, 10].
SosCascade designButterworth(FilterType type, int order, double fs,
                             double low_hz, double high_hz = 0.0);

// Complex response of a cascade at normalised angular frequency w (rad/sample)
Complex sosResponse(const SosCascade& sos, double w);

// Causal filtering with zero initial state
void sosFilter(const SosCascade& sos, std::vector<double>& data);

// Zero-phase forward-backward filtering with odd-extension padding and
// steady-state initial conditions. Throws ProcessingError for fewer than
// three samples or if the output is not finite.
void sosFiltFilt(const SosCascade& sos, std::vector<double>& data);

} // namespace fastdaq
