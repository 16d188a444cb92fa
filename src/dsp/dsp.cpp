// dsp.cpp - FFT, window functions and Butterworth second-order sections

#define _USE_MATH_DEFINES
#include <cmath>
#include "fastdaq/dsp.hpp"
#include "fastdaq/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fastdaq {

// ============================================================================
// FFT
// ============================================================================

bool isPowerOfTwo(size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

FFT::FFT(size_t size)
    : size_(size)
{
    if (!isPowerOfTwo(size) || size < 2) {
        throw std::invalid_argument("FFT size must be a power of two >= 2");
    }

    twiddles_.resize(size / 2);
    for (size_t k = 0; k < size / 2; ++k) {
        double angle = -2.0 * M_PI * static_cast<double>(k) / static_cast<double>(size);
        twiddles_[k] = Complex(std::cos(angle), std::sin(angle));
    }

    bitrev_.resize(size);
    size_t bits = 0;
    while ((size_t{1} << bits) < size) bits++;
    for (size_t i = 0; i < size; ++i) {
        size_t r = 0;
        for (size_t b = 0; b < bits; ++b) {
            if (i & (size_t{1} << b)) r |= size_t{1} << (bits - 1 - b);
        }
        bitrev_[i] = r;
    }
}

void FFT::forward(std::vector<Complex>& data) const {
    transform(data, false);
}

void FFT::inverse(std::vector<Complex>& data) const {
    transform(data, true);
    double scale = 1.0 / static_cast<double>(size_);
    for (auto& v : data) v *= scale;
}

void FFT::transform(std::vector<Complex>& data, bool inverse) const {
    if (data.size() != size_) {
        throw std::invalid_argument("FFT input size mismatch");
    }

    for (size_t i = 0; i < size_; ++i) {
        size_t j = bitrev_[i];
        if (i < j) std::swap(data[i], data[j]);
    }

    for (size_t len = 2; len <= size_; len <<= 1) {
        size_t half = len / 2;
        size_t step = size_ / len;
        for (size_t i = 0; i < size_; i += len) {
            for (size_t j = 0; j < half; ++j) {
                Complex w = twiddles_[j * step];
                if (inverse) w = std::conj(w);
                Complex u = data[i + j];
                Complex v = data[i + j + half] * w;
                data[i + j] = u + v;
                data[i + j + half] = u - v;
            }
        }
    }
}

// ============================================================================
// WINDOWS
// ============================================================================

std::vector<double> makeWindow(WindowType type, size_t n) {
    std::vector<double> w(n, 1.0);
    if (n <= 1 || type == WindowType::RECTANGULAR) return w;

    double denom = static_cast<double>(n - 1);
    for (size_t i = 0; i < n; ++i) {
        double x = 2.0 * M_PI * static_cast<double>(i) / denom;
        switch (type) {
            case WindowType::HANN:
                w[i] = 0.5 - 0.5 * std::cos(x);
                break;
            case WindowType::HAMMING:
                w[i] = 0.54 - 0.46 * std::cos(x);
                break;
            case WindowType::BLACKMAN:
                w[i] = 0.42 - 0.5 * std::cos(x) + 0.08 * std::cos(2.0 * x);
                break;
            case WindowType::RECTANGULAR:
                break;
        }
    }
    // Blackman endpoints come out as tiny negatives from rounding
    if (type == WindowType::BLACKMAN) {
        w.front() = 0.0;
        w.back() = 0.0;
    }
    return w;
}

// ============================================================================
// BUTTERWORTH DESIGN
// ============================================================================

namespace {

constexpr double ROOT_IMAG_TOL = 1e-9;

struct Quad {
    double c1 = 0.0;   // coefficient of z^-1
    double c2 = 0.0;   // coefficient of z^-2
};

// Group roots into real-coefficient quadratics: conjugate pairs first
// (sorted by magnitude), then real roots paired outermost-first. A lone
// real root becomes a first-order factor at the end.
std::vector<Quad> groupRoots(const std::vector<Complex>& roots) {
    std::vector<Complex> upper;
    std::vector<double> reals;
    for (const auto& r : roots) {
        double tol = ROOT_IMAG_TOL * std::max(1.0, std::abs(r));
        if (r.imag() > tol) {
            upper.push_back(r);
        } else if (std::abs(r.imag()) <= tol) {
            reals.push_back(r.real());
        }
    }

    std::sort(upper.begin(), upper.end(), [](const Complex& a, const Complex& b) {
        return std::abs(a) < std::abs(b);
    });
    std::sort(reals.begin(), reals.end());

    std::vector<Quad> quads;
    for (const auto& r : upper) {
        quads.push_back({-2.0 * r.real(), std::norm(r)});
    }

    size_t lo = 0;
    size_t hi = reals.size();
    while (hi - lo >= 2) {
        double r1 = reals[lo++];
        double r2 = reals[--hi];
        quads.push_back({-(r1 + r2), r1 * r2});
    }
    if (hi - lo == 1) {
        quads.push_back({-reals[lo], 0.0});
    }
    return quads;
}

Complex bilinear(const Complex& s, double fs2) {
    return (fs2 + s) / (fs2 - s);
}

// Both roots of s^2 + b*s + c = 0
void quadraticRoots(const Complex& b, const Complex& c, Complex& r1, Complex& r2) {
    Complex disc = std::sqrt(b * b - 4.0 * c);
    r1 = (-b + disc) / 2.0;
    r2 = (-b - disc) / 2.0;
}

double prewarp(double f_hz, double fs) {
    return 2.0 * fs * std::tan(M_PI * f_hz / fs);
}

} // namespace

SosCascade designButterworth(FilterType type, int order, double fs,
                             double low_hz, double high_hz) {
    if (type == FilterType::NONE) return {};
    if (order < 1 || order > 10) {
        throw std::invalid_argument("Butterworth order must be in [1, 10]");
    }
    if (!(fs > 0.0)) {
        throw std::invalid_argument("Sampling rate must be positive");
    }
    double nyquist = fs / 2.0;
    if (!(low_hz > 0.0) || !(low_hz < nyquist)) {
        throw std::invalid_argument("Cutoff frequency must be inside (0, Nyquist)");
    }
    bool band = (type == FilterType::BANDPASS || type == FilterType::BANDSTOP);
    if (band && (!(high_hz > low_hz) || !(high_hz < nyquist))) {
        throw std::invalid_argument("Band edges must satisfy low < high < Nyquist");
    }

    // Analog prototype (unit cutoff, left half plane)
    std::vector<Complex> proto(order);
    for (int k = 0; k < order; ++k) {
        double theta = M_PI * (2.0 * k + order + 1) / (2.0 * order);
        proto[k] = std::polar(1.0, theta);
    }

    std::vector<Complex> poles;
    std::vector<Complex> zeros;
    double w_ref = 0.0;   // Digital frequency with unity gain

    switch (type) {
        case FilterType::LOWPASS: {
            double wc = prewarp(low_hz, fs);
            for (const auto& p : proto) poles.push_back(wc * p);
            w_ref = 0.0;
            break;
        }
        case FilterType::HIGHPASS: {
            double wc = prewarp(low_hz, fs);
            for (const auto& p : proto) {
                poles.push_back(wc / p);
                zeros.push_back(Complex(0.0, 0.0));
            }
            w_ref = M_PI;
            break;
        }
        case FilterType::BANDPASS: {
            double w1 = prewarp(low_hz, fs);
            double w2 = prewarp(high_hz, fs);
            double w0 = std::sqrt(w1 * w2);
            double bw = w2 - w1;
            for (const auto& p : proto) {
                Complex r1, r2;
                quadraticRoots(-p * bw, Complex(w0 * w0, 0.0), r1, r2);
                poles.push_back(r1);
                poles.push_back(r2);
                zeros.push_back(Complex(0.0, 0.0));
            }
            w_ref = 2.0 * std::atan(w0 / (2.0 * fs));
            break;
        }
        case FilterType::BANDSTOP: {
            double w1 = prewarp(low_hz, fs);
            double w2 = prewarp(high_hz, fs);
            double w0 = std::sqrt(w1 * w2);
            double bw = w2 - w1;
            for (const auto& p : proto) {
                Complex r1, r2;
                quadraticRoots(-bw / p, Complex(w0 * w0, 0.0), r1, r2);
                poles.push_back(r1);
                poles.push_back(r2);
                zeros.push_back(Complex(0.0, w0));
                zeros.push_back(Complex(0.0, -w0));
            }
            w_ref = 0.0;
            break;
        }
        case FilterType::NONE:
            return {};
    }

    // Bilinear transform; zeros at infinity land on z = -1
    double fs2 = 2.0 * fs;
    std::vector<Complex> zpoles;
    std::vector<Complex> zzeros;
    for (const auto& p : poles) zpoles.push_back(bilinear(p, fs2));
    for (const auto& z : zeros) zzeros.push_back(bilinear(z, fs2));
    while (zzeros.size() < zpoles.size()) zzeros.push_back(Complex(-1.0, 0.0));

    std::vector<Quad> den = groupRoots(zpoles);
    std::vector<Quad> num = groupRoots(zzeros);
    if (den.size() != num.size()) {
        throw std::invalid_argument("Butterworth design produced mismatched sections");
    }

    SosCascade sos(den.size());
    for (size_t i = 0; i < sos.size(); ++i) {
        sos[i].b0 = 1.0;
        sos[i].b1 = num[i].c1;
        sos[i].b2 = num[i].c2;
        sos[i].a1 = den[i].c1;
        sos[i].a2 = den[i].c2;
    }

    // Unity gain at the reference frequency, spread evenly across sections
    double mag = std::abs(sosResponse(sos, w_ref));
    if (!(mag > 0.0) || !std::isfinite(mag)) {
        throw std::invalid_argument("Butterworth design is degenerate for these cutoffs");
    }
    double per_section = std::pow(1.0 / mag, 1.0 / static_cast<double>(sos.size()));
    for (auto& s : sos) {
        s.b0 *= per_section;
        s.b1 *= per_section;
        s.b2 *= per_section;
    }
    return sos;
}

Complex sosResponse(const SosCascade& sos, double w) {
    Complex z1 = std::polar(1.0, -w);
    Complex z2 = z1 * z1;
    Complex h(1.0, 0.0);
    for (const auto& s : sos) {
        Complex num = s.b0 + s.b1 * z1 + s.b2 * z2;
        Complex den = 1.0 + s.a1 * z1 + s.a2 * z2;
        h *= num / den;
    }
    return h;
}

// ============================================================================
// FILTERING
// ============================================================================

namespace {

void runSection(const Biquad& s, std::vector<double>& data, double s1, double s2) {
    for (double& x : data) {
        double y = s.b0 * x + s1;
        s1 = s.b1 * x - s.a1 * y + s2;
        s2 = s.b2 * x - s.a2 * y;
        x = y;
    }
}

// Run the cascade starting from the steady state for a constant input `x0`
void runCascadeSteady(const SosCascade& sos, std::vector<double>& data) {
    double x = data.empty() ? 0.0 : data.front();
    for (const auto& s : sos) {
        double y = s.dcGain() * x;
        double s1 = y - s.b0 * x;
        double s2 = s.b2 * x - s.a2 * y;
        runSection(s, data, s1, s2);
        x = y;
    }
}

} // namespace

void sosFilter(const SosCascade& sos, std::vector<double>& data) {
    for (const auto& s : sos) {
        runSection(s, data, 0.0, 0.0);
    }
}

void sosFiltFilt(const SosCascade& sos, std::vector<double>& data) {
    if (sos.empty()) return;

    size_t n = data.size();
    if (n < 3) {
        throw ProcessingError("filtering needs at least 3 samples");
    }

    size_t padlen = std::min(n - 1, 3 * (2 * sos.size() + 1));

    // Odd extension about both end points
    std::vector<double> ext;
    ext.reserve(n + 2 * padlen);
    double first = data.front();
    double last = data.back();
    for (size_t i = padlen; i >= 1; --i) ext.push_back(2.0 * first - data[i]);
    ext.insert(ext.end(), data.begin(), data.end());
    for (size_t i = 1; i <= padlen; ++i) ext.push_back(2.0 * last - data[n - 1 - i]);

    runCascadeSteady(sos, ext);
    std::reverse(ext.begin(), ext.end());
    runCascadeSteady(sos, ext);
    std::reverse(ext.begin(), ext.end());

    for (size_t i = 0; i < n; ++i) {
        double v = ext[padlen + i];
        if (!std::isfinite(v)) {
            throw ProcessingError("filter output is not finite");
        }
        data[i] = v;
    }
}

} // namespace fastdaq
