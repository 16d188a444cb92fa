// test_signal_processing.cpp - DSP building blocks and the window processor
//
// Tests:
// 1. FFT puts a bin-centred tone in the right bin
// 2. Window shapes
// 3. PSD scaling (Parseval) and the NOT_READY rule
// 4. Channel statistics
// 5. Butterworth responses and zero-phase filtering
// 6. Non-finite input is rejected

#define _USE_MATH_DEFINES
#include <cmath>
#include "fastdaq/dsp.hpp"
#include "fastdaq/errors.hpp"
#include "processing/signal_processor.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

using namespace fastdaq;

namespace {

std::vector<double> tone(size_t n, double fs, double freq, double amp, double offset = 0.0) {
    std::vector<double> x(n);
    for (size_t i = 0; i < n; ++i) {
        x[i] = offset + amp * std::sin(2.0 * M_PI * freq * static_cast<double>(i) / fs);
    }
    return x;
}

// Single-channel SampleBlock over caller-owned storage
SampleBlock blockOf(const std::vector<double>& values, const std::vector<double>& ts, size_t channels) {
    SampleBlock b;
    b.values = values;
    b.timestamps_ms = ts;
    b.channels = channels;
    b.samples = ts.size();
    return b;
}

std::vector<double> timestamps(size_t n, double fs) {
    std::vector<double> ts(n);
    for (size_t i = 0; i < n; ++i) ts[i] = static_cast<double>(i) * 1000.0 / fs;
    return ts;
}

} // namespace

int main() {
    std::cout << "=== Signal Processing Unit Test ===\n\n";

    int pass = 0, fail = 0;
    auto check = [&](bool ok, const std::string& what) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << what << "\n";
        ok ? pass++ : fail++;
    };

    // ========================================================================
    // TEST 1: FFT
    // ========================================================================
    std::cout << "TEST 1: FFT\n";
    {
        const size_t n = 1024;
        FFT fft(n);
        auto x = tone(n, 1000.0, 125.0, 1.0);   // 125 Hz = bin 128
        std::vector<Complex> buf(x.begin(), x.end());
        fft.forward(buf);

        size_t peak = 0;
        for (size_t k = 1; k <= n / 2; ++k) {
            if (std::abs(buf[k]) > std::abs(buf[peak])) peak = k;
        }
        check(peak == 128, "Tone lands in bin 128 (got " + std::to_string(peak) + ")");
        check(std::abs(std::abs(buf[128]) - n / 2.0) < 1e-6, "Bin magnitude is N/2 for unit amplitude");

        fft.inverse(buf);
        double err = 0.0;
        for (size_t i = 0; i < n; ++i) err = std::max(err, std::abs(buf[i].real() - x[i]));
        check(err < 1e-9, "Inverse restores the input");

        bool threw = false;
        try {
            FFT bad(1000);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "Non power-of-two size rejected");
    }

    // ========================================================================
    // TEST 2: Windows
    // ========================================================================
    std::cout << "\nTEST 2: Windows\n";
    {
        auto hann = makeWindow(WindowType::HANN, 65);
        auto hamming = makeWindow(WindowType::HAMMING, 65);
        auto blackman = makeWindow(WindowType::BLACKMAN, 65);
        auto rect = makeWindow(WindowType::RECTANGULAR, 65);

        check(hann.front() == 0.0 && std::abs(hann[32] - 1.0) < 1e-12 && std::abs(hann.back()) < 1e-12,
              "Hann: zero ends, unit centre");
        check(std::abs(hamming.front() - 0.08) < 1e-12 && std::abs(hamming[32] - 1.0) < 1e-12,
              "Hamming: 0.08 ends, unit centre");
        check(blackman.front() == 0.0 && blackman.back() == 0.0 && std::abs(blackman[32] - 1.0) < 1e-12,
              "Blackman: zero ends, unit centre");
        check(std::all_of(rect.begin(), rect.end(), [](double w) { return w == 1.0; }),
              "Rectangular: all ones");

        bool symmetric = true;
        for (size_t i = 0; i < 65; ++i) {
            if (std::abs(hann[i] - hann[64 - i]) > 1e-12) symmetric = false;
        }
        check(symmetric, "Hann is symmetric");
    }

    // ========================================================================
    // TEST 3: Spectrum
    // ========================================================================
    std::cout << "\nTEST 3: Spectrum\n";
    {
        SignalProcessor::Config cfg;
        cfg.sample_rate_hz = 1000.0;
        cfg.window_samples = 1000;
        cfg.spectrum.fft_length = 1024;
        cfg.spectrum.window = WindowType::HANN;
        SignalProcessor proc(cfg);

        const double amp = 2.0;
        auto x = tone(2048, 1000.0, 125.0, amp);
        std::vector<double> psd;
        SpectrumStatus st = proc.computeSpectrum(SampleSpan(x.data(), x.size()), psd);
        check(st == SpectrumStatus::OK && psd.size() == 513, "1024-point PSD has 513 bins");

        size_t peak = static_cast<size_t>(std::max_element(psd.begin(), psd.end()) - psd.begin());
        check(std::abs(proc.frequencies()[peak] - 125.0) < 1e-9, "PSD peak at 125 Hz");

        // One-sided bins hold half the power of the two-sided periodogram:
        // sum(psd) * df ~= mean(x^2) / 2 = amp^2 / 4
        double df = 1000.0 / 1024.0;
        double power = 0.0;
        for (double db : psd) power += std::pow(10.0, db / 10.0) * df;
        check(std::abs(power - amp * amp / 4.0) / (amp * amp / 4.0) < 0.05,
              "PSD integrates to the signal power");

        std::vector<double> short_x(1000, 0.5);
        st = proc.computeSpectrum(SampleSpan(short_x.data(), short_x.size()), psd);
        check(st == SpectrumStatus::NOT_READY && psd.empty(), "Fewer than fft_length samples: NOT_READY");

        std::vector<double> zeros(1024, 0.0);
        proc.computeSpectrum(SampleSpan(zeros.data(), zeros.size()), psd);
        check(std::all_of(psd.begin(), psd.end(), [](double db) { return std::abs(db + 120.0) < 1e-9; }),
              "Silence floors at -120 dB");

        SignalProcessor::Config limited = cfg;
        limited.spectrum.max_freq_hz = 200.0;
        SignalProcessor lp(limited);
        check(!lp.frequencies().empty() && lp.frequencies().back() <= 200.0 &&
              lp.frequencies().back() > 199.0, "max_freq_hz trims the bins");

        // Through process(): short window gives statistics but no spectrum
        auto xs = tone(600, 1000.0, 50.0, 1.0);
        auto ts = timestamps(600, 1000.0);
        ProcessingResult r = proc.process(blockOf(xs, ts, 1), 5000);
        check(r.spectrum.status == SpectrumStatus::NOT_READY && r.spectrum.psd_db.empty() &&
              r.statistics.size() == 1 && r.statistics[0].count == 600,
              "process(): NOT_READY spectrum with statistics");
        check(r.first_index == 5000 && r.samples == 600 && std::abs(r.window_end_ms - 599.0) < 1e-9,
              "process(): window bookkeeping");
    }

    // ========================================================================
    // TEST 4: Statistics
    // ========================================================================
    std::cout << "\nTEST 4: Statistics\n";
    {
        std::vector<double> v = {1.0, 2.0, 3.0, 4.0};
        ChannelStatistics s = SignalProcessor::computeStatistics(SampleSpan(v.data(), v.size()));
        check(s.min == 1.0 && s.max == 4.0 && std::abs(s.mean - 2.5) < 1e-12, "min/max/mean");
        check(std::abs(s.std_dev - std::sqrt(1.25)) < 1e-12, "Population standard deviation");
        check(std::abs(s.rms - std::sqrt(7.5)) < 1e-12, "RMS");

        auto x = tone(10000, 10000.0, 100.0, 2.0, 0.5);
        ChannelStatistics t = SignalProcessor::computeStatistics(SampleSpan(x.data(), x.size()));
        check(std::abs(t.mean - 0.5) < 1e-6 && std::abs(t.std_dev - 2.0 / std::sqrt(2.0)) < 1e-6,
              "Sine: mean = offset, std = A/sqrt(2)");

        ChannelStatistics e = SignalProcessor::computeStatistics(SampleSpan());
        check(e.count == 0 && e.mean == 0.0, "Empty input gives zeros");
    }

    // ========================================================================
    // TEST 5: Filters
    // ========================================================================
    std::cout << "\nTEST 5: Butterworth\n";
    {
        const double fs = 1000.0;
        auto gain = [fs](const SosCascade& sos, double f) {
            return std::abs(sosResponse(sos, 2.0 * M_PI * f / fs));
        };

        SosCascade lp = designButterworth(FilterType::LOWPASS, 4, fs, 100.0);
        check(lp.size() == 2, "Order 4 low-pass has 2 sections");
        check(std::abs(gain(lp, 0.0) - 1.0) < 1e-9, "Low-pass DC gain 1");
        check(std::abs(gain(lp, 100.0) - M_SQRT1_2) < 1e-6, "Low-pass -3 dB at cutoff");
        check(gain(lp, 400.0) < 1e-2, "Low-pass stopband");

        SosCascade hp = designButterworth(FilterType::HIGHPASS, 4, fs, 100.0);
        check(gain(hp, 0.0) < 1e-9 && std::abs(gain(hp, 499.999) - 1.0) < 1e-3, "High-pass: DC blocked, Nyquist passed");
        check(std::abs(gain(hp, 100.0) - M_SQRT1_2) < 1e-6, "High-pass -3 dB at cutoff");

        SosCascade bp = designButterworth(FilterType::BANDPASS, 2, fs, 100.0, 200.0);
        check(bp.size() == 2 && gain(bp, 0.0) < 1e-9 && gain(bp, 145.0) > 0.95 && gain(bp, 450.0) < 0.05,
              "Band-pass shape");
        check(std::abs(gain(bp, 100.0) - M_SQRT1_2) < 1e-6 && std::abs(gain(bp, 200.0) - M_SQRT1_2) < 1e-6,
              "Band-pass -3 dB at both edges");

        SosCascade bs = designButterworth(FilterType::BANDSTOP, 2, fs, 100.0, 200.0);
        check(std::abs(gain(bs, 0.0) - 1.0) < 1e-9 && gain(bs, 145.0) < 0.05, "Band-stop shape");

        FilterConfig mains;
        parseFilterSetting("notch50", mains);
        SosCascade notch = designButterworth(mains.type, mains.order, fs, mains.low_hz, mains.high_hz);
        check(gain(notch, 50.0) < 0.05 && gain(notch, 10.0) > 0.95 && gain(notch, 100.0) > 0.95,
              "notch50 removes 50 Hz, passes 10 and 100 Hz");

        bool threw = false;
        try {
            designButterworth(FilterType::LOWPASS, 4, fs, 600.0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "Cutoff above Nyquist rejected");

        // Zero phase: a passband tone comes out aligned with the input
        auto x = tone(4000, fs, 20.0, 1.0);
        auto y = x;
        sosFiltFilt(lp, y);
        double err = 0.0;
        for (size_t i = 500; i < 3500; ++i) err = std::max(err, std::abs(y[i] - x[i]));
        check(err < 0.01, "filtfilt keeps a passband tone in phase (max err " + std::to_string(err) + ")");

        // Causal filter lags the same tone
        auto z = x;
        sosFilter(lp, z);
        double causal_err = 0.0;
        for (size_t i = 500; i < 3500; ++i) causal_err = std::max(causal_err, std::abs(z[i] - x[i]));
        check(causal_err > err * 5.0, "Causal filter shows phase lag");

        // Stopband tone removed
        auto hf = tone(4000, fs, 400.0, 1.0);
        sosFiltFilt(lp, hf);
        double peak = 0.0;
        for (size_t i = 500; i < 3500; ++i) peak = std::max(peak, std::abs(hf[i]));
        check(peak < 1e-3, "filtfilt removes a stopband tone");

        std::vector<double> tiny = {1.0, 2.0};
        bool short_threw = false;
        try {
            sosFiltFilt(lp, tiny);
        } catch (const ProcessingError&) {
            short_threw = true;
        }
        check(short_threw, "filtfilt rejects fewer than three samples");
    }

    // ========================================================================
    // TEST 6: Invalid input
    // ========================================================================
    std::cout << "\nTEST 6: Non-finite input\n";
    {
        SignalProcessor::Config cfg;
        cfg.sample_rate_hz = 1000.0;
        cfg.window_samples = 256;
        cfg.spectrum.fft_length = 256;
        cfg.filter.type = FilterType::LOWPASS;
        cfg.filter.low_hz = 100.0;
        SignalProcessor proc(cfg);

        // Two channels, NaN in the second
        std::vector<double> values(512, 0.25);
        values[256 + 100] = std::numeric_limits<double>::quiet_NaN();
        auto ts = timestamps(256, 1000.0);
        bool threw = false;
        try {
            proc.process(blockOf(values, ts, 2));
        } catch (const ProcessingError& e) {
            threw = std::string(e.what()).find("channel 1") != std::string::npos;
        }
        check(threw, "NaN raises ProcessingError naming the channel");

        values[256 + 100] = 0.25;
        ProcessingResult r = proc.process(blockOf(values, ts, 2));
        check(r.filtered && r.statistics.size() == 2 && r.spectrum.status == SpectrumStatus::OK &&
              r.spectrum.psd_db.size() == 2, "Clean two-channel window processes");
        check(std::abs(r.statistics[1].mean - 0.25) < 1e-6, "Filtered DC level preserved");

        bool bad_filter = false;
        try {
            SignalProcessor::Config c2 = cfg;
            c2.filter.low_hz = 900.0;
            SignalProcessor p2(c2);
        } catch (const std::invalid_argument&) {
            bad_filter = true;
        }
        check(bad_filter, "Unusable filter rejected at construction");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All signal processing tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
