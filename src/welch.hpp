#pragma once
#include "acq_config.hpp"
#include <fftw3.h>
#include <complex>
#include <vector>

// Periodic (DFT-even) window of length n
std::vector<float> make_window(WindowType type, int n);

// ── WelchEstimator ────────────────────────────────────────────────────────
// Two-sided Welch PSD of complex IQ. Output is FFT-shifted (DC in the
// middle, ascending frequency), density scaled:
//   Pxx[k] = mean_seg |X[k]|^2 / (fs * sum(w^2))
// Owns one FFTW plan; configure() rebuilds it only when nperseg changes.
// Not thread-safe: one instance per processing thread.
class WelchEstimator {
public:
    WelchEstimator() = default;
    ~WelchEstimator();

    WelchEstimator(const WelchEstimator&) = delete;
    WelchEstimator& operator=(const WelchEstimator&) = delete;

    ConfigError configure(const PsdConfig& cfg);

    // INSUFFICIENT_SAMPLES when n < nperseg
    ConfigError compute(const std::complex<float>* x, size_t n,
                        std::vector<double>& freqs, std::vector<double>& pxx);

    const PsdConfig& config() const { return cfg_; }
    int  last_segments() const { return last_segments_; }
    bool configured() const { return plan_ != nullptr; }

    // Number of segments a window of n samples yields
    static size_t segment_count(size_t n, int nperseg, int noverlap);

private:
    void release();

    PsdConfig          cfg_;
    std::vector<float> win_;
    double             win_pow_ = 1.0;   // sum(w^2)
    fftwf_complex*     fft_in_  = nullptr;
    fftwf_complex*     fft_out_ = nullptr;
    fftwf_plan         plan_    = nullptr;
    int                plan_n_  = 0;
    std::vector<double> acc_;
    int                last_segments_ = 0;
};
