#include "welch.hpp"
#include "iq_convert.hpp"
#include "hw_config.hpp"
#include "test_common.hpp"
#include <cmath>
#include <complex>
#include <cstring>
#include <random>
#include <vector>

// Welch PSD against known signals, plus raw IQ normalisation

static PsdConfig psd_cfg(int nperseg, int noverlap, WindowType w, uint32_t fs, uint64_t fc){
    PsdConfig c;
    c.nperseg        = nperseg;
    c.noverlap       = noverlap;
    c.window_type    = w;
    c.sample_rate_hz = fs;
    c.center_freq_hz = fc;
    return c;
}

static std::vector<std::complex<float>> tone(size_t n, double f, double fs, float amp){
    std::vector<std::complex<float>> x(n);
    for(size_t i=0;i<n;i++){
        double ph = 2.0 * M_PI * f * (double)i / fs;
        x[i] = {amp * (float)cos(ph), amp * (float)sin(ph)};
    }
    return x;
}

static size_t argmax(const std::vector<double>& v){
    size_t k = 0;
    for(size_t i=1;i<v.size();i++) if(v[i] > v[k]) k = i;
    return k;
}

static void test_segment_count(){
    check("segments(1000,256,128) = 6", WelchEstimator::segment_count(1000, 256, 128) == 6);
    check("segments(256,256,128) = 1",  WelchEstimator::segment_count(256, 256, 128) == 1);
    check("segments(255,256,0) = 0",    WelchEstimator::segment_count(255, 256, 0) == 0);
    check("segments(4096,1024,0) = 4",  WelchEstimator::segment_count(4096, 1024, 0) == 4);
}

static void test_windows(){
    auto w = make_window(WindowType::HANNING, 8);
    check("periodic hann starts at 0", std::fabs(w[0]) < 1e-6);
    check("periodic hann peak at n/2", std::fabs(w[4] - 1.0f) < 1e-6);
    auto r = make_window(WindowType::RECTANGULAR, 4);
    check("rectangular is all ones", r[0]==1.0f && r[3]==1.0f);
    auto h = make_window(WindowType::HAMMING, 16);
    check_near("hamming w[0] = 0.08", h[0], 0.08, 1e-6);
}

static void test_tone_rectangular(){
    const int N = 1024;
    const double fs = 1024000.0;
    const uint64_t fc = 100000000;
    WelchEstimator we;
    check("configure rectangular", we.configure(psd_cfg(N, 0, WindowType::RECTANGULAR, (uint32_t)fs, fc)) == ConfigError::NONE);

    auto x = tone(4*N, 256000.0, fs, 1.0f);
    std::vector<double> f, p;
    check("compute ok", we.compute(x.data(), x.size(), f, p) == ConfigError::NONE);
    check("N bins out", f.size() == (size_t)N && p.size() == (size_t)N);
    check("4 segments used", we.last_segments() == 4);

    check_near("DC bin sits at the centre", f[N/2], (double)fc, 1e-3);
    check_near("first bin = fc - fs/2", f[0], (double)fc - fs/2.0, 1e-3);
    check("frequencies ascending", f[1] > f[0] && f[N-1] > f[N-2]);

    size_t k = argmax(p);
    check("+fs/4 tone lands in bin 3N/4", k == (size_t)(3*N/4));
    check_near("tone bin frequency", f[k], (double)fc + 256000.0, 1e-3);
    // |X|^2 = N^2 → N^2 / (fs * N)
    check_near("tone density N/fs", p[k], (double)N / fs, 1e-6);
}

static void test_power_conservation(){
    // sum(Pxx) * df equals mean |x|^2 for any window
    const int N = 512;
    const double fs = 2048000.0;
    const double df = fs / N;
    const WindowType wins[] = { WindowType::HAMMING, WindowType::HANNING, WindowType::BLACKMAN };
    const char* names[] = { "hamming power conserved", "hanning power conserved", "blackman power conserved" };
    auto x = tone(8*N, 4.0 * df, fs, 0.5f);
    for(int i=0;i<3;i++){
        WelchEstimator we;
        we.configure(psd_cfg(N, N/2, wins[i], (uint32_t)fs, 0));
        std::vector<double> f, p;
        we.compute(x.data(), x.size(), f, p);
        double total = 0.0;
        for(double v : p) total += v;
        check_near(names[i], total * df, 0.25, 1e-4);
    }
}

static void test_white_noise_level(){
    const int N = 256;
    const double fs = 1000000.0;
    std::mt19937 rng(42);
    std::normal_distribution<float> g(0.0f, (float)std::sqrt(0.5));
    std::vector<std::complex<float>> x(65536);
    for(auto& s : x) s = {g(rng), g(rng)};

    WelchEstimator we;
    we.configure(psd_cfg(N, N/2, WindowType::HAMMING, (uint32_t)fs, 0));
    std::vector<double> f, p;
    we.compute(x.data(), x.size(), f, p);
    double mean = 0.0;
    for(double v : p) mean += v;
    mean /= (double)p.size();
    // unit-variance complex noise → 1/fs W/Hz
    check_near("white noise density ~ 1/fs", mean * fs, 1.0, 0.05);
}

static void test_errors_and_replan(){
    WelchEstimator we;
    std::vector<double> f, p;
    std::vector<std::complex<float>> x(100);
    check("compute before configure fails", we.compute(x.data(), x.size(), f, p) != ConfigError::NONE);
    check("noverlap >= nperseg rejected",
          we.configure(psd_cfg(64, 64, WindowType::HAMMING, 1000, 0)) == ConfigError::INVALID_OVERLAP);
    check("configure 128", we.configure(psd_cfg(128, 64, WindowType::HAMMING, 1000, 0)) == ConfigError::NONE);
    check("too few samples", we.compute(x.data(), x.size(), f, p) == ConfigError::INSUFFICIENT_SAMPLES);
    check("reconfigure 64", we.configure(psd_cfg(64, 32, WindowType::HANNING, 1000, 0)) == ConfigError::NONE);
    check("compute after replan", we.compute(x.data(), x.size(), f, p) == ConfigError::NONE && p.size() == 64);
    check("replan segments (100-64)/32+1 = 2", we.last_segments() == 2);
}

static void test_iq_convert(){
    std::vector<std::complex<float>> out;

    const uint8_t cu8[5] = { 255, 0, 127, 128, 9 };
    size_t n = iq_to_complex(cu8, sizeof(cu8), make_rtlsdr_config(), out);
    check("cu8: trailing byte ignored", n == 2 && out.size() == 2);
    check_near("cu8 I full scale", out[0].real(), 1.0, 1e-6);
    check_near("cu8 Q -full scale", out[0].imag(), -1.0, 1e-6);
    check_near("cu8 127 ~ 0", out[1].real(), -0.5/127.5, 1e-6);

    const int8_t cs8[4] = { 127, -128, 0, 64 };
    n = iq_to_complex(reinterpret_cast<const uint8_t*>(cs8), sizeof(cs8), make_hackrf_config(), out);
    check("cs8: 2 samples", n == 2);
    check_near("cs8 -128 → -1", out[0].imag(), -1.0, 1e-6);
    check_near("cs8 64 → 0.5", out[1].imag(), 0.5, 1e-6);

    int16_t sc16[4] = { 2048, -2048, 1024, 0 };
    uint8_t raw[sizeof(sc16) + 3];
    memcpy(raw, sc16, sizeof(sc16));
    n = iq_to_complex(raw, sizeof(raw), make_bladerf_config(), out);
    check("sc16: 2 samples, partial sample ignored", n == 2);
    check_near("sc16 2048 → 1", out[0].real(), 1.0, 1e-6);
    check_near("sc16 -2048 → -1", out[0].imag(), -1.0, 1e-6);
    check_near("sc16 1024 → 0.5", out[1].real(), 0.5, 1e-6);
}

int main(){
    test_segment_count();
    test_windows();
    test_tone_rectangular();
    test_power_conservation();
    test_white_noise_level();
    test_errors_and_replan();
    test_iq_convert();
    std::printf("%d failure(s)\n", g_failures);
    return g_failures;
}
