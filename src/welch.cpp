#include "welch.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>

// fftw planner is not thread-safe
static std::mutex g_fftw_plan_mtx;

std::vector<float> make_window(WindowType type, int n){
    std::vector<float> w(n > 0 ? n : 0, 1.0f);
    const double tp = 2.0 * M_PI / (double)n;
    for(int i=0;i<n;i++){
        double v = 1.0;
        switch(type){
            case WindowType::RECTANGULAR: v = 1.0; break;
            case WindowType::HAMMING:     v = 0.54 - 0.46*cos(tp*i); break;
            case WindowType::HANNING:     v = 0.5  - 0.5 *cos(tp*i); break;
            case WindowType::BLACKMAN:    v = 0.42 - 0.5 *cos(tp*i) + 0.08*cos(2.0*tp*i); break;
        }
        w[i] = (float)v;
    }
    return w;
}

WelchEstimator::~WelchEstimator(){ release(); }

void WelchEstimator::release(){
    std::lock_guard<std::mutex> lk(g_fftw_plan_mtx);
    if(plan_)    { fftwf_destroy_plan(plan_); plan_ = nullptr; }
    if(fft_in_)  { fftwf_free(fft_in_);  fft_in_  = nullptr; }
    if(fft_out_) { fftwf_free(fft_out_); fft_out_ = nullptr; }
    plan_n_ = 0;
}

size_t WelchEstimator::segment_count(size_t n, int nperseg, int noverlap){
    if(nperseg <= 0 || noverlap < 0 || noverlap >= nperseg || n < (size_t)nperseg) return 0;
    size_t step = (size_t)(nperseg - noverlap);
    return (n - (size_t)nperseg) / step + 1;
}

ConfigError WelchEstimator::configure(const PsdConfig& cfg){
    if(cfg.noverlap < 0 || cfg.noverlap >= cfg.nperseg) return ConfigError::INVALID_OVERLAP;
    if(cfg.nperseg <= 0 || cfg.sample_rate_hz == 0)     return ConfigError::RESOLUTION_TOO_COARSE;

    if(plan_n_ != cfg.nperseg){
        release();
        std::lock_guard<std::mutex> lk(g_fftw_plan_mtx);
        fft_in_  = fftwf_alloc_complex(cfg.nperseg);
        fft_out_ = fftwf_alloc_complex(cfg.nperseg);
        plan_    = fftwf_plan_dft_1d(cfg.nperseg, fft_in_, fft_out_, FFTW_FORWARD, FFTW_MEASURE);
        if(!plan_){
            rfs_err("[Welch] fftwf_plan_dft_1d(%d) failed", cfg.nperseg);
            fftwf_free(fft_in_);  fft_in_  = nullptr;
            fftwf_free(fft_out_); fft_out_ = nullptr;
            return ConfigError::INSUFFICIENT_SAMPLES;
        }
        plan_n_ = cfg.nperseg;
        rfs_debug("[Welch] plan nperseg=%d", cfg.nperseg);
    }
    if(plan_n_ != cfg_.nperseg || cfg.window_type != cfg_.window_type || win_.empty()){
        win_ = make_window(cfg.window_type, cfg.nperseg);
        win_pow_ = 0.0;
        for(float v : win_) win_pow_ += (double)v * (double)v;
    }
    cfg_ = cfg;
    acc_.assign(cfg.nperseg, 0.0);
    return ConfigError::NONE;
}

ConfigError WelchEstimator::compute(const std::complex<float>* x, size_t n,
                                    std::vector<double>& freqs, std::vector<double>& pxx){
    if(!plan_) return ConfigError::RESOLUTION_TOO_COARSE;
    const int N = cfg_.nperseg;
    if(n < (size_t)N) return ConfigError::INSUFFICIENT_SAMPLES;

    const size_t step = (size_t)(N - cfg_.noverlap);
    const size_t nseg = segment_count(n, N, cfg_.noverlap);
    std::fill(acc_.begin(), acc_.end(), 0.0);

    for(size_t s=0; s<nseg; s++){
        const std::complex<float>* seg = x + s*step;
        for(int i=0;i<N;i++){
            fft_in_[i][0] = seg[i].real() * win_[i];
            fft_in_[i][1] = seg[i].imag() * win_[i];
        }
        fftwf_execute(plan_);
        for(int k=0;k<N;k++){
            double re = fft_out_[k][0], im = fft_out_[k][1];
            acc_[k] += re*re + im*im;
        }
    }
    last_segments_ = (int)nseg;

    const double fs    = (double)cfg_.sample_rate_hz;
    const double scale = 1.0 / ((double)nseg * fs * win_pow_);
    const double f0    = (double)cfg_.center_freq_hz - fs/2.0;
    const double df    = fs / (double)N;
    const int    half  = N / 2;

    freqs.resize(N);
    pxx.resize(N);
    for(int j=0;j<N;j++){
        pxx[j]   = acc_[(j + half) % N] * scale;   // fftshift
        freqs[j] = f0 + (double)j * df;
    }
    return ConfigError::NONE;
}
