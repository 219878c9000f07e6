#include "acq_config.hpp"
#include "hw_config.hpp"
#include "test_common.hpp"
#include <cmath>
#include <cstring>

// Validation order and parameter derivation for acquisition commands

static DesiredConfig base_cmd(){
    DesiredConfig d;
    d.center_freq_hz          = 100000000;
    d.sample_rate_hz          = 2048000;
    d.span_hz                 = 2048000;
    d.resolution_bandwidth_hz = 1000;
    d.window_type             = WindowType::HAMMING;
    d.overlap                 = 0.5;
    return d;
}

static ConfigError derive(const DesiredConfig& d, const HWConfig& caps = HWConfig()){
    HardwareConfig hw; PsdConfig psd; RingBufferConfig rb;
    return derive_params(d, caps, hw, psd, rb);
}

static void test_next_pow2(){
    check("next_pow2(1) = 1",           next_pow2(1.0) == 1);
    check("next_pow2(1000) = 1024",     next_pow2(1000.0) == 1024);
    check("next_pow2(1024) = 1024",     next_pow2(1024.0) == 1024);
    check("next_pow2(1024.5) = 2048",   next_pow2(1024.5) == 2048);
    check("next_pow2(2785.28) = 4096",  next_pow2(2785.28) == 4096);
}

static void test_derive_hamming(){
    DesiredConfig d = base_cmd();
    HardwareConfig hw; PsdConfig psd; RingBufferConfig rb;
    HWConfig caps = make_hackrf_config();
    ConfigError e = derive_params(d, caps, hw, psd, rb);
    check("hamming 2.048 MSPS / 1 kHz accepted", e == ConfigError::NONE);
    // 1.36 * 2048000 / 1000 = 2785.28 → 4096
    check("nperseg = 4096",  psd.nperseg == 4096);
    check("noverlap = 2048", psd.noverlap == 2048);
    check("psd carries window/rate/center",
          psd.window_type == WindowType::HAMMING && psd.sample_rate_hz == 2048000 &&
          psd.center_freq_hz == 100000000);
    check("hw sample_rate / center", hw.sample_rate == 2048000 && hw.center_freq == 100000000);
    check("ring window = 1 s of CS8", rb.total_bytes == 2048000u * 2u);
    check("ring holds two windows", rb.rb_size == rb.total_bytes * 2);
}

static void test_fm_band_scenario(){
    DesiredConfig d;
    d.center_freq_hz          = 98000000;
    d.sample_rate_hz          = 20000000;
    d.span_hz                 = 20000000;
    d.resolution_bandwidth_hz = 5000;
    d.window_type             = WindowType::HAMMING;
    d.overlap                 = 0.5;
    HardwareConfig hw; PsdConfig psd; RingBufferConfig rb;
    check("20 MSPS on HackRF accepted",
          derive_params(d, make_hackrf_config(), hw, psd, rb) == ConfigError::NONE);
    // 1.36 * 20e6 / 5000 = 5440 → 8192
    check("nperseg = 8192", psd.nperseg == 8192);
    check("noverlap = 4096", psd.noverlap == 4096);
}

static void test_pow2_property(){
    const uint64_t rates[] = { 2000000, 2400000, 8000000, 10000000, 20000000 };
    const uint64_t rbws[]  = { 100, 977, 1000, 12500, 250000 };
    const WindowType wins[] = { WindowType::RECTANGULAR, WindowType::HAMMING,
                                WindowType::HANNING, WindowType::BLACKMAN };
    const double overlaps[] = { 0.0, 0.25, 0.5, 0.9, 0.999 };
    bool pow2 = true, enough = true, ovl = true;
    for(uint64_t sr : rates) for(uint64_t rbw : rbws) for(WindowType w : wins) for(double ov : overlaps){
        DesiredConfig d = base_cmd();
        d.sample_rate_hz = sr; d.span_hz = 0; d.resolution_bandwidth_hz = rbw;
        d.window_type = w; d.overlap = ov;
        HardwareConfig hw; PsdConfig psd; RingBufferConfig rb;
        if(derive_params(d, HWConfig(), hw, psd, rb) != ConfigError::NONE) continue;
        uint64_t n = (uint64_t)psd.nperseg;
        if(n == 0 || (n & (n-1)) != 0) pow2 = false;
        if((double)n < window_enbw(w) * (double)sr / (double)rbw - 1e-6) enough = false;
        if(psd.noverlap < 0 || psd.noverlap >= psd.nperseg ||
           psd.noverlap != (int)std::floor((double)psd.nperseg * ov)) ovl = false;
    }
    check("nperseg always a power of two", pow2);
    check("nperseg covers ENBW*fs/rbw", enough);
    check("noverlap = floor(nperseg*overlap) < nperseg", ovl);
}

static void test_derive_other_windows(){
    DesiredConfig d = base_cmd();
    d.sample_rate_hz = 1000000; d.span_hz = 0; d.resolution_bandwidth_hz = 1000;
    HardwareConfig hw; PsdConfig psd; RingBufferConfig rb;

    d.window_type = WindowType::RECTANGULAR;
    check("rectangular accepted", derive_params(d, HWConfig(), hw, psd, rb) == ConfigError::NONE);
    check("rectangular 1e6/1e3 → 1024", psd.nperseg == 1024);

    d.window_type = WindowType::HANNING;
    derive_params(d, HWConfig(), hw, psd, rb);
    check("hanning 1.5e3 → 2048", psd.nperseg == 2048);

    d.window_type = WindowType::BLACKMAN;
    derive_params(d, HWConfig(), hw, psd, rb);
    check("blackman 1.73e3 → 2048", psd.nperseg == 2048);

    d.overlap = 0.0;
    derive_params(d, HWConfig(), hw, psd, rb);
    check("overlap 0 → noverlap 0", psd.noverlap == 0);

    d.overlap = 0.75;
    derive_params(d, HWConfig(), hw, psd, rb);
    check("overlap 0.75 → 1536", psd.noverlap == 1536);
}

static void test_rejections(){
    DesiredConfig d;

    d = base_cmd(); d.overlap = 1.0;
    check("overlap 1.0 rejected", derive(d) == ConfigError::INVALID_OVERLAP);
    d = base_cmd(); d.overlap = -0.1;
    check("overlap < 0 rejected", derive(d) == ConfigError::INVALID_OVERLAP);

    d = base_cmd(); d.sample_rate_hz = 0;
    check("sample_rate 0 rejected", derive(d) == ConfigError::INVALID_SAMPLE_RATE);

    d = base_cmd(); d.resolution_bandwidth_hz = 0;
    check("rbw 0 rejected", derive(d) == ConfigError::INVALID_RBW);

    d = base_cmd(); d.resolution_bandwidth_hz = d.sample_rate_hz + 1;
    check("rbw above sample rate too coarse", derive(d) == ConfigError::RESOLUTION_TOO_COARSE);

    // rbw == fs with rectangular window: 1 bin is legal
    d = base_cmd(); d.window_type = WindowType::RECTANGULAR; d.resolution_bandwidth_hz = d.sample_rate_hz;
    check("rbw == fs rectangular accepted", derive(d) == ConfigError::NONE);

    d = base_cmd(); d.span_hz = d.sample_rate_hz + 1;
    check("span above sample rate rejected", derive(d) == ConfigError::INVALID_SPAN);

    d = base_cmd(); d.lna_gain = 41;
    check("lna 41 rejected", derive(d) == ConfigError::INVALID_GAIN);
    d = base_cmd(); d.vga_gain = -1;
    check("vga -1 rejected", derive(d) == ConfigError::INVALID_GAIN);
    d = base_cmd(); d.ppm_error = 1001;
    check("ppm 1001 rejected", derive(d) == ConfigError::INVALID_GAIN);

    // nperseg larger than one second of samples
    d = base_cmd(); d.sample_rate_hz = 1000; d.span_hz = 0; d.resolution_bandwidth_hz = 1;
    check("rbw finer than window rejected", derive(d) == ConfigError::INSUFFICIENT_SAMPLES);
}

static void test_device_ranges(){
    HWConfig rtl = make_rtlsdr_config();
    DesiredConfig d = base_cmd();
    check("rtl 100 MHz / 2.048 MSPS accepted", derive(d, rtl) == ConfigError::NONE);

    d.sample_rate_hz = 20000000; d.span_hz = 0;
    check("rtl 20 MSPS rejected", derive(d, rtl) == ConfigError::INVALID_SAMPLE_RATE);

    d = base_cmd(); d.center_freq_hz = 10000;
    check("rtl 10 kHz rejected", derive(d, rtl) == ConfigError::INVALID_FREQUENCY);

    // no caps: only generic checks
    check("10 kHz without caps accepted", derive(d) == ConfigError::NONE);

    HWConfig blade = make_bladerf_config();
    HardwareConfig hw; PsdConfig psd; RingBufferConfig rb;
    d = base_cmd();
    derive_params(d, blade, hw, psd, rb);
    check("bladerf window uses 4 bytes/sample", rb.total_bytes == 2048000u * 4u);
}

static void test_names(){
    WindowType w = WindowType::RECTANGULAR;
    check("window 'hann' alias",   window_from_name("hann", w) && w == WindowType::HANNING);
    check("window 'Blackman'",     window_from_name("blackman", w) && w == WindowType::BLACKMAN);
    check("window 'kaiser' unknown", !window_from_name("kaiser", w));
    check("window index 1 = hamming", window_from_index(1, w) && w == WindowType::HAMMING);
    check("window index 4 invalid", !window_from_index(4, w));

    ScaleKind s = ScaleKind::W;
    check("scale dBm",  scale_from_name("dBm", s) && s == ScaleKind::DBM);
    check("scale dBuV", scale_from_name("dBuV", s) && s == ScaleKind::DBUV);
    check("scale dB\xC2\xB5V", scale_from_name("dB\xC2\xB5V", s) && s == ScaleKind::DBUV);
    check("scale 'dBW' unknown", !scale_from_name("dBW", s));

    check("error names are snake_case",
          !strcmp(config_error_str(ConfigError::RESOLUTION_TOO_COARSE), "resolution_too_coarse") &&
          !strcmp(config_error_str(ConfigError::NONE), "none"));
}

static void test_gain_snapping(){
    HWConfig hrf = make_hackrf_config();
    check("hackrf lna 23 → 16", hrf.snap_lna(23) == 16);
    check("hackrf lna 99 → 40", hrf.snap_lna(99) == 40);
    check("hackrf vga 33 → 32", hrf.snap_vga(33) == 32);
    check("rtl 20 dB → 19.7 dB step", HWConfig::rtl_snap_gain(20.0f) == 197);
    check("rtl 0 dB → 0", HWConfig::rtl_snap_gain(0.0f) == 0);
}

int main(){
    test_next_pow2();
    test_derive_hamming();
    test_fm_band_scenario();
    test_pow2_property();
    test_derive_other_windows();
    test_rejections();
    test_device_ranges();
    test_names();
    test_gain_snapping();
    std::printf("%d failure(s)\n", g_failures);
    return g_failures;
}
