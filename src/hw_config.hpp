#pragma once
#include <cstdint>
#include <cstdlib>  // abs(int)

// ── Hardware type ─────────────────────────────────────────────────────────
enum class HWType { NONE, BLADERF, RTLSDR, HACKRF };

// Raw IQ layout delivered by the capture callback
enum class SampleFormat { CU8, CS8, CS16_Q11 };

// ── Backend capabilities (fixed per HWType) ───────────────────────────────
struct HWConfig {
    HWType       type             = HWType::NONE;
    const char*  name             = "Unknown";

    // Tuning / sampling range
    double       freq_min_hz      = 0.0;
    double       freq_max_hz      = 0.0;
    uint32_t     sample_rate_min  = 0;
    uint32_t     sample_rate_max  = 0;

    // IQ layout: normalised = (raw - iq_offset) / iq_scale
    SampleFormat format           = SampleFormat::CS8;
    int          bytes_per_sample = 2;        // I+Q
    float        iq_scale         = 128.0f;
    float        iq_offset        = 0.0f;

    // Gain stages (dB)
    int          lna_max          = 40;
    int          lna_step         = 8;
    int          vga_max          = 62;
    int          vga_step         = 2;
    int          total_gain_max   = 102;      // single-stage tuners clamp lna+vga
    bool         has_amp          = false;
    bool         has_ppm          = false;

    // RTL-SDR R82xx discrete gain table (0.1 dB units, as librtlsdr reports)
    static constexpr int RTL_GAIN_STEPS = 29;
    static constexpr int RTL_GAINS_TENTHS[RTL_GAIN_STEPS] = {
        0, 9, 14, 27, 37, 77, 87, 125, 144, 157, 166,
        197, 207, 229, 254, 280, 297, 328, 338, 364,
        372, 386, 402, 421, 434, 439, 445, 480, 496
    };

    // dB → nearest R82xx step (0.1 dB units)
    static int rtl_snap_gain(float db){
        int tenths = (int)(db * 10.0f + 0.5f);
        int best = RTL_GAINS_TENTHS[0], best_diff = abs(tenths - best);
        for(int i=1;i<RTL_GAIN_STEPS;i++){
            int d = abs(tenths - RTL_GAINS_TENTHS[i]);
            if(d < best_diff){ best_diff=d; best=RTL_GAINS_TENTHS[i]; }
        }
        return best;
    }

    // Clamp into [0,max] and round down to the stage's step
    static int snap_stage(int db, int max, int step){
        if(db < 0)   db = 0;
        if(db > max) db = max;
        return step > 1 ? db - db % step : db;
    }

    int snap_lna(int db) const { return snap_stage(db, lna_max, lna_step); }
    int snap_vga(int db) const { return snap_stage(db, vga_max, vga_step); }

    // Combined gain for single-stage tuners
    int total_gain(int lna, int vga) const {
        int g = lna + vga;
        if(g < 0) g = 0;
        if(g > total_gain_max) g = total_gain_max;
        return g;
    }

    bool freq_ok(uint64_t hz) const {
        return (double)hz >= freq_min_hz && (double)hz <= freq_max_hz;
    }
    bool rate_ok(uint64_t sps) const {
        return sps >= sample_rate_min && sps <= sample_rate_max;
    }
};

// BladeRF (SC16 Q11)
inline HWConfig make_bladerf_config(){
    HWConfig c;
    c.type             = HWType::BLADERF;
    c.name             = "BladeRF";
    c.freq_min_hz      = 47e6;
    c.freq_max_hz      = 6000e6;
    c.sample_rate_min  = 520834;
    c.sample_rate_max  = 61440000;
    c.format           = SampleFormat::CS16_Q11;
    c.bytes_per_sample = 4;
    c.iq_scale         = 2048.0f;
    c.iq_offset        = 0.0f;
    c.lna_step         = 1;
    c.vga_step         = 1;
    c.total_gain_max   = 60;
    c.has_amp          = false;
    c.has_ppm          = false;
    return c;
}

// RTL-SDR (unsigned 8 bit, centre 127.5)
inline HWConfig make_rtlsdr_config(){
    HWConfig c;
    c.type             = HWType::RTLSDR;
    c.name             = "RTL-SDR";
    c.freq_min_hz      = 500e3;
    c.freq_max_hz      = 1766e6;
    c.sample_rate_min  = 225001;
    c.sample_rate_max  = 3200000;
    c.format           = SampleFormat::CU8;
    c.bytes_per_sample = 2;
    c.iq_scale         = 127.5f;
    c.iq_offset        = 127.5f;
    c.lna_step         = 1;
    c.vga_step         = 1;
    c.total_gain_max   = 50;
    c.has_amp          = true;   // RTL2832 digital AGC
    c.has_ppm          = true;
    return c;
}

// HackRF One (signed 8 bit)
inline HWConfig make_hackrf_config(){
    HWConfig c;
    c.type             = HWType::HACKRF;
    c.name             = "HackRF";
    c.freq_min_hz      = 1e6;
    c.freq_max_hz      = 6000e6;
    c.sample_rate_min  = 2000000;
    c.sample_rate_max  = 20000000;
    c.format           = SampleFormat::CS8;
    c.bytes_per_sample = 2;
    c.iq_scale         = 128.0f;
    c.iq_offset        = 0.0f;
    c.lna_max          = 40;
    c.lna_step         = 8;
    c.vga_max          = 62;
    c.vga_step         = 2;
    c.has_amp          = true;
    c.has_ppm          = true;   // applied by pre-scaling the tuned frequency
    return c;
}

inline HWConfig make_hw_config(HWType t){
    switch(t){
        case HWType::BLADERF: return make_bladerf_config();
        case HWType::RTLSDR:  return make_rtlsdr_config();
        case HWType::HACKRF:  return make_hackrf_config();
        default:              return HWConfig{};
    }
}
