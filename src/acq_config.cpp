#include "acq_config.hpp"
#include "config.hpp"
#include <cmath>
#include <cstring>
#include <strings.h>

const char* config_error_str(ConfigError e){
    switch(e){
        case ConfigError::NONE:                  return "none";
        case ConfigError::INVALID_OVERLAP:       return "invalid_overlap";
        case ConfigError::RESOLUTION_TOO_COARSE: return "resolution_too_coarse";
        case ConfigError::INSUFFICIENT_SAMPLES:  return "insufficient_samples";
        case ConfigError::INVALID_SAMPLE_RATE:   return "invalid_sample_rate";
        case ConfigError::INVALID_FREQUENCY:     return "invalid_frequency";
        case ConfigError::INVALID_RBW:           return "invalid_rbw";
        case ConfigError::INVALID_SPAN:          return "invalid_span";
        case ConfigError::INVALID_GAIN:          return "invalid_gain";
        case ConfigError::PARSE_ERROR:           return "parse_error";
    }
    return "unknown";
}

const char* window_name(WindowType w){
    switch(w){
        case WindowType::RECTANGULAR: return "rectangular";
        case WindowType::HAMMING:     return "hamming";
        case WindowType::HANNING:     return "hanning";
        case WindowType::BLACKMAN:    return "blackman";
    }
    return "unknown";
}

const char* scale_name(ScaleKind s){
    switch(s){
        case ScaleKind::DBM:  return "dBm";
        case ScaleKind::DBMV: return "dBmV";
        case ScaleKind::DBUV: return "dBuV";
        case ScaleKind::V:    return "V";
        case ScaleKind::W:    return "W";
    }
    return "unknown";
}

bool window_from_name(const char* s, WindowType& out){
    if(!s) return false;
    if(!strcasecmp(s,"rectangular") || !strcasecmp(s,"rect") || !strcasecmp(s,"boxcar")){
        out=WindowType::RECTANGULAR; return true;
    }
    if(!strcasecmp(s,"hamming")){ out=WindowType::HAMMING; return true; }
    if(!strcasecmp(s,"hanning") || !strcasecmp(s,"hann")){ out=WindowType::HANNING; return true; }
    if(!strcasecmp(s,"blackman")){ out=WindowType::BLACKMAN; return true; }
    return false;
}

bool window_from_index(long i, WindowType& out){
    if(i < 0 || i > 3) return false;
    out = static_cast<WindowType>(i);
    return true;
}

bool scale_from_name(const char* s, ScaleKind& out){
    if(!s) return false;
    if(!strcasecmp(s,"dBm"))  { out=ScaleKind::DBM;  return true; }
    if(!strcasecmp(s,"dBmV")) { out=ScaleKind::DBMV; return true; }
    // "dBµV" arrives as UTF-8 (µ = C2 B5)
    if(!strcasecmp(s,"dBuV") || !strcmp(s,"dB\xC2\xB5V")){ out=ScaleKind::DBUV; return true; }
    if(!strcmp(s,"V") || !strcmp(s,"v")) { out=ScaleKind::V; return true; }
    if(!strcmp(s,"W") || !strcmp(s,"w")) { out=ScaleKind::W; return true; }
    return false;
}

double window_enbw(WindowType w){
    switch(w){
        case WindowType::RECTANGULAR: return 1.0;
        case WindowType::HAMMING:     return 1.36;
        case WindowType::HANNING:     return 1.5;
        case WindowType::BLACKMAN:    return 1.73;
    }
    return 1.0;
}

uint64_t next_pow2(double required){
    uint64_t p = 1;
    // tolerance keeps an exact power of two (e.g. 1024.0000000001) from doubling
    while((double)p < required - 1e-9 && p < (1ull<<62)) p <<= 1;
    return p;
}

ConfigError validate_desired(const DesiredConfig& d, const HWConfig& caps){
    if(!(d.overlap >= 0.0 && d.overlap < 1.0))
        return ConfigError::INVALID_OVERLAP;
    if(d.sample_rate_hz == 0 || d.sample_rate_hz > UINT32_MAX)
        return ConfigError::INVALID_SAMPLE_RATE;
    if(d.resolution_bandwidth_hz == 0)
        return ConfigError::INVALID_RBW;
    if(d.resolution_bandwidth_hz > d.sample_rate_hz)
        return ConfigError::RESOLUTION_TOO_COARSE;
    if(d.span_hz > d.sample_rate_hz)
        return ConfigError::INVALID_SPAN;
    if(d.lna_gain < 0 || d.lna_gain > RFSENSE_MAX_LNA_GAIN ||
       d.vga_gain < 0 || d.vga_gain > RFSENSE_MAX_VGA_GAIN ||
       d.ppm_error < -RFSENSE_MAX_PPM || d.ppm_error > RFSENSE_MAX_PPM)
        return ConfigError::INVALID_GAIN;

    if(caps.type != HWType::NONE){
        if(!caps.rate_ok(d.sample_rate_hz)) return ConfigError::INVALID_SAMPLE_RATE;
        if(!caps.freq_ok(d.center_freq_hz)) return ConfigError::INVALID_FREQUENCY;
    }
    return ConfigError::NONE;
}

ConfigError derive_params(const DesiredConfig& d, const HWConfig& caps,
                          HardwareConfig& hw, PsdConfig& psd, RingBufferConfig& rb){
    ConfigError err = validate_desired(d, caps);
    if(err != ConfigError::NONE) return err;

    double required = window_enbw(d.window_type) * (double)d.sample_rate_hz
                    / (double)d.resolution_bandwidth_hz;
    if(required < 1.0) return ConfigError::RESOLUTION_TOO_COARSE;
    uint64_t nperseg = next_pow2(required);

    // One window = one second of samples
    int bps = caps.bytes_per_sample > 0 ? caps.bytes_per_sample : 2;
    uint64_t window_samples = d.sample_rate_hz;
    if(nperseg > window_samples || nperseg > (1u<<30))
        return ConfigError::INSUFFICIENT_SAMPLES;

    hw.sample_rate = (uint32_t)d.sample_rate_hz;
    hw.center_freq = d.center_freq_hz;
    hw.lna_gain    = d.lna_gain;
    hw.vga_gain    = d.vga_gain;
    hw.amp_enabled = d.amp_enabled;
    hw.ppm_error   = d.ppm_error;

    psd.nperseg        = (int)nperseg;
    psd.noverlap       = (int)std::floor((double)nperseg * d.overlap);
    psd.window_type    = d.window_type;
    psd.sample_rate_hz = (uint32_t)d.sample_rate_hz;
    psd.center_freq_hz = d.center_freq_hz;

    rb.total_bytes = (size_t)window_samples * (size_t)bps;
    rb.rb_size     = rb.total_bytes * 2;
    return ConfigError::NONE;
}
