#pragma once
#include "hw_config.hpp"
#include <cstdint>
#include <cstddef>

// ── Enums ─────────────────────────────────────────────────────────────────
enum class WindowType : uint8_t { RECTANGULAR=0, HAMMING=1, HANNING=2, BLACKMAN=3 };
enum class ScaleKind  : uint8_t { DBM, DBMV, DBUV, V, W };

enum class ConfigError : uint8_t {
    NONE = 0,
    INVALID_OVERLAP,
    RESOLUTION_TOO_COARSE,
    INSUFFICIENT_SAMPLES,
    INVALID_SAMPLE_RATE,
    INVALID_FREQUENCY,
    INVALID_RBW,
    INVALID_SPAN,
    INVALID_GAIN,
    PARSE_ERROR,
};

const char* config_error_str(ConfigError e);
const char* window_name(WindowType w);
const char* scale_name(ScaleKind s);
bool        window_from_name(const char* s, WindowType& out);
bool        window_from_index(long i, WindowType& out);
bool        scale_from_name(const char* s, ScaleKind& out);

// Nominal equivalent noise bandwidth (bins) of each window
double window_enbw(WindowType w);

// ── Operator intent (one acquisition command) ─────────────────────────────
struct DesiredConfig {
    uint64_t   center_freq_hz          = 0;
    uint64_t   span_hz                 = 0;     // 0 = full captured band
    uint64_t   resolution_bandwidth_hz = 0;
    uint64_t   sample_rate_hz          = 0;
    double     overlap                 = 0.5;
    WindowType window_type             = WindowType::HAMMING;
    ScaleKind  scale                   = ScaleKind::DBM;
    int        lna_gain                = 0;
    int        vga_gain                = 0;
    bool       amp_enabled             = false;
    int        ppm_error               = 0;
};

// ── Derived configuration ─────────────────────────────────────────────────
struct HardwareConfig {
    uint32_t sample_rate  = 0;
    uint64_t center_freq  = 0;
    int      lna_gain     = 0;
    int      vga_gain     = 0;
    bool     amp_enabled  = false;
    int      ppm_error    = 0;
};

struct PsdConfig {
    int        nperseg        = 0;
    int        noverlap       = 0;
    WindowType window_type    = WindowType::HAMMING;
    uint32_t   sample_rate_hz = 0;
    uint64_t   center_freq_hz = 0;
};

struct RingBufferConfig {
    size_t total_bytes = 0;   // one PSD input window
    size_t rb_size     = 0;   // physical capacity, 2 windows
};

// Smallest power of two >= required (required > 0)
uint64_t next_pow2(double required);

// Checks ranges (device-specific when caps.type != NONE)
ConfigError validate_desired(const DesiredConfig& d, const HWConfig& caps);

// Validates and derives the three concrete configurations.
// Outputs are untouched unless NONE is returned.
ConfigError derive_params(const DesiredConfig& d, const HWConfig& caps,
                          HardwareConfig& hw, PsdConfig& psd, RingBufferConfig& rb);
