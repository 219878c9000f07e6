#pragma once
#include "acq_config.hpp"
#include "config.hpp"
#include <cstdint>
#include <vector>

// ── PsdResult ─────────────────────────────────────────────────────────────
// One published spectrum. pxx is in the unit named by scale.
struct PsdResult {
    uint64_t            start_freq_hz  = 0;
    uint64_t            end_freq_hz    = 0;
    uint64_t            center_freq_hz = 0;
    uint32_t            bin_count      = 0;
    std::vector<double> pxx;
    int64_t             timestamp_ms   = 0;   // Unix ms
    ScaleKind           scale          = ScaleKind::DBM;
};

// Linear power (W) → unit. Power is floored at RFSENSE_POWER_FLOOR_W.
double scale_value(double p_watt, ScaleKind s, double r_ohm = RFSENSE_REF_IMPEDANCE_OHM);
// Unit → linear power (W)
double unscale_value(double v, ScaleKind s, double r_ohm = RFSENSE_REF_IMPEDANCE_OHM);

std::vector<double> scale_psd(const std::vector<double>& pxx, ScaleKind s,
                              double r_ohm = RFSENSE_REF_IMPEDANCE_OHM);

// Keeps bins with |f - center| <= span/2 (span 0 keeps everything).
// freqs ascending; pxx same length. Fills start/end/center/bin_count/pxx.
void crop_span(const std::vector<double>& freqs, const std::vector<double>& pxx,
               uint64_t center_freq_hz, uint64_t span_hz, PsdResult& out);
