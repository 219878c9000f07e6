#include "psd_scale.hpp"
#include <cmath>

double scale_value(double p_watt, ScaleKind s, double r_ohm){
    double p = p_watt > RFSENSE_POWER_FLOOR_W ? p_watt : RFSENSE_POWER_FLOOR_W;
    switch(s){
        case ScaleKind::DBM:  return 10.0 * log10(p / 1e-3);
        case ScaleKind::DBMV: return 20.0 * log10(sqrt(p * r_ohm) / 1e-3);
        case ScaleKind::DBUV: return 20.0 * log10(sqrt(p * r_ohm) / 1e-6);
        case ScaleKind::V:    return sqrt(p * r_ohm);
        case ScaleKind::W:    return p;
    }
    return p;
}

double unscale_value(double v, ScaleKind s, double r_ohm){
    switch(s){
        case ScaleKind::DBM:  return 1e-3 * pow(10.0, v / 10.0);
        case ScaleKind::DBMV: { double u = 1e-3 * pow(10.0, v / 20.0); return u*u / r_ohm; }
        case ScaleKind::DBUV: { double u = 1e-6 * pow(10.0, v / 20.0); return u*u / r_ohm; }
        case ScaleKind::V:    return v*v / r_ohm;
        case ScaleKind::W:    return v;
    }
    return v;
}

std::vector<double> scale_psd(const std::vector<double>& pxx, ScaleKind s, double r_ohm){
    std::vector<double> out(pxx.size());
    for(size_t i=0;i<pxx.size();i++) out[i] = scale_value(pxx[i], s, r_ohm);
    return out;
}

void crop_span(const std::vector<double>& freqs, const std::vector<double>& pxx,
               uint64_t center_freq_hz, uint64_t span_hz, PsdResult& out){
    out.center_freq_hz = center_freq_hz;
    out.pxx.clear();
    const size_t n = freqs.size() < pxx.size() ? freqs.size() : pxx.size();
    const double c = (double)center_freq_hz;
    const double half = (double)span_hz / 2.0;

    size_t first = n, last = 0;
    for(size_t i=0;i<n;i++){
        if(span_hz != 0 && fabs(freqs[i] - c) > half + 1e-6) continue;
        if(first == n) first = i;
        last = i;
    }
    if(first == n){
        out.start_freq_hz = out.end_freq_hz = center_freq_hz;
        out.bin_count = 0;
        return;
    }
    out.pxx.assign(pxx.begin() + first, pxx.begin() + last + 1);
    out.bin_count     = (uint32_t)out.pxx.size();
    out.start_freq_hz = (uint64_t)llround(freqs[first] > 0.0 ? freqs[first] : 0.0);
    out.end_freq_hz   = (uint64_t)llround(freqs[last]  > 0.0 ? freqs[last]  : 0.0);
}
