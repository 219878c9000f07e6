#include "sdr_device.hpp"
#include "bladerf_io.hpp"
#include "rtlsdr_io.hpp"
#include "hackrf_io.hpp"
#include "log.hpp"
#include <libbladeRF.h>
#include <rtl-sdr.h>
#include <libhackrf/hackrf.h>
#include <cstring>

const char* device_error_str(DeviceError e){
    switch(e){
        case DeviceError::OK:              return "ok";
        case DeviceError::NOT_FOUND:       return "not_found";
        case DeviceError::OPEN_FAILED:     return "open_failed";
        case DeviceError::CONFIG_REJECTED: return "config_rejected";
        case DeviceError::STREAM_FAILED:   return "stream_failed";
        case DeviceError::NOT_OPEN:        return "not_open";
    }
    return "unknown";
}

const char* hw_type_str(HWType t){
    switch(t){
        case HWType::NONE:    return "auto";
        case HWType::BLADERF: return "bladerf";
        case HWType::RTLSDR:  return "rtlsdr";
        case HWType::HACKRF:  return "hackrf";
    }
    return "unknown";
}

bool parse_hw_type(const char* s, HWType& out){
    if(!s) return false;
    if(!strcmp(s,"auto"))    { out=HWType::NONE;    return true; }
    if(!strcmp(s,"bladerf")) { out=HWType::BLADERF; return true; }
    if(!strcmp(s,"rtlsdr"))  { out=HWType::RTLSDR;  return true; }
    if(!strcmp(s,"hackrf"))  { out=HWType::HACKRF;  return true; }
    return false;
}

// ── HW auto-detection ─────────────────────────────────────────────────────
// Priority: BladeRF > HackRF > RTL-SDR
HWType detect_hw_type(){
    // BladeRF
    struct bladerf_devinfo* blade_list = nullptr;
    int n_blade = bladerf_get_device_list(&blade_list);
    bool has_blade = (n_blade > 0);
    if(blade_list) bladerf_free_device_list(blade_list);

    // HackRF
    bool has_hackrf = false;
    if(hackrf_init() == HACKRF_SUCCESS){
        hackrf_device_list_t* hl = hackrf_device_list();
        if(hl){
            has_hackrf = hl->devicecount > 0;
            hackrf_device_list_free(hl);
        }
        hackrf_exit();
    }

    // RTL-SDR
    uint32_t n_rtl = rtlsdr_get_device_count();
    bool has_rtl = (n_rtl > 0);

    if(has_blade){
        rfs_log("[HW] BladeRF detected%s", (has_hackrf||has_rtl) ? " (others present, using BladeRF)" : "");
        return HWType::BLADERF;
    }
    if(has_hackrf){
        rfs_log("[HW] HackRF detected%s", has_rtl ? " (RTL-SDR also present, using HackRF)" : "");
        return HWType::HACKRF;
    }
    if(has_rtl){
        rfs_log("[HW] RTL-SDR detected");
        return HWType::RTLSDR;
    }
    rfs_err("[HW] No SDR device found (BladeRF, HackRF or RTL-SDR)");
    return HWType::NONE;
}

std::unique_ptr<SdrDevice> create_sdr_device(HWType type){
    switch(type){
        case HWType::BLADERF: return std::unique_ptr<SdrDevice>(new BladeRfDevice());
        case HWType::RTLSDR:  return std::unique_ptr<SdrDevice>(new RtlSdrDevice());
        case HWType::HACKRF:  return std::unique_ptr<SdrDevice>(new HackRfDevice());
        case HWType::NONE:    break;
    }
    return nullptr;
}
