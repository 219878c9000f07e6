#include "rtlsdr_io.hpp"
#include "config.hpp"
#include "log.hpp"
#include <chrono>

RtlSdrDevice::RtlSdrDevice() : hw_(make_rtlsdr_config()) {}

RtlSdrDevice::~RtlSdrDevice(){
    stop_streaming();
    close();
}

// ── Open ──────────────────────────────────────────────────────────────────
DeviceError RtlSdrDevice::open(const HardwareConfig& cfg){
    if(dev_) close();
    uint32_t dev_count = rtlsdr_get_device_count();
    if(dev_count == 0){ rfs_err("[RTL-SDR] no device found"); return DeviceError::NOT_FOUND; }

    int r = rtlsdr_open(&dev_, 0);
    if(r < 0){
        rfs_err("[RTL-SDR] rtlsdr_open failed (%d)", r);
        dev_ = nullptr;
        return DeviceError::OPEN_FAILED;
    }
    last_ppm_ = 0;
    rfs_log("[RTL-SDR] opened %s", rtlsdr_get_device_name(0));

    DeviceError e = configure(cfg);
    if(e != DeviceError::OK){ close(); return e; }
    return DeviceError::OK;
}

// ── Configure ─────────────────────────────────────────────────────────────
DeviceError RtlSdrDevice::configure(const HardwareConfig& cfg){
    if(!dev_) return DeviceError::NOT_OPEN;

    int r = rtlsdr_set_sample_rate(dev_, cfg.sample_rate);
    if(r < 0){ rfs_err("[RTL-SDR] set_sample_rate(%u) failed (%d)", cfg.sample_rate, r); return DeviceError::CONFIG_REJECTED; }
    uint32_t actual_sr = rtlsdr_get_sample_rate(dev_);

    // -2 = value unchanged
    if(cfg.ppm_error != last_ppm_){
        r = rtlsdr_set_freq_correction(dev_, cfg.ppm_error);
        if(r < 0 && r != -2){ rfs_err("[RTL-SDR] set_freq_correction(%d) failed (%d)", cfg.ppm_error, r); return DeviceError::CONFIG_REJECTED; }
        last_ppm_ = cfg.ppm_error;
    }

    r = rtlsdr_set_center_freq(dev_, (uint32_t)cfg.center_freq);
    if(r < 0){ rfs_err("[RTL-SDR] set_center_freq(%llu) failed (%d)", (unsigned long long)cfg.center_freq, r); return DeviceError::CONFIG_REJECTED; }

    // Tuner BW auto (0 = follows sample rate)
    rtlsdr_set_tuner_bandwidth(dev_, 0);

    // Manual tuner gain: lna+vga as one stage, snapped to the R82xx table
    int gain_db = hw_.total_gain(cfg.lna_gain, cfg.vga_gain);
    int tenths  = HWConfig::rtl_snap_gain((float)gain_db);
    r = rtlsdr_set_tuner_gain_mode(dev_, 1);
    if(r < 0){ rfs_err("[RTL-SDR] set_tuner_gain_mode failed (%d)", r); return DeviceError::CONFIG_REJECTED; }
    r = rtlsdr_set_tuner_gain(dev_, tenths);
    if(r < 0){ rfs_err("[RTL-SDR] set_tuner_gain(%d) failed (%d)", tenths, r); return DeviceError::CONFIG_REJECTED; }

    // amp flag → RTL2832 digital AGC
    rtlsdr_set_agc_mode(dev_, cfg.amp_enabled ? 1 : 0);

    r = rtlsdr_reset_buffer(dev_);
    if(r < 0){ rfs_err("[RTL-SDR] reset_buffer failed (%d)", r); return DeviceError::CONFIG_REJECTED; }

    rfs_log("[RTL-SDR] %.3f MHz  %.3f MSPS  gain %.1f dB  agc %s  ppm %d",
            cfg.center_freq/1e6, actual_sr/1e6, tenths/10.0,
            cfg.amp_enabled ? "on" : "off", cfg.ppm_error);
    return DeviceError::OK;
}

// ── Streaming ─────────────────────────────────────────────────────────────
void RtlSdrDevice::rx_callback(unsigned char* buf, uint32_t len, void* ctx){
    auto* self = static_cast<RtlSdrDevice*>(ctx);
    if(self->stop_req_.load(std::memory_order_relaxed)){
        rtlsdr_cancel_async(self->dev_);
        return;
    }
    if(!self->cb_(buf, len)){
        self->stop_req_.store(true);
        rtlsdr_cancel_async(self->dev_);
    }
}

void RtlSdrDevice::rx_loop(){
    int r = rtlsdr_read_async(dev_, rx_callback, this,
                              RFSENSE_RTL_BUF_COUNT, RFSENSE_RTL_BUF_LEN);
    // read_async only returns on cancel or USB error
    if(!stop_req_.load()){
        rfs_err("[RTL-SDR] read_async ended unexpectedly (%d)", r);
        failed_.store(true);
    }
    streaming_.store(false);
}

DeviceError RtlSdrDevice::start_streaming(SampleCallback cb){
    if(!dev_) return DeviceError::NOT_OPEN;
    if(streaming_.load() || rx_thr_.joinable()) stop_streaming();
    cb_ = std::move(cb);
    stop_req_.store(false);
    failed_.store(false);
    streaming_.store(true);
    rx_thr_ = std::thread(&RtlSdrDevice::rx_loop, this);
    return DeviceError::OK;
}

void RtlSdrDevice::stop_streaming(){
    stop_req_.store(true);
    // cancel is a no-op until read_async is running: repeat until the thread leaves
    while(dev_ && streaming_.load()){
        rtlsdr_cancel_async(dev_);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if(rx_thr_.joinable()) rx_thr_.join();
    streaming_.store(false);
}

void RtlSdrDevice::close(){
    stop_streaming();
    if(dev_){
        rtlsdr_close(dev_);
        dev_ = nullptr;
        rfs_log("[RTL-SDR] closed");
    }
}
