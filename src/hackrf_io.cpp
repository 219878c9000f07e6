#include "hackrf_io.hpp"
#include "log.hpp"
#include <mutex>

// hackrf_init()/hackrf_exit() are process-wide
static std::mutex g_hackrf_lib_mtx;
static int        g_hackrf_lib_refs = 0;

static bool hackrf_lib_acquire(){
    std::lock_guard<std::mutex> lk(g_hackrf_lib_mtx);
    if(g_hackrf_lib_refs == 0){
        int r = hackrf_init();
        if(r != HACKRF_SUCCESS){
            rfs_err("[HackRF] hackrf_init: %s", hackrf_error_name((hackrf_error)r));
            return false;
        }
    }
    g_hackrf_lib_refs++;
    return true;
}

static void hackrf_lib_release(){
    std::lock_guard<std::mutex> lk(g_hackrf_lib_mtx);
    if(g_hackrf_lib_refs > 0 && --g_hackrf_lib_refs == 0) hackrf_exit();
}

HackRfDevice::HackRfDevice() : hw_(make_hackrf_config()) {}

HackRfDevice::~HackRfDevice(){
    stop_streaming();
    close();
}

DeviceError HackRfDevice::open(const HardwareConfig& cfg){
    if(dev_) close();
    if(!lib_init_){
        if(!hackrf_lib_acquire()) return DeviceError::OPEN_FAILED;
        lib_init_ = true;
    }

    int r = hackrf_open(&dev_);
    if(r != HACKRF_SUCCESS){
        rfs_err("[HackRF] hackrf_open: %s", hackrf_error_name((hackrf_error)r));
        dev_ = nullptr;
        return r == HACKRF_ERROR_NOT_FOUND ? DeviceError::NOT_FOUND : DeviceError::OPEN_FAILED;
    }
    rfs_log("[HackRF] opened");

    DeviceError e = configure(cfg);
    if(e != DeviceError::OK){ close(); return e; }
    return DeviceError::OK;
}

DeviceError HackRfDevice::configure(const HardwareConfig& cfg){
    if(!dev_) return DeviceError::NOT_OPEN;

    int r = hackrf_set_sample_rate(dev_, (double)cfg.sample_rate);
    if(r != HACKRF_SUCCESS){
        rfs_err("[HackRF] set_sample_rate(%u): %s", cfg.sample_rate, hackrf_error_name((hackrf_error)r));
        return DeviceError::CONFIG_REJECTED;
    }
    uint32_t bw = hackrf_compute_baseband_filter_bw((uint32_t)(cfg.sample_rate * 0.75));
    r = hackrf_set_baseband_filter_bandwidth(dev_, bw);
    if(r != HACKRF_SUCCESS){
        rfs_err("[HackRF] set_baseband_filter_bandwidth(%u): %s", bw, hackrf_error_name((hackrf_error)r));
        return DeviceError::CONFIG_REJECTED;
    }

    // No on-board ppm trim: pre-scale the tuned frequency
    uint64_t f_tune = (uint64_t)((double)cfg.center_freq / (1.0 + cfg.ppm_error * 1e-6) + 0.5);
    r = hackrf_set_freq(dev_, f_tune);
    if(r != HACKRF_SUCCESS){
        rfs_err("[HackRF] set_freq(%llu): %s", (unsigned long long)f_tune, hackrf_error_name((hackrf_error)r));
        return DeviceError::CONFIG_REJECTED;
    }

    int lna = hw_.snap_lna(cfg.lna_gain);   // multiple of 8, 0..40
    int vga = hw_.snap_vga(cfg.vga_gain);   // even, 0..62
    r = hackrf_set_lna_gain(dev_, (uint32_t)lna);
    if(r != HACKRF_SUCCESS){
        rfs_err("[HackRF] set_lna_gain(%d): %s", lna, hackrf_error_name((hackrf_error)r));
        return DeviceError::CONFIG_REJECTED;
    }
    r = hackrf_set_vga_gain(dev_, (uint32_t)vga);
    if(r != HACKRF_SUCCESS){
        rfs_err("[HackRF] set_vga_gain(%d): %s", vga, hackrf_error_name((hackrf_error)r));
        return DeviceError::CONFIG_REJECTED;
    }
    r = hackrf_set_amp_enable(dev_, cfg.amp_enabled ? 1 : 0);
    if(r != HACKRF_SUCCESS){
        rfs_err("[HackRF] set_amp_enable: %s", hackrf_error_name((hackrf_error)r));
        return DeviceError::CONFIG_REJECTED;
    }

    rfs_log("[HackRF] %.3f MHz (tuned %.3f)  %.2f MSPS  lna %d  vga %d  amp %s",
            cfg.center_freq/1e6, f_tune/1e6, cfg.sample_rate/1e6, lna, vga,
            cfg.amp_enabled ? "on" : "off");
    return DeviceError::OK;
}

int HackRfDevice::rx_callback(hackrf_transfer* transfer){
    auto* self = static_cast<HackRfDevice*>(transfer->rx_ctx);
    if(self->stop_req_.load(std::memory_order_relaxed)) return -1;
    // non-zero return stops the transfer thread
    return self->cb_(transfer->buffer, (size_t)transfer->valid_length) ? 0 : -1;
}

DeviceError HackRfDevice::start_streaming(SampleCallback cb){
    if(!dev_) return DeviceError::NOT_OPEN;
    if(streaming_.load()) stop_streaming();
    cb_ = std::move(cb);
    stop_req_.store(false);
    int r = hackrf_start_rx(dev_, &HackRfDevice::rx_callback, this);
    if(r != HACKRF_SUCCESS){
        rfs_err("[HackRF] start_rx: %s", hackrf_error_name((hackrf_error)r));
        return DeviceError::STREAM_FAILED;
    }
    streaming_.store(true);
    return DeviceError::OK;
}

bool HackRfDevice::is_streaming() const {
    return streaming_.load() && dev_ && hackrf_is_streaming(dev_) == HACKRF_TRUE;
}

bool HackRfDevice::stream_failed() const {
    // Transfer thread ended on its own (USB error / device gone)
    return streaming_.load() && !stop_req_.load() && dev_ &&
           hackrf_is_streaming(dev_) != HACKRF_TRUE;
}

void HackRfDevice::stop_streaming(){
    stop_req_.store(true);
    if(dev_ && streaming_.load()){
        int r = hackrf_stop_rx(dev_);
        if(r != HACKRF_SUCCESS)
            rfs_err("[HackRF] stop_rx: %s", hackrf_error_name((hackrf_error)r));
    }
    streaming_.store(false);
}

void HackRfDevice::close(){
    stop_streaming();
    if(dev_){
        int r = hackrf_close(dev_);
        if(r != HACKRF_SUCCESS)
            rfs_err("[HackRF] hackrf_close: %s", hackrf_error_name((hackrf_error)r));
        dev_ = nullptr;
        rfs_log("[HackRF] closed");
    }
    if(lib_init_){
        hackrf_lib_release();
        lib_init_ = false;
    }
}
