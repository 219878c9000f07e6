#include "bladerf_io.hpp"
#include "config.hpp"
#include "log.hpp"
#include <vector>

#define CHANNEL BLADERF_CHANNEL_RX(0)

BladeRfDevice::BladeRfDevice() : hw_(make_bladerf_config()) {}

BladeRfDevice::~BladeRfDevice(){
    stop_streaming();
    close();
}

DeviceError BladeRfDevice::open(const HardwareConfig& cfg){
    if(dev_) close();
    int s=bladerf_open(&dev_,nullptr);
    if(s){
        rfs_err("[BladeRF] bladerf_open: %s",bladerf_strerror(s));
        dev_=nullptr;
        return s==BLADERF_ERR_NODEV ? DeviceError::NOT_FOUND : DeviceError::OPEN_FAILED;
    }
    rfs_log("[BladeRF] opened");

    DeviceError e=configure(cfg);
    if(e!=DeviceError::OK){ close(); return e; }
    return DeviceError::OK;
}

DeviceError BladeRfDevice::configure(const HardwareConfig& cfg){
    if(!dev_) return DeviceError::NOT_OPEN;

    // Sample rate / bandwidth / frequency can change while the module is on;
    // the sync stream is set up again in start_streaming().
    uint32_t actual=0;
    int s=bladerf_set_sample_rate(dev_,CHANNEL,cfg.sample_rate,&actual);
    if(s){ rfs_err("[BladeRF] set_sr: %s",bladerf_strerror(s)); return DeviceError::CONFIG_REJECTED; }

    uint32_t actual_bw=0;
    s=bladerf_set_bandwidth(dev_,CHANNEL,(uint32_t)(cfg.sample_rate*0.8f),&actual_bw);
    if(s){ rfs_err("[BladeRF] set_bw: %s",bladerf_strerror(s)); return DeviceError::CONFIG_REJECTED; }

    s=bladerf_set_frequency(dev_,CHANNEL,cfg.center_freq);
    if(s){ rfs_err("[BladeRF] set_freq: %s",bladerf_strerror(s)); return DeviceError::CONFIG_REJECTED; }

    s=bladerf_set_gain_mode(dev_,CHANNEL,BLADERF_GAIN_MGC);
    if(s){ rfs_err("[BladeRF] set_gain_mode: %s",bladerf_strerror(s)); return DeviceError::CONFIG_REJECTED; }

    int gain=hw_.total_gain(cfg.lna_gain,cfg.vga_gain);
    s=bladerf_set_gain(dev_,CHANNEL,gain);
    if(s){ rfs_err("[BladeRF] set_gain: %s",bladerf_strerror(s)); return DeviceError::CONFIG_REJECTED; }

    if((cfg.amp_enabled || cfg.ppm_error!=0) && !warned_unsupported_){
        rfs_log("[BladeRF] amp_enabled / ppm_error not supported, ignored");
        warned_unsupported_=true;
    }

    rfs_log("[BladeRF] %.2f MHz  %.2f MSPS  BW %.2f MHz  gain %d dB",
            cfg.center_freq/1e6,actual/1e6,actual_bw/1e6,gain);
    return DeviceError::OK;
}

void BladeRfDevice::rx_loop(){
    const int n=RFSENSE_BLADERF_BUF_SAMPLES;
    std::vector<int16_t> iq((size_t)n*2);
    int errors=0;

    while(!stop_req_.load(std::memory_order_relaxed)){
        int status=bladerf_sync_rx(dev_,iq.data(),n,nullptr,RFSENSE_BLADERF_RX_TIMEOUT);
        if(status){
            // Timeouts are left to the no-data watchdog; persistent errors fail the stream
            if(status==BLADERF_ERR_TIMEOUT) continue;
            if(++errors>=RFSENSE_BLADERF_MAX_ERRORS){
                rfs_err("[BladeRF] RX: %s (giving up after %d errors)",bladerf_strerror(status),errors);
                failed_.store(true);
                break;
            }
            continue;
        }
        errors=0;
        if(!cb_(reinterpret_cast<const uint8_t*>(iq.data()),(size_t)n*4)) break;
    }
    streaming_.store(false);
}

DeviceError BladeRfDevice::start_streaming(SampleCallback cb){
    if(!dev_) return DeviceError::NOT_OPEN;
    if(streaming_.load() || rx_thr_.joinable()) stop_streaming();

    int s=bladerf_sync_config(dev_,BLADERF_RX_X1,BLADERF_FORMAT_SC16_Q11,512,16384,16,10000);
    if(s){ rfs_err("[BladeRF] sync: %s",bladerf_strerror(s)); return DeviceError::STREAM_FAILED; }
    s=bladerf_enable_module(dev_,CHANNEL,true);
    if(s){ rfs_err("[BladeRF] enable: %s",bladerf_strerror(s)); return DeviceError::STREAM_FAILED; }
    module_on_=true;

    cb_=std::move(cb);
    stop_req_.store(false);
    failed_.store(false);
    streaming_.store(true);
    rx_thr_=std::thread(&BladeRfDevice::rx_loop,this);
    return DeviceError::OK;
}

void BladeRfDevice::stop_streaming(){
    stop_req_.store(true);
    if(rx_thr_.joinable()) rx_thr_.join();
    if(dev_ && module_on_){
        int s=bladerf_enable_module(dev_,CHANNEL,false);
        if(s) rfs_err("[BladeRF] disable: %s",bladerf_strerror(s));
        module_on_=false;
    }
    streaming_.store(false);
}

void BladeRfDevice::close(){
    stop_streaming();
    if(dev_){
        bladerf_close(dev_);
        dev_=nullptr;
        rfs_log("[BladeRF] closed");
    }
}
