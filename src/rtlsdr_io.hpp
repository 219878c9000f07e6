#pragma once
#include "sdr_device.hpp"
#include <rtl-sdr.h>
#include <atomic>
#include <thread>

// ── RTL-SDR backend ───────────────────────────────────────────────────────
// Async capture: rtlsdr_read_async() blocks on its own thread and hands
// each USB transfer (uint8 IQ) to the callback.
class RtlSdrDevice : public SdrDevice {
public:
    RtlSdrDevice();
    ~RtlSdrDevice() override;

    DeviceError open(const HardwareConfig& cfg) override;
    DeviceError configure(const HardwareConfig& cfg) override;
    DeviceError start_streaming(SampleCallback cb) override;
    void        stop_streaming() override;
    void        close() override;

    bool is_open() const override { return dev_ != nullptr; }
    bool is_streaming() const override { return streaming_.load(); }
    bool stream_failed() const override { return failed_.load(); }
    const HWConfig& hw() const override { return hw_; }

private:
    static void rx_callback(unsigned char* buf, uint32_t len, void* ctx);
    void rx_loop();

    HWConfig          hw_;
    rtlsdr_dev_t*     dev_ = nullptr;
    SampleCallback    cb_;
    std::thread       rx_thr_;
    std::atomic<bool> streaming_{false};
    std::atomic<bool> stop_req_{false};
    std::atomic<bool> failed_{false};
    int               last_ppm_ = 0;
};
