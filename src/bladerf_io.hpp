#pragma once
#include "sdr_device.hpp"
#include <libbladeRF.h>
#include <atomic>
#include <thread>

// ── BladeRF backend ───────────────────────────────────────────────────────
// Sync interface (SC16 Q11) polled on an owned RX thread.
class BladeRfDevice : public SdrDevice {
public:
    BladeRfDevice();
    ~BladeRfDevice() override;

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
    void rx_loop();

    HWConfig          hw_;
    bladerf*          dev_ = nullptr;
    SampleCallback    cb_;
    std::thread       rx_thr_;
    std::atomic<bool> streaming_{false};
    std::atomic<bool> stop_req_{false};
    std::atomic<bool> failed_{false};
    bool              module_on_ = false;
    bool              warned_unsupported_ = false;
};
