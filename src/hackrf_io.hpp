#pragma once
#include "sdr_device.hpp"
#include <libhackrf/hackrf.h>
#include <atomic>

// ── HackRF backend ────────────────────────────────────────────────────────
// libhackrf runs its own transfer thread; rx_callback() is invoked there.
class HackRfDevice : public SdrDevice {
public:
    HackRfDevice();
    ~HackRfDevice() override;

    DeviceError open(const HardwareConfig& cfg) override;
    DeviceError configure(const HardwareConfig& cfg) override;
    DeviceError start_streaming(SampleCallback cb) override;
    void        stop_streaming() override;
    void        close() override;

    bool is_open() const override { return dev_ != nullptr; }
    bool is_streaming() const override;
    bool stream_failed() const override;
    const HWConfig& hw() const override { return hw_; }

private:
    static int rx_callback(hackrf_transfer* transfer);

    HWConfig          hw_;
    hackrf_device*    dev_ = nullptr;
    SampleCallback    cb_;
    std::atomic<bool> streaming_{false};
    std::atomic<bool> stop_req_{false};
    bool              lib_init_ = false;
};
