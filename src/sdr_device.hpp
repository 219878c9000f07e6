#pragma once
#include "hw_config.hpp"
#include "acq_config.hpp"
#include <cstdint>
#include <cstddef>
#include <memory>
#include <functional>

enum class DeviceError : uint8_t {
    OK = 0,
    NOT_FOUND,
    OPEN_FAILED,
    CONFIG_REJECTED,
    STREAM_FAILED,
    NOT_OPEN,
};
const char* device_error_str(DeviceError e);

// Raw IQ chunk from the driver's I/O thread. Must return quickly;
// false asks the backend to stop streaming.
using SampleCallback = std::function<bool(const uint8_t* data, size_t n_bytes)>;

// ── SdrDevice ─────────────────────────────────────────────────────────────
// One radio. Only the Watchdog drives open/close; the destructor always
// stops streaming and closes.
class SdrDevice {
public:
    virtual ~SdrDevice() = default;

    virtual DeviceError open(const HardwareConfig& cfg) = 0;
    virtual DeviceError configure(const HardwareConfig& cfg) = 0;
    virtual DeviceError start_streaming(SampleCallback cb) = 0;
    virtual void        stop_streaming() = 0;
    virtual void        close() = 0;

    virtual bool is_open() const = 0;
    virtual bool is_streaming() const = 0;
    // Set by the I/O thread on a transfer error / unexpected stream end
    virtual bool stream_failed() const = 0;

    virtual const HWConfig& hw() const = 0;
};

// ── Backends / detection (hw_detect.cpp) ──────────────────────────────────
// Priority BladeRF > HackRF > RTL-SDR; NONE when nothing is attached
HWType detect_hw_type();
std::unique_ptr<SdrDevice> create_sdr_device(HWType type);
bool parse_hw_type(const char* s, HWType& out);   // "auto" → NONE
const char* hw_type_str(HWType t);
