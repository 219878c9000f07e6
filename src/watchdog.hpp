#pragma once
#include "sdr_device.hpp"
#include "ring_buffer.hpp"
#include "metrics.hpp"
#include "config.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

enum class DeviceState : uint8_t { CLOSED, OPENING, OPEN, STREAMING, FAULTED };
const char* device_state_str(DeviceState s);

struct WatchdogConfig {
    int no_data_timeout_ms = RFSENSE_NO_DATA_TIMEOUT_MS;
    int backoff_min_ms     = RFSENSE_BACKOFF_MIN_MS;
    int backoff_max_ms     = RFSENSE_BACKOFF_MAX_MS;
    int poll_ms            = RFSENSE_WATCHDOG_POLL_MS;
};

// Doubles the retry delay, capped at max_ms (no overflow near INT_MAX)
int next_backoff_ms(int current_ms, int max_ms);

using DeviceFactory = std::function<std::unique_ptr<SdrDevice>()>;

// ── Watchdog ──────────────────────────────────────────────────────────────
// Sole owner of the device lifecycle. Runs the state machine
//   CLOSED → OPENING → OPEN → STREAMING → (fault) FAULTED → OPENING ...
// on its own thread. Retries forever with exponential backoff
// (backoff_min .. backoff_max); a successful start resets the backoff.
// The capture callback only copies into the RingBuffer.
class Watchdog {
public:
    Watchdog(DeviceFactory factory, RingBuffer& rb, MetricsSink& metrics,
             const WatchdogConfig& cfg = WatchdogConfig());
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void start();
    // Stops streaming, closes the device, joins. State ends CLOSED.
    void stop();

    // Latest configuration to run. Applied between windows: streaming is
    // stopped, the device reconfigured and the ring reset.
    void set_target(uint64_t generation, const HardwareConfig& hw, const RingBufferConfig& rb);

    // Close the device and stay CLOSED until the next set_target()
    void release();

    DeviceState state() const { return state_.load(); }
    uint64_t    applied_generation() const { return applied_gen_.load(); }
    uint64_t    fault_count() const { return faults_.load(); }
    int         current_backoff_ms() const { return backoff_ms_.load(); }

    // Waits until STREAMING with the given generation applied
    bool wait_streaming(uint64_t generation, int timeout_ms);

    // Called on the watchdog thread on every state change. Set before start().
    void set_state_listener(std::function<void(DeviceState)> fn){ listener_ = std::move(fn); }

private:
    struct Target {
        uint64_t         gen = 0;
        HardwareConfig   hw;
        RingBufferConfig rb;
    };

    void run();
    void set_state(DeviceState s);
    void enter_fault(FaultKind kind, DeviceError err, const std::string& detail);
    bool sleep_interruptible(int ms);
    void release_device();

    DeviceFactory  factory_;
    RingBuffer&    rb_;
    MetricsSink&   metrics_;
    WatchdogConfig cfg_;

    std::unique_ptr<SdrDevice> dev_;     // watchdog thread only

    std::mutex              mtx_;
    std::condition_variable cv_;
    bool   has_target_ = false;
    bool   released_   = false;
    bool   stop_req_   = false;
    Target target_;

    std::condition_variable    state_cv_;
    std::atomic<DeviceState>   state_{DeviceState::CLOSED};
    std::atomic<uint64_t>      applied_gen_{0};
    std::atomic<uint64_t>      faults_{0};
    std::atomic<int>           backoff_ms_{0};
    std::atomic<int64_t>       last_data_ms_{0};
    std::thread                thr_;
    std::function<void(DeviceState)> listener_;

    // pending fault (watchdog thread only)
    FaultKind   fault_kind_  = FaultKind::OPEN_FAILED;
    DeviceError fault_err_   = DeviceError::OK;
    std::string fault_detail_;
    uint32_t    attempt_     = 0;
};
