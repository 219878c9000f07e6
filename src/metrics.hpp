#pragma once
#include "sdr_device.hpp"
#include <cstdint>
#include <string>

// ── Metrics collaborator ──────────────────────────────────────────────────
struct CycleMetrics {
    uint64_t cycle        = 0;
    double   acq_ms       = 0.0;   // waiting for the window
    double   dsp_ms       = 0.0;   // convert + Welch + scale
    int      nperseg      = 0;
    int      segments     = 0;
    uint32_t bins         = 0;
    uint64_t overruns     = 0;     // ring buffer, cumulative
    int64_t  wall_ms      = 0;
};

enum class FaultKind : uint8_t {
    OPEN_FAILED,
    CONFIG_FAILED,
    STREAM_FAILED,
    NO_DATA,
    BUFFER_OVERRUN,
    PUBLISH_FAILED,
};
const char* fault_kind_str(FaultKind k);

struct FaultEvent {
    FaultKind   kind       = FaultKind::OPEN_FAILED;
    DeviceError error      = DeviceError::OK;
    uint32_t    attempt    = 0;     // consecutive failures
    int         backoff_ms = 0;
    int64_t     wall_ms    = 0;
    std::string detail;
};

class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void on_cycle(const CycleMetrics& m) = 0;
    virtual void on_fault(const FaultEvent& f) = 0;
};

// One flat key=value line per record through rfs_log
class LogMetrics : public MetricsSink {
public:
    void on_cycle(const CycleMetrics& m) override;
    void on_fault(const FaultEvent& f) override;
};

int64_t wall_ms_now();
