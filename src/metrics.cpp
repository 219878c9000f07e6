#include "metrics.hpp"
#include "log.hpp"
#include <chrono>

int64_t wall_ms_now(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

const char* fault_kind_str(FaultKind k){
    switch(k){
        case FaultKind::OPEN_FAILED:    return "open_failed";
        case FaultKind::CONFIG_FAILED:  return "config_failed";
        case FaultKind::STREAM_FAILED:  return "stream_failed";
        case FaultKind::NO_DATA:        return "no_data";
        case FaultKind::BUFFER_OVERRUN: return "buffer_overrun";
        case FaultKind::PUBLISH_FAILED: return "publish_failed";
    }
    return "unknown";
}

void LogMetrics::on_cycle(const CycleMetrics& m){
    rfs_log("[Metrics] type=cycle cycle=%llu acq_ms=%.1f dsp_ms=%.1f nperseg=%d segments=%d "
            "bins=%u overruns=%llu ts=%lld",
            (unsigned long long)m.cycle, m.acq_ms, m.dsp_ms, m.nperseg, m.segments,
            m.bins, (unsigned long long)m.overruns, (long long)m.wall_ms);
}

void LogMetrics::on_fault(const FaultEvent& f){
    rfs_log("[Metrics] type=fault kind=%s error=%s attempt=%u backoff_ms=%d ts=%lld detail=\"%s\"",
            fault_kind_str(f.kind), device_error_str(f.error), f.attempt, f.backoff_ms,
            (long long)f.wall_ms, f.detail.c_str());
}
