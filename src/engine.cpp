#include "engine.hpp"
#include "iq_convert.hpp"
#include "psd_scale.hpp"
#include "json_msg.hpp"
#include "log.hpp"
#include <chrono>
#include <cstring>

using Clock = std::chrono::steady_clock;

static double ms_since(Clock::time_point t0){
    return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}

const char* acq_mode_str(AcqMode m){
    return m == AcqMode::SINGLE ? "single" : "continuous";
}

bool parse_acq_mode(const char* s, AcqMode& out){
    if(!s) return false;
    if(!strcmp(s,"continuous")){ out=AcqMode::CONTINUOUS; return true; }
    if(!strcmp(s,"single"))    { out=AcqMode::SINGLE;     return true; }
    return false;
}

AcquisitionEngine::AcquisitionEngine(CommandIntake& intake, Watchdog& wd, RingBuffer& rb,
                                     Publisher& pub, MetricsSink& metrics, const HWConfig& caps,
                                     const EngineConfig& cfg)
    : intake_(intake), wd_(wd), rb_(rb), pub_(pub), metrics_(metrics), caps_(caps), cfg_(cfg) {}

AcquisitionEngine::~AcquisitionEngine(){ stop(); }

void AcquisitionEngine::start(){
    if(thr_.joinable()) return;
    stop_.store(false);
    thr_ = std::thread(&AcquisitionEngine::run, this);
    rfs_log("[Engine] started (%s mode, device_id %s)", acq_mode_str(cfg_.mode), cfg_.device_id.c_str());
}

void AcquisitionEngine::stop(){
    stop_.store(true);
    intake_.wake();
    rb_.wake();
    if(thr_.joinable()){
        thr_.join();
        rfs_log("[Engine] stopped after %llu cycle(s)", (unsigned long long)cycles_.load());
    }
}

void AcquisitionEngine::on_device_state(DeviceState s){
    pub_.submit(RFSENSE_TOPIC_STATUS,
                encode_status(device_state_str(s), wd_.fault_count(), rb_.overruns(),
                              active_gen_.load(), wall_ms_now()));
}

// ── Processing loop ───────────────────────────────────────────────────────
// A new plan is taken only at a window boundary: while the device streams
// the active plan, the window being filled is completed and published first.
void AcquisitionEngine::run(){
    AcqPlan  plan;
    uint64_t active_gen  = 0;
    bool     plan_ok     = false;
    bool     single_done = false;
    bool     in_flight   = false;   // a window of the active plan is filling
    uint64_t seen_overruns = rb_.overruns();
    Clock::time_point cycle_t0 = Clock::now();

    while(!stop_.load()){
        // ── New configuration (window boundary) ──────────────────────────
        uint64_t g = intake_.generation();
        if(g == 0){
            intake_.wait_new(0, cfg_.window_wait_ms);
            continue;
        }
        if(in_flight && !streaming(active_gen)) in_flight = false;
        if(g != active_gen && !in_flight){
            if(!intake_.latest(plan)) continue;
            active_gen = plan.generation;
            active_gen_.store(active_gen);
            single_done = false;
            ConfigError e = welch_.configure(plan.psd);
            plan_ok = (e == ConfigError::NONE);
            if(!plan_ok){
                rfs_err("[Engine] gen %llu: PSD setup failed (%s)",
                        (unsigned long long)active_gen, config_error_str(e));
                continue;
            }
            wd_.set_target(plan.generation, plan.hw, plan.rb);
            seen_overruns = rb_.overruns();
            cycle_t0 = Clock::now();
            rfs_debug("[Engine] gen %llu applied", (unsigned long long)active_gen);
        }
        if(!plan_ok || single_done){
            intake_.wait_new(active_gen, cfg_.window_wait_ms);
            continue;
        }

        // ── Wait for the device and a full window ────────────────────────
        if(!wd_.wait_streaming(active_gen, cfg_.window_wait_ms)) continue;
        in_flight = true;
        if(!rb_.wait_window(plan.rb.total_bytes, raw_, cfg_.window_wait_ms)) continue;
        in_flight = false;

        uint64_t ov = rb_.overruns();
        if(ov != seen_overruns){
            uint64_t n = ov - seen_overruns;
            seen_overruns = ov;
            overruns_handled_.fetch_add(1);
            rfs_err("[Engine] ring buffer overrun (%llu overflow(s)), retrying with a fresh window",
                    (unsigned long long)n);
            FaultEvent ev;
            ev.kind    = FaultKind::BUFFER_OVERRUN;
            ev.attempt = (uint32_t)n;
            ev.wall_ms = wall_ms_now();
            ev.detail  = "window discarded";
            metrics_.on_fault(ev);
            rb_.clear();
            cycle_t0 = Clock::now();
            continue;
        }

        process_window(plan, ms_since(cycle_t0));
        cycle_t0 = Clock::now();

        if(cfg_.mode == AcqMode::SINGLE){
            single_done = true;
            wd_.release();
        }
    }
}

bool AcquisitionEngine::streaming(uint64_t generation) const {
    return wd_.state() == DeviceState::STREAMING && wd_.applied_generation() == generation;
}

void AcquisitionEngine::process_window(const AcqPlan& plan, double acq_ms){
    Clock::time_point t0 = Clock::now();

    iq_to_complex(raw_.data(), raw_.size(), caps_, iq_);
    ConfigError e = welch_.compute(iq_.data(), iq_.size(), freqs_, pxx_);
    if(e != ConfigError::NONE){
        rfs_err("[Engine] Welch failed: %s", config_error_str(e));
        return;
    }

    PsdResult r;
    crop_span(freqs_, pxx_, plan.desired.center_freq_hz, plan.desired.span_hz, r);
    r.pxx          = scale_psd(r.pxx, plan.desired.scale, cfg_.ref_impedance_ohm);
    r.scale        = plan.desired.scale;
    r.timestamp_ms = wall_ms_now();
    double dsp_ms  = ms_since(t0);

    if(!pub_.submit(RFSENSE_TOPIC_DATA, encode_psd_result(r, cfg_.device_id))){
        rfs_err("[Engine] publish queue full, result dropped");
        FaultEvent ev;
        ev.kind    = FaultKind::PUBLISH_FAILED;
        ev.wall_ms = r.timestamp_ms;
        ev.detail  = "queue full";
        metrics_.on_fault(ev);
    }

    CycleMetrics m;
    m.cycle    = cycles_.fetch_add(1) + 1;
    m.acq_ms   = acq_ms;
    m.dsp_ms   = dsp_ms;
    m.nperseg  = plan.psd.nperseg;
    m.segments = welch_.last_segments();
    m.bins     = r.bin_count;
    m.overruns = rb_.overruns();
    m.wall_ms  = r.timestamp_ms;
    metrics_.on_cycle(m);
}
