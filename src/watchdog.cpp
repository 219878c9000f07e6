#include "watchdog.hpp"
#include "log.hpp"
#include <chrono>

static int64_t mono_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

const char* device_state_str(DeviceState s){
    switch(s){
        case DeviceState::CLOSED:    return "closed";
        case DeviceState::OPENING:   return "opening";
        case DeviceState::OPEN:      return "open";
        case DeviceState::STREAMING: return "streaming";
        case DeviceState::FAULTED:   return "faulted";
    }
    return "unknown";
}

int next_backoff_ms(int current_ms, int max_ms){
    if(current_ms > max_ms / 2) return max_ms;
    return current_ms * 2;
}

Watchdog::Watchdog(DeviceFactory factory, RingBuffer& rb, MetricsSink& metrics,
                   const WatchdogConfig& cfg)
    : factory_(std::move(factory)), rb_(rb), metrics_(metrics), cfg_(cfg) {
    if(cfg_.backoff_min_ms < 1) cfg_.backoff_min_ms = 1;
    if(cfg_.backoff_max_ms < cfg_.backoff_min_ms) cfg_.backoff_max_ms = cfg_.backoff_min_ms;
    if(cfg_.poll_ms < 1) cfg_.poll_ms = 1;
    backoff_ms_.store(cfg_.backoff_min_ms);
}

Watchdog::~Watchdog(){ stop(); }

void Watchdog::start(){
    if(thr_.joinable()) return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_req_ = false;
    }
    thr_ = std::thread(&Watchdog::run, this);
}

void Watchdog::stop(){
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_req_ = true;
    }
    cv_.notify_all();
    if(thr_.joinable()) thr_.join();
    // thread never started: nothing can be open, but stay symmetric
    release_device();
}

void Watchdog::set_target(uint64_t generation, const HardwareConfig& hw, const RingBufferConfig& rb){
    {
        std::lock_guard<std::mutex> lk(mtx_);
        target_.gen = generation;
        target_.hw  = hw;
        target_.rb  = rb;
        has_target_ = true;
        released_   = false;
    }
    cv_.notify_all();
}

void Watchdog::release(){
    {
        std::lock_guard<std::mutex> lk(mtx_);
        released_ = true;
    }
    cv_.notify_all();
}

bool Watchdog::wait_streaming(uint64_t generation, int timeout_ms){
    std::unique_lock<std::mutex> lk(mtx_);
    return state_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&]{
        return stop_req_ ||
               (state_.load() == DeviceState::STREAMING && applied_gen_.load() == generation);
    }) && !stop_req_;
}

void Watchdog::set_state(DeviceState s){
    DeviceState prev;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        prev = state_.exchange(s);
    }
    state_cv_.notify_all();
    if(prev == s) return;
    rfs_debug("[Watchdog] %s -> %s", device_state_str(prev), device_state_str(s));
    if(listener_) listener_(s);
}

void Watchdog::enter_fault(FaultKind kind, DeviceError err, const std::string& detail){
    fault_kind_   = kind;
    fault_err_    = err;
    fault_detail_ = detail;
    set_state(DeviceState::FAULTED);
}

// true = slept the full interval, false = stop requested
bool Watchdog::sleep_interruptible(int ms){
    std::unique_lock<std::mutex> lk(mtx_);
    return !cv_.wait_for(lk, std::chrono::milliseconds(ms), [&]{ return stop_req_; });
}

void Watchdog::release_device(){
    if(!dev_) return;
    dev_->stop_streaming();
    dev_->close();
    dev_.reset();
}

// ── Supervising loop ──────────────────────────────────────────────────────
void Watchdog::run(){
    Target cur;     // configuration the device runs

    auto on_samples = [this](const uint8_t* data, size_t n) -> bool {
        rb_.write(data, n);
        last_data_ms_.store(mono_ms(), std::memory_order_relaxed);
        return true;
    };

    for(;;){
        bool stop, released, has_target;
        Target t;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            stop = stop_req_; released = released_; has_target = has_target_;
            t = target_;
        }
        if(stop) break;

        switch(state_.load()){
        case DeviceState::CLOSED: {
            if(has_target && !released){ set_state(DeviceState::OPENING); break; }
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_for(lk, std::chrono::milliseconds(cfg_.poll_ms), [&]{
                return stop_req_ || (has_target_ && !released_);
            });
            break;
        }

        case DeviceState::OPENING: {
            if(!has_target || released){ set_state(DeviceState::CLOSED); break; }
            if(!dev_) dev_ = factory_();
            if(!dev_){
                enter_fault(FaultKind::OPEN_FAILED, DeviceError::NOT_FOUND, "no backend");
                break;
            }
            DeviceError e = dev_->open(t.hw);
            if(e != DeviceError::OK){
                enter_fault(e == DeviceError::CONFIG_REJECTED ? FaultKind::CONFIG_FAILED
                                                              : FaultKind::OPEN_FAILED,
                            e, "open");
                break;
            }
            cur = t;
            set_state(DeviceState::OPEN);
            break;
        }

        case DeviceState::OPEN: {
            // No stale samples from a previous configuration
            rb_.reset(cur.rb);
            last_data_ms_.store(mono_ms());
            DeviceError e = dev_->start_streaming(on_samples);
            if(e != DeviceError::OK){
                enter_fault(FaultKind::STREAM_FAILED, e, "start_streaming");
                break;
            }
            if(attempt_ > 0)
                rfs_log("[Watchdog] device recovered after %u failed attempt(s)", attempt_);
            attempt_ = 0;
            backoff_ms_.store(cfg_.backoff_min_ms);
            applied_gen_.store(cur.gen);
            set_state(DeviceState::STREAMING);
            break;
        }

        case DeviceState::STREAMING: {
            {
                std::unique_lock<std::mutex> lk(mtx_);
                cv_.wait_for(lk, std::chrono::milliseconds(cfg_.poll_ms), [&]{
                    return stop_req_ || released_ || target_.gen != cur.gen;
                });
                stop = stop_req_; released = released_;
                t = target_;
            }
            if(stop) break;
            if(released){
                release_device();
                set_state(DeviceState::CLOSED);
                break;
            }
            if(t.gen != cur.gen){
                // Reconfigure at the window boundary
                dev_->stop_streaming();
                rb_.wake();
                DeviceError e = dev_->configure(t.hw);
                if(e != DeviceError::OK){
                    enter_fault(FaultKind::CONFIG_FAILED, e, "configure");
                    break;
                }
                cur = t;
                set_state(DeviceState::OPEN);
                break;
            }
            if(!dev_->is_open()){
                enter_fault(FaultKind::STREAM_FAILED, DeviceError::NOT_OPEN, "device lost");
                break;
            }
            if(dev_->stream_failed() || !dev_->is_streaming()){
                enter_fault(FaultKind::STREAM_FAILED, DeviceError::STREAM_FAILED, "stream ended");
                break;
            }
            int64_t idle = mono_ms() - last_data_ms_.load(std::memory_order_relaxed);
            if(idle > cfg_.no_data_timeout_ms){
                enter_fault(FaultKind::NO_DATA, DeviceError::STREAM_FAILED,
                            "no samples for " + std::to_string(idle) + " ms");
            }
            break;
        }

        case DeviceState::FAULTED: {
            release_device();
            rb_.wake();
            attempt_++;
            faults_.fetch_add(1);
            int backoff = backoff_ms_.load();

            FaultEvent ev;
            ev.kind       = fault_kind_;
            ev.error      = fault_err_;
            ev.attempt    = attempt_;
            ev.backoff_ms = backoff;
            ev.wall_ms    = wall_ms_now();
            ev.detail     = fault_detail_;
            rfs_err("[Watchdog] %s (%s): %s, retry #%u in %d ms",
                    fault_kind_str(ev.kind), device_error_str(ev.error),
                    ev.detail.c_str(), attempt_, backoff);
            metrics_.on_fault(ev);

            if(!sleep_interruptible(backoff)) break;
            backoff_ms_.store(next_backoff_ms(backoff, cfg_.backoff_max_ms));

            fault_detail_.clear();
            {
                std::lock_guard<std::mutex> lk(mtx_);
                released = released_;
            }
            set_state(released ? DeviceState::CLOSED : DeviceState::OPENING);
            break;
        }
        }
    }

    release_device();
    set_state(DeviceState::CLOSED);
}
