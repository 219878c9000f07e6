#include "publisher.hpp"
#include "log.hpp"
#include <chrono>

Publisher::Publisher(MessageChannel& ch, MetricsSink& metrics, size_t depth)
    : ch_(ch), metrics_(metrics), depth_(depth ? depth : 1) {}

Publisher::~Publisher(){ stop(); }

void Publisher::start(){
    if(thr_.joinable()) return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_ = false;
    }
    thr_ = std::thread(&Publisher::worker, this);
}

void Publisher::stop(){
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    if(thr_.joinable()) thr_.join();
}

bool Publisher::submit(const std::string& topic, std::string json){
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if(stop_ || q_.size() >= depth_){
            dropped_.fetch_add(1);
            return false;
        }
        q_.push_back(Msg{topic, std::move(json)});
    }
    cv_.notify_one();
    return true;
}

void Publisher::send_one(const Msg& m){
    if(ch_.publish(m.topic, m.json)){
        if(fail_streak_ > 0)
            rfs_log("[Publisher] channel available again after %llu failed publish(es)",
                    (unsigned long long)fail_streak_);
        fail_streak_ = 0;
        published_.fetch_add(1);
        return;
    }
    failed_.fetch_add(1);
    fail_streak_++;
    // first failure, then every 100th, so an idle channel does not flood the log
    if(fail_streak_ == 1 || fail_streak_ % 100 == 0){
        rfs_err("[Publisher] publish on '%s' failed (%llu in a row), result dropped",
                m.topic.c_str(), (unsigned long long)fail_streak_);
        FaultEvent ev;
        ev.kind    = FaultKind::PUBLISH_FAILED;
        ev.attempt = (uint32_t)fail_streak_;
        ev.wall_ms = wall_ms_now();
        ev.detail  = m.topic;
        metrics_.on_fault(ev);
    }
}

// ── Broadcast thread ──────────────────────────────────────────────────────
// Channel sends may block on slow clients; never on the processing thread.
void Publisher::worker(){
    for(;;){
        Msg m;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_for(lk, std::chrono::milliseconds(100), [&]{ return stop_ || !q_.empty(); });
            if(q_.empty()){
                if(stop_) break;
                continue;
            }
            m = std::move(q_.front());
            q_.pop_front();
        }
        send_one(m);
    }
}
