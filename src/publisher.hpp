#pragma once
#include "channel.hpp"
#include "metrics.hpp"
#include "config.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

// ── Publisher ─────────────────────────────────────────────────────────────
// Moves channel sends off the processing thread. submit() never blocks:
// when `depth` messages are already queued the new one is dropped.
// A failed publish is logged, reported as PUBLISH_FAILED and dropped.
class Publisher {
public:
    Publisher(MessageChannel& ch, MetricsSink& metrics, size_t depth = RFSENSE_PUBLISH_DEPTH);
    ~Publisher();

    Publisher(const Publisher&) = delete;
    Publisher& operator=(const Publisher&) = delete;

    void start();
    // Sends what is queued, then joins
    void stop();

    bool submit(const std::string& topic, std::string json);

    uint64_t published() const { return published_.load(); }
    uint64_t failed()    const { return failed_.load(); }
    uint64_t dropped()   const { return dropped_.load(); }

private:
    struct Msg { std::string topic, json; };

    void worker();
    void send_one(const Msg& m);

    MessageChannel& ch_;
    MetricsSink&    metrics_;
    size_t          depth_;

    std::mutex              mtx_;
    std::condition_variable cv_;
    std::deque<Msg>         q_;
    bool                    stop_ = false;
    std::thread             thr_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
    uint64_t              fail_streak_ = 0;   // worker only
};
