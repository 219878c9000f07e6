#pragma once
#include "acq_config.hpp"
#include "hw_config.hpp"
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

// Everything one acquisition generation needs
struct AcqPlan {
    uint64_t         generation = 0;
    DesiredConfig    desired;
    HardwareConfig   hw;
    PsdConfig        psd;
    RingBufferConfig rb;
};

// ── CommandIntake ─────────────────────────────────────────────────────────
// Validates commands and keeps only the most recent derived plan. Each
// accepted command bumps the generation; the engine picks it up at its
// next window boundary. A rejected command leaves the current plan.
class CommandIntake {
public:
    // persist_path "" disables persistence
    explicit CommandIntake(const HWConfig& caps, std::string persist_path = "");

    ConfigError on_command(const DesiredConfig& d);

    // Channel entry: JSON in, JSON ack out
    void on_message(const std::string& topic, const std::string& json, std::string& reply);

    // Re-applies the persisted command; false when absent or invalid
    bool load_persisted();

    bool     latest(AcqPlan& out) const;   // false before the first command
    uint64_t generation() const;

    // true once generation() > seen; false on timeout or wake()
    bool wait_new(uint64_t seen, int timeout_ms);
    void wake();

private:
    void persist(const DesiredConfig& d);

    HWConfig    caps_;
    std::string persist_path_;

    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    AcqPlan  plan_;
    bool     has_plan_ = false;
    uint64_t wake_seq_ = 0;
};
