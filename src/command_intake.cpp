#include "command_intake.hpp"
#include "json_msg.hpp"
#include "rfsense_paths.hpp"
#include "config.hpp"
#include "log.hpp"
#include <chrono>

CommandIntake::CommandIntake(const HWConfig& caps, std::string persist_path)
    : caps_(caps), persist_path_(std::move(persist_path)) {}

ConfigError CommandIntake::on_command(const DesiredConfig& d){
    AcqPlan p;
    ConfigError err = derive_params(d, caps_, p.hw, p.psd, p.rb);
    if(err != ConfigError::NONE){
        rfs_err("[Intake] command rejected: %s", config_error_str(err));
        return err;
    }
    p.desired = d;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        p.generation = plan_.generation + 1;
        plan_ = p;
        has_plan_ = true;
    }
    cv_.notify_all();

    rfs_log("[Intake] gen %llu: %.3f MHz  sr %.3f MSPS  rbw %llu Hz  span %llu Hz  %s  "
            "nperseg %d  noverlap %d  %s",
            (unsigned long long)p.generation, d.center_freq_hz/1e6, d.sample_rate_hz/1e6,
            (unsigned long long)d.resolution_bandwidth_hz, (unsigned long long)d.span_hz,
            window_name(d.window_type), p.psd.nperseg, p.psd.noverlap, scale_name(d.scale));
    persist(d);
    return ConfigError::NONE;
}

void CommandIntake::on_message(const std::string& topic, const std::string& json, std::string& reply){
    if(topic != RFSENSE_TOPIC_CMD){
        rfs_err("[Intake] command on unknown topic '%s'", topic.c_str());
        reply = "{\"ok\":false,\"error\":\"unknown_topic\"}";
        return;
    }
    DesiredConfig d;
    ConfigError err = parse_command(json, d);
    if(err != ConfigError::NONE){
        rfs_err("[Intake] malformed command: %s", config_error_str(err));
        reply = encode_ack(err);
        return;
    }
    reply = encode_ack(on_command(d));
}

void CommandIntake::persist(const DesiredConfig& d){
    if(persist_path_.empty()) return;
    if(!RFSensePaths::atomic_write(persist_path_, encode_command(d) + "\n"))
        rfs_err("[Intake] could not persist command to %s", persist_path_.c_str());
}

bool CommandIntake::load_persisted(){
    if(persist_path_.empty()) return false;
    std::string text;
    if(!RFSensePaths::read_file(persist_path_, text)){
        rfs_debug("[Intake] no persisted command at %s", persist_path_.c_str());
        return false;
    }
    while(!text.empty() && (text.back()=='\n' || text.back()=='\r' || text.back()==' '))
        text.pop_back();
    DesiredConfig d;
    ConfigError err = parse_command(text, d);
    if(err == ConfigError::NONE) err = on_command(d);
    if(err != ConfigError::NONE){
        rfs_err("[Intake] persisted command ignored: %s", config_error_str(err));
        return false;
    }
    rfs_log("[Intake] resumed persisted command");
    return true;
}

bool CommandIntake::latest(AcqPlan& out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    if(!has_plan_) return false;
    out = plan_;
    return true;
}

uint64_t CommandIntake::generation() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return plan_.generation;
}

bool CommandIntake::wait_new(uint64_t seen, int timeout_ms){
    std::unique_lock<std::mutex> lk(mtx_);
    uint64_t ws = wake_seq_;
    cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&]{
        return plan_.generation > seen || wake_seq_ != ws;
    });
    return plan_.generation > seen;
}

void CommandIntake::wake(){
    {
        std::lock_guard<std::mutex> lk(mtx_);
        wake_seq_++;
    }
    cv_.notify_all();
}
