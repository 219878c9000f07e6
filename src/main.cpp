#include "app_config.hpp"
#include "command_intake.hpp"
#include "engine.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include "net_server.hpp"
#include "publisher.hpp"
#include "rfsense_paths.hpp"
#include "ring_buffer.hpp"
#include "sdr_device.hpp"
#include "watchdog.hpp"
#include <atomic>
#include <csignal>
#include <unistd.h>

static std::atomic<bool> g_stop{false};

static void on_signal(int){ g_stop.store(true); }

int main(int argc, char** argv){
    AppConfig app;
    if(!parse_app_args(argc, argv, app)) return 1;
    if(app.help){ print_usage(argv[0]); return 0; }

    signal(SIGINT,  on_signal);
    signal(SIGTERM, on_signal);
    signal(SIGPIPE, SIG_IGN);

    rfs_log_set_verbose(app.verbose);
    RFSensePaths::ensure_dirs();
    if(!app.log_file.empty() && !rfs_log_open(app.log_file.c_str()))
        rfs_err("[Main] cannot open log file %s, logging to the console only", app.log_file.c_str());

    // ── Backend ───────────────────────────────────────────────────────────
    HWType type = app.device;
    if(type == HWType::NONE){
        type = detect_hw_type();
        if(type == HWType::NONE){
            rfs_err("[Main] no SDR detected, assuming HackRF and retrying until one appears");
            type = HWType::HACKRF;
        }
    }
    HWConfig caps = make_hw_config(type);
    rfs_log("[Main] backend %s (%s)", hw_type_str(type), caps.name);

    std::string device_id = app.device_id;
    if(device_id.empty()) device_id = RFSensePaths::interface_mac();
    if(device_id.empty()) device_id = "unknown";

    // ── Components ────────────────────────────────────────────────────────
    LogMetrics    metrics;
    RingBuffer    ring;
    NetServer     server;
    CommandIntake intake(caps, RFSensePaths::last_command_file());
    Watchdog      watchdog([type]{ return create_sdr_device(type); }, ring, metrics, app.watchdog);
    Publisher     publisher(server, metrics);

    EngineConfig ecfg;
    ecfg.mode              = app.mode;
    ecfg.ref_impedance_ohm = app.impedance_ohm;
    ecfg.device_id         = device_id;
    AcquisitionEngine engine(intake, watchdog, ring, publisher, metrics, caps, ecfg);

    watchdog.set_state_listener([&engine](DeviceState s){ engine.on_device_state(s); });
    server.set_command_handler([&intake](const std::string& topic, const std::string& json,
                                         std::string& reply){
        intake.on_message(topic, json, reply);
    });

    if(!server.start(app.port)){
        rfs_err("[Main] cannot listen on port %d", app.port);
        rfs_log_close();
        return 1;
    }
    publisher.start();
    watchdog.start();
    engine.start();

    if(app.resume) intake.load_persisted();
    rfs_log("[Main] rfsense ready: port %d, device_id %s, %s mode",
            server.port(), device_id.c_str(), acq_mode_str(app.mode));

    while(!g_stop.load()) usleep(100000);

    // ── Shutdown ──────────────────────────────────────────────────────────
    rfs_log("[Main] shutting down");
    engine.stop();
    watchdog.stop();
    publisher.stop();
    server.stop();
    rfs_log("[Main] bye (published %llu, dropped %llu, faults %llu)",
            (unsigned long long)publisher.published(), (unsigned long long)publisher.dropped(),
            (unsigned long long)watchdog.fault_count());
    rfs_log_close();
    return 0;
}
