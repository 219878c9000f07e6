#pragma once
#include "engine.hpp"
#include "watchdog.hpp"
#include "hw_config.hpp"
#include "config.hpp"
#include <string>

// ── Daemon settings ───────────────────────────────────────────────────────
// config.hpp defaults, overridden from the command line
struct AppConfig {
    int            port        = RFSENSE_DEFAULT_PORT;
    HWType         device      = HWType::NONE;   // NONE = auto-detect
    AcqMode        mode        = AcqMode::CONTINUOUS;
    WatchdogConfig watchdog;
    double         impedance_ohm = RFSENSE_REF_IMPEDANCE_OHM;
    std::string    device_id;                    // "" = interface MAC
    std::string    log_file;
    bool           resume      = true;
    bool           verbose     = false;
    bool           help        = false;
};

// false on an invalid option or value (message already printed)
bool parse_app_args(int argc, char** argv, AppConfig& cfg);
void print_usage(const char* prog);
