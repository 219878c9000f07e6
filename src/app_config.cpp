#include "app_config.hpp"
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <getopt.h>

static bool parse_int(const char* s, long lo, long hi, int& out){
    if(!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long v = strtol(s, &end, 10);
    if(errno || *end || v < lo || v > hi) return false;
    out = (int)v;
    return true;
}

static bool parse_positive(const char* s, double& out){
    if(!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    double v = strtod(s, &end);
    if(errno || *end || !(v > 0.0)) return false;
    out = v;
    return true;
}

void print_usage(const char* prog){
    fprintf(stderr,
        "Usage: %s [options]\n"
        "  -p, --port PORT             TCP port (default %d)\n"
        "  -d, --device TYPE           auto|rtlsdr|bladerf|hackrf (default auto)\n"
        "  -m, --mode MODE             continuous|single (default continuous)\n"
        "  -t, --no-data-timeout MS    stall detection (default %d)\n"
        "  -b, --backoff-min MS        first reconnect delay (default %d)\n"
        "  -B, --backoff-max MS        reconnect delay cap (default %d)\n"
        "  -r, --impedance OHM         reference impedance (default %.0f)\n"
        "  -i, --device-id ID          identity in data messages (default: interface MAC)\n"
        "  -l, --log-file PATH         also append log lines to PATH\n"
        "  -n, --no-resume             ignore the persisted last command\n"
        "  -v, --verbose               debug logging\n"
        "  -h, --help                  this text\n",
        prog, RFSENSE_DEFAULT_PORT, RFSENSE_NO_DATA_TIMEOUT_MS,
        RFSENSE_BACKOFF_MIN_MS, RFSENSE_BACKOFF_MAX_MS, RFSENSE_REF_IMPEDANCE_OHM);
}

bool parse_app_args(int argc, char** argv, AppConfig& cfg){
    static const option long_opts[] = {
        {"port",            required_argument, nullptr, 'p'},
        {"device",          required_argument, nullptr, 'd'},
        {"mode",            required_argument, nullptr, 'm'},
        {"no-data-timeout", required_argument, nullptr, 't'},
        {"backoff-min",     required_argument, nullptr, 'b'},
        {"backoff-max",     required_argument, nullptr, 'B'},
        {"impedance",       required_argument, nullptr, 'r'},
        {"device-id",       required_argument, nullptr, 'i'},
        {"log-file",        required_argument, nullptr, 'l'},
        {"no-resume",       no_argument,       nullptr, 'n'},
        {"verbose",         no_argument,       nullptr, 'v'},
        {"help",            no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    const char* prog = argc > 0 ? argv[0] : "rfsense";
    optind = 0;   // GNU: full rescan, so the parser can run more than once
    opterr = 1;
    int c;
    while((c = getopt_long(argc, argv, "p:d:m:t:b:B:r:i:l:nvh", long_opts, nullptr)) != -1){
        bool ok = true;
        switch(c){
            case 'p': ok = parse_int(optarg, 0, 65535, cfg.port); break;
            case 'd': ok = parse_hw_type(optarg, cfg.device); break;
            case 'm': ok = parse_acq_mode(optarg, cfg.mode); break;
            case 't': ok = parse_int(optarg, 1, INT_MAX, cfg.watchdog.no_data_timeout_ms); break;
            case 'b': ok = parse_int(optarg, 1, INT_MAX, cfg.watchdog.backoff_min_ms); break;
            case 'B': ok = parse_int(optarg, 1, INT_MAX, cfg.watchdog.backoff_max_ms); break;
            case 'r': ok = parse_positive(optarg, cfg.impedance_ohm); break;
            case 'i': cfg.device_id = optarg; ok = !cfg.device_id.empty(); break;
            case 'l': cfg.log_file  = optarg; ok = !cfg.log_file.empty(); break;
            case 'n': cfg.resume  = false; break;
            case 'v': cfg.verbose = true;  break;
            case 'h': cfg.help    = true;  break;
            default:
                print_usage(prog);
                return false;
        }
        if(!ok){
            fprintf(stderr, "%s: invalid value for -%c: '%s'\n", prog, c, optarg ? optarg : "");
            print_usage(prog);
            return false;
        }
    }
    if(optind < argc){
        fprintf(stderr, "%s: unexpected argument '%s'\n", prog, argv[optind]);
        print_usage(prog);
        return false;
    }
    if(cfg.watchdog.backoff_max_ms < cfg.watchdog.backoff_min_ms){
        fprintf(stderr, "%s: --backoff-max must not be below --backoff-min\n", prog);
        print_usage(prog);
        return false;
    }
    return true;
}
