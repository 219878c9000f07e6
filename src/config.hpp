#pragma once
#include <cstdint>

// ── Network ───────────────────────────────────────────────────────────────
#define RFSENSE_DEFAULT_PORT         5555
#define RFSENSE_TOPIC_CMD            "acquire"
#define RFSENSE_TOPIC_DATA           "data"
#define RFSENSE_TOPIC_STATUS         "status"
#define RFSENSE_MAX_PAYLOAD          (64u*1024u*1024u)

// ── Watchdog ──────────────────────────────────────────────────────────────
#define RFSENSE_NO_DATA_TIMEOUT_MS   5000
#define RFSENSE_BACKOFF_MIN_MS       500
#define RFSENSE_BACKOFF_MAX_MS       30000
#define RFSENSE_WATCHDOG_POLL_MS     100

// ── Processing ────────────────────────────────────────────────────────────
#define RFSENSE_PUBLISH_DEPTH        4
#define RFSENSE_REF_IMPEDANCE_OHM    50.0
#define RFSENSE_POWER_FLOOR_W        1e-30
#define RFSENSE_WINDOW_WAIT_MS       200

// ── Command defaults ──────────────────────────────────────────────────────
#define RFSENSE_DEFAULT_OVERLAP      0.5
#define RFSENSE_MAX_LNA_GAIN         40
#define RFSENSE_MAX_VGA_GAIN         62
#define RFSENSE_MAX_PPM              1000

// ── Device I/O ────────────────────────────────────────────────────────────
#define RFSENSE_RTL_BUF_COUNT        32
#define RFSENSE_RTL_BUF_LEN          (16*16384)   // bytes per async transfer
#define RFSENSE_BLADERF_BUF_SAMPLES  16384
#define RFSENSE_BLADERF_RX_TIMEOUT   1000          // ms
#define RFSENSE_BLADERF_MAX_ERRORS   5
