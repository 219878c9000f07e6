#pragma once
#include "acq_config.hpp"
#include "psd_scale.hpp"
#include <cstdint>
#include <map>
#include <string>

// ── Flat JSON ─────────────────────────────────────────────────────────────
// Commands are one flat object of scalars; nested values are rejected.
struct JsonValue {
    enum Kind : uint8_t { STRING, NUMBER, BOOL, NUL } kind = NUL;
    std::string str;
    double      num = 0.0;
    bool        b   = false;
};
using JsonObject = std::map<std::string, JsonValue>;

bool json_parse_flat(const std::string& text, JsonObject& out);
std::string json_escape(const std::string& s);

// ── Messages ──────────────────────────────────────────────────────────────
// Inbound acquisition command → DesiredConfig (defaults for missing
// optional keys). PARSE_ERROR on malformed JSON, wrong types or a
// missing center_freq / rbw / sample_rate.
ConfigError parse_command(const std::string& json, DesiredConfig& out);

// Canonical command (persisted, re-parsed by parse_command)
std::string encode_command(const DesiredConfig& d);

std::string encode_psd_result(const PsdResult& r, const std::string& device_id);
std::string encode_ack(ConfigError err);
std::string encode_status(const char* state, uint64_t faults, uint64_t overruns,
                          uint64_t generation, int64_t timestamp_ms);
