#include "json_msg.hpp"
#include "config.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <initializer_list>

// ── Parser ────────────────────────────────────────────────────────────────
namespace {

struct Cursor {
    const char* p;
    const char* end;
    void ws(){ while(p < end && (*p==' '||*p=='\t'||*p=='\n'||*p=='\r')) p++; }
    bool eat(char c){ ws(); if(p < end && *p == c){ p++; return true; } return false; }
};

bool parse_string(Cursor& c, std::string& out){
    if(!c.eat('"')) return false;
    out.clear();
    while(c.p < c.end){
        char ch = *c.p++;
        if(ch == '"') return true;
        if(ch != '\\'){ out += ch; continue; }
        if(c.p >= c.end) return false;
        char e = *c.p++;
        switch(e){
            case '"': out += '"';  break;
            case '\\': out += '\\'; break;
            case '/': out += '/';  break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                if(c.end - c.p < 4) return false;
                char hex[5] = {c.p[0], c.p[1], c.p[2], c.p[3], 0};
                char* stop = nullptr;
                unsigned long cp = strtoul(hex, &stop, 16);
                if(stop != hex + 4) return false;
                c.p += 4;
                // BMP only, as UTF-8
                if(cp < 0x80) out += (char)cp;
                else if(cp < 0x800){
                    out += (char)(0xC0 | (cp >> 6));
                    out += (char)(0x80 | (cp & 0x3F));
                }else{
                    out += (char)(0xE0 | (cp >> 12));
                    out += (char)(0x80 | ((cp >> 6) & 0x3F));
                    out += (char)(0x80 | (cp & 0x3F));
                }
                break;
            }
            default: return false;
        }
    }
    return false;
}

bool parse_value(Cursor& c, JsonValue& v){
    c.ws();
    if(c.p >= c.end) return false;
    char ch = *c.p;
    if(ch == '"'){ v.kind = JsonValue::STRING; return parse_string(c, v.str); }
    if(c.end - c.p >= 4 && !strncmp(c.p, "true", 4)) { c.p += 4; v.kind = JsonValue::BOOL; v.b = true;  return true; }
    if(c.end - c.p >= 5 && !strncmp(c.p, "false", 5)){ c.p += 5; v.kind = JsonValue::BOOL; v.b = false; return true; }
    if(c.end - c.p >= 4 && !strncmp(c.p, "null", 4)) { c.p += 4; v.kind = JsonValue::NUL; return true; }
    if(ch == '-' || (ch >= '0' && ch <= '9')){
        std::string tok;
        while(c.p < c.end && (strchr("+-.eE", *c.p) || (*c.p >= '0' && *c.p <= '9'))) tok += *c.p++;
        char* stop = nullptr;
        v.num = strtod(tok.c_str(), &stop);
        if(stop != tok.c_str() + tok.size() || !std::isfinite(v.num)) return false;
        v.kind = JsonValue::NUMBER;
        return true;
    }
    return false;   // objects / arrays not accepted
}

} // namespace

bool json_parse_flat(const std::string& text, JsonObject& out){
    out.clear();
    Cursor c{text.data(), text.data() + text.size()};
    if(!c.eat('{')) return false;
    if(c.eat('}')){ c.ws(); return c.p == c.end; }
    for(;;){
        std::string key;
        c.ws();
        if(!parse_string(c, key)) return false;
        if(!c.eat(':')) return false;
        JsonValue v;
        if(!parse_value(c, v)) return false;
        out[key] = v;
        if(c.eat(',')) continue;
        if(c.eat('}')) break;
        return false;
    }
    c.ws();
    return c.p == c.end;
}

std::string json_escape(const std::string& s){
    std::string o;
    o.reserve(s.size() + 2);
    for(unsigned char ch : s){
        switch(ch){
            case '"':  o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n";  break;
            case '\r': o += "\\r";  break;
            case '\t': o += "\\t";  break;
            default:
                if(ch < 0x20){ char b[8]; snprintf(b, sizeof(b), "\\u%04x", ch); o += b; }
                else o += (char)ch;
        }
    }
    return o;
}

// ── Command ───────────────────────────────────────────────────────────────
namespace {

// First present key among aliases
const JsonValue* find_key(const JsonObject& o, std::initializer_list<const char*> keys){
    for(const char* k : keys){
        auto it = o.find(k);
        if(it != o.end() && it->second.kind != JsonValue::NUL) return &it->second;
    }
    return nullptr;
}

// Numbers may also arrive as numeric strings
bool as_number(const JsonValue& v, double& out){
    if(v.kind == JsonValue::NUMBER){ out = v.num; return true; }
    if(v.kind == JsonValue::STRING && !v.str.empty()){
        char* stop = nullptr;
        out = strtod(v.str.c_str(), &stop);
        return stop == v.str.c_str() + v.str.size() && std::isfinite(out);
    }
    return false;
}

bool as_u64(const JsonValue& v, uint64_t& out){
    double d;
    if(!as_number(v, d) || d < 0.0 || d > 1.8e19 || d != std::floor(d)) return false;
    out = (uint64_t)d;
    return true;
}

bool as_int(const JsonValue& v, int& out){
    double d;
    if(!as_number(v, d) || d < -2147483648.0 || d > 2147483647.0 || d != std::floor(d)) return false;
    out = (int)d;
    return true;
}

bool as_bool(const JsonValue& v, bool& out){
    if(v.kind == JsonValue::BOOL){ out = v.b; return true; }
    if(v.kind == JsonValue::NUMBER){ out = v.num != 0.0; return true; }
    return false;
}

} // namespace

ConfigError parse_command(const std::string& json, DesiredConfig& out){
    JsonObject o;
    if(!json_parse_flat(json, o)) return ConfigError::PARSE_ERROR;

    DesiredConfig d;
    const JsonValue* v;

    v = find_key(o, {"center_freq", "center_freq_hz"});
    if(!v || !as_u64(*v, d.center_freq_hz)) return ConfigError::PARSE_ERROR;
    v = find_key(o, {"rbw", "rbw_hz", "resolution_bandwidth_hz"});
    if(!v || !as_u64(*v, d.resolution_bandwidth_hz)) return ConfigError::PARSE_ERROR;
    v = find_key(o, {"sample_rate", "sample_rate_hz"});
    if(!v || !as_u64(*v, d.sample_rate_hz)) return ConfigError::PARSE_ERROR;

    d.span_hz = d.sample_rate_hz;
    if((v = find_key(o, {"span", "span_hz"})) && !as_u64(*v, d.span_hz))
        return ConfigError::PARSE_ERROR;

    d.overlap = RFSENSE_DEFAULT_OVERLAP;
    if((v = find_key(o, {"overlap"})) && !as_number(*v, d.overlap))
        return ConfigError::PARSE_ERROR;

    if((v = find_key(o, {"window_type", "window"}))){
        double idx;
        if(v->kind == JsonValue::NUMBER){
            if(v->num != std::floor(v->num) || fabs(v->num) > 16.0 ||
               !window_from_index((long)v->num, d.window_type))
                return ConfigError::PARSE_ERROR;
        }else if(v->kind == JsonValue::STRING && !window_from_name(v->str.c_str(), d.window_type)){
            // "2" as a string
            if(!as_number(*v, idx) || idx != std::floor(idx) || fabs(idx) > 16.0 ||
               !window_from_index((long)idx, d.window_type))
                return ConfigError::PARSE_ERROR;
        }else if(v->kind != JsonValue::STRING){
            return ConfigError::PARSE_ERROR;
        }
    }

    if((v = find_key(o, {"scale"}))){
        if(v->kind != JsonValue::STRING || !scale_from_name(v->str.c_str(), d.scale))
            return ConfigError::PARSE_ERROR;
    }

    if((v = find_key(o, {"lna_gain"})) && !as_int(*v, d.lna_gain))   return ConfigError::PARSE_ERROR;
    if((v = find_key(o, {"vga_gain"})) && !as_int(*v, d.vga_gain))   return ConfigError::PARSE_ERROR;
    if((v = find_key(o, {"ppm_error"})) && !as_int(*v, d.ppm_error)) return ConfigError::PARSE_ERROR;
    if((v = find_key(o, {"amp_enabled", "antenna_amp"})) && !as_bool(*v, d.amp_enabled))
        return ConfigError::PARSE_ERROR;

    out = d;
    return ConfigError::NONE;
}

std::string encode_command(const DesiredConfig& d){
    char buf[512];
    snprintf(buf, sizeof(buf),
             "{\"center_freq\":%llu,\"span\":%llu,\"rbw\":%llu,\"sample_rate\":%llu,"
             "\"overlap\":%.17g,\"window_type\":\"%s\",\"scale\":\"%s\","
             "\"lna_gain\":%d,\"vga_gain\":%d,\"amp_enabled\":%s,\"ppm_error\":%d}",
             (unsigned long long)d.center_freq_hz, (unsigned long long)d.span_hz,
             (unsigned long long)d.resolution_bandwidth_hz, (unsigned long long)d.sample_rate_hz,
             d.overlap, window_name(d.window_type), scale_name(d.scale),
             d.lna_gain, d.vga_gain, d.amp_enabled ? "true" : "false", d.ppm_error);
    return buf;
}

// ── Outbound ──────────────────────────────────────────────────────────────
std::string encode_psd_result(const PsdResult& r, const std::string& device_id){
    std::string s;
    s.reserve(256 + r.pxx.size() * 16);
    char buf[256];
    snprintf(buf, sizeof(buf),
             "{\"start_freq_hz\":%llu,\"end_freq_hz\":%llu,\"center_freq_hz\":%llu,"
             "\"bin_count\":%u,\"timestamp\":%lld,\"scale\":\"%s\",\"device_id\":\"",
             (unsigned long long)r.start_freq_hz, (unsigned long long)r.end_freq_hz,
             (unsigned long long)r.center_freq_hz, r.bin_count,
             (long long)r.timestamp_ms, scale_name(r.scale));
    s += buf;
    s += json_escape(device_id);
    s += "\",\"Pxx\":[";
    for(size_t i=0;i<r.pxx.size();i++){
        double v = std::isfinite(r.pxx[i]) ? r.pxx[i] : 0.0;
        snprintf(buf, sizeof(buf), i ? ",%.10g" : "%.10g", v);
        s += buf;
    }
    s += "]}";
    return s;
}

std::string encode_ack(ConfigError err){
    char buf[96];
    if(err == ConfigError::NONE)
        snprintf(buf, sizeof(buf), "{\"ok\":true,\"error\":\"\"}");
    else
        snprintf(buf, sizeof(buf), "{\"ok\":false,\"error\":\"%s\"}", config_error_str(err));
    return buf;
}

std::string encode_status(const char* state, uint64_t faults, uint64_t overruns,
                          uint64_t generation, int64_t timestamp_ms){
    char buf[192];
    snprintf(buf, sizeof(buf),
             "{\"state\":\"%s\",\"faults\":%llu,\"overruns\":%llu,\"generation\":%llu,\"timestamp\":%lld}",
             state, (unsigned long long)faults, (unsigned long long)overruns,
             (unsigned long long)generation, (long long)timestamp_ms);
    return buf;
}
