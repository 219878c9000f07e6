#include "json_msg.hpp"
#include "test_common.hpp"
#include <cstring>
#include <string>

// Command parsing (keys, aliases, defaults) and outbound encoding

static void test_flat_parser(){
    JsonObject o;
    check("empty object", json_parse_flat("{}", o) && o.empty());
    check("scalars",
          json_parse_flat(" { \"a\" : 1.5e3, \"b\":\"x\\\"y\", \"c\":true, \"d\":null } ", o) &&
          o["a"].kind == JsonValue::NUMBER && o["a"].num == 1500.0 &&
          o["b"].str == "x\"y" && o["c"].b && o["d"].kind == JsonValue::NUL);
    check("\\u00b5 decodes to UTF-8",
          json_parse_flat("{\"s\":\"dB\\u00b5V\"}", o) && o["s"].str == "dB\xC2\xB5V");
    check("nested object rejected", !json_parse_flat("{\"a\":{\"b\":1}}", o));
    check("array rejected",         !json_parse_flat("{\"a\":[1,2]}", o));
    check("trailing garbage rejected", !json_parse_flat("{\"a\":1} x", o));
    check("unterminated rejected",  !json_parse_flat("{\"a\":1", o));
    check("not an object rejected", !json_parse_flat("[1]", o));
    check("escape control chars", json_escape("a\"b\n\x01") == "a\\\"b\\n\\u0001");
}

static void test_full_command(){
    DesiredConfig d;
    ConfigError e = parse_command(
        "{\"center_freq\":98000000,\"span\":10000000,\"rbw\":5000,\"sample_rate\":20000000,"
        "\"overlap\":0.25,\"window_type\":\"blackman\",\"scale\":\"dBuV\","
        "\"lna_gain\":16,\"vga_gain\":20,\"amp_enabled\":true,\"ppm_error\":-3}", d);
    check("full command parses", e == ConfigError::NONE);
    check("center/span/rbw/rate",
          d.center_freq_hz == 98000000 && d.span_hz == 10000000 &&
          d.resolution_bandwidth_hz == 5000 && d.sample_rate_hz == 20000000);
    check("overlap 0.25", d.overlap == 0.25);
    check("window blackman", d.window_type == WindowType::BLACKMAN);
    check("scale dBuV", d.scale == ScaleKind::DBUV);
    check("gains / amp / ppm", d.lna_gain == 16 && d.vga_gain == 20 && d.amp_enabled && d.ppm_error == -3);
}

static void test_defaults_and_aliases(){
    DesiredConfig d;
    ConfigError e = parse_command("{\"center_freq_hz\":433920000,\"rbw_hz\":\"1000\",\"sample_rate_hz\":2000000}", d);
    check("alias keys + numeric string", e == ConfigError::NONE && d.resolution_bandwidth_hz == 1000);
    check("span defaults to sample rate", d.span_hz == 2000000);
    check("overlap defaults to 0.5", d.overlap == 0.5);
    check("window defaults to hamming", d.window_type == WindowType::HAMMING);
    check("scale defaults to dBm", d.scale == ScaleKind::DBM);
    check("gains default 0, amp off", d.lna_gain == 0 && d.vga_gain == 0 && !d.amp_enabled && d.ppm_error == 0);

    e = parse_command("{\"center_freq\":1e8,\"rbw\":1000,\"sample_rate\":2e6,\"window\":2,\"antenna_amp\":1}", d);
    check("window index + antenna_amp", e == ConfigError::NONE && d.window_type == WindowType::HANNING && d.amp_enabled);

    e = parse_command("{\"center_freq\":1e8,\"rbw\":1000,\"sample_rate\":2e6,\"window_type\":\"0\"}", d);
    check("window index as string", e == ConfigError::NONE && d.window_type == WindowType::RECTANGULAR);

    e = parse_command("{\"center_freq\":1e8,\"rbw\":1000,\"sample_rate\":2e6,\"scale\":\"dB\\u00b5V\"}", d);
    check("dBµV via \\u escape", e == ConfigError::NONE && d.scale == ScaleKind::DBUV);
}

static void test_malformed(){
    DesiredConfig d;
    d.center_freq_hz = 777;
    check("not JSON", parse_command("center_freq=1", d) == ConfigError::PARSE_ERROR);
    check("missing rbw", parse_command("{\"center_freq\":1e8,\"sample_rate\":2e6}", d) == ConfigError::PARSE_ERROR);
    check("missing center", parse_command("{\"rbw\":1,\"sample_rate\":2e6}", d) == ConfigError::PARSE_ERROR);
    check("negative frequency", parse_command("{\"center_freq\":-5,\"rbw\":1,\"sample_rate\":2e6}", d) == ConfigError::PARSE_ERROR);
    check("fractional rate", parse_command("{\"center_freq\":1e8,\"rbw\":1,\"sample_rate\":2.5}", d) == ConfigError::PARSE_ERROR);
    check("unknown window", parse_command("{\"center_freq\":1e8,\"rbw\":1,\"sample_rate\":2e6,\"window_type\":\"kaiser\"}", d) == ConfigError::PARSE_ERROR);
    check("window index 7", parse_command("{\"center_freq\":1e8,\"rbw\":1,\"sample_rate\":2e6,\"window_type\":7}", d) == ConfigError::PARSE_ERROR);
    check("unknown scale", parse_command("{\"center_freq\":1e8,\"rbw\":1,\"sample_rate\":2e6,\"scale\":\"dBW\"}", d) == ConfigError::PARSE_ERROR);
    check("amp as string", parse_command("{\"center_freq\":1e8,\"rbw\":1,\"sample_rate\":2e6,\"amp_enabled\":\"yes\"}", d) == ConfigError::PARSE_ERROR);
    check("output untouched on error", d.center_freq_hz == 777);
}

static void test_command_reencode(){
    DesiredConfig a;
    a.center_freq_hz = 915000000; a.span_hz = 1000000; a.resolution_bandwidth_hz = 300;
    a.sample_rate_hz = 2400000; a.overlap = 0.125; a.window_type = WindowType::HANNING;
    a.scale = ScaleKind::V; a.lna_gain = 8; a.vga_gain = 4; a.amp_enabled = true; a.ppm_error = 12;
    DesiredConfig b;
    check("canonical command parses back", parse_command(encode_command(a), b) == ConfigError::NONE);
    check("persisted fields survive",
          b.center_freq_hz == a.center_freq_hz && b.span_hz == a.span_hz &&
          b.resolution_bandwidth_hz == a.resolution_bandwidth_hz && b.sample_rate_hz == a.sample_rate_hz &&
          b.overlap == a.overlap && b.window_type == a.window_type && b.scale == a.scale &&
          b.lna_gain == a.lna_gain && b.vga_gain == a.vga_gain && b.amp_enabled == a.amp_enabled &&
          b.ppm_error == a.ppm_error);
}

static void test_outbound(){
    PsdResult r;
    r.start_freq_hz = 99000000; r.end_freq_hz = 101000000; r.center_freq_hz = 100000000;
    r.bin_count = 3; r.pxx = { -120.5, -80.25, -121.0 };
    r.timestamp_ms = 1700000000123LL; r.scale = ScaleKind::DBM;
    std::string js = encode_psd_result(r, "aa:bb:cc:dd:ee:ff");
    check("data message keys",
          js.find("\"start_freq_hz\":99000000") != std::string::npos &&
          js.find("\"end_freq_hz\":101000000") != std::string::npos &&
          js.find("\"center_freq_hz\":100000000") != std::string::npos &&
          js.find("\"bin_count\":3") != std::string::npos &&
          js.find("\"timestamp\":1700000000123") != std::string::npos &&
          js.find("\"scale\":\"dBm\"") != std::string::npos &&
          js.find("\"device_id\":\"aa:bb:cc:dd:ee:ff\"") != std::string::npos);
    check("Pxx array", js.find("\"Pxx\":[-120.5,-80.25,-121]") != std::string::npos);

    JsonObject o;
    std::string head = js.substr(0, js.find(",\"Pxx\"")) + "}";
    check("header part is flat JSON", json_parse_flat(head, o) && o["bin_count"].num == 3.0);

    check("ack ok", encode_ack(ConfigError::NONE) == "{\"ok\":true,\"error\":\"\"}");
    check("ack error", encode_ack(ConfigError::INVALID_OVERLAP) == "{\"ok\":false,\"error\":\"invalid_overlap\"}");

    std::string st = encode_status("faulted", 3, 1, 7, 42);
    check("status parses", json_parse_flat(st, o) && o["state"].str == "faulted" &&
          o["faults"].num == 3.0 && o["overruns"].num == 1.0 && o["generation"].num == 7.0);
}

int main(){
    test_flat_parser();
    test_full_command();
    test_defaults_and_aliases();
    test_malformed();
    test_command_reencode();
    test_outbound();
    std::printf("%d failure(s)\n", g_failures);
    return g_failures;
}
