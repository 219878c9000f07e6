#include "net_server.hpp"
#include "net_protocol.hpp"
#include "test_common.hpp"
#include <arpa/inet.h>
#include <chrono>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

// TCP transport: framing, command round trip, topic filtering

static int connect_local(int port){
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if(fd < 0) return -1;
    sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_port   = htons((uint16_t)port);
    inet_pton(AF_INET, "127.0.0.1", &a.sin_addr);
    if(connect(fd, (sockaddr*)&a, sizeof(a)) < 0){ close(fd); return -1; }
    timeval tv{2, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return fd;
}

static bool wait_clients(NetServer& s, int n){
    for(int i=0;i<400;i++){
        if(s.client_count() == n) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

static void test_packet_helpers(){
    auto pkt = make_topic_packet(PacketType::DATA, "data", "{\"x\":1}");
    check("header is 9 bytes", PKT_HDR_SIZE == 9);
    check("packet size", pkt.size() == 9 + 16 + 7);
    check("magic RFSN", pkt[0]=='R' && pkt[1]=='F' && pkt[2]=='S' && pkt[3]=='N');
    check("type byte", pkt[4] == 0x03);
    std::string topic, body;
    check("split topic payload",
          split_topic_payload(pkt.data() + 9, (uint32_t)(pkt.size() - 9), topic, body) &&
          topic == "data" && body == "{\"x\":1}");
    check("short payload rejected", !split_topic_payload(pkt.data() + 9, 8, topic, body));

    std::string long_topic(40, 'a');
    auto p2 = make_topic_packet(PacketType::CMD, long_topic, "");
    split_topic_payload(p2.data() + 9, (uint32_t)(p2.size() - 9), topic, body);
    check("topic truncated to 15 chars", topic.size() == 15);
}

static void test_command_round_trip(){
    NetServer srv;
    std::string last_topic, last_body;
    srv.set_command_handler([&](const std::string& t, const std::string& j, std::string& r){
        last_topic = t; last_body = j;
        r = "{\"ok\":true,\"error\":\"\"}";
    });
    check("server starts on an ephemeral port", srv.start(0) && srv.port() > 0);

    int fd = connect_local(srv.port());
    check("client connects", fd >= 0);
    check("client counted", wait_clients(srv, 1));

    auto cmd = make_topic_packet(PacketType::CMD, "acquire", "{\"center_freq\":1}");
    check("command sent", send_all(fd, cmd.data(), cmd.size()));
    PacketType type; std::vector<uint8_t> payload;
    check("ack received", recv_packet(fd, type, payload) && type == PacketType::CMD_ACK);
    check("ack body", std::string(payload.begin(), payload.end()) == "{\"ok\":true,\"error\":\"\"}");
    check("handler saw topic and body", last_topic == "acquire" && last_body == "{\"center_freq\":1}");

    check("publish without subscribers fails", !srv.publish("data", "{}"));

    check("subscribe sent", send_packet(fd, PacketType::SUBSCRIBE, "data", 4));
    // subscription is applied on the client thread; poll publish until it lands
    bool ok = false;
    for(int i=0;i<200 && !ok;i++){
        ok = srv.publish("data", "{\"bin_count\":1}");
        if(!ok) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    check("publish to subscriber succeeds", ok);
    check("DATA received", recv_packet(fd, type, payload) && type == PacketType::DATA);
    std::string topic, body;
    split_topic_payload(payload.data(), (uint32_t)payload.size(), topic, body);
    check("DATA carries topic and JSON", topic == "data" && body == "{\"bin_count\":1}");
    check("other topic not delivered", !srv.publish("status", "{}"));

    check("disconnect sent", send_packet(fd, PacketType::DISCONNECT, nullptr, 0));
    check("client gone", wait_clients(srv, 0));
    close(fd);
    srv.stop();
    check("stopped server refuses publish", !srv.publish("data", "{}"));
}

static void test_bad_magic_drops_client(){
    NetServer srv;
    check("server starts", srv.start(0));
    int fd = connect_local(srv.port());
    check("connected", fd >= 0 && wait_clients(srv, 1));
    const char junk[9] = {'X','X','X','X',1,0,0,0,0};
    send_all(fd, junk, sizeof(junk));
    check("bad magic disconnects", wait_clients(srv, 0));
    close(fd);

    // no handler installed: CMD answered with an error ack
    fd = connect_local(srv.port());
    auto cmd = make_topic_packet(PacketType::CMD, "acquire", "{}");
    send_all(fd, cmd.data(), cmd.size());
    PacketType type; std::vector<uint8_t> payload;
    check("unhandled command nacked",
          recv_packet(fd, type, payload) && type == PacketType::CMD_ACK &&
          std::string(payload.begin(), payload.end()).find("\"ok\":false") != std::string::npos);
    close(fd);
    srv.stop();
}

int main(){
    test_packet_helpers();
    test_command_round_trip();
    test_bad_magic_drops_client();
    std::printf("%d failure(s)\n", g_failures);
    return g_failures;
}
