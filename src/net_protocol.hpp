#pragma once
#include "config.hpp"
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>

// ── Magic ───────────────────────────────────────────────────────────────
static constexpr uint8_t  RFSN_MAGIC[4]  = {'R','F','S','N'};

// ── Packet types ──────────────────────────────────────────────────────────
enum class PacketType : uint8_t {
    SUBSCRIBE      = 0x01,  // client → server: topic prefix ("" = all)
    DATA           = 0x03,  // server → subscribers: PktTopic + JSON
    CMD            = 0x05,  // client → server: PktTopic + JSON
    CMD_ACK        = 0x06,  // server → client: JSON {"ok","error"}
    DISCONNECT     = 0x0B,
};

// ── Packet header (9 bytes, packed) ──────────────────────────────────────
struct __attribute__((packed)) PktHdr {
    uint8_t  magic[4];
    uint8_t  type;      // PacketType
    uint32_t len;       // payload length (LE)
};
static constexpr int PKT_HDR_SIZE = sizeof(PktHdr);

// ── Topic prefix of CMD / DATA ────────────────────────────────────────────
struct __attribute__((packed)) PktTopic {
    char topic[16];     // NUL padded
};

// ── Wire helpers ──────────────────────────────────────────────────────────
inline std::vector<uint8_t> make_packet(PacketType type,
                                         const void* payload, uint32_t len){
    std::vector<uint8_t> pkt(PKT_HDR_SIZE + len);
    PktHdr* h = reinterpret_cast<PktHdr*>(pkt.data());
    memcpy(h->magic, RFSN_MAGIC, 4);
    h->type = static_cast<uint8_t>(type);
    h->len  = len;
    if(len && payload)
        memcpy(pkt.data() + PKT_HDR_SIZE, payload, len);
    return pkt;
}

// PktTopic + body
inline std::vector<uint8_t> make_topic_packet(PacketType type,
                                               const std::string& topic,
                                               const std::string& body){
    std::vector<uint8_t> payload(sizeof(PktTopic) + body.size());
    PktTopic t{};
    strncpy(t.topic, topic.c_str(), sizeof(t.topic)-1);
    memcpy(payload.data(), &t, sizeof(t));
    if(!body.empty()) memcpy(payload.data() + sizeof(t), body.data(), body.size());
    return make_packet(type, payload.data(), (uint32_t)payload.size());
}

// Splits a PktTopic + body payload; false when too short
inline bool split_topic_payload(const uint8_t* payload, uint32_t len,
                                std::string& topic, std::string& body){
    if(len < sizeof(PktTopic)) return false;
    const PktTopic* t = reinterpret_cast<const PktTopic*>(payload);
    topic.assign(t->topic, strnlen(t->topic, sizeof(t->topic)));
    body.assign(reinterpret_cast<const char*>(payload) + sizeof(PktTopic), len - sizeof(PktTopic));
    return true;
}

inline bool send_all(int fd, const void* buf, size_t len){
    const uint8_t* p = static_cast<const uint8_t*>(buf);
    while(len > 0){
        ssize_t r = send(fd, p, len, MSG_NOSIGNAL);
        if(r <= 0) return false;
        p += r; len -= r;
    }
    return true;
}

inline bool recv_all(int fd, void* buf, size_t len){
    uint8_t* p = static_cast<uint8_t*>(buf);
    while(len > 0){
        ssize_t r = recv(fd, p, len, 0);
        if(r <= 0) return false;
        p += r; len -= r;
    }
    return true;
}

inline bool send_packet(int fd, PacketType type, const void* payload, uint32_t len){
    auto pkt = make_packet(type, payload, len);
    return send_all(fd, pkt.data(), pkt.size());
}

// Reads one packet; false on EOF, bad magic or oversized payload
inline bool recv_packet(int fd, PacketType& type, std::vector<uint8_t>& payload){
    PktHdr hdr{};
    if(!recv_all(fd, &hdr, PKT_HDR_SIZE)) return false;
    if(memcmp(hdr.magic, RFSN_MAGIC, 4) != 0) return false;
    if(hdr.len > RFSENSE_MAX_PAYLOAD) return false;
    payload.resize(hdr.len);
    if(hdr.len > 0 && !recv_all(fd, payload.data(), hdr.len)) return false;
    type = static_cast<PacketType>(hdr.type);
    return true;
}
