#pragma once
#include "net_protocol.hpp"
#include "channel.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <memory>
#include <netinet/in.h>

// ── Per-client connection ─────────────────────────────────────────────────
struct ClientConn {
    int     fd       = -1;
    int     id       = 0;
    char    peer[64] = {};
    std::vector<std::string> topics;   // subscribed prefixes (guarded by send_mtx)
    bool    subscribed = false;
    std::mutex        send_mtx;
    std::atomic<bool> alive{false};
    std::atomic<bool> done{false};     // client thread has exited
    std::thread       thr;

    ClientConn() = default;
    ClientConn(const ClientConn&) = delete;
    ClientConn& operator=(const ClientConn&) = delete;
};

// ── NetServer ─────────────────────────────────────────────────────────────
// TCP transport of MessageChannel. One thread per client; CMD packets go
// to the command handler and are answered with CMD_ACK; publish() sends
// DATA to every client subscribed to a matching topic prefix.
class NetServer : public MessageChannel {
public:
    ~NetServer() override { stop(); }

    bool start(int port = RFSENSE_DEFAULT_PORT);
    void stop();
    bool is_running() const { return running_.load(); }
    int  client_count() const;
    int  port() const { return port_; }

    bool publish(const std::string& topic, const std::string& json) override;
    void set_command_handler(CommandHandler h) override { handler_ = std::move(h); }

private:
    int  server_fd_ = -1;
    int  port_      = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thr_;
    CommandHandler handler_;

    mutable std::mutex            clients_mtx_;
    std::vector<std::shared_ptr<ClientConn>> clients_;
    std::atomic<int>              next_id_{1};

    void accept_loop();
    void client_loop(std::shared_ptr<ClientConn> c);
    void handle_packet(std::shared_ptr<ClientConn> c,
                       PacketType type,
                       const uint8_t* payload, uint32_t len);
    bool send_to(ClientConn& c, const std::vector<uint8_t>& pkt);
    void reap_clients();
};
