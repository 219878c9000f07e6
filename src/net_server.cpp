#include "net_server.hpp"
#include "log.hpp"
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <algorithm>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

// ── start / stop ──────────────────────────────────────────────────────────
bool NetServer::start(int port){
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if(server_fd_ < 0){ rfs_err("[NetServer] socket: %s", strerror(errno)); return false; }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port        = htons((uint16_t)port);

    if(bind(server_fd_, (sockaddr*)&addr, sizeof(addr)) < 0){
        rfs_err("[NetServer] bind %d: %s", port, strerror(errno));
        close(server_fd_); server_fd_=-1; return false;
    }
    if(listen(server_fd_, 8) < 0){
        rfs_err("[NetServer] listen: %s", strerror(errno));
        close(server_fd_); server_fd_=-1; return false;
    }

    // port 0 → kernel picked one
    socklen_t alen = sizeof(addr);
    if(getsockname(server_fd_, (sockaddr*)&addr, &alen) == 0) port_ = ntohs(addr.sin_port);
    else port_ = port;

    running_.store(true);
    accept_thr_ = std::thread(&NetServer::accept_loop, this);
    rfs_log("[NetServer] listening on port %d", port_);
    return true;
}

void NetServer::stop(){
    bool was = running_.exchange(false);
    if(server_fd_ >= 0){ shutdown(server_fd_, SHUT_RDWR); close(server_fd_); server_fd_=-1; }
    if(accept_thr_.joinable()) accept_thr_.join();

    std::vector<std::shared_ptr<ClientConn>> cs;
    {
        std::lock_guard<std::mutex> lk(clients_mtx_);
        cs.swap(clients_);
    }
    for(auto& c : cs){
        c->alive.store(false);
        {
            std::lock_guard<std::mutex> slk(c->send_mtx);
            if(c->fd >= 0) shutdown(c->fd, SHUT_RDWR);
        }
        if(c->thr.joinable()) c->thr.join();
    }
    if(was) rfs_log("[NetServer] stopped");
}

int NetServer::client_count() const {
    std::lock_guard<std::mutex> lk(clients_mtx_);
    int n = 0;
    for(auto& c : clients_) if(c->alive.load()) ++n;
    return n;
}

// Joins threads of clients that already left
void NetServer::reap_clients(){
    std::vector<std::shared_ptr<ClientConn>> dead;
    {
        std::lock_guard<std::mutex> lk(clients_mtx_);
        auto it = std::partition(clients_.begin(), clients_.end(),
            [](const std::shared_ptr<ClientConn>& x){ return !x->done.load(); });
        dead.assign(it, clients_.end());
        clients_.erase(it, clients_.end());
    }
    for(auto& c : dead) if(c->thr.joinable()) c->thr.join();
}

// ── Accept loop ───────────────────────────────────────────────────────────
void NetServer::accept_loop(){
    while(running_.load()){
        sockaddr_in caddr{}; socklen_t clen = sizeof(caddr);
        int cfd = accept(server_fd_, (sockaddr*)&caddr, &clen);
        if(cfd < 0){
            if(errno == EINTR) continue;
            if(running_.load()) rfs_err("[NetServer] accept: %s", strerror(errno));
            break;
        }
        // set TCP keepalive
        int ka=1; setsockopt(cfd, SOL_SOCKET, SO_KEEPALIVE, &ka, sizeof(ka));

        reap_clients();

        auto conn = std::make_shared<ClientConn>();
        conn->fd = cfd;
        conn->id = next_id_.fetch_add(1);
        inet_ntop(AF_INET, &caddr.sin_addr, conn->peer, sizeof(conn->peer));
        conn->alive.store(true);

        {
            std::lock_guard<std::mutex> lk(clients_mtx_);
            clients_.push_back(conn);
        }
        rfs_log("[NetServer] client %d (%s) connected", conn->id, conn->peer);
        conn->thr = std::thread(&NetServer::client_loop, this, conn);
    }
}

// ── Client loop ───────────────────────────────────────────────────────────
void NetServer::client_loop(std::shared_ptr<ClientConn> c){
    std::vector<uint8_t> payload;
    while(c->alive.load()){
        PacketType type;
        if(!recv_packet(c->fd, type, payload)) break;
        handle_packet(c, type, payload.data(), (uint32_t)payload.size());
    }
    c->alive.store(false);
    {
        std::lock_guard<std::mutex> slk(c->send_mtx);
        if(c->fd >= 0){ close(c->fd); c->fd = -1; }
    }
    rfs_log("[NetServer] client %d (%s) disconnected", c->id, c->peer);
    c->done.store(true);
}

// ── Packet handler ────────────────────────────────────────────────────────
void NetServer::handle_packet(std::shared_ptr<ClientConn> c,
                               PacketType type,
                               const uint8_t* payload, uint32_t len){
    switch(type){

    case PacketType::SUBSCRIBE: {
        std::string prefix(reinterpret_cast<const char*>(payload), len);
        {
            std::lock_guard<std::mutex> slk(c->send_mtx);
            if(std::find(c->topics.begin(), c->topics.end(), prefix) == c->topics.end())
                c->topics.push_back(prefix);
            c->subscribed = true;
        }
        rfs_log("[NetServer] client %d subscribed to '%s'", c->id, prefix.c_str());
        break;
    }

    case PacketType::CMD: {
        std::string topic, body, reply;
        if(!split_topic_payload(payload, len, topic, body)){
            reply = "{\"ok\":false,\"error\":\"parse_error\"}";
        }else if(handler_){
            handler_(topic, body, reply);
        }else{
            reply = "{\"ok\":false,\"error\":\"unavailable\"}";
        }
        send_to(*c, make_packet(PacketType::CMD_ACK, reply.data(), (uint32_t)reply.size()));
        break;
    }

    case PacketType::DISCONNECT:
        c->alive.store(false);
        break;

    default:
        rfs_debug("[NetServer] client %d: ignored packet type 0x%02x", c->id, (unsigned)type);
        break;
    }
}

// ── send_to ───────────────────────────────────────────────────────────────
bool NetServer::send_to(ClientConn& c, const std::vector<uint8_t>& pkt){
    std::lock_guard<std::mutex> lk(c.send_mtx);
    if(!c.alive.load() || c.fd < 0) return false;
    if(!send_all(c.fd, pkt.data(), pkt.size())){
        // client thread notices on its next recv
        c.alive.store(false);
        shutdown(c.fd, SHUT_RDWR);
        return false;
    }
    return true;
}

// ── Publish ───────────────────────────────────────────────────────────────
bool NetServer::publish(const std::string& topic, const std::string& json){
    if(!running_.load()) return false;
    std::vector<std::shared_ptr<ClientConn>> targets;
    {
        std::lock_guard<std::mutex> lk(clients_mtx_);
        for(auto& c : clients_){
            if(!c->alive.load()) continue;
            std::lock_guard<std::mutex> slk(c->send_mtx);
            if(!c->subscribed) continue;
            for(auto& p : c->topics){
                if(topic.compare(0, p.size(), p) == 0){ targets.push_back(c); break; }
            }
        }
    }
    if(targets.empty()) return false;

    auto pkt = make_topic_packet(PacketType::DATA, topic, json);
    int sent = 0;
    for(auto& c : targets) if(send_to(*c, pkt)) sent++;
    return sent > 0;
}
