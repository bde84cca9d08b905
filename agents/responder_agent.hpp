#ifndef RESPONDER_AGENT_HPP
#define RESPONDER_AGENT_HPP

#include <atomic>
#include <netinet/in.h>
#include "agents/agent.hpp"
#include "config.hpp"
#include "session_store.hpp"
#include "tunnel_manager.hpp"

// Runs next to the devices. Accepts the tunnel from a capture agent,
// replays every query as a local broadcast, and sends each reply that
// arrives within the collection window back through the tunnel.
//
// One capture agent at a time: a new inbound tunnel replaces the current one.
class ResponderAgent : public Agent
{
private:
    ResponderConfig config;
    TunnelManager tunnel;
    SessionStore sessions;
    sockaddr_in broadcast_addr;
    int listen_fd = -1;

    std::atomic<bool> tunnel_up{false};
    std::atomic<size_t> relayed{0};

    void setup_listener();
    void accept_connections(std::vector<Event> &events);

    void on_peer_connected(const Event &ev);
    void on_peer_disconnected();
    void handle_tunnel_data(const Event &ev);
    void open_query(const Envelope &query);
    void handle_reply(const Event &ev);
    void close_window(int timer_fd);

protected:
    void start() override;
    void collect(const Readiness &ready, std::vector<Event> &events) override;
    void dispatch(Event &ev) override;
    void after_dispatch() override;
    void shutdown() override;

public:
    explicit ResponderAgent(const ResponderConfig &config);
    ~ResponderAgent();

    bool tunnel_connected() const { return tunnel_up; }
    // Replies sent back through the tunnel so far
    size_t relayed_replies() const { return relayed; }
};

#endif
