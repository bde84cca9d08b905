#ifndef CAPTURE_AGENT_HPP
#define CAPTURE_AGENT_HPP

#include <atomic>
#include <stdexcept>
#include <string>
#include "agents/agent.hpp"
#include "config.hpp"
#include "tunnel_manager.hpp"

// The responder host does not exist. Retrying cannot help.
class ResolveError : public std::runtime_error
{
public:
    explicit ResolveError(const std::string &what) : std::runtime_error(what) {}
};

// Runs next to the discovery clients. Captures their broadcast queries,
// ships them through the tunnel, and unicasts relayed replies back to
// whichever client asked.
class CaptureAgent : public Agent
{
private:
    enum class State
    {
        DISCONNECTED,
        CONNECTING,
        CONNECTED
    };

    CaptureConfig config;
    TunnelManager tunnel;
    State state = State::DISCONNECTED;
    int discovery_fd = -1;
    int reply_fd = -1;
    int reconnect_timer = -1;
    int connect_timer = -1;
    bool reconnecting = false;

    std::atomic<bool> tunnel_up{false};
    std::atomic<size_t> dropped{0};
    std::atomic<size_t> attempts{0};

    void setup_discovery_listener();
    void setup_reply_socket();
    void close_sockets();

    void begin_connect();
    void schedule_reconnect();
    void on_connected();
    void on_connection_lost(int error);
    void on_timer(int fd);

    void handle_discovery_datagram(const Event &ev);
    void handle_tunnel_data(const Event &ev);
    void relay_reply(const Envelope &reply);

protected:
    void start() override;
    void collect(const Readiness &ready, std::vector<Event> &events) override;
    void dispatch(Event &ev) override;
    void after_dispatch() override;
    void shutdown() override;

public:
    explicit CaptureAgent(const CaptureConfig &config);
    ~CaptureAgent();

    bool tunnel_connected() const { return tunnel_up; }
    // Queries discarded because no tunnel was up when they arrived
    size_t dropped_queries() const { return dropped; }

    size_t connect_attempts() const { return attempts; }
};

#endif
