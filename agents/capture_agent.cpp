#include "agents/capture_agent.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <spdlog/spdlog.h>
#include "network_utils.hpp"

CaptureAgent::CaptureAgent(const CaptureConfig &config)
    : config(config), tunnel(loop)
{
    // The destructor does not run for a half built agent
    try
    {
        setup_discovery_listener();
        setup_reply_socket();
    }
    catch (const std::exception &)
    {
        close_sockets();
        throw;
    }
}

CaptureAgent::~CaptureAgent()
{
    running = false;
    tunnel.drop();
    loop.cancel_timer(reconnect_timer);
    loop.cancel_timer(connect_timer);
    close_sockets();
}

void CaptureAgent::close_sockets()
{
    if (discovery_fd >= 0)
        close(discovery_fd);
    if (reply_fd >= 0)
        close(reply_fd);
    discovery_fd = -1;
    reply_fd = -1;
}

void CaptureAgent::setup_discovery_listener()
{
    discovery_fd = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (discovery_fd < 0)
    {
        throw socket_error("socket failed");
    }

    // Other listeners on the discovery port keep working
    set_flag(discovery_fd, SOL_SOCKET, SO_REUSEADDR);
    set_flag(discovery_fd, SOL_SOCKET, SO_REUSEPORT);
    set_flag(discovery_fd, SOL_SOCKET, SO_BROADCAST);

    sockaddr_in addr;
    setup_sockaddr(addr, config.listen_addr, config.discovery_port);

    if (bind(discovery_fd, (sockaddr *)&addr, sizeof(addr)) < 0)
    {
        throw socket_error("Bind failed on discovery port " + endpoint_to_string(addr));
    }

    loop.add(discovery_fd, Source::DISCOVERY, EPOLLIN);
    spdlog::info("Listening for discovery broadcasts on {}", endpoint_to_string(addr));
}

void CaptureAgent::setup_reply_socket()
{
    reply_fd = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (reply_fd < 0)
    {
        throw socket_error("socket failed");
    }
}

void CaptureAgent::start()
{
    begin_connect();
}

void CaptureAgent::begin_connect()
{
    state = State::CONNECTING;
    attempts++;
    spdlog::info("Connecting to responder {}:{} ...", config.peer_host, config.tunnel_port);

    // Blocks the loop for the lookup. Only reached while the tunnel is
    // down, when captured queries are dropped anyway.
    sockaddr_in peer;
    int rc = resolve_ipv4(config.peer_host, config.tunnel_port, peer);
    if (rc == EAI_NONAME)
    {
        state = State::DISCONNECTED;
        throw ResolveError("Unknown host: " + config.peer_host);
    }
    if (rc != 0)
    {
        spdlog::info("Failed to resolve {}: {}", config.peer_host, gai_strerror(rc));
        state = State::DISCONNECTED;
        schedule_reconnect();
        return;
    }

    try
    {
        tunnel.replace(TunnelConnection::connect_to(peer));
    }
    catch (const std::system_error &e)
    {
        spdlog::info("Failed to connect: {}", e.what());
        state = State::DISCONNECTED;
        schedule_reconnect();
        return;
    }

    connect_timer = loop.add_timer(std::chrono::milliseconds(config.connect_timeout_ms));
}

void CaptureAgent::schedule_reconnect()
{
    loop.cancel_timer(reconnect_timer);
    reconnect_timer = loop.add_timer(std::chrono::milliseconds(config.reconnect_delay_ms));
}

void CaptureAgent::on_connected()
{
    loop.cancel_timer(connect_timer);
    connect_timer = -1;

    if (!tunnel.establish())
    {
        on_connection_lost(tunnel.get() ? tunnel.get()->last_error() : 0);
        return;
    }

    state = State::CONNECTED;
    reconnecting = false;
    tunnel_up = true;
    spdlog::info("Connected to responder: {}", tunnel.get()->peer_name());
}

void CaptureAgent::on_connection_lost(int error)
{
    loop.cancel_timer(connect_timer);
    connect_timer = -1;
    tunnel.drop();
    tunnel_up = false;

    if (state == State::CONNECTING)
    {
        spdlog::info("Failed to connect: {}. Retrying in {} ms ...",
                     error ? strerror(error) : "timed out", config.reconnect_delay_ms);
    }
    else
    {
        if (error)
            spdlog::info("Connection lost: {}", strerror(error));
        else
            spdlog::info("Connection lost");
        reconnecting = true;
    }

    state = State::DISCONNECTED;
    schedule_reconnect();
}

void CaptureAgent::on_timer(int fd)
{
    if (fd == reconnect_timer)
    {
        loop.cancel_timer(reconnect_timer);
        reconnect_timer = -1;
        if (reconnecting)
            spdlog::info("Attempting reconnection ...");
        begin_connect();
    }
    else if (fd == connect_timer)
    {
        if (state == State::CONNECTING)
        {
            on_connection_lost(ETIMEDOUT);
        }
        else
        {
            loop.cancel_timer(connect_timer);
            connect_timer = -1;
        }
    }
}

void CaptureAgent::collect(const Readiness &ready, std::vector<Event> &events)
{
    switch (ready.source)
    {
    case Source::DISCOVERY:
        read_datagrams(ready.fd, Source::DISCOVERY, events);
        break;
    case Source::TUNNEL:
        tunnel.collect(ready, events);
        break;
    case Source::TIMER:
        read_timer(ready.fd, events);
        break;
    default:
        break;
    }
}

void CaptureAgent::dispatch(Event &ev)
{
    if (ev.source == Source::TUNNEL && !tunnel.owns(ev.fd))
        return;

    switch (ev.type)
    {
    case Event::Type::CONNECTED:
        on_connected();
        break;
    case Event::Type::DISCONNECTED:
        on_connection_lost(tunnel.get()->last_error());
        break;
    case Event::Type::DATA:
        if (ev.source == Source::DISCOVERY)
            handle_discovery_datagram(ev);
        else
            handle_tunnel_data(ev);
        break;
    case Event::Type::TIMER_FIRED:
        on_timer(ev.fd);
        break;
    }
}

void CaptureAgent::after_dispatch()
{
    // A write inside dispatch may have killed the connection
    if (state == State::CONNECTED && tunnel.has_connection() && !tunnel.get()->is_alive())
    {
        on_connection_lost(tunnel.get()->last_error());
    }
}

void CaptureAgent::shutdown()
{
    tunnel.drop();
    tunnel_up = false;
    state = State::DISCONNECTED;
}

void CaptureAgent::handle_discovery_datagram(const Event &ev)
{
    if (!tunnel.connected())
    {
        dropped++;
        spdlog::debug("Dropping {} bytes from {}: tunnel is down",
                      ev.data.size(), endpoint_to_string(ev.from));
        return;
    }

    spdlog::debug("UDP broadcast received {} bytes from {}", ev.data.size(), endpoint_to_string(ev.from));

    auto envelope = Envelope::from_datagram(ev.from, ev.data.data(), ev.data.size());
    if (!tunnel.send(envelope))
    {
        spdlog::debug("Tunnel write failed, query from {} lost", envelope.source_string());
    }
}

void CaptureAgent::handle_tunnel_data(const Event &ev)
{
    spdlog::debug("Received {} bytes from responder", ev.data.size());

    std::vector<std::vector<uint8_t>> bodies;
    tunnel.get()->decode(ev.data, bodies);

    for (const auto &body : bodies)
    {
        try
        {
            relay_reply(decode_envelope(body));
        }
        catch (const MalformedEnvelope &e)
        {
            spdlog::warn("Discarding message from responder: {}", e.what());
        }
    }
}

void CaptureAgent::relay_reply(const Envelope &reply)
{
    sockaddr_in dest = reply.source();
    spdlog::debug("Replying with {} bytes to {}", reply.payload.size(), reply.source_string());

    if (sendto(reply_fd, reply.payload.data(), reply.payload.size(), 0,
               (const sockaddr *)&dest, sizeof(dest)) < 0)
    {
        spdlog::warn("Reply to {} failed: {}", reply.source_string(), strerror(errno));
    }
}
