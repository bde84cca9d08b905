#include "agents/responder_agent.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <spdlog/spdlog.h>
#include "network_utils.hpp"

ResponderAgent::ResponderAgent(const ResponderConfig &config)
    : config(config), tunnel(loop), sessions(loop)
{
    setup_sockaddr(broadcast_addr, config.broadcast_addr, config.discovery_port);
    try
    {
        setup_listener();
    }
    catch (const std::exception &)
    {
        if (listen_fd >= 0)
            close(listen_fd);
        listen_fd = -1;
        throw;
    }
}

ResponderAgent::~ResponderAgent()
{
    running = false;
    sessions.close_all();
    tunnel.drop();
    if (listen_fd >= 0)
        close(listen_fd);
}

void ResponderAgent::setup_listener()
{
    listen_fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd < 0)
    {
        throw socket_error("socket failed");
    }
    set_flag(listen_fd, SOL_SOCKET, SO_REUSEADDR);

    sockaddr_in addr;
    setup_sockaddr(addr, config.bind_addr, config.tunnel_port);

    if (bind(listen_fd, (sockaddr *)&addr, sizeof(addr)) < 0)
    {
        throw socket_error("Bind failed on tunnel port " + endpoint_to_string(addr));
    }
    if (listen(listen_fd, LISTEN_BACKLOG) < 0)
    {
        throw socket_error("listen failed");
    }

    loop.add(listen_fd, Source::TUNNEL_LISTENER, EPOLLIN);
    spdlog::info("Waiting for capture agent on {}", endpoint_to_string(addr));
}

void ResponderAgent::start()
{
    spdlog::info("Relaying queries to {} with a {} ms collection window",
                 endpoint_to_string(broadcast_addr), config.window_ms);
}

void ResponderAgent::collect(const Readiness &ready, std::vector<Event> &events)
{
    switch (ready.source)
    {
    case Source::TUNNEL_LISTENER:
        accept_connections(events);
        break;
    case Source::TUNNEL:
        tunnel.collect(ready, events);
        break;
    case Source::QUERY:
        read_datagrams(ready.fd, Source::QUERY, events);
        break;
    case Source::TIMER:
        read_timer(ready.fd, events);
        break;
    default:
        break;
    }
}

void ResponderAgent::accept_connections(std::vector<Event> &events)
{
    while (true)
    {
        Event ev;
        socklen_t addr_len = sizeof(ev.from);
        int fd = accept4(listen_fd, (sockaddr *)&ev.from, &addr_len, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                spdlog::warn("accept failed: {}", strerror(errno));
            return;
        }

        ev.type = Event::Type::CONNECTED;
        ev.source = Source::TUNNEL_LISTENER;
        ev.fd = fd;
        events.push_back(std::move(ev));
    }
}

void ResponderAgent::dispatch(Event &ev)
{
    if (ev.source == Source::TUNNEL && !tunnel.owns(ev.fd))
        return;

    switch (ev.type)
    {
    case Event::Type::CONNECTED:
        on_peer_connected(ev);
        break;
    case Event::Type::DISCONNECTED:
        on_peer_disconnected();
        break;
    case Event::Type::DATA:
        if (ev.source == Source::TUNNEL)
            handle_tunnel_data(ev);
        else
            handle_reply(ev);
        break;
    case Event::Type::TIMER_FIRED:
        close_window(ev.fd);
        break;
    }
}

void ResponderAgent::after_dispatch()
{
    sessions.reap();

    if (tunnel.has_connection() && !tunnel.get()->is_alive())
    {
        on_peer_disconnected();
    }
}

void ResponderAgent::shutdown()
{
    sessions.close_all();
    tunnel.drop();
    tunnel_up = false;
}

void ResponderAgent::on_peer_connected(const Event &ev)
{
    if (tunnel.has_connection())
    {
        spdlog::info("Capture agent at {} replaces {}",
                     endpoint_to_string(ev.from), tunnel.get()->peer_name());
    }
    else
    {
        spdlog::info("Capture agent at {} connected", endpoint_to_string(ev.from));
    }

    tunnel.replace(std::make_unique<TunnelConnection>(ev.fd, ev.from));
    tunnel_up = true;
}

void ResponderAgent::on_peer_disconnected()
{
    if (!tunnel.has_connection())
        return;

    int error = tunnel.get()->last_error();
    if (error)
        spdlog::info("Capture agent {} disconnected: {}", tunnel.get()->peer_name(), strerror(error));
    else
        spdlog::info("Capture agent {} disconnected", tunnel.get()->peer_name());

    tunnel.drop();
    tunnel_up = false;
}

void ResponderAgent::handle_tunnel_data(const Event &ev)
{
    std::vector<std::vector<uint8_t>> bodies;
    tunnel.get()->decode(ev.data, bodies);

    for (const auto &body : bodies)
    {
        try
        {
            open_query(decode_envelope(body));
        }
        catch (const MalformedEnvelope &e)
        {
            spdlog::warn("Discarding message from capture agent: {}", e.what());
        }
    }
}

void ResponderAgent::open_query(const Envelope &query)
{
    spdlog::debug("Broadcasting {} byte query from {}", query.payload.size(), query.source_string());

    try
    {
        sessions.open(query, tunnel.generation(), broadcast_addr, std::chrono::milliseconds(config.window_ms));
    }
    catch (const std::system_error &e)
    {
        spdlog::warn("Query from {} not relayed: {}", query.source_string(), e.what());
    }
}

void ResponderAgent::handle_reply(const Event &ev)
{
    QuerySession *session = sessions.find(ev.fd);
    if (!session)
        return;

    if (session->expired(QuerySession::Clock::now()))
    {
        spdlog::debug("Late reply of {} bytes from {} discarded", ev.data.size(), endpoint_to_string(ev.from));
        return;
    }

    if (session->generation != tunnel.generation())
    {
        spdlog::debug("Reply of {} bytes from {} dropped: its tunnel was replaced",
                      ev.data.size(), endpoint_to_string(ev.from));
        return;
    }

    auto reply = session->reply(ev.data.data(), ev.data.size());
    session->replies++;

    spdlog::debug("Reply of {} bytes from {} for {}", ev.data.size(),
                  endpoint_to_string(ev.from), reply.source_string());

    if (tunnel.send(reply))
        relayed++;
    else
        spdlog::debug("No tunnel, reply for {} lost", reply.source_string());
}

void ResponderAgent::close_window(int timer_fd)
{
    long replies = sessions.close_expired(timer_fd);
    if (replies >= 0)
        spdlog::debug("Collection window closed after {} replies", replies);
}
