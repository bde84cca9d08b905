#include "session_store.hpp"
#include <unistd.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include "network_utils.hpp"

QuerySession::QuerySession(int sockfd, int timer_fd, const Envelope &query, Clock::time_point deadline)
    : sockfd(sockfd), timer_fd(timer_fd),
      source_address(query.address), source_port(query.port),
      deadline(deadline)
{
}

QuerySession::~QuerySession()
{
    if (sockfd >= 0)
        close(sockfd);
}

Envelope QuerySession::reply(const uint8_t *data, size_t len) const
{
    Envelope envelope;
    envelope.address = source_address;
    envelope.port = source_port;
    envelope.payload.assign(data, data + len);
    return envelope;
}

SessionStore::SessionStore(EventLoop &loop) : loop(loop)
{
}

SessionStore::~SessionStore()
{
    close_all();
}

QuerySession *SessionStore::open(const Envelope &query, uint64_t generation,
                                 const sockaddr_in &broadcast, std::chrono::milliseconds window)
{
    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        throw socket_error("socket failed");
    }

    // Owns fd from here on
    auto session = std::make_unique<QuerySession>(fd, -1, query, QuerySession::Clock::now() + window);
    session->generation = generation;

    set_flag(fd, SOL_SOCKET, SO_BROADCAST);

    if (sendto(fd, query.payload.data(), query.payload.size(), 0,
               (const sockaddr *)&broadcast, sizeof(broadcast)) < 0)
    {
        throw socket_error("broadcast to " + endpoint_to_string(broadcast) + " failed");
    }

    loop.add(fd, Source::QUERY, EPOLLIN);
    try
    {
        session->timer_fd = loop.add_timer(window);
    }
    catch (...)
    {
        loop.remove(fd);
        throw;
    }

    timer_to_socket[session->timer_fd] = fd;
    QuerySession *raw = session.get();
    sessions[fd] = std::move(session);
    return raw;
}

QuerySession *SessionStore::find(int sockfd)
{
    auto it = sessions.find(sockfd);
    if (it == sessions.end())
        return nullptr;
    return it->second.get();
}

long SessionStore::close_expired(int timer_fd)
{
    auto it = timer_to_socket.find(timer_fd);
    if (it == timer_to_socket.end())
        return -1;

    int fd = it->second;
    timer_to_socket.erase(it);
    loop.cancel_timer(timer_fd);

    long replies = 0;
    auto session = sessions.find(fd);
    if (session != sessions.end())
    {
        replies = static_cast<long>(session->second->replies);
        loop.remove(fd);
        retired.push_back(std::move(session->second));
        sessions.erase(session);
    }
    return replies;
}

void SessionStore::reap()
{
    retired.clear();
}

void SessionStore::close_all()
{
    for (auto &entry : sessions)
    {
        loop.remove(entry.first);
        loop.cancel_timer(entry.second->timer_fd);
    }
    sessions.clear();
    timer_to_socket.clear();
    retired.clear();
}
