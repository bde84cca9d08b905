#ifndef SESSION_STORE_HPP
#define SESSION_STORE_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>
#include <netinet/in.h>
#include "event_loop.hpp"
#include "codec/envelope.hpp"

// One relayed query: its ephemeral broadcast socket, the window timer,
// and the client endpoint every reply is addressed back to.
class QuerySession
{
public:
    using Clock = std::chrono::steady_clock;

    QuerySession(int sockfd, int timer_fd, const Envelope &query, Clock::time_point deadline);
    ~QuerySession();
    QuerySession(const QuerySession &) = delete;
    QuerySession &operator=(const QuerySession &) = delete;

    bool expired(Clock::time_point now) const { return now >= deadline; }

    // The reply addressed to the client that sent the query
    Envelope reply(const uint8_t *data, size_t len) const;

    int sockfd;
    int timer_fd;
    std::array<uint8_t, 4> source_address;
    uint16_t source_port;
    Clock::time_point deadline;
    // Tunnel the query came in on; replies only go back on that one
    uint64_t generation = 0;
    size_t replies = 0;
};

// Open query windows of a responder, keyed by socket and by timer
class SessionStore
{
private:
    EventLoop &loop;
    std::unordered_map<int, std::unique_ptr<QuerySession>> sessions;
    std::unordered_map<int, int> timer_to_socket;
    // Closed windows whose sockets stay open until reap(), so a descriptor
    // number is not recycled while events for it may still be queued
    std::vector<std::unique_ptr<QuerySession>> retired;

public:
    explicit SessionStore(EventLoop &loop);
    ~SessionStore();

    // Broadcasts the query payload from a fresh socket and opens its
    // collection window. Throws std::system_error if the socket cannot be
    // set up or the broadcast cannot be sent.
    QuerySession *open(const Envelope &query, uint64_t generation,
                       const sockaddr_in &broadcast, std::chrono::milliseconds window);

    QuerySession *find(int sockfd);

    // Closes the window owning timer_fd. Returns the closed session's reply
    // count, or -1 when the timer belongs to no open window.
    long close_expired(int timer_fd);

    void reap();
    void close_all();
    size_t size() const { return sessions.size(); }
};

#endif
