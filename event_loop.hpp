#ifndef EVENT_LOOP_HPP
#define EVENT_LOOP_HPP

#include <chrono>
#include <cstdint>
#include <vector>
#include <netinet/in.h>

// What a registered descriptor is, so a dispatcher can route its readiness
enum class Source : uint32_t
{
    TUNNEL,
    TUNNEL_LISTENER,
    DISCOVERY,
    QUERY,
    TIMER
};

struct Readiness
{
    int fd;
    Source source;
    uint32_t events;
};

// Typed events the agents dispatch on
struct Event
{
    enum class Type
    {
        CONNECTED,
        DISCONNECTED,
        DATA,
        TIMER_FIRED
    };

    Type type;
    Source source;
    int fd;
    std::vector<uint8_t> data;
    sockaddr_in from{};
};

// Single-threaded epoll reactor. Timers are one-shot timerfds living in
// the same epoll set as the sockets.
class EventLoop
{
private:
    int epoll_fd;

public:
    EventLoop();
    ~EventLoop();
    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    void add(int fd, Source source, uint32_t events);
    void modify(int fd, Source source, uint32_t events);
    void remove(int fd);

    // Returns the timerfd; it becomes readable once after delay
    int add_timer(std::chrono::milliseconds delay);
    void cancel_timer(int timer_fd);
    // False for a timer that is still armed or no longer exists, which is
    // how stale expiries of a recycled descriptor number are recognised
    bool timer_expired(int timer_fd) const;

    std::vector<Readiness> wait(int timeout_ms);
};

#endif
