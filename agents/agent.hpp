#ifndef AGENT_HPP
#define AGENT_HPP

#include <atomic>
#include <vector>
#include "event_loop.hpp"

// Base of the bridge processes. run() owns the thread that calls it:
// readiness is gathered into typed events, then each event goes through
// the agent's dispatch().
class Agent
{
protected:
    std::atomic<bool> running{true};
    EventLoop loop;

    // Sockets and the first connect attempt; called at the top of run()
    virtual void start() = 0;
    virtual void collect(const Readiness &ready, std::vector<Event> &events) = 0;
    virtual void dispatch(Event &ev) = 0;
    // Called after every batch of events
    virtual void after_dispatch() {}
    virtual void shutdown() {}

    // Reads every queued datagram of fd into one DATA event each
    static void read_datagrams(int fd, Source source, std::vector<Event> &events);
    // Consumes a timerfd expiry into a TIMER_FIRED event
    static void read_timer(int fd, std::vector<Event> &events);

public:
    virtual ~Agent() = default;
    virtual void run();
    virtual void stop() { running = false; }
    bool is_running() const { return running; }
};

#endif
