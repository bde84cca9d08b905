#include "agents/agent.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "network_utils.hpp"

void Agent::run()
{
    start();

    std::vector<Event> events;
    while (running)
    {
        events.clear();
        for (const auto &ready : loop.wait(POLL_INTERVAL_MS))
        {
            collect(ready, events);
        }

        for (auto &ev : events)
        {
            if (ev.type == Event::Type::TIMER_FIRED && !loop.timer_expired(ev.fd))
                continue;
            dispatch(ev);
        }
        after_dispatch();
    }

    shutdown();
    spdlog::info("Exiting ...");
}

void Agent::read_datagrams(int fd, Source source, std::vector<Event> &events)
{
    uint8_t buffer[BUFFER_SIZE];

    while (true)
    {
        Event ev;
        ev.type = Event::Type::DATA;
        ev.source = source;
        ev.fd = fd;
        socklen_t addr_len = sizeof(ev.from);

        ssize_t len = recvfrom(fd, buffer, sizeof(buffer), 0, (sockaddr *)&ev.from, &addr_len);
        if (len < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                spdlog::debug("recvfrom failed: {}", strerror(errno));
            return;
        }

        ev.data.assign(buffer, buffer + len);
        events.push_back(std::move(ev));
    }
}

void Agent::read_timer(int fd, std::vector<Event> &events)
{
    uint64_t expirations = 0;
    if (read(fd, &expirations, sizeof(expirations)) != sizeof(expirations))
        return;

    Event ev;
    ev.type = Event::Type::TIMER_FIRED;
    ev.source = Source::TIMER;
    ev.fd = fd;
    events.push_back(std::move(ev));
}
