#include "event_loop.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>
#include <sys/epoll.h>
#include <sys/timerfd.h>
#include "config.hpp"
#include "network_utils.hpp"

namespace
{

// epoll_data is a union, so fd and source share one 64-bit slot
uint64_t pack(int fd, Source source)
{
    return (static_cast<uint64_t>(source) << 32) | static_cast<uint32_t>(fd);
}

}

EventLoop::EventLoop()
{
    epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd < 0)
    {
        throw socket_error("epoll_create1 failed");
    }
}

EventLoop::~EventLoop()
{
    if (epoll_fd >= 0)
        close(epoll_fd);
}

void EventLoop::add(int fd, Source source, uint32_t events)
{
    epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.u64 = pack(fd, source);
    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &ev) < 0)
    {
        throw socket_error("epoll_ctl(ADD) failed");
    }
}

void EventLoop::modify(int fd, Source source, uint32_t events)
{
    epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.u64 = pack(fd, source);
    if (epoll_ctl(epoll_fd, EPOLL_CTL_MOD, fd, &ev) < 0)
    {
        throw socket_error("epoll_ctl(MOD) failed");
    }
}

void EventLoop::remove(int fd)
{
    // The descriptor may already be gone from the set; nothing to undo then
    epoll_ctl(epoll_fd, EPOLL_CTL_DEL, fd, nullptr);
}

int EventLoop::add_timer(std::chrono::milliseconds delay)
{
    int timer_fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd < 0)
    {
        throw socket_error("timerfd_create failed");
    }

    itimerspec spec;
    memset(&spec, 0, sizeof(spec));
    auto ms = delay.count() > 0 ? delay.count() : 1;
    spec.it_value.tv_sec = ms / 1000;
    spec.it_value.tv_nsec = (ms % 1000) * 1000000L;

    if (timerfd_settime(timer_fd, 0, &spec, nullptr) < 0)
    {
        auto error = socket_error("timerfd_settime failed");
        close(timer_fd);
        throw error;
    }

    try
    {
        add(timer_fd, Source::TIMER, EPOLLIN);
    }
    catch (...)
    {
        close(timer_fd);
        throw;
    }
    return timer_fd;
}

void EventLoop::cancel_timer(int timer_fd)
{
    if (timer_fd < 0)
        return;
    remove(timer_fd);
    close(timer_fd);
}

bool EventLoop::timer_expired(int timer_fd) const
{
    itimerspec spec;
    if (timerfd_gettime(timer_fd, &spec) < 0)
        return false;
    return spec.it_value.tv_sec == 0 && spec.it_value.tv_nsec == 0;
}

std::vector<Readiness> EventLoop::wait(int timeout_ms)
{
    epoll_event events[MAX_EVENTS];
    std::vector<Readiness> ready;

    int nfds = epoll_wait(epoll_fd, events, MAX_EVENTS, timeout_ms);
    if (nfds < 0)
    {
        if (errno == EINTR)
            return ready;
        throw socket_error("epoll_wait failed");
    }

    ready.reserve(nfds);
    for (int i = 0; i < nfds; ++i)
    {
        uint64_t data = events[i].data.u64;
        ready.push_back(Readiness{static_cast<int>(data & 0xFFFFFFFFu),
                                  static_cast<Source>(data >> 32),
                                  events[i].events});
    }
    return ready;
}
