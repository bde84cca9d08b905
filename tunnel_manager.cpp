#include "tunnel_manager.hpp"
#include <sys/epoll.h>

TunnelManager::TunnelManager(EventLoop &loop) : loop(loop)
{
}

TunnelManager::~TunnelManager()
{
    drop();
}

void TunnelManager::replace(std::unique_ptr<TunnelConnection> conn)
{
    drop();
    current = std::move(conn);
    if (!current)
        return;
    current_generation = ++generations;

    uint32_t events = current->is_connecting() ? EPOLLOUT : EPOLLIN;
    loop.add(current->get_fd(), Source::TUNNEL, events);
}

void TunnelManager::drop()
{
    if (!current)
        return;
    loop.remove(current->get_fd());
    current.reset();
    current_generation = 0;
}

void TunnelManager::update_interest()
{
    if (!current || !current->is_alive())
        return;

    uint32_t events;
    if (current->is_connecting())
        events = EPOLLOUT;
    else
        events = EPOLLIN | (current->wants_write() ? EPOLLOUT : 0);
    loop.modify(current->get_fd(), Source::TUNNEL, events);
}

void TunnelManager::collect(const Readiness &ready, std::vector<Event> &events)
{
    if (!owns(ready.fd))
        return;

    Event ev;
    ev.source = Source::TUNNEL;
    ev.fd = ready.fd;
    ev.from = current->get_peer();

    if (current->is_connecting())
    {
        ev.type = current->finish_connect() == 0 ? Event::Type::CONNECTED : Event::Type::DISCONNECTED;
        events.push_back(std::move(ev));
        return;
    }

    bool open = true;
    if (ready.events & EPOLLOUT)
    {
        open = current->flush();
        update_interest();
    }

    if (open && (ready.events & (EPOLLIN | EPOLLHUP | EPOLLERR)))
    {
        open = current->receive(ev.data);
        if (!ev.data.empty())
        {
            Event data_ev;
            data_ev.type = Event::Type::DATA;
            data_ev.source = Source::TUNNEL;
            data_ev.fd = ready.fd;
            data_ev.from = ev.from;
            data_ev.data.swap(ev.data);
            events.push_back(std::move(data_ev));
        }
    }

    if (!open)
    {
        ev.type = Event::Type::DISCONNECTED;
        events.push_back(std::move(ev));
    }
}

bool TunnelManager::establish()
{
    if (!current || current->is_connecting() || !current->is_alive())
        return false;
    update_interest();
    return true;
}

bool TunnelManager::send(const Envelope &envelope)
{
    if (!connected())
        return false;

    bool ok = current->send_frame(encode_envelope(envelope));
    update_interest();
    return ok;
}
