#ifndef TUNNEL_MANAGER_HPP
#define TUNNEL_MANAGER_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "connection.hpp"
#include "event_loop.hpp"
#include "codec/envelope.hpp"

// Owns the single live tunnel connection of an agent. Every write to the
// tunnel goes through send(); a new connection replaces the old one.
class TunnelManager
{
private:
    EventLoop &loop;
    std::unique_ptr<TunnelConnection> current;
    uint64_t generations = 0;
    uint64_t current_generation = 0;

    void update_interest();

public:
    explicit TunnelManager(EventLoop &loop);
    ~TunnelManager();

    void replace(std::unique_ptr<TunnelConnection> conn);
    void drop();

    // Turns readiness of the tunnel socket into CONNECTED, DATA and
    // DISCONNECTED events. Readiness of a replaced socket is ignored.
    void collect(const Readiness &ready, std::vector<Event> &events);

    // Marks a completed connect; false when the connect failed
    bool establish();

    // Frames the envelope onto the live connection. Returns false when
    // there is no connected tunnel or the write failed.
    bool send(const Envelope &envelope);

    // Number of the live connection, unique per replace(); 0 without one
    uint64_t generation() const { return current_generation; }

    bool has_connection() const { return current != nullptr; }
    bool connected() const { return current && !current->is_connecting() && current->is_alive(); }
    bool owns(int fd) const { return current && current->get_fd() == fd; }
    TunnelConnection *get() { return current.get(); }
};

#endif
