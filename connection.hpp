#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <memory>
#include <string>
#include <vector>
#include <netinet/in.h>
#include "codec/frame_codec.hpp"

// One end of the TCP tunnel: the socket, the decoder for its inbound
// stream, and whatever outbound bytes the kernel has not taken yet.
class TunnelConnection
{
private:
    int sockfd;
    sockaddr_in peer;
    bool connecting;
    bool alive = true;
    int error = 0;
    FrameDecoder decoder;
    std::vector<uint8_t> outbound;

    void configure();

public:
    // Starts a non-blocking connect. Throws std::system_error when the
    // attempt fails before it is even in progress.
    static std::unique_ptr<TunnelConnection> connect_to(const sockaddr_in &peer);

    // Wraps a socket returned by accept()
    TunnelConnection(int fd, const sockaddr_in &peer, bool connecting = false);
    ~TunnelConnection();
    TunnelConnection(const TunnelConnection &) = delete;
    TunnelConnection &operator=(const TunnelConnection &) = delete;

    // Result of a pending connect: 0 or the socket error
    int finish_connect();

    // Appends everything readable to data. Returns false once the peer
    // closed the stream or the socket failed.
    bool receive(std::vector<uint8_t> &data);

    // Splits received stream bytes into complete frame bodies
    void decode(const std::vector<uint8_t> &data, std::vector<std::vector<uint8_t>> &bodies);

    // Frames body and writes it, queueing what does not fit in the socket
    // buffer. Returns false when the connection is dead.
    bool send_frame(const std::vector<uint8_t> &body);
    bool flush();

    bool wants_write() const { return !outbound.empty(); }
    bool is_connecting() const { return connecting; }
    bool is_alive() const { return alive; }
    // errno that killed the connection, 0 for an orderly close by the peer
    int last_error() const { return error; }
    int get_fd() const { return sockfd; }
    const sockaddr_in &get_peer() const { return peer; }
    std::string peer_name() const;
};

#endif
