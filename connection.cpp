#include "connection.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/tcp.h>
#include "config.hpp"
#include "network_utils.hpp"

std::unique_ptr<TunnelConnection> TunnelConnection::connect_to(const sockaddr_in &peer)
{
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        throw socket_error("socket failed");
    }

    if (connect(fd, (const sockaddr *)&peer, sizeof(peer)) < 0 && errno != EINPROGRESS)
    {
        auto error = socket_error("connect to " + endpoint_to_string(peer) + " failed");
        close(fd);
        throw error;
    }

    // Completion, even an immediate one, is reported when the socket turns writable
    return std::make_unique<TunnelConnection>(fd, peer, true);
}

TunnelConnection::TunnelConnection(int fd, const sockaddr_in &peer, bool connecting)
    : sockfd(fd), peer(peer), connecting(connecting)
{
    configure();
}

TunnelConnection::~TunnelConnection()
{
    if (sockfd >= 0)
    {
        close(sockfd);
    }
}

void TunnelConnection::configure()
{
    set_nonblocking(sockfd);
    int flag = 1;
    setsockopt(sockfd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    setsockopt(sockfd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
}

int TunnelConnection::finish_connect()
{
    int status = 0;
    socklen_t len = sizeof(status);
    if (getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &status, &len) < 0)
    {
        status = errno;
    }

    if (status == 0)
    {
        connecting = false;
    }
    else
    {
        alive = false;
        error = status;
    }
    return status;
}

bool TunnelConnection::receive(std::vector<uint8_t> &data)
{
    uint8_t buffer[BUFFER_SIZE];

    while (true)
    {
        ssize_t len = recv(sockfd, buffer, sizeof(buffer), 0);
        if (len > 0)
        {
            data.insert(data.end(), buffer, buffer + len);
            continue;
        }
        if (len < 0 && errno == EINTR)
            continue;
        if (len < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            return true;

        alive = false;
        error = len < 0 ? errno : 0;
        return false;
    }
}

void TunnelConnection::decode(const std::vector<uint8_t> &data, std::vector<std::vector<uint8_t>> &bodies)
{
    decoder.decode(data.data(), data.size(),
                   [&bodies](std::vector<uint8_t> &&body)
                   {
                       bodies.push_back(std::move(body));
                   });
}

bool TunnelConnection::send_frame(const std::vector<uint8_t> &body)
{
    if (!alive)
        return false;

    auto frame = encode_frame(body);
    outbound.insert(outbound.end(), frame.begin(), frame.end());
    return flush();
}

bool TunnelConnection::flush()
{
    if (!alive)
        return false;
    if (connecting)
        return true;

    size_t sent = 0;
    while (sent < outbound.size())
    {
        ssize_t len = send(sockfd, outbound.data() + sent, outbound.size() - sent, MSG_NOSIGNAL);
        if (len > 0)
        {
            sent += len;
            continue;
        }
        if (len < 0 && errno == EINTR)
            continue;
        if (len < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            break;

        alive = false;
        error = errno;
        outbound.clear();
        return false;
    }

    outbound.erase(outbound.begin(), outbound.begin() + sent);
    return true;
}

std::string TunnelConnection::peer_name() const
{
    return endpoint_to_string(peer);
}
