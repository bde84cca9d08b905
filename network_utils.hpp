#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <cstring>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <fcntl.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

// Envelopes only carry IPv4 addresses, so everything here is AF_INET.

inline std::system_error socket_error(const std::string &what)
{
    return std::system_error(errno, std::generic_category(), what);
}

// Setup sockaddr_in for a dotted-quad address and port
inline void setup_sockaddr(sockaddr_in &addr, const std::string &host, uint16_t port)
{
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
    {
        throw std::runtime_error("Invalid IPv4 address: " + host);
    }
}

inline std::string endpoint_to_string(const sockaddr_in &addr)
{
    char str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, str, INET_ADDRSTRLEN);
    return std::string(str) + ":" + std::to_string(ntohs(addr.sin_port));
}

inline void set_nonblocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        throw socket_error("fcntl(O_NONBLOCK) failed");
    }
}

inline void set_flag(int fd, int level, int option)
{
    int opt = 1;
    if (setsockopt(fd, level, option, &opt, sizeof(opt)) < 0)
    {
        throw socket_error("setsockopt failed");
    }
}

// Resolve host to an IPv4 endpoint. Returns the getaddrinfo() status,
// 0 on success. Blocking; callers on an event loop stall for the lookup.
inline int resolve_ipv4(const std::string &host, uint16_t port, sockaddr_in &out)
{
    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0)
        return rc;

    memcpy(&out, result->ai_addr, sizeof(sockaddr_in));
    out.sin_port = htons(port);
    freeaddrinfo(result);
    return 0;
}

#endif
