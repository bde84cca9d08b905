#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <string>

// HDHomeRun discovery port (libhdhomerun hdhomerun_pkt.h)
constexpr uint16_t DISCOVER_UDP_PORT = 65001;
// The tunnel reuses the discovery port number unless told otherwise
constexpr uint16_t DEFAULT_TUNNEL_PORT = DISCOVER_UDP_PORT;

// How long a responder keeps a query socket open for replies.
// Device count is unknown, so the window is closed by time only.
constexpr int COLLECTION_WINDOW_MS = 500;
constexpr int RECONNECT_DELAY_MS = 3000;
constexpr int CONNECT_TIMEOUT_MS = 5000;

constexpr int POLL_INTERVAL_MS = 100;
constexpr int BUFFER_SIZE = 65536;
constexpr int MAX_EVENTS = 64;
constexpr int LISTEN_BACKLOG = 16;

constexpr const char *LIMITED_BROADCAST_ADDR = "255.255.255.255";
constexpr const char *ANY_ADDR = "0.0.0.0";

struct CaptureConfig
{
    std::string peer_host;
    uint16_t tunnel_port = DEFAULT_TUNNEL_PORT;
    std::string listen_addr = LIMITED_BROADCAST_ADDR;
    uint16_t discovery_port = DISCOVER_UDP_PORT;
    int reconnect_delay_ms = RECONNECT_DELAY_MS;
    int connect_timeout_ms = CONNECT_TIMEOUT_MS;
};

struct ResponderConfig
{
    std::string bind_addr = ANY_ADDR;
    uint16_t tunnel_port = DEFAULT_TUNNEL_PORT;
    std::string broadcast_addr = LIMITED_BROADCAST_ADDR;
    uint16_t discovery_port = DISCOVER_UDP_PORT;
    int window_ms = COLLECTION_WINDOW_MS;
};

struct DumpConfig
{
    std::string listen_addr = LIMITED_BROADCAST_ADDR;
    uint16_t discovery_port = DISCOVER_UDP_PORT;
};

#endif
