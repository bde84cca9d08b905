#include "agents/packet_dumper.hpp"
#include <cstdio>
#include <unistd.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <spdlog/spdlog.h>
#include "network_utils.hpp"

PacketDumper::PacketDumper(const DumpConfig &config) : config(config)
{
    try
    {
        setup_listener();
    }
    catch (const std::exception &)
    {
        if (listen_fd >= 0)
            close(listen_fd);
        listen_fd = -1;
        throw;
    }
}

PacketDumper::~PacketDumper()
{
    running = false;
    if (listen_fd >= 0)
        close(listen_fd);
}

void PacketDumper::setup_listener()
{
    listen_fd = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd < 0)
    {
        throw socket_error("socket failed");
    }

    set_flag(listen_fd, SOL_SOCKET, SO_REUSEADDR);
    set_flag(listen_fd, SOL_SOCKET, SO_REUSEPORT);
    set_flag(listen_fd, SOL_SOCKET, SO_BROADCAST);

    sockaddr_in addr;
    setup_sockaddr(addr, config.listen_addr, config.discovery_port);
    if (bind(listen_fd, (sockaddr *)&addr, sizeof(addr)) < 0)
    {
        throw socket_error("Bind failed on " + endpoint_to_string(addr));
    }

    loop.add(listen_fd, Source::DISCOVERY, EPOLLIN);
}

void PacketDumper::start()
{
    spdlog::info("Listening ...");
}

void PacketDumper::collect(const Readiness &ready, std::vector<Event> &events)
{
    if (ready.source == Source::DISCOVERY)
        read_datagrams(ready.fd, Source::DISCOVERY, events);
}

void PacketDumper::dispatch(Event &ev)
{
    if (ev.type != Event::Type::DATA)
        return;

    spdlog::info("Received {} bytes from {}", ev.data.size(), endpoint_to_string(ev.from));
    for (const auto &line : describe_packet(ev.data.data(), ev.data.size()))
    {
        spdlog::info("  {}", line);
    }
}

std::vector<std::string> describe_packet(const uint8_t *data, size_t len)
{
    std::vector<std::string> lines;

    try
    {
        Packet packet = parse_packet(data, len);

        char crc[16];
        snprintf(crc, sizeof(crc), "0x%08x", packet.crc);
        lines.push_back(packet_type_name(packet.type) + " len(" + std::to_string(packet.length) +
                        ") CRC:" + crc);

        if (!packet.has_tags())
        {
            lines.push_back("Unsupported packet type: " + std::to_string(packet.type));
            return lines;
        }

        for (const auto &tv : packet.tags)
        {
            lines.push_back("TAG: " + tag_name(tv.tag) + "  Length: " + std::to_string(tv.value.size()) +
                            "  Value: " + format_tag_value(tv));
        }
    }
    catch (const MalformedPacket &e)
    {
        lines.push_back(std::string("Malformed packet: ") + e.what());
    }
    return lines;
}
