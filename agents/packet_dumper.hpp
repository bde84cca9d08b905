#ifndef PACKET_DUMPER_HPP
#define PACKET_DUMPER_HPP

#include <string>
#include <vector>
#include "agents/agent.hpp"
#include "config.hpp"
#include "hdhomerun/packet.hpp"

// Diagnostic listener: logs every datagram on the discovery port decoded
// as an HDHomeRun packet. Touches nothing else.
class PacketDumper : public Agent
{
private:
    DumpConfig config;
    int listen_fd = -1;

    void setup_listener();

protected:
    void start() override;
    void collect(const Readiness &ready, std::vector<Event> &events) override;
    void dispatch(Event &ev) override;

public:
    explicit PacketDumper(const DumpConfig &config);
    ~PacketDumper();
};

// Log lines for one datagram: a summary, then one line per tag
std::vector<std::string> describe_packet(const uint8_t *data, size_t len);

#endif
