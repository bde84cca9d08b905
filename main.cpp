#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include "config.hpp"
#include "logging.hpp"
#include "agents/agent.hpp"
#include "agents/capture_agent.hpp"
#include "agents/responder_agent.hpp"
#include "agents/packet_dumper.hpp"

namespace
{

std::atomic<Agent *> active_agent{nullptr};

void handle_stop_signal(int)
{
    Agent *agent = active_agent.load();
    if (agent)
        agent->stop();
}

}

int main(int argc, char *argv[])
{
    CLI::App app{"Discovery Bridge - tunnels LAN discovery broadcasts between two networks over TCP"};

    app.set_version_flag("-v,--version", "1.0.0");

    CaptureConfig capture_config;
    ResponderConfig responder_config;
    DumpConfig dump_config;

    auto capture = app.add_subcommand(
        "capture", "Run next to the discovery clients (captures broadcasts and connects to the responder)");
    auto responder = app.add_subcommand(
        "responder", "Run next to the devices (accepts the tunnel and replays queries as broadcasts)");
    auto dump = app.add_subcommand(
        "dump", "Print HDHomeRun packets seen on the discovery port");

    // Capture options
    capture->add_option("peer_host", capture_config.peer_host, "Responder host name or address")
        ->required();
    capture->add_option("-t,--tunnel-port", capture_config.tunnel_port, "Responder tunnel port")
        ->capture_default_str();
    capture->add_option("-l,--listen", capture_config.listen_addr, "Address the discovery listener binds to")
        ->capture_default_str()
        ->check(CLI::ValidIPV4);
    capture->add_option("-d,--discovery-port", capture_config.discovery_port, "Discovery UDP port")
        ->capture_default_str();
    capture->add_option("--reconnect-ms", capture_config.reconnect_delay_ms, "Delay before reconnecting")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    capture->add_option("--connect-timeout-ms", capture_config.connect_timeout_ms, "Connect attempt timeout")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);

    // Responder options
    responder->add_option("bind_address", responder_config.bind_addr, "Address the tunnel listener binds to")
        ->capture_default_str()
        ->check(CLI::ValidIPV4);
    responder->add_option("-t,--tunnel-port", responder_config.tunnel_port, "Tunnel listen port")
        ->capture_default_str();
    responder->add_option("-b,--broadcast", responder_config.broadcast_addr, "Destination of replayed queries")
        ->capture_default_str()
        ->check(CLI::ValidIPV4);
    responder->add_option("-d,--discovery-port", responder_config.discovery_port, "Discovery UDP port")
        ->capture_default_str();
    responder->add_option("-w,--window-ms", responder_config.window_ms, "Reply collection window")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);

    // Dump options
    dump->add_option("-l,--listen", dump_config.listen_addr, "Address to listen on")
        ->capture_default_str()
        ->check(CLI::ValidIPV4);
    dump->add_option("-d,--discovery-port", dump_config.discovery_port, "Discovery UDP port")
        ->capture_default_str();

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    init_logging();

    try
    {
        std::unique_ptr<Agent> agent;

        if (capture->parsed())
        {
            agent = std::make_unique<CaptureAgent>(capture_config);
        }
        else if (responder->parsed())
        {
            agent = std::make_unique<ResponderAgent>(responder_config);
        }
        else if (dump->parsed())
        {
            agent = std::make_unique<PacketDumper>(dump_config);
        }
        else
        {
            throw std::runtime_error("Unknown mode");
        }

        active_agent = agent.get();
        std::signal(SIGINT, handle_stop_signal);
        std::signal(SIGTERM, handle_stop_signal);

        agent->run();

        active_agent = nullptr;
    }
    catch (const std::exception &e)
    {
        active_agent = nullptr;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
