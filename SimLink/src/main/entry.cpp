// simlink_probe: opens one circuit to a simulator, logs the handshake and the traffic
// it sees, then logs out.

#include "../../include/core/Logger.hpp"
#include "../../include/core/EventLoop.hpp"
#include "../../include/core/NetworkManager.hpp"
#include "../../include/core/TerseUpdate.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

using namespace SimLink;
using namespace SimLink::Networking;
using namespace SimLink::Protocol;

namespace {

    std::atomic<bool> g_interrupted{ false };

    void OnSignal(int) {
        g_interrupted.store(true);
    }

    struct ProbeOptions {
        NetworkEndpoint      sim;
        uint32_t             circuitCode{ 0 };
        Types::Uuid          agentId;
        Types::Uuid          sessionId;
        int                  seconds{ 30 };
        Logging::LogSettings log;
    };

    void PrintUsage() {
        std::cerr << "usage: simlink_probe --sim <ip:port> --circuit-code <n> --agent <uuid> --session <uuid>\n"
                  << "                     [--seconds <n>] [--log-level <trace|debug|info|warn|error>] [--log-file <path>]\n";
    }

    bool ParseUnsigned(const std::string& text, unsigned long long max, unsigned long long& out) {
        if (text.empty()) return false;
        char* end = nullptr;
        errno = 0;
        const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
        if (errno != 0 || end == nullptr || *end != '\0' || value > max) return false;
        out = value;
        return true;
    }

    bool ParseArgs(int argc, char** argv, ProbeOptions& options) {
        bool haveSim = false, haveCode = false, haveAgent = false, haveSession = false;

        for (int i = 1; i < argc; ++i) {
            const std::string flag = argv[i];
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << flag << "\n";
                return false;
            }
            const std::string value = argv[++i];
            unsigned long long number = 0;

            if (flag == "--sim") {
                haveSim = NetworkEndpoint::Parse(value, options.sim);
                if (!haveSim) { std::cerr << "bad --sim " << value << "\n"; return false; }
            }
            else if (flag == "--circuit-code") {
                haveCode = ParseUnsigned(value, 0xFFFFFFFFull, number);
                if (!haveCode) { std::cerr << "bad --circuit-code " << value << "\n"; return false; }
                options.circuitCode = static_cast<uint32_t>(number);
            }
            else if (flag == "--agent") {
                haveAgent = Types::Uuid::Parse(value, options.agentId);
                if (!haveAgent) { std::cerr << "bad --agent " << value << "\n"; return false; }
            }
            else if (flag == "--session") {
                haveSession = Types::Uuid::Parse(value, options.sessionId);
                if (!haveSession) { std::cerr << "bad --session " << value << "\n"; return false; }
            }
            else if (flag == "--seconds") {
                if (!ParseUnsigned(value, 86400, number)) { std::cerr << "bad --seconds " << value << "\n"; return false; }
                options.seconds = static_cast<int>(number);
            }
            else if (flag == "--log-level") {
                options.log.level = spdlog::level::from_str(value);
                if (options.log.level == spdlog::level::off && value != "off") {
                    std::cerr << "bad --log-level " << value << "\n";
                    return false;
                }
            }
            else if (flag == "--log-file") {
                options.log.filePath = value;
            }
            else {
                std::cerr << "unknown option " << flag << "\n";
                return false;
            }
        }
        return haveSim && haveCode && haveAgent && haveSession;
    }

} // namespace

int main(int argc, char** argv) {
    ProbeOptions options;
    if (!ParseArgs(argc, argv, options)) {
        PrintUsage();
        return 2;
    }

    Logging::Logger::Init(options.log);
    SL_NETWORK_INFO("simlink_probe starting: sim={} circuit={}", options.sim.ToString(), options.circuitCode);

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    EventLoop loop;
    if (!loop.IsValid()) {
        SL_NETWORK_CRITICAL("Event loop could not be created");
        return 1;
    }

    NetworkSettings settings;
    SessionContext session{ options.agentId, options.sessionId };
    NetworkManager manager(loop, settings, session);

    std::map<std::string, uint64_t> messageCounts;
    for (MessageType type : { MessageType::RegionHandshake, MessageType::AgentMovementComplete,
                              MessageType::ImprovedTerseObjectUpdate, MessageType::ObjectUpdate,
                              MessageType::ObjectUpdateCompressed, MessageType::ObjectUpdateCached,
                              MessageType::KillObject, MessageType::CoarseLocationUpdate,
                              MessageType::LayerData, MessageType::SimStats, MessageType::ChatFromSimulator,
                              MessageType::AvatarAnimation, MessageType::LogoutReply })
    {
        manager.RegisterHandler(type, [&messageCounts](Circuit&, const Packet& packet) {
            ++messageCounts[MessageTable::NameOf(packet.type)];
        });
    }

    manager.RegisterHandler(MessageType::ImprovedTerseObjectUpdate, [](Circuit&, const Packet& packet) {
        ImprovedTerseObjectUpdate update;
        if (!TerseUpdateCodec::Decode(packet.body.data(), packet.body.size(), update)) {
            SL_NETWORK_WARN("ImprovedTerseObjectUpdate could not be decoded");
            return;
        }
        for (const TerseObjectUpdate& object : update.objects) {
            if (object.position) {
                SL_NETWORK_DEBUG("Object {} at <{:.2f}, {:.2f}, {:.2f}>", object.localId,
                    object.position->x, object.position->y, object.position->z);
            }
        }
    });

    bool sessionOver = false;
    manager.AddEventListener([&sessionOver, &loop](const NetworkEvent& event) {
        SL_NETWORK_INFO("Event {} on {} ({})", ToString(event.type),
            event.circuit ? event.circuit->GetEndpoint().ToString() : std::string("-"), ToString(event.reason));
        if (event.type == NetworkEventType::SessionDisconnected) {
            sessionOver = true;
            loop.Stop();
        }
    });

    if (!manager.Connect(options.sim, options.circuitCode, true) || !manager.Start()) {
        SL_NETWORK_CRITICAL("Could not open a circuit to {}", options.sim.ToString());
        return 1;
    }

    bool logoutSent = false;
    std::chrono::steady_clock::time_point logoutDeadline{};
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options.seconds);
    while (!sessionOver) {
        loop.RunOnce(std::chrono::milliseconds(100));

        const bool timeUp = std::chrono::steady_clock::now() >= deadline;
        if ((timeUp || g_interrupted.load()) && !logoutSent) {
            logoutSent = true;
            logoutDeadline = std::chrono::steady_clock::now() + settings.handshakeTimeout;
            const SendResult result = manager.Logout();
            if (result != SendResult::Ok) {
                SL_NETWORK_WARN("Logout not sent ({}), closing circuits", ToString(result));
                manager.Shutdown();
                break;
            }
        }
        // Give the simulator one handshake timeout to answer the logout.
        if (logoutSent && std::chrono::steady_clock::now() >= logoutDeadline) {
            SL_NETWORK_WARN("No LogoutReply, closing circuits");
            manager.Shutdown();
            break;
        }
    }

    for (const auto& [name, count] : messageCounts) {
        SL_NETWORK_INFO("{:<28} {}", name, count);
    }
    manager.Shutdown();
    SL_NETWORK_INFO("simlink_probe finished");
    return 0;
}
