#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "FakeNetworkIO.hpp"
#include "../include/core/NetworkManager.hpp"
#include "../include/core/Messages.hpp"

using namespace SimLink;
using namespace SimLink::Networking;
using namespace SimLink::Protocol;
using namespace SimLink::Testing;
using namespace std::chrono_literals;

namespace {

    class NetworkManagerTest : public ::testing::Test {
    protected:
        EventLoop loop;
        NetworkSettings settings;
        SessionContext session;
        Clock::time_point now = Clock::now();

        std::vector<std::shared_ptr<FakeWire>> wires;
        bool failNextInit = false;
        SequenceNumber simSequence = 1000;

        std::unique_ptr<NetworkManager> manager;
        std::vector<NetworkEvent> events;

        const NetworkEndpoint simA{ "127.0.0.1", 13000 };
        const NetworkEndpoint simB{ "127.0.0.1", 13001 };

        void SetUp() override {
            ASSERT_TRUE(Types::Uuid::Parse("0b9a1c64-1f7e-4d57-9f43-3c0f8a6b2e11", session.agentId));
            ASSERT_TRUE(Types::Uuid::Parse("7d2e5f90-8c41-4b3a-a6d2-51e0c9f4b873", session.sessionId));

            manager = std::make_unique<NetworkManager>(loop, settings, session, [this]() -> std::unique_ptr<INetworkIO> {
                auto wire = std::make_shared<FakeWire>();
                wire->failInit = failNextInit;
                wires.push_back(wire);
                return std::make_unique<FakeNetworkIO>(wire);
            });
            manager->SetClock([this]() { return now; });
            manager->AddEventListener([this](const NetworkEvent& e) { events.push_back(e); });
        }

        void TearDown() override {
            events.clear();
            manager.reset();
        }

        // Connects and walks the circuit through its handshake. `wire` receives the circuit's FakeWire.
        std::shared_ptr<Circuit> Bring(const NetworkEndpoint& sim, bool current, std::shared_ptr<FakeWire>& wire) {
            auto circuit = manager->Connect(sim, 77, current);
            if (!circuit) return nullptr;
            wire = wires.back();
            FromSim(*wire, sim, MessageType::RegionHandshake, RegionHandshakeBody("Sandbox"));
            if (current) {
                FromSim(*wire, sim, MessageType::AgentMovementComplete, AgentMovementCompleteBody(session));
            }
            return circuit;
        }

        void FromSim(FakeWire& wire, const NetworkEndpoint& sim, MessageType type, std::vector<uint8_t> body) {
            wire.Inject(sim, MakeDatagram(type, std::move(body), ++simSequence, true));
        }

        std::vector<uint8_t> LogoutReplyBody() const {
            std::vector<uint8_t> body(32);
            session.agentId.WriteTo(body.data());
            session.sessionId.WriteTo(body.data() + 16);
            return body;
        }

        std::size_t CountEvents(NetworkEventType type) const {
            return static_cast<std::size_t>(std::count_if(events.begin(), events.end(),
                [type](const NetworkEvent& e) { return e.type == type; }));
        }
    };

} // namespace

// ---------- Construction ----------

TEST(NetworkManagerSettings, RejectsUnusableSettings) {
    EventLoop loop;
    NetworkSettings settings;
    settings.maxHandshakeAttempts = 0;
    EXPECT_THROW({ NetworkManager manager(loop, settings, SessionContext{}); }, std::invalid_argument);

    settings = NetworkSettings{};
    settings.receiveBufferSize = 100;
    EXPECT_THROW({ NetworkManager manager(loop, settings, SessionContext{}); }, std::invalid_argument);
}

// ---------- Circuits ----------

TEST_F(NetworkManagerTest, ConnectedEventOnceActive) {
    std::shared_ptr<FakeWire> wire;
    auto circuit = Bring(simA, true, wire);
    ASSERT_TRUE(circuit);

    EXPECT_TRUE(circuit->IsActive());
    EXPECT_EQ(manager->GetCurrentCircuit(), circuit);
    ASSERT_EQ(CountEvents(NetworkEventType::CircuitConnected), 1u);
    EXPECT_EQ(events.front().circuit, circuit);
}

TEST_F(NetworkManagerTest, FirstCircuitBecomesCurrentEvenAsChild) {
    auto circuit = manager->Connect(simA, 77, false);
    ASSERT_TRUE(circuit);
    EXPECT_TRUE(circuit->IsCurrent());

    auto child = manager->Connect(simB, 78, false);
    ASSERT_TRUE(child);
    EXPECT_FALSE(child->IsCurrent());
    EXPECT_EQ(manager->GetCircuits().size(), 2u);
}

TEST_F(NetworkManagerTest, ConnectingTwiceReusesCircuit) {
    auto first = manager->Connect(simA, 77);
    auto second = manager->Connect(simA, 77);
    EXPECT_EQ(first, second);
    EXPECT_EQ(wires.size(), 1u);
    EXPECT_EQ(manager->FindCircuit(simA), first);
    EXPECT_EQ(manager->FindCircuit(simB), nullptr);
}

TEST_F(NetworkManagerTest, SocketFailureReturnsNull) {
    failNextInit = true;
    EXPECT_EQ(manager->Connect(simA, 77), nullptr);
    EXPECT_TRUE(manager->GetCircuits().empty());
    EXPECT_EQ(manager->GetCurrentCircuit(), nullptr);
    ASSERT_EQ(CountEvents(NetworkEventType::CircuitDisconnected), 1u);
    EXPECT_EQ(events.front().reason, DisconnectReason::SocketError);
}

TEST_F(NetworkManagerTest, HandshakeTimeoutRaisesConnectionFailed) {
    ASSERT_TRUE(manager->Connect(simA, 77));
    for (int i = 0; i < settings.maxHandshakeAttempts; ++i) {
        now += settings.handshakeTimeout;
        manager->Update(now);
    }

    EXPECT_EQ(CountEvents(NetworkEventType::ConnectionFailed), 1u);
    EXPECT_EQ(CountEvents(NetworkEventType::SessionDisconnected), 1u);
    EXPECT_TRUE(manager->GetCircuits().empty());
}

TEST_F(NetworkManagerTest, ChildLossKeepsSession) {
    std::shared_ptr<FakeWire> wireA, wireB;
    auto current = Bring(simA, true, wireA);
    auto child = Bring(simB, false, wireB);
    ASSERT_TRUE(current && child);
    EXPECT_TRUE(child->IsActive());

    manager->Disconnect(child);
    EXPECT_EQ(CountEvents(NetworkEventType::CircuitDisconnected), 1u);
    EXPECT_EQ(CountEvents(NetworkEventType::SessionDisconnected), 0u);
    EXPECT_EQ(wireB->CountSent(MessageType::CloseCircuit), 1u);

    manager->Disconnect(current);
    EXPECT_EQ(CountEvents(NetworkEventType::SessionDisconnected), 1u);
    EXPECT_EQ(manager->GetCurrentCircuit(), nullptr);
}

TEST_F(NetworkManagerTest, ClosedCircuitIsReleasedOnNextLoopTurn) {
    std::weak_ptr<Circuit> watch;
    {
        auto circuit = manager->Connect(simA, 77);
        ASSERT_TRUE(circuit);
        watch = circuit;
        manager->Disconnect(circuit);
    }
    events.clear();
    EXPECT_FALSE(watch.expired());

    loop.RunOnce(0ms);
    EXPECT_TRUE(watch.expired());
}

// ---------- Traffic ----------

TEST_F(NetworkManagerTest, SendWithoutCircuit) {
    EXPECT_EQ(manager->Send(Packet::Make(MessageType::ChatFromViewer, { 1 }, true)), SendResult::NoCircuit);
    EXPECT_EQ(manager->Logout(), SendResult::NoCircuit);
}

TEST_F(NetworkManagerTest, AgentMovementOnlyOnCurrentCircuit) {
    std::shared_ptr<FakeWire> wireA, wireB;
    auto current = Bring(simA, true, wireA);
    auto child = Bring(simB, false, wireB);
    ASSERT_TRUE(current && child);

    const std::vector<uint8_t> body(40, 1);
    EXPECT_EQ(manager->Send(Packet::Make(MessageType::AgentUpdate, body, false), child.get()),
        SendResult::NotCurrentCircuit);
    EXPECT_EQ(manager->Send(Packet::Make(MessageType::AgentUpdate, body, false)), SendResult::Ok);
    EXPECT_EQ(wireA->CountSent(MessageType::AgentUpdate), 1u);
    EXPECT_EQ(wireB->CountSent(MessageType::AgentUpdate), 0u);

    EXPECT_EQ(manager->Send(Packet::Make(MessageType::ChatFromViewer, { 1 }, true), child.get()), SendResult::Ok);
}

TEST_F(NetworkManagerTest, LogoutReplyClosesEveryCircuit) {
    std::shared_ptr<FakeWire> wireA, wireB;
    auto current = Bring(simA, true, wireA);
    auto child = Bring(simB, false, wireB);
    ASSERT_TRUE(current && child);

    bool replySeen = false;
    manager->RegisterHandler(MessageType::LogoutReply, [&replySeen](Circuit&, const Packet&) { replySeen = true; });

    ASSERT_EQ(manager->Logout(), SendResult::Ok);
    EXPECT_EQ(wireA->CountSent(MessageType::LogoutRequest), 1u);

    FromSim(*wireA, simA, MessageType::LogoutReply, LogoutReplyBody());
    EXPECT_TRUE(replySeen);
    EXPECT_EQ(current->GetDisconnectReason(), DisconnectReason::Logout);
    EXPECT_EQ(child->GetDisconnectReason(), DisconnectReason::Logout);
    EXPECT_TRUE(manager->GetCircuits().empty());
    EXPECT_EQ(CountEvents(NetworkEventType::SessionDisconnected), 1u);
}

TEST_F(NetworkManagerTest, DeliveryFailureEvent) {
    std::shared_ptr<FakeWire> wire;
    auto circuit = Bring(simA, true, wire);
    ASSERT_TRUE(circuit);
    ASSERT_EQ(manager->Send(Packet::Make(MessageType::ChatFromViewer, { 1 }, true)), SendResult::Ok);

    for (int i = 0; i <= settings.reliability.maxResendCount; ++i) {
        now += settings.reliability.resendTimeout;
        manager->Update(now);
    }

    const auto failed = std::find_if(events.begin(), events.end(), [](const NetworkEvent& e) {
        return e.type == NetworkEventType::DeliveryFailed && e.message == MessageType::ChatFromViewer;
    });
    ASSERT_NE(failed, events.end());
    EXPECT_EQ(failed->circuit, circuit);
    EXPECT_TRUE(circuit->IsActive());
}

// ---------- Dispatch ----------

TEST_F(NetworkManagerTest, HandlersRunInRegistrationOrder) {
    std::shared_ptr<FakeWire> wire;
    ASSERT_TRUE(Bring(simA, true, wire));

    std::vector<int> order;
    manager->RegisterHandler(MessageType::ChatFromSimulator, [&order](Circuit&, const Packet&) { order.push_back(1); });
    manager->RegisterHandler(MessageType::ChatFromSimulator, [&order](Circuit&, const Packet&) { order.push_back(2); });
    manager->RegisterHandler(MessageType::SimStats, [&order](Circuit&, const Packet&) { order.push_back(99); });

    FromSim(*wire, simA, MessageType::ChatFromSimulator, { 1, 2, 3 });
    EXPECT_EQ(order, (std::vector<int>{ 1, 2 }));
}

TEST_F(NetworkManagerTest, HandlerAddedDuringDispatchSeesNextPacket) {
    std::shared_ptr<FakeWire> wire;
    ASSERT_TRUE(Bring(simA, true, wire));

    int outer = 0;
    int inner = 0;
    manager->RegisterHandler(MessageType::ChatFromSimulator, [&](Circuit&, const Packet&) {
        if (outer++ == 0) {
            manager->RegisterHandler(MessageType::ChatFromSimulator, [&inner](Circuit&, const Packet&) { ++inner; });
        }
    });

    FromSim(*wire, simA, MessageType::ChatFromSimulator, { 1 });
    EXPECT_EQ(inner, 0);
    FromSim(*wire, simA, MessageType::ChatFromSimulator, { 2 });
    EXPECT_EQ(outer, 2);
    EXPECT_EQ(inner, 1);
}

TEST_F(NetworkManagerTest, UnregisteredHandlerStopsReceiving) {
    std::shared_ptr<FakeWire> wire;
    ASSERT_TRUE(Bring(simA, true, wire));

    int calls = 0;
    const auto id = manager->RegisterHandler(MessageType::ChatFromSimulator, [&calls](Circuit&, const Packet&) { ++calls; });
    FromSim(*wire, simA, MessageType::ChatFromSimulator, { 1 });

    EXPECT_TRUE(manager->UnregisterHandler(MessageType::ChatFromSimulator, id));
    EXPECT_FALSE(manager->UnregisterHandler(MessageType::ChatFromSimulator, id));
    FromSim(*wire, simA, MessageType::ChatFromSimulator, { 2 });
    EXPECT_EQ(calls, 1);
}

TEST_F(NetworkManagerTest, ThrowingHandlerDoesNotStopOthers) {
    std::shared_ptr<FakeWire> wire;
    auto circuit = Bring(simA, true, wire);
    ASSERT_TRUE(circuit);

    bool later = false;
    manager->RegisterHandler(MessageType::ChatFromSimulator, [](Circuit&, const Packet&) {
        throw std::runtime_error("handler failure");
    });
    manager->RegisterHandler(MessageType::ChatFromSimulator, [&later](Circuit&, const Packet&) { later = true; });

    FromSim(*wire, simA, MessageType::ChatFromSimulator, { 1 });
    EXPECT_TRUE(later);
    EXPECT_TRUE(circuit->IsActive());
}

TEST_F(NetworkManagerTest, RemovedListenerGetsNoEvents) {
    int seen = 0;
    const auto id = manager->AddEventListener([&seen](const NetworkEvent&) { ++seen; });
    EXPECT_TRUE(manager->RemoveEventListener(id));
    EXPECT_FALSE(manager->RemoveEventListener(id));

    std::shared_ptr<FakeWire> wire;
    ASSERT_TRUE(Bring(simA, true, wire));
    EXPECT_EQ(seen, 0);
    EXPECT_EQ(CountEvents(NetworkEventType::CircuitConnected), 1u);
}

// ---------- Driving ----------

TEST_F(NetworkManagerTest, BackgroundWorkCompletesOnLoopThread) {
    std::atomic<bool> worked{ false };
    std::thread::id workerThread;
    std::thread::id doneThread;
    bool done = false;

    manager->RunInBackground(
        [&]() { workerThread = std::this_thread::get_id(); worked = true; },
        [&]() { doneThread = std::this_thread::get_id(); done = true; });

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!done && std::chrono::steady_clock::now() < deadline) {
        loop.RunOnce(20ms);
    }

    ASSERT_TRUE(done);
    EXPECT_TRUE(worked);
    EXPECT_NE(workerThread, std::this_thread::get_id());
    EXPECT_EQ(doneThread, std::this_thread::get_id());
}

TEST_F(NetworkManagerTest, StartDrivesCircuitsFromTheLoop) {
    ASSERT_TRUE(manager->Start());
    ASSERT_TRUE(manager->Connect(simA, 77));

    // Let the tick timer run handshake retries without advancing the injected clock.
    now += settings.handshakeTimeout;
    const auto deadline = std::chrono::steady_clock::now() + 1s;
    while (wires.back()->CountSent(MessageType::UseCircuitCode) < 2 && std::chrono::steady_clock::now() < deadline) {
        loop.RunOnce(20ms);
    }
    EXPECT_GE(wires.back()->CountSent(MessageType::UseCircuitCode), 2u);
}

TEST_F(NetworkManagerTest, ShutdownClosesEverything) {
    std::shared_ptr<FakeWire> wireA, wireB;
    ASSERT_TRUE(Bring(simA, true, wireA));
    ASSERT_TRUE(Bring(simB, false, wireB));

    manager->Shutdown();
    EXPECT_TRUE(manager->GetCircuits().empty());
    EXPECT_FALSE(wireA->running);
    EXPECT_FALSE(wireB->running);
    EXPECT_EQ(CountEvents(NetworkEventType::CircuitDisconnected), 2u);
}
