#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "LanChat/chat_manager.hpp"
#include "LanChat/socket_transport.hpp"
#include "test_helpers.hpp"

namespace {

const char* LOOPBACK = "127.0.0.1";

// Collects what a transport reports from its worker threads.
// Declare it before the transport it watches: the transport's workers may
// still report while it is being destroyed.
class Recorder {
public:
    void attach(Transport& transport) {
        transport.onJoin([this](const Participant& p) {
            std::lock_guard<std::mutex> lock(mutex_);
            joined_.push_back(p);
        });
        transport.onReceive([this](const ChatEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(e);
        });
        transport.onLeave([this](const Participant& p) {
            std::lock_guard<std::mutex> lock(mutex_);
            left_.push_back(p);
        });
    }

    std::vector<Participant> joined() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return joined_;
    }

    std::vector<ChatEvent> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::vector<Participant> left() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return left_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Participant> joined_;
    std::vector<ChatEvent> received_;
    std::vector<Participant> left_;
};

TransportOptions quiet() {
    TransportOptions options;
    options.maxConnections = 4;
    options.welcomeNewcomers = false;
    return options;
}

Participant local(const std::string& name) {
    return Participant(name, LOOPBACK);
}

}

TEST(SocketTransportTest, DirectHelloCarriesTheSender) {
    Recorder hostEvents;
    SocketTransport host(local("Host"), quiet());
    hostEvents.attach(host);
    host.listen(0);
    ASSERT_TRUE(host.hosting());

    Recorder aliceEvents;
    SocketTransport alice(local("Alice"), quiet());
    aliceEvents.attach(alice);
    const Participant hostPeer = alice.connect(LOOPBACK, host.listeningPort());
    EXPECT_EQ(hostPeer.name(), "Host");

    ASSERT_TRUE(waitFor([&]() { return hostEvents.joined().size() == 1; }));
    const Participant alicePeer = hostEvents.joined()[0];
    EXPECT_EQ(alicePeer, local("Alice"));
    EXPECT_TRUE(alicePeer.online());

    alice.sendTo(hostPeer, ChatEvent(local("Alice"), ChatText{"hello"}));
    ASSERT_TRUE(waitFor([&]() { return hostEvents.received().size() == 1; }));
    EXPECT_EQ(hostEvents.received()[0].body(), "hello");
    EXPECT_EQ(hostEvents.received()[0].sender(), alicePeer);

    host.sendTo(alicePeer, ChatEvent(local("Host"), ChatText{"hi back"}));
    ASSERT_TRUE(waitFor([&]() { return aliceEvents.received().size() == 1; }));
    EXPECT_EQ(aliceEvents.received()[0].body(), "hi back");
    EXPECT_EQ(aliceEvents.received()[0].sender().name(), "Host");
}

TEST(SocketTransportTest, SenderCannotImpersonateSomeoneElse) {
    Recorder hostEvents;
    SocketTransport host(local("Host"), quiet());
    hostEvents.attach(host);
    host.listen(0);

    SocketTransport alice(local("Alice"), quiet());
    const Participant hostPeer = alice.connect(LOOPBACK, host.listeningPort());
    alice.sendTo(hostPeer, ChatEvent(Participant("Mallory", "6.6.6.6"), ChatText{"trust me"}));

    ASSERT_TRUE(waitFor([&]() { return hostEvents.received().size() == 1; }));
    EXPECT_EQ(hostEvents.received()[0].sender().name(), "Alice");
}

TEST(SocketTransportTest, NewcomersAreWelcomed) {
    SocketTransport host(local("Host"));
    host.listen(0);

    Recorder aliceEvents;
    SocketTransport alice(local("Alice"), quiet());
    aliceEvents.attach(alice);
    alice.connect(LOOPBACK, host.listeningPort());

    ASSERT_TRUE(waitFor([&]() { return aliceEvents.received().size() == 1; }));
    const ChatEvent welcome = aliceEvents.received()[0];
    EXPECT_EQ(welcome.kind(), EventKind::System);
    EXPECT_EQ(welcome.body(), "Welcome to the chat, Alice!");
    EXPECT_EQ(welcome.sender().name(), "Host");
}

TEST(SocketTransportTest, ClosingAClientRemovesItOnTheHost) {
    SocketTransport host(local("Host"), quiet());
    ChatManager session(local("Host"));
    session.attachTransport(host);
    host.listen(0);

    SocketTransport alice(local("Alice"), quiet());
    alice.connect(LOOPBACK, host.listeningPort());
    ASSERT_TRUE(waitFor([&]() { return session.isActive(local("Alice")); }));

    alice.stop();

    ASSERT_TRUE(waitFor([&]() { return !session.isActive(local("Alice")); }));
    EXPECT_TRUE(waitFor([&]() { return host.connectionCount() == 0; }));
    EXPECT_EQ(alice.connectionCount(), 0u);

    host.stop();
    session.detachTransport();
}

TEST(SocketTransportTest, HostStopDisconnectsClients) {
    SocketTransport host(local("Host"), quiet());
    host.listen(0);

    Recorder aliceEvents;
    SocketTransport alice(local("Alice"), quiet());
    aliceEvents.attach(alice);
    alice.connect(LOOPBACK, host.listeningPort());

    host.stop();

    ASSERT_TRUE(waitFor([&]() { return aliceEvents.left().size() == 1; }));
    EXPECT_EQ(aliceEvents.left()[0].name(), "Host");
    EXPECT_FALSE(aliceEvents.left()[0].online());
    EXPECT_FALSE(host.hosting());
}

TEST(SocketTransportTest, BroadcastIsRelayedAndRecordedOnce) {
    SocketTransport host(local("Host"), quiet());
    ChatManager session(local("Host"));
    session.attachTransport(host);
    host.listen(0);

    Recorder bobEvents;
    Recorder carolEvents;
    SocketTransport bob(local("Bob"), quiet());
    SocketTransport carol(local("Carol"), quiet());
    bobEvents.attach(bob);
    carolEvents.attach(carol);
    bob.connect(LOOPBACK, host.listeningPort());
    carol.connect(LOOPBACK, host.listeningPort());
    ASSERT_TRUE(waitFor([&]() { return host.connectionCount() == 2; }));

    const BroadcastReport report = bob.broadcast(ChatEvent(local("Bob"), ChatText{"hi all"}));
    EXPECT_EQ(report.delivered, 1u);
    EXPECT_EQ(report.failed, 0u);

    ASSERT_TRUE(waitFor([&]() { return carolEvents.received().size() == 1; }));
    EXPECT_EQ(carolEvents.received()[0].body(), "hi all");
    EXPECT_EQ(carolEvents.received()[0].sender().name(), "Bob");

    ASSERT_TRUE(waitFor([&]() { return !session.history().empty(); }));
    const auto history = session.history();
    EXPECT_EQ(std::count_if(history.begin(), history.end(),
                            [](const ChatEvent& e) { return e.body() == "hi all"; }), 1);

    // The host does not echo a broadcast back to its sender.
    session.sendLocal("marker");
    ASSERT_TRUE(waitFor([&]() { return bobEvents.received().size() == 1; }));
    EXPECT_EQ(bobEvents.received()[0].body(), "marker");

    host.stop();
    session.detachTransport();
}

TEST(SocketTransportTest, SecondConnectionWithTheSameIdentityIsRejected) {
    SocketTransport host(local("Host"), quiet());
    host.listen(0);

    SocketTransport alice(local("Alice"), quiet());
    alice.connect(LOOPBACK, host.listeningPort());
    ASSERT_TRUE(waitFor([&]() { return host.connectionCount() == 1; }));

    Recorder twinEvents;
    SocketTransport twin(local("Alice"), quiet());
    twinEvents.attach(twin);
    twin.connect(LOOPBACK, host.listeningPort());

    ASSERT_TRUE(waitFor([&]() { return twinEvents.left().size() == 1; }));
    EXPECT_EQ(host.connectionCount(), 1u);
}

TEST(SocketTransportTest, PortInUseIsReported) {
    SocketTransport first(local("First"), quiet());
    first.listen(0);

    SocketTransport second(local("Second"), quiet());
    try {
        second.listen(first.listeningPort());
        FAIL() << "second listen succeeded";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.cause(), TransportErrorCause::AddressInUse);
    }
}

TEST(SocketTransportTest, RefusedConnectionIsReported) {
    std::uint16_t closedPort = 0;
    {
        SocketTransport probe(local("Probe"), quiet());
        probe.listen(0);
        closedPort = probe.listeningPort();
    }

    SocketTransport alice(local("Alice"), quiet());
    try {
        alice.connect(LOOPBACK, closedPort);
        FAIL() << "connected to a closed port";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.cause(), TransportErrorCause::ConnectionRefused);
    }
}

TEST(SocketTransportTest, SendToAStrangerIsNotConnected) {
    SocketTransport alone(local("Alone"), quiet());

    try {
        alone.sendTo(local("Nobody"), ChatEvent(local("Alone"), ChatText{"hello?"}));
        FAIL() << "send succeeded";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.cause(), TransportErrorCause::NotConnected);
    }

    const BroadcastReport report = alone.broadcast(ChatEvent(local("Alone"), ChatText{"echo"}));
    EXPECT_EQ(report.delivered, 0u);
    EXPECT_EQ(report.failed, 0u);
}

TEST(SocketTransportTest, ConcurrentSendsArriveIntact) {
    Recorder hostEvents;
    SocketTransport host(local("Host"), quiet());
    hostEvents.attach(host);
    host.listen(0);

    SocketTransport alice(local("Alice"), quiet());
    const Participant hostPeer = alice.connect(LOOPBACK, host.listeningPort());

    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 50;
    std::vector<std::thread> senders;
    for (int t = 0; t < THREADS; ++t) {
        senders.emplace_back([&alice, &hostPeer, t]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                const std::string text = std::to_string(t) + "-" + std::to_string(i) + std::string(200, 'x');
                alice.sendTo(hostPeer, ChatEvent(local("Alice"), ChatText{text}));
            }
        });
    }
    for (auto& s : senders) s.join();

    ASSERT_TRUE(waitFor([&]() { return hostEvents.received().size() == static_cast<std::size_t>(THREADS * PER_THREAD); }));

    std::set<std::string> bodies;
    int lastOfThreadZero = -1;
    for (const auto& event : hostEvents.received()) {
        bodies.insert(event.body());
        if (event.body().rfind("0-", 0) == 0) {
            const int index = std::stoi(event.body().substr(2));
            EXPECT_GT(index, lastOfThreadZero);
            lastOfThreadZero = index;
        }
    }
    EXPECT_EQ(bodies.size(), static_cast<std::size_t>(THREADS * PER_THREAD));
}

TEST(SocketTransportTest, ThrowingReceiverDropsOnlyThatConnection) {
    std::mutex mutex;
    std::vector<std::string> accepted;
    Recorder aliceEvents;
    Recorder bobEvents;

    SocketTransport host(local("Host"), quiet());
    host.onReceive([&](const ChatEvent& event) {
        if (event.body() == "boom") throw std::runtime_error("observer failed");
        std::lock_guard<std::mutex> lock(mutex);
        accepted.push_back(event.sender().name() + ":" + event.body());
    });
    host.listen(0);

    SocketTransport alice(local("Alice"), quiet());
    aliceEvents.attach(alice);
    const Participant hostSeenByAlice = alice.connect(LOOPBACK, host.listeningPort());
    alice.sendTo(hostSeenByAlice, ChatEvent(local("Alice"), ChatText{"boom"}));

    ASSERT_TRUE(waitFor([&]() { return aliceEvents.left().size() == 1; }));
    EXPECT_TRUE(waitFor([&]() { return host.connectionCount() == 0; }));
    EXPECT_TRUE(host.hosting());

    SocketTransport bob(local("Bob"), quiet());
    bobEvents.attach(bob);
    const Participant hostSeenByBob = bob.connect(LOOPBACK, host.listeningPort());
    bob.sendTo(hostSeenByBob, ChatEvent(local("Bob"), ChatText{"still there?"}));

    ASSERT_TRUE(waitFor([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return accepted.size() == 1;
    }));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(accepted[0], "Bob:still there?");
}

TEST(SocketTransportTest, ThrowingJoinHandlerRejectsThePeer) {
    Recorder aliceEvents;

    SocketTransport host(local("Host"), quiet());
    host.onJoin([](const Participant&) { throw std::runtime_error("observer failed"); });
    host.listen(0);

    SocketTransport alice(local("Alice"), quiet());
    aliceEvents.attach(alice);
    alice.connect(LOOPBACK, host.listeningPort());

    ASSERT_TRUE(waitFor([&]() { return aliceEvents.left().size() == 1; }));
    EXPECT_EQ(host.connectionCount(), 0u);
    EXPECT_TRUE(host.hosting());
}

TEST(SocketTransportTest, StopFinishesHandlersBeforeReturning) {
    SocketTransport host(local("Host"), quiet());
    ChatManager session(local("Host"));
    session.attachTransport(host);
    host.listen(0);

    SocketTransport alice(local("Alice"), quiet());
    const Participant hostPeer = alice.connect(LOOPBACK, host.listeningPort());
    ASSERT_TRUE(waitFor([&]() { return session.isActive(local("Alice")); }));
    alice.sendTo(hostPeer, ChatEvent(local("Alice"), ChatText{"last words"}));
    ASSERT_TRUE(waitFor([&]() { return session.history().size() == 1; }));

    host.stop();

    // The leave handler has already run; nothing is left to race the detach.
    EXPECT_FALSE(session.isActive(local("Alice")));
    session.detachTransport();
    EXPECT_EQ(session.history().size(), 1u);
    EXPECT_EQ(host.connectionCount(), 0u);
}
