#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "LanChat/discovery.hpp"

namespace {

// Unicast loopback keeps the tests independent of multicast routing.
DiscoveryOptions loopback(std::uint16_t port) {
    DiscoveryOptions options;
    options.group = "127.0.0.1";
    options.port = port;
    return options;
}

}

TEST(DiscoveryTest, FindsTheAdvertisedChatPort) {
    Advertiser advertiser(4242, loopback(0));
    advertiser.start();
    ASSERT_TRUE(advertiser.running());
    ASSERT_NE(advertiser.port(), 0);

    const auto hosts = Discoverer(loopback(advertiser.port())).discover(std::chrono::milliseconds(1000));

    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0], (HostInfo{"127.0.0.1", 4242}));
}

TEST(DiscoveryTest, NobodyAnsweringGivesEmptyResultByTheDeadline) {
    std::uint16_t silentPort = 0;
    {
        Advertiser probe(1, loopback(0));
        probe.start();
        silentPort = probe.port();
        probe.stop();
    }

    const auto started = std::chrono::steady_clock::now();
    const auto hosts = Discoverer(loopback(silentPort)).discover(std::chrono::milliseconds(2000));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(hosts.empty());
    EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
}

TEST(DiscoveryTest, StoppedAdvertiserCanBeStoppedAgain) {
    Advertiser advertiser(4242, loopback(0));
    advertiser.start();
    advertiser.stop();
    advertiser.stop();

    EXPECT_FALSE(advertiser.running());
}

TEST(DiscoveryTest, ParsesAdvertisements) {
    EXPECT_EQ(parseAdvertisement("LANCHAT_HOST:8888"), std::optional<std::uint16_t>(8888));
    EXPECT_FALSE(parseAdvertisement("LANCHAT_HOST:").has_value());
    EXPECT_FALSE(parseAdvertisement("LANCHAT_HOST:0").has_value());
    EXPECT_FALSE(parseAdvertisement("LANCHAT_HOST:65536").has_value());
    EXPECT_FALSE(parseAdvertisement("LANCHAT_HOST:88a").has_value());
    EXPECT_FALSE(parseAdvertisement("I_AM_CLIPSERVER").has_value());
    EXPECT_FALSE(parseAdvertisement(DISCOVERY_REQUEST).has_value());
}

TEST(DiscoveryTest, HostInfoToString) {
    EXPECT_EQ((HostInfo{"192.168.1.5", 8888}).toString(), "192.168.1.5:8888");
}

TEST(DiscoveryTest, RepeatedAndForeignAnswersAreFiltered) {
    asio::io_context io;
    asio::ip::udp::socket host(io, asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    host.non_blocking(true);
    const std::uint16_t port = host.local_endpoint().port();

    std::atomic<bool> answered{false};
    std::thread responder([&]() {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        std::array<char, DISCOVERY_DATAGRAM_BYTES> buf;
        while (std::chrono::steady_clock::now() < deadline) {
            asio::ip::udp::endpoint asker;
            asio::error_code ec;
            const std::size_t len = host.receive_from(asio::buffer(buf), asker, 0, ec);
            if (ec || std::string(buf.data(), len) != DISCOVERY_REQUEST) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }
            for (const std::string reply : {"LANCHAT_HOST:4242", "garbage", "LANCHAT_HOST:4242"}) {
                host.send_to(asio::buffer(reply), asker, 0, ec);
            }
            answered = true;
            return;
        }
    });

    const auto hosts = Discoverer(loopback(port)).discover(std::chrono::milliseconds(1000));
    responder.join();

    EXPECT_TRUE(answered.load());
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0], (HostInfo{"127.0.0.1", 4242}));
}
