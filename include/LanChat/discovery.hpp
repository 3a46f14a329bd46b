#ifndef LANCHAT_DISCOVERY_HPP
#define LANCHAT_DISCOVERY_HPP

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wsign-conversion"
#pragma clang diagnostic ignored "-Wshorten-64-to-32"
#pragma clang diagnostic ignored "-Wold-style-cast"
#include <asio.hpp>
#pragma clang diagnostic pop

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

inline constexpr const char* DISCOVERY_REQUEST  = "DISCOVER_LANCHAT";
inline constexpr const char* DISCOVERY_RESPONSE = "LANCHAT_HOST";
inline constexpr const char* DEFAULT_MULTICAST_GROUP = "224.0.0.1";
inline constexpr std::uint16_t DEFAULT_DISCOVERY_PORT = 8889;
inline constexpr std::size_t DISCOVERY_DATAGRAM_BYTES = 1024;
inline constexpr auto DEFAULT_DISCOVERY_TIMEOUT = std::chrono::milliseconds(3000);

struct DiscoveryOptions {
    // A unicast address works too (no group membership is attempted).
    std::string group = DEFAULT_MULTICAST_GROUP;
    std::uint16_t port = DEFAULT_DISCOVERY_PORT;
};

struct HostInfo {
    std::string address;
    std::uint16_t port = 0;

    bool operator==(const HostInfo& other) const {
        return address == other.address && port == other.port;
    }
    bool operator!=(const HostInfo& other) const { return !(*this == other); }

    std::string toString() const { return address + ":" + std::to_string(port); }
};

// "LANCHAT_HOST:<port>" -> port. Anything else -> nullopt.
std::optional<std::uint16_t> parseAdvertisement(const std::string& payload);

// Best guess of the address other hosts on the LAN reach us at.
std::string localAddress();

// Answers discovery requests on the discovery port with our chat port.
class Advertiser {
    public:
        Advertiser(std::uint16_t chatPort, DiscoveryOptions options = {});
        ~Advertiser();

        Advertiser(const Advertiser&) = delete;
        Advertiser& operator=(const Advertiser&) = delete;

        // Binds and starts the answering thread. Throws TransportError.
        void start();
        void stop();

        bool running() const { return running_.load(); }

        // Bound discovery port (useful when options.port is 0).
        std::uint16_t port() const { return boundPort_; }

    private:
        void loop();

        const std::uint16_t chatPort_;
        const DiscoveryOptions options_;

        asio::io_context io_;
        asio::ip::udp::socket socket_;
        std::uint16_t boundPort_ = 0;
        std::atomic<bool> running_{false};
        std::thread thread_;
};

// Asks the group who hosts a chat and collects the answers until the timeout.
class Discoverer {
    public:
        explicit Discoverer(DiscoveryOptions options = {});

        // Never throws and never waits past the timeout. Hosts are returned
        // once each, in the order they answered.
        std::vector<HostInfo> discover(std::chrono::milliseconds timeout = DEFAULT_DISCOVERY_TIMEOUT);

    private:
        const DiscoveryOptions options_;
};

#endif // LANCHAT_DISCOVERY_HPP
