#include "LanChat/discovery.hpp"
#include "LanChat/log.hpp"
#include "LanChat/transport.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <utility>
#include <system_error>

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);

void joinGroup(asio::ip::udp::socket& socket, const asio::ip::address& group) {
    if (!group.is_multicast()) return;

    asio::error_code ec;
    socket.set_option(asio::ip::multicast::join_group(group), ec);
    if (ec) {
        qCWarning(lcDiscovery) << "could not join" << group.to_string().c_str() << ":" << ec.message().c_str();
    }
}

bool isWouldBlock(const asio::error_code& ec) {
    return ec == asio::error::would_block || ec == asio::error::try_again;
}

}

std::optional<std::uint16_t> parseAdvertisement(const std::string& payload) {
    const std::string prefix = std::string(DISCOVERY_RESPONSE) + ":";
    if (payload.size() <= prefix.size() || payload.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    unsigned long value = 0;
    for (std::size_t i = prefix.size(); i < payload.size(); ++i) {
        const char c = payload[i];
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<unsigned long>(c - '0');
        if (value > std::numeric_limits<std::uint16_t>::max()) return std::nullopt;
    }
    if (value == 0) return std::nullopt;
    return static_cast<std::uint16_t>(value);
}

std::string localAddress() {
    try {
        asio::io_context ctx;
        asio::ip::udp::socket socket(ctx);
        socket.connect(asio::ip::udp::endpoint(asio::ip::make_address("8.8.8.8"), 80));
        return socket.local_endpoint().address().to_string();
    } catch (const std::system_error& e) {
        qCDebug(lcDiscovery) << "no routable interface, using loopback:" << e.what();
        return "127.0.0.1";
    }
}

Advertiser::Advertiser(std::uint16_t chatPort, DiscoveryOptions options)
    : chatPort_(chatPort),
      options_(std::move(options)),
      socket_(io_) {}

Advertiser::~Advertiser() {
    stop();
}

void Advertiser::start() {
    if (running_) return;

    asio::error_code ec;
    const auto group = asio::ip::make_address(options_.group, ec);
    if (ec) throw transportError(ec, "discovery group " + options_.group);

    const asio::ip::udp::endpoint endpoint(asio::ip::udp::v4(), options_.port);
    socket_.open(endpoint.protocol(), ec);
    if (ec) throw transportError(ec, "open discovery socket");

    socket_.set_option(asio::socket_base::reuse_address(true), ec);
    socket_.bind(endpoint, ec);
    if (ec) {
        asio::error_code ignored;
        socket_.close(ignored);
        throw transportError(ec, "bind discovery port " + std::to_string(options_.port));
    }

    joinGroup(socket_, group);
    socket_.non_blocking(true, ec);

    boundPort_ = socket_.local_endpoint(ec).port();
    running_ = true;
    thread_ = std::thread(&Advertiser::loop, this);

    qCInfo(lcDiscovery) << "answering discovery on port" << boundPort_ << "for chat port" << chatPort_;
}

void Advertiser::stop() {
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) {
        thread_.join();
    }
    asio::error_code ec;
    socket_.close(ec);
}

void Advertiser::loop() {
    std::array<char, DISCOVERY_DATAGRAM_BYTES> buf;
    const std::string reply = std::string(DISCOVERY_RESPONSE) + ":" + std::to_string(chatPort_);

    while (running_) {
        asio::ip::udp::endpoint remote;
        asio::error_code ec;
        const std::size_t len = socket_.receive_from(asio::buffer(buf), remote, 0, ec);

        if (ec) {
            if (!isWouldBlock(ec) && running_) {
                qCWarning(lcDiscovery) << "discovery receive failed:" << ec.message().c_str();
            }
            std::this_thread::sleep_for(POLL_INTERVAL);
            continue;
        }

        if (std::string(buf.data(), len) != DISCOVERY_REQUEST) {
            qCDebug(lcDiscovery) << "ignoring foreign datagram from" << remote.address().to_string().c_str();
            continue;
        }

        socket_.send_to(asio::buffer(reply), remote, 0, ec);
        if (ec && running_) {
            qCWarning(lcDiscovery) << "discovery reply to" << remote.address().to_string().c_str()
                                   << "failed:" << ec.message().c_str();
        }
    }
}

Discoverer::Discoverer(DiscoveryOptions options)
    : options_(std::move(options)) {}

std::vector<HostInfo> Discoverer::discover(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<HostInfo> found;

    asio::error_code ec;
    const auto group = asio::ip::make_address(options_.group, ec);
    if (ec) {
        qCWarning(lcDiscovery) << "bad discovery group" << options_.group.c_str() << ":" << ec.message().c_str();
        return found;
    }

    asio::io_context io;
    asio::ip::udp::socket socket(io);
    socket.open(asio::ip::udp::v4(), ec);
    if (!ec) socket.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), 0), ec);
    if (ec) {
        qCWarning(lcDiscovery) << "could not open discovery socket:" << ec.message().c_str();
        return found;
    }
    joinGroup(socket, group);

    const std::string request = DISCOVERY_REQUEST;
    socket.send_to(asio::buffer(request), asio::ip::udp::endpoint(group, options_.port), 0, ec);
    if (ec) {
        qCWarning(lcDiscovery) << "discovery request failed:" << ec.message().c_str();
        return found;
    }
    socket.non_blocking(true, ec);

    std::array<char, DISCOVERY_DATAGRAM_BYTES> buf;
    while (std::chrono::steady_clock::now() < deadline) {
        asio::ip::udp::endpoint sender;
        const std::size_t len = socket.receive_from(asio::buffer(buf), sender, 0, ec);

        if (ec) {
            if (!isWouldBlock(ec)) {
                qCDebug(lcDiscovery) << "discovery receive failed:" << ec.message().c_str();
            }
            const auto remaining = deadline - std::chrono::steady_clock::now();
            if (remaining <= std::chrono::steady_clock::duration::zero()) break;
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(POLL_INTERVAL, remaining));
            continue;
        }

        const auto port = parseAdvertisement(std::string(buf.data(), len));
        if (!port) {
            qCDebug(lcDiscovery) << "dropping malformed answer from" << sender.address().to_string().c_str();
            continue;
        }

        HostInfo host{sender.address().to_string(), *port};
        if (std::find(found.begin(), found.end(), host) == found.end()) {
            qCInfo(lcDiscovery) << "found host" << host.toString().c_str();
            found.push_back(std::move(host));
        }
    }
    return found;
}
