#include "LanChat/server.hpp"
#include "LanChat/log.hpp"
#include "LanChat/transport.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <utility>

#ifdef _WIN32
    #include <winsock2.h>
#else
    #include <sys/socket.h>
#endif

namespace {

constexpr auto ACCEPT_RETRY_DELAY = std::chrono::milliseconds(50);

// Closing a listening socket does not wake a thread blocked in accept();
// shutting it down does.
void interruptAccept(asio::ip::tcp::acceptor& acceptor) {
    if (!acceptor.is_open()) return;
#ifdef _WIN32
    ::shutdown(acceptor.native_handle(), SD_BOTH);
#else
    ::shutdown(acceptor.native_handle(), SHUT_RDWR);
#endif
}

class SlotRelease {
public:
    explicit SlotRelease(std::function<void()> release) : release_(std::move(release)) {}
    ~SlotRelease() { release_(); }

    SlotRelease(const SlotRelease&) = delete;
    SlotRelease& operator=(const SlotRelease&) = delete;

private:
    std::function<void()> release_;
};

}

Server::Server(asio::io_context& io, Participant self, ConnectionHandler& handler,
               std::size_t maxConnections)
    : io_(io),
      self_(std::move(self)),
      handler_(handler),
      maxConnections_(maxConnections == 0 ? 1 : maxConnections),
      acceptor_(io),
      workers_(maxConnections_) {}

Server::~Server() {
    stop();
    join();
}

void Server::listen(std::uint16_t port) {
    if (running_) {
        throw TransportError(TransportErrorCause::Io, "server already listening on port " + std::to_string(port_));
    }

    asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port);
    asio::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw transportError(ec, "open listening socket");

    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        qCWarning(lcTransport) << "SO_REUSEADDR failed:" << ec.message().c_str();
    }

    acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        asio::error_code ignored;
        acceptor_.close(ignored);
        throw transportError(ec, "listen on port " + std::to_string(port));
    }

    port_ = acceptor_.local_endpoint(ec).port();
    running_ = true;
    acceptThread_ = std::thread(&Server::acceptLoop, this);

    qCInfo(lcTransport) << "listening on port" << port_ << "with" << maxConnections_ << "connection slots";
}

void Server::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(slotMutex_);
    }
    slotCv_.notify_all();

    interruptAccept(acceptor_);
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }

    asio::error_code ec;
    acceptor_.close(ec);

    {
        std::lock_guard<std::mutex> lock(handshakeMutex_);
        for (const auto& connection : handshaking_) {
            connection->close();
        }
    }
    qCInfo(lcTransport) << "stopped listening on port" << port_;
}

void Server::join() {
    workers_.shutdown();
}

std::size_t Server::activeConnections() const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return busySlots_;
}

void Server::acceptLoop() {
    while (running_) {
        if (!acquireSlot()) break;

        asio::ip::tcp::socket socket(io_);
        asio::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            releaseSlot();
            if (!running_) break;
            qCWarning(lcTransport) << "accept failed:" << ec.message().c_str();
            std::this_thread::sleep_for(ACCEPT_RETRY_DELAY);
            continue;
        }

        auto connection = std::make_shared<Connection>(std::move(socket));
        qCDebug(lcTransport) << "accepted connection from" << connection->remoteAddress().c_str();

        if (!workers_.submit([this, connection]() { serve(connection); })) {
            releaseSlot();
            connection->close();
        }
    }
}

void Server::serve(const std::shared_ptr<Connection>& connection) {
    SlotRelease slot([this]() { releaseSlot(); });

    {
        std::lock_guard<std::mutex> lock(handshakeMutex_);
        if (!running_) return;
        handshaking_.insert(connection);
    }

    bool handshaken = true;
    try {
        connection->acceptIdentity(self_);
    } catch (const TransportError& e) {
        qCWarning(lcTransport) << "handshake with" << connection->remoteAddress().c_str() << "failed:" << e.what();
        handshaken = false;
    }

    {
        std::lock_guard<std::mutex> lock(handshakeMutex_);
        handshaking_.erase(connection);
    }
    if (!handshaken) {
        connection->close();
        return;
    }

    try {
        if (!handler_.connectionOpened(connection)) {
            connection->close();
            return;
        }
    } catch (const std::exception& e) {
        qCWarning(lcTransport) << "could not open connection from" << connection->remoteAddress().c_str()
                               << ":" << e.what();
        connection->close();
        return;
    }

    connection->run(handler_);
}

bool Server::acquireSlot() {
    std::unique_lock<std::mutex> lock(slotMutex_);
    if (busySlots_ >= maxConnections_ && running_) {
        qCInfo(lcTransport) << "all" << maxConnections_ << "connection slots busy, holding new connections";
    }
    slotCv_.wait(lock, [this]() {
        return !running_ || busySlots_ < maxConnections_;
    });
    if (!running_) return false;
    ++busySlots_;
    return true;
}

void Server::releaseSlot() {
    {
        std::lock_guard<std::mutex> lock(slotMutex_);
        if (busySlots_ > 0) --busySlots_;
    }
    slotCv_.notify_one();
}
