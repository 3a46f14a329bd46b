#include "LanChat/client.hpp"
#include "LanChat/log.hpp"
#include "LanChat/transport.hpp"

#include <utility>

Client::Client(asio::io_context& io, ConnectionHandler& handler)
    : io_(io),
      handler_(handler) {}

Client::~Client() {
    disconnect();
}

Participant Client::connect(const std::string& host, std::uint16_t port, const Participant& self) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
        throw TransportError(TransportErrorCause::Io, "client already used for " + connection_->peer().name());
    }

    const std::string target = host + ":" + std::to_string(port);

    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) throw transportError(ec, "resolve " + target);

    asio::ip::tcp::socket socket(io_);
    asio::connect(socket, endpoints, ec);
    if (ec) throw transportError(ec, "connect to " + target);

    auto connection = std::make_shared<Connection>(std::move(socket));
    try {
        connection->offerIdentity(self);
    } catch (const TransportError&) {
        connection->close();
        throw;
    }

    if (!handler_.connectionOpened(connection)) {
        connection->close();
        throw TransportError(TransportErrorCause::Protocol,
                             "connection to " + connection->peer().name() + " at " + target
                             + " rejected (already connected?)");
    }

    connection_ = connection;
    reader_ = std::thread([this, connection]() {
        connection->run(handler_);
    });

    qCInfo(lcTransport) << "connected to" << connection->peer().name().c_str() << "at" << target.c_str();
    return connection->peer();
}

void Client::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
        connection_->close();
    }
    if (reader_.joinable()) {
        reader_.join();
    }
}

bool Client::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_ && connection_->state() == ConnectionState::Open;
}
