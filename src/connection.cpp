#include "LanChat/connection.hpp"
#include "LanChat/log.hpp"
#include "LanChat/transport.hpp"

#include <array>
#include <cstdint>
#include <exception>
#include <utility>

const char* toString(ConnectionState state) {
    switch (state) {
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::IdentityExchange:
        return "identity-exchange";
    case ConnectionState::Open:
        return "open";
    case ConnectionState::Closing:
        return "closing";
    case ConnectionState::Closed:
        return "closed";
    }
    return "closed";
}

Connection::Connection(asio::ip::tcp::socket socket)
    : socket_(std::move(socket)),
      remoteAddress_(UNKNOWN_ADDRESS) {
    asio::error_code ec;
    const asio::ip::tcp::endpoint remote = socket_.remote_endpoint(ec);
    if (!ec) {
        remoteAddress_ = remote.address().to_string();
    }

    // Chat frames are small, send them right away.
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

Connection::~Connection() {
    asio::error_code ec;
    socket_.close(ec);
}

void Connection::acceptIdentity(const Participant& self) {
    state_ = ConnectionState::IdentityExchange;
    accepted_ = true;

    Participant peer = readIdentity();
    writePayload(encodeIdentity(self));

    peer_ = std::move(peer);
    ConnectionState expected = ConnectionState::IdentityExchange;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Open)) {
        throw TransportError(TransportErrorCause::NotConnected, "connection closed during handshake");
    }
}

void Connection::offerIdentity(const Participant& self) {
    state_ = ConnectionState::IdentityExchange;
    accepted_ = false;

    writePayload(encodeIdentity(self));
    peer_ = readIdentity();

    ConnectionState expected = ConnectionState::IdentityExchange;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Open)) {
        throw TransportError(TransportErrorCause::NotConnected, "connection closed during handshake");
    }
}

Participant Connection::readIdentity() {
    Frame frame = decodeFrame(readPayload());
    auto* identity = std::get_if<IdentityFrame>(&frame);
    if (!identity) {
        throw TransportError(TransportErrorCause::Protocol, "expected identity as first frame");
    }

    // Never route on a self-reported address.
    Participant peer = std::move(identity->participant);
    peer.setAddress(remoteAddress_);
    peer.setOnline(true);
    return peer;
}

void Connection::send(const ChatEvent& event, Route route) {
    writePayload(encodeEvent(event, route));
}

void Connection::run(ConnectionHandler& handler) {
    auto self = shared_from_this();

    while (state_.load() == ConnectionState::Open) {
        try {
            Frame frame = decodeFrame(readPayload());
            auto* event = std::get_if<EventFrame>(&frame);
            if (!event) {
                throw TransportError(TransportErrorCause::Protocol, "identity frame after handshake");
            }
            handler.eventReceived(*this, std::move(*event));
        } catch (const TransportError& e) {
            if (state_.load() != ConnectionState::Open) {
                break;
            }
            if (e.cause() == TransportErrorCause::NotConnected) {
                qCInfo(lcTransport) << "peer" << peer_.name().c_str() << "disconnected";
            } else {
                qCWarning(lcTransport) << "dropping connection to" << peer_.name().c_str() << "-" << e.what();
            }
            break;
        } catch (const std::exception& e) {
            qCWarning(lcTransport) << "dropping connection to" << peer_.name().c_str()
                                   << "after handler error:" << e.what();
            break;
        }
    }

    ConnectionState expected = ConnectionState::Open;
    state_.compare_exchange_strong(expected, ConnectionState::Closing);

    try {
        handler.connectionClosed(self);
    } catch (const std::exception& e) {
        qCWarning(lcTransport) << "close handler for" << peer_.name().c_str() << "failed:" << e.what();
    }
    finish();
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(closeMutex_);
    if (state_.load() == ConnectionState::Closed) return;
    state_ = ConnectionState::Closing;

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected) {
        qCDebug(lcTransport) << "shutdown:" << ec.message().c_str();
    }
}

void Connection::finish() {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    std::lock_guard<std::mutex> closeLock(closeMutex_);

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    state_ = ConnectionState::Closed;
}

std::string Connection::readPayload() {
    std::array<unsigned char, FRAME_HEADER_BYTES> header{};
    asio::error_code ec;

    asio::read(socket_, asio::buffer(header), ec);
    if (ec) throw transportError(ec, "read frame header");

    const std::uint32_t length = (static_cast<std::uint32_t>(header[0]) << 24)
                               | (static_cast<std::uint32_t>(header[1]) << 16)
                               | (static_cast<std::uint32_t>(header[2]) << 8)
                               | static_cast<std::uint32_t>(header[3]);
    if (length > MAX_FRAME_BYTES) {
        throw TransportError(TransportErrorCause::Protocol,
                             "frame of " + std::to_string(length) + " bytes exceeds limit");
    }

    std::string payload(length, '\0');
    if (length > 0) {
        asio::read(socket_, asio::buffer(payload), ec);
        if (ec) throw transportError(ec, "read frame body");
    }
    return payload;
}

void Connection::writePayload(const std::string& payload) {
    if (payload.size() > MAX_FRAME_BYTES) {
        throw TransportError(TransportErrorCause::Protocol, "frame too large to send");
    }

    const auto length = static_cast<std::uint32_t>(payload.size());
    const std::array<unsigned char, FRAME_HEADER_BYTES> header{
        static_cast<unsigned char>((length >> 24) & 0xFF),
        static_cast<unsigned char>((length >> 16) & 0xFF),
        static_cast<unsigned char>((length >> 8) & 0xFF),
        static_cast<unsigned char>(length & 0xFF),
    };
    const std::array<asio::const_buffer, 2> buffers{
        asio::buffer(header),
        asio::buffer(payload),
    };

    std::lock_guard<std::mutex> lock(writeMutex_);
    const ConnectionState state = state_.load();
    if (state == ConnectionState::Closing || state == ConnectionState::Closed) {
        throw TransportError(TransportErrorCause::NotConnected, "connection to " + peer_.name() + " is closed");
    }

    asio::error_code ec;
    asio::write(socket_, buffers, ec);
    if (ec) throw transportError(ec, "write to " + peer_.name());
}
