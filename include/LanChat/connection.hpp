#ifndef LANCHAT_CONNECTION_HPP
#define LANCHAT_CONNECTION_HPP

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wsign-conversion"
#pragma clang diagnostic ignored "-Wshorten-64-to-32"
#pragma clang diagnostic ignored "-Wold-style-cast"
#include <asio.hpp>
#pragma clang diagnostic pop

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "LanChat/chat_event.hpp"
#include "LanChat/participant.hpp"
#include "LanChat/wire.hpp"

enum class ConnectionState {
    Connecting,
    IdentityExchange,
    Open,
    Closing,
    Closed
};

const char* toString(ConnectionState state);

class Connection;

// Owner of live connections. Called from the connection's reader thread.
class ConnectionHandler {
public:
    virtual ~ConnectionHandler() = default;

    // The identity exchange succeeded. Returning false rejects the peer and
    // the connection is closed without entering its receive loop.
    virtual bool connectionOpened(const std::shared_ptr<Connection>& connection) = 0;

    virtual void eventReceived(Connection& connection, EventFrame frame) = 0;

    // Called exactly once, after the receive loop of an opened connection ends.
    virtual void connectionClosed(const std::shared_ptr<Connection>& connection) = 0;
};

// One framed TCP connection: identity handshake, then a stream of events.
// Exactly one thread reads (run()); writes from any thread are serialized.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    explicit Connection(asio::ip::tcp::socket socket);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Accepting side: read the peer identity, answer with ours.
    // The peer address is replaced by the observed source address.
    void acceptIdentity(const Participant& self);

    // Connecting side: send ours first, then read the peer identity.
    void offerIdentity(const Participant& self);

    void send(const ChatEvent& event, Route route);

    // Receive loop. Blocks until the peer disconnects, a read fails or
    // close() is called, then reports connectionClosed() and closes the socket.
    void run(ConnectionHandler& handler);

    // Unblocks the reader. Safe from any thread, any number of times.
    void close();

    const Participant& peer() const noexcept { return peer_; }
    const std::string& remoteAddress() const noexcept { return remoteAddress_; }
    bool accepted() const noexcept { return accepted_; }
    ConnectionState state() const noexcept { return state_.load(); }

private:
    std::string readPayload();
    void writePayload(const std::string& payload);
    Participant readIdentity();
    void finish();

    asio::ip::tcp::socket socket_;
    std::string remoteAddress_;
    Participant peer_;
    bool accepted_ = false;
    std::atomic<ConnectionState> state_{ConnectionState::Connecting};

    // Lock order: writeMutex_ before closeMutex_.
    std::mutex writeMutex_;
    std::mutex closeMutex_;
};

#endif // LANCHAT_CONNECTION_HPP
