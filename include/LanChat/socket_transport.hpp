#ifndef LANCHAT_SOCKET_TRANSPORT_HPP
#define LANCHAT_SOCKET_TRANSPORT_HPP

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wsign-conversion"
#pragma clang diagnostic ignored "-Wshorten-64-to-32"
#pragma clang diagnostic ignored "-Wold-style-cast"
#include <asio.hpp>
#pragma clang diagnostic pop

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "LanChat/client.hpp"
#include "LanChat/connection.hpp"
#include "LanChat/server.hpp"
#include "LanChat/transport.hpp"

struct TransportOptions {
    std::size_t maxConnections = DEFAULT_MAX_CONNECTIONS;
    bool welcomeNewcomers = true;
};

// TCP transport: hosts (listen), joins (connect), or both. Keeps exactly one
// binding per remote participant while its connection is open.
//
// A host relays every broadcast received from one client to its other
// clients, marked as relayed so receivers keep the original sender.
class SocketTransport final : public Transport, private ConnectionHandler {
public:
    explicit SocketTransport(Participant self, TransportOptions options = {});
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    void listen(std::uint16_t port) override;
    Participant connect(const std::string& host, std::uint16_t port) override;
    void sendTo(const Participant& recipient, const ChatEvent& event) override;
    BroadcastReport broadcast(const ChatEvent& event) override;
    std::size_t connectionCount() const override;

    void onJoin(JoinHandler handler) override;
    void onReceive(ReceiveHandler handler) override;
    void onLeave(LeaveHandler handler) override;

    // Rejects new connections, keeps the open ones.
    void stopListening();

    // Stops listening, closes every connection (each reports its peer as
    // gone) and joins all workers.
    void stop() override;

    bool hosting() const;
    std::uint16_t listeningPort() const;
    std::vector<Participant> peers() const;

private:
    bool connectionOpened(const std::shared_ptr<Connection>& connection) override;
    void eventReceived(Connection& connection, EventFrame frame) override;
    void connectionClosed(const std::shared_ptr<Connection>& connection) override;

    void relay(const Connection& origin, const ChatEvent& event);
    std::vector<std::shared_ptr<Connection>> snapshot() const;

    asio::io_context io_;
    const Participant self_;
    const TransportOptions options_;

    mutable std::mutex serverMutex_;
    std::unique_ptr<Server> server_;

    std::mutex clientsMutex_;
    std::vector<std::unique_ptr<Client>> clients_;

    mutable std::mutex bindingsMutex_;
    std::unordered_map<Participant, std::shared_ptr<Connection>> bindings_;
    bool stopping_ = false;

    mutable std::mutex handlersMutex_;
    JoinHandler onJoin_;
    ReceiveHandler onReceive_;
    LeaveHandler onLeave_;
};

#endif // LANCHAT_SOCKET_TRANSPORT_HPP
