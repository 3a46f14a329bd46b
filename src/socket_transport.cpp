#include "LanChat/socket_transport.hpp"
#include "LanChat/log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

SocketTransport::SocketTransport(Participant self, TransportOptions options)
    : self_(std::move(self)),
      options_(options) {}

SocketTransport::~SocketTransport() {
    stop();
}

void SocketTransport::listen(std::uint16_t port) {
    std::lock_guard<std::mutex> lock(serverMutex_);
    if (server_) {
        throw TransportError(TransportErrorCause::Io,
                             "already hosting on port " + std::to_string(server_->port()));
    }

    auto server = std::make_unique<Server>(io_, self_, static_cast<ConnectionHandler&>(*this),
                                           options_.maxConnections);
    server->listen(port);
    server_ = std::move(server);
}

Participant SocketTransport::connect(const std::string& host, std::uint16_t port) {
    auto client = std::make_unique<Client>(io_, static_cast<ConnectionHandler&>(*this));
    Participant peer = client->connect(host, port, self_);

    std::lock_guard<std::mutex> lock(clientsMutex_);
    clients_.erase(std::remove_if(clients_.begin(), clients_.end(),
                                  [](const std::unique_ptr<Client>& c) { return !c->connected(); }),
                   clients_.end());
    clients_.push_back(std::move(client));
    return peer;
}

void SocketTransport::sendTo(const Participant& recipient, const ChatEvent& event) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(bindingsMutex_);
        auto it = bindings_.find(recipient);
        if (it != bindings_.end()) connection = it->second;
    }
    if (!connection) {
        throw TransportError(TransportErrorCause::NotConnected,
                             "no open connection to " + recipient.name() + " (" + recipient.address() + ")");
    }
    connection->send(event, Route::Direct);
}

BroadcastReport SocketTransport::broadcast(const ChatEvent& event) {
    BroadcastReport report;
    for (const auto& connection : snapshot()) {
        try {
            connection->send(event, Route::Broadcast);
            ++report.delivered;
        } catch (const TransportError& e) {
            ++report.failed;
            qCWarning(lcTransport) << "broadcast to" << connection->peer().name().c_str() << "failed:" << e.what();
        }
    }
    return report;
}

std::size_t SocketTransport::connectionCount() const {
    std::lock_guard<std::mutex> lock(bindingsMutex_);
    return bindings_.size();
}

void SocketTransport::onJoin(JoinHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    onJoin_ = std::move(handler);
}

void SocketTransport::onReceive(ReceiveHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    onReceive_ = std::move(handler);
}

void SocketTransport::onLeave(LeaveHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    onLeave_ = std::move(handler);
}

void SocketTransport::stopListening() {
    std::lock_guard<std::mutex> lock(serverMutex_);
    if (server_) {
        server_->stop();
    }
}

void SocketTransport::stop() {
    stopListening();

    std::vector<std::shared_ptr<Connection>> open;
    {
        std::lock_guard<std::mutex> lock(bindingsMutex_);
        stopping_ = true;
        for (const auto& binding : bindings_) {
            open.push_back(binding.second);
        }
    }
    for (const auto& connection : open) {
        connection->close();
    }

    {
        std::lock_guard<std::mutex> lock(serverMutex_);
        if (server_) {
            server_->join();
        }
    }
    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        for (auto& client : clients_) {
            client->disconnect();
        }
    }
}

bool SocketTransport::hosting() const {
    std::lock_guard<std::mutex> lock(serverMutex_);
    return server_ && server_->running();
}

std::uint16_t SocketTransport::listeningPort() const {
    std::lock_guard<std::mutex> lock(serverMutex_);
    return server_ ? server_->port() : 0;
}

std::vector<Participant> SocketTransport::peers() const {
    std::lock_guard<std::mutex> lock(bindingsMutex_);
    std::vector<Participant> result;
    result.reserve(bindings_.size());
    for (const auto& binding : bindings_) {
        result.push_back(binding.first);
    }
    return result;
}

bool SocketTransport::connectionOpened(const std::shared_ptr<Connection>& connection) {
    const Participant& peer = connection->peer();
    {
        std::lock_guard<std::mutex> lock(bindingsMutex_);
        if (stopping_) return false;
        if (!bindings_.emplace(peer, connection).second) {
            qCWarning(lcTransport) << "rejecting second connection for" << peer.name().c_str()
                                   << "at" << peer.address().c_str();
            return false;
        }
    }
    qCInfo(lcTransport) << peer.name().c_str() << "joined from" << peer.address().c_str();

    JoinHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handler = onJoin_;
    }
    if (handler) {
        try {
            handler(peer);
        } catch (const std::exception& e) {
            qCWarning(lcTransport) << "join handler for" << peer.name().c_str() << "failed:" << e.what();
            std::lock_guard<std::mutex> lock(bindingsMutex_);
            bindings_.erase(peer);
            return false;
        }
    }

    if (options_.welcomeNewcomers && connection->accepted()) {
        try {
            connection->send(ChatEvent(self_, SystemNotice{"Welcome to the chat, " + peer.name() + "!"}),
                             Route::Direct);
        } catch (const TransportError& e) {
            qCWarning(lcTransport) << "welcome to" << peer.name().c_str() << "failed:" << e.what();
        }
    }
    return true;
}

void SocketTransport::eventReceived(Connection& connection, EventFrame frame) {
    // Only a host may vouch for somebody else's identity.
    const bool keepSender = frame.route == Route::Relayed && !connection.accepted();
    ChatEvent event = keepSender
        ? std::move(frame.event)
        : ChatEvent(connection.peer(), frame.event.payload(), frame.event.timestamp());

    if (frame.route == Route::Broadcast && connection.accepted()) {
        relay(connection, event);
    }

    ReceiveHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handler = onReceive_;
    }
    if (handler) handler(event);
}

void SocketTransport::connectionClosed(const std::shared_ptr<Connection>& connection) {
    {
        std::lock_guard<std::mutex> lock(bindingsMutex_);
        auto it = bindings_.find(connection->peer());
        if (it == bindings_.end() || it->second != connection) return;
        bindings_.erase(it);
    }

    Participant gone = connection->peer();
    gone.setOnline(false);
    qCInfo(lcTransport) << gone.name().c_str() << "left";

    LeaveHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handler = onLeave_;
    }
    if (handler) handler(gone);
}

void SocketTransport::relay(const Connection& origin, const ChatEvent& event) {
    for (const auto& connection : snapshot()) {
        if (connection.get() == &origin) continue;
        try {
            connection->send(event, Route::Relayed);
        } catch (const TransportError& e) {
            qCWarning(lcTransport) << "relay to" << connection->peer().name().c_str() << "failed:" << e.what();
        }
    }
}

std::vector<std::shared_ptr<Connection>> SocketTransport::snapshot() const {
    std::lock_guard<std::mutex> lock(bindingsMutex_);
    std::vector<std::shared_ptr<Connection>> result;
    result.reserve(bindings_.size());
    for (const auto& binding : bindings_) {
        result.push_back(binding.second);
    }
    return result;
}
