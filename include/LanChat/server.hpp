#ifndef LANCHAT_SERVER_HPP
#define LANCHAT_SERVER_HPP

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wsign-conversion"
#pragma clang diagnostic ignored "-Wshorten-64-to-32"
#pragma clang diagnostic ignored "-Wold-style-cast"
#include <asio.hpp>
#pragma clang diagnostic pop

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>

#include "LanChat/connection.hpp"
#include "LanChat/participant.hpp"
#include "LanChat/thread_pool.hpp"

inline constexpr std::size_t DEFAULT_MAX_CONNECTIONS = 32;

// Accept loop on its own thread; every accepted socket is handshaken and
// served on a pool worker. When all workers are busy the accept loop waits
// for one to free up instead of accepting more sockets.
class Server {
public:
    Server(asio::io_context& io, Participant self, ConnectionHandler& handler,
           std::size_t maxConnections = DEFAULT_MAX_CONNECTIONS);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds and starts accepting. Throws TransportError (AddressInUse, Io).
    void listen(std::uint16_t port);

    // Closes the listening endpoint and joins the accept thread. Connections
    // still in the handshake are dropped; open ones are left running.
    void stop();

    // Waits for every worker to finish its connection. Call after the
    // connections have been closed.
    void join();

    bool running() const { return running_.load(); }
    std::uint16_t port() const { return port_; }
    std::size_t activeConnections() const;

private:
    void acceptLoop();
    void serve(const std::shared_ptr<Connection>& connection);
    bool acquireSlot();
    void releaseSlot();

    asio::io_context& io_;
    Participant self_;
    ConnectionHandler& handler_;
    const std::size_t maxConnections_;

    asio::ip::tcp::acceptor acceptor_;
    std::uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread acceptThread_;

    mutable std::mutex slotMutex_;
    std::condition_variable slotCv_;
    std::size_t busySlots_ = 0;

    std::mutex handshakeMutex_;
    std::unordered_set<std::shared_ptr<Connection>> handshaking_;

    ThreadPool workers_;
};

#endif // LANCHAT_SERVER_HPP
