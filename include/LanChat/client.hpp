#ifndef LANCHAT_CLIENT_HPP
#define LANCHAT_CLIENT_HPP

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wsign-conversion"
#pragma clang diagnostic ignored "-Wshorten-64-to-32"
#pragma clang diagnostic ignored "-Wold-style-cast"
#include <asio.hpp>
#pragma clang diagnostic pop

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "LanChat/connection.hpp"
#include "LanChat/participant.hpp"

// One outbound connection to a host, read on its own thread.
class Client {
    public:
        Client(asio::io_context& io, ConnectionHandler& handler);
        ~Client();

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        // Connects, sends our identity, reads the host identity and starts
        // the receive loop. Returns the host as observed from here.
        // Throws TransportError (ConnectionRefused, HostUnreachable, Protocol, Io).
        Participant connect(const std::string& host, std::uint16_t port, const Participant& self);

        // Closes the connection and waits for the receive loop to finish.
        void disconnect();

        bool connected() const;

    private:
        asio::io_context& io_;
        ConnectionHandler& handler_;

        mutable std::mutex mutex_;
        std::shared_ptr<Connection> connection_;
        std::thread reader_;
};

#endif // LANCHAT_CLIENT_HPP
