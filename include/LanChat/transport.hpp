#ifndef LANCHAT_TRANSPORT_HPP
#define LANCHAT_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "LanChat/chat_event.hpp"
#include "LanChat/participant.hpp"

inline constexpr std::uint16_t DEFAULT_CHAT_PORT = 8888;

enum class TransportErrorCause {
    AddressInUse,
    ConnectionRefused,
    HostUnreachable,
    NotConnected,
    Protocol,
    Io
};

const char* toString(TransportErrorCause cause);

class TransportError : public std::runtime_error {
public:
    TransportError(TransportErrorCause cause, const std::string& what);

    TransportErrorCause cause() const noexcept { return cause_; }

private:
    TransportErrorCause cause_;
};

// Maps a socket error to a TransportError, keeping the cause distinguishable
// for callers that present different guidance (port taken, host down...).
TransportError transportError(const std::error_code& ec, const std::string& context);

struct BroadcastReport {
    std::size_t delivered = 0;
    std::size_t failed = 0;
};

// Canonical chat transport. Handlers must be installed before listen() or
// connect(); they are invoked on the transport's worker threads.
class Transport {
public:
    using JoinHandler    = std::function<void(const Participant&)>;
    using ReceiveHandler = std::function<void(const ChatEvent&)>;
    using LeaveHandler   = std::function<void(const Participant&)>;

    virtual ~Transport() = default;

    virtual void listen(std::uint16_t port) = 0;
    virtual Participant connect(const std::string& host, std::uint16_t port) = 0;

    // Throws TransportError(NotConnected) when no open connection is bound
    // to the recipient, or the write error otherwise.
    virtual void sendTo(const Participant& recipient, const ChatEvent& event) = 0;

    // Independent write to every open connection; failures are counted, not thrown.
    virtual BroadcastReport broadcast(const ChatEvent& event) = 0;

    virtual std::size_t connectionCount() const = 0;

    virtual void onJoin(JoinHandler handler) = 0;
    virtual void onReceive(ReceiveHandler handler) = 0;
    virtual void onLeave(LeaveHandler handler) = 0;

    virtual void stop() = 0;
};

#endif // LANCHAT_TRANSPORT_HPP
