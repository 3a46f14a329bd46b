#include "LanChat/transport.hpp"

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wsign-conversion"
#pragma clang diagnostic ignored "-Wshorten-64-to-32"
#pragma clang diagnostic ignored "-Wold-style-cast"
#include <asio.hpp>
#pragma clang diagnostic pop

const char* toString(TransportErrorCause cause) {
    switch (cause) {
    case TransportErrorCause::AddressInUse:
        return "address in use";
    case TransportErrorCause::ConnectionRefused:
        return "connection refused";
    case TransportErrorCause::HostUnreachable:
        return "host unreachable";
    case TransportErrorCause::NotConnected:
        return "not connected";
    case TransportErrorCause::Protocol:
        return "protocol error";
    case TransportErrorCause::Io:
        return "i/o error";
    }
    return "i/o error";
}

TransportError::TransportError(TransportErrorCause cause, const std::string& what)
    : std::runtime_error(what),
      cause_(cause) {}

TransportError transportError(const std::error_code& ec, const std::string& context) {
    TransportErrorCause cause = TransportErrorCause::Io;

    if (ec == asio::error::address_in_use) {
        cause = TransportErrorCause::AddressInUse;
    } else if (ec == asio::error::connection_refused) {
        cause = TransportErrorCause::ConnectionRefused;
    } else if (ec == asio::error::host_unreachable
               || ec == asio::error::network_unreachable
               || ec == asio::error::host_not_found
               || ec == asio::error::timed_out) {
        cause = TransportErrorCause::HostUnreachable;
    } else if (ec == asio::error::not_connected
               || ec == asio::error::eof
               || ec == asio::error::connection_reset
               || ec == asio::error::broken_pipe
               || ec == asio::error::bad_descriptor) {
        cause = TransportErrorCause::NotConnected;
    }

    return TransportError(cause, context + ": " + ec.message());
}
