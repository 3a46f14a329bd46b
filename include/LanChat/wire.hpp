#ifndef LANCHAT_WIRE_HPP
#define LANCHAT_WIRE_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

#include "LanChat/chat_event.hpp"
#include "LanChat/participant.hpp"

// Chat channel framing: 4-byte big-endian payload length, then the payload.
//
//   identity: LC1|ID|b64(name)|b64(address)|online|b64(avatar)
//   event:    LC1|EV|route|kind|epochMillis|b64(senderName)|b64(senderAddress)|payload...
//
// Event payload fields by kind:
//   CHAT, SYSTEM: b64(text)
//   FILE:         b64(fileName)|sizeBytes
//   COMMAND:      b64(name)|argc|b64(arg)...
inline constexpr const char* WIRE_PREFIX      = "LC1";
inline constexpr std::size_t FRAME_HEADER_BYTES = 4;
inline constexpr std::size_t MAX_FRAME_BYTES  = 1024 * 1024;

// Latest event time the clock can represent; later timestamps are rejected.
inline constexpr long long MAX_EPOCH_MILLIS =
    std::chrono::duration_cast<std::chrono::milliseconds>(ChatEvent::Clock::duration::max()).count();

enum class Route : char {
    Direct    = 'D',
    Broadcast = 'B',
    Relayed   = 'R'
};

struct IdentityFrame {
    Participant participant;
};

struct EventFrame {
    Route route;
    ChatEvent event;
};

using Frame = std::variant<IdentityFrame, EventFrame>;

std::string encodeIdentity(const Participant& participant);
std::string encodeEvent(const ChatEvent& event, Route route);

// Throws TransportError(Protocol) on anything that is not a well-formed frame.
Frame decodeFrame(const std::string& payload);

std::string base64Encode(std::string_view data);
bool base64Decode(const std::string& in, std::string& out);

#endif // LANCHAT_WIRE_HPP
