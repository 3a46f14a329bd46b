#ifndef LANCHAT_CHAT_EVENT_HPP
#define LANCHAT_CHAT_EVENT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "LanChat/participant.hpp"

enum class EventKind {
    Chat,
    System,
    File,
    Command
};

// "CHAT", "SYSTEM", "FILE", "COMMAND"
const char* toString(EventKind kind);
std::optional<EventKind> eventKindFromString(const std::string& text);

struct ChatText {
    std::string text;
};

struct SystemNotice {
    std::string text;
};

struct FileShare {
    std::string fileName;
    std::uint64_t sizeBytes = 0;
};

struct Command {
    std::string name;
    std::vector<std::string> args;
};

using EventPayload = std::variant<ChatText, SystemNotice, FileShare, Command>;

class ChatEvent {
public:
    using Clock = std::chrono::system_clock;

    ChatEvent(Participant sender, EventPayload payload);
    ChatEvent(Participant sender, EventPayload payload, Clock::time_point timestamp);

    const Participant& sender() const noexcept { return sender_; }
    const EventPayload& payload() const noexcept { return payload_; }
    Clock::time_point timestamp() const noexcept { return timestamp_; }

    EventKind kind() const noexcept;

    // Text form of the payload: message text, file name, or "name arg...".
    std::string body() const;

    std::string formatForDisplay() const;

    // Inverse of body(), used when only the text form survived (history files).
    static EventPayload payloadFromBody(EventKind kind, const std::string& body);

private:
    Participant sender_;
    EventPayload payload_;
    Clock::time_point timestamp_;
};

// Sender used for local notices that never travel over the network.
Participant systemParticipant();

#endif // LANCHAT_CHAT_EVENT_HPP
