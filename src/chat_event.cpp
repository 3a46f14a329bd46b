#include "LanChat/chat_event.hpp"

#include <QDateTime>
#include <QString>

#include <sstream>
#include <utility>

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string timeOfDay(ChatEvent::Clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    return QDateTime::fromMSecsSinceEpoch(ms).toString(QStringLiteral("HH:mm:ss")).toStdString();
}

}

const char* toString(EventKind kind) {
    switch (kind) {
    case EventKind::Chat:
        return "CHAT";
    case EventKind::System:
        return "SYSTEM";
    case EventKind::File:
        return "FILE";
    case EventKind::Command:
        return "COMMAND";
    }
    return "CHAT";
}

std::optional<EventKind> eventKindFromString(const std::string& text) {
    if (text == "CHAT") return EventKind::Chat;
    if (text == "SYSTEM") return EventKind::System;
    if (text == "FILE") return EventKind::File;
    if (text == "COMMAND") return EventKind::Command;
    return std::nullopt;
}

ChatEvent::ChatEvent(Participant sender, EventPayload payload)
    : ChatEvent(std::move(sender), std::move(payload), Clock::now()) {}

ChatEvent::ChatEvent(Participant sender, EventPayload payload, Clock::time_point timestamp)
    : sender_(std::move(sender)),
      payload_(std::move(payload)),
      timestamp_(timestamp) {}

EventKind ChatEvent::kind() const noexcept {
    return std::visit(overloaded{
        [](const ChatText&) { return EventKind::Chat; },
        [](const SystemNotice&) { return EventKind::System; },
        [](const FileShare&) { return EventKind::File; },
        [](const Command&) { return EventKind::Command; },
    }, payload_);
}

std::string ChatEvent::body() const {
    return std::visit(overloaded{
        [](const ChatText& p) { return p.text; },
        [](const SystemNotice& p) { return p.text; },
        [](const FileShare& p) { return p.fileName; },
        [](const Command& p) {
            std::string line = p.name;
            for (const auto& arg : p.args) {
                line.push_back(' ');
                line.append(arg);
            }
            return line;
        },
    }, payload_);
}

std::string ChatEvent::formatForDisplay() const {
    const std::string time = "[" + timeOfDay(timestamp_) + "] ";

    switch (kind()) {
    case EventKind::System:
        return time + "SYSTEM: " + body();
    case EventKind::File:
        return time + sender_.name() + " shared a file: " + body();
    case EventKind::Command:
        return time + "COMMAND: " + body();
    case EventKind::Chat:
        break;
    }
    return time + sender_.name() + ": " + body();
}

EventPayload ChatEvent::payloadFromBody(EventKind kind, const std::string& body) {
    switch (kind) {
    case EventKind::System:
        return SystemNotice{body};
    case EventKind::File:
        return FileShare{body, 0};
    case EventKind::Command: {
        Command command;
        std::istringstream words(body);
        words >> command.name;
        std::string arg;
        while (words >> arg) {
            command.args.push_back(arg);
        }
        return command;
    }
    case EventKind::Chat:
        break;
    }
    return ChatText{body};
}

Participant systemParticipant() {
    return Participant("System", UNKNOWN_ADDRESS);
}
