#include "LanChat/wire.hpp"
#include "LanChat/transport.hpp"

#include <chrono>
#include <limits>
#include <utility>
#include <vector>

namespace {

static const char* b64_table() {
    return "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

static int b64_index(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

static bool parse_uint(const std::string& s, unsigned long long max, unsigned long long& out) {
    if (s.empty()) return false;
    unsigned long long v = 0;
    for (char ch : s) {
        if (ch < '0' || ch > '9') return false;
        const unsigned long long digit = static_cast<unsigned long long>(ch - '0');
        if (v > max / 10 || (v == max / 10 && digit > max % 10)) return false;
        v = v * 10 + digit;
    }
    out = v;
    return true;
}

// Protocol fields never contain '|': text is base64 encoded.
static std::vector<std::string> split_fields(const std::string& s) {
    std::vector<std::string> fields;
    std::size_t pos = 0;
    while (true) {
        const std::size_t next = s.find('|', pos);
        if (next == std::string::npos) {
            fields.push_back(s.substr(pos));
            return fields;
        }
        fields.push_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
}

[[noreturn]] void malformed(const std::string& why) {
    throw TransportError(TransportErrorCause::Protocol, "malformed frame: " + why);
}

std::string decodeText(const std::string& field, const char* what) {
    std::string out;
    if (!base64Decode(field, out)) malformed(std::string("bad base64 in ") + what);
    return out;
}

void appendField(std::string& packet, const std::string& field) {
    packet.push_back('|');
    packet.append(field);
}

void appendText(std::string& packet, const std::string& text) {
    appendField(packet, base64Encode(text));
}

EventPayload decodePayload(EventKind kind, const std::vector<std::string>& f, std::size_t first) {
    const std::size_t n = f.size() - first;

    switch (kind) {
    case EventKind::Chat:
    case EventKind::System: {
        if (n != 1) malformed("text payload");
        std::string text = decodeText(f[first], "text");
        if (kind == EventKind::System) return SystemNotice{std::move(text)};
        return ChatText{std::move(text)};
    }
    case EventKind::File: {
        if (n != 2) malformed("file payload");
        unsigned long long size = 0;
        if (!parse_uint(f[first + 1], std::numeric_limits<std::uint64_t>::max(), size)) {
            malformed("file size");
        }
        return FileShare{decodeText(f[first], "file name"), static_cast<std::uint64_t>(size)};
    }
    case EventKind::Command: {
        if (n < 2) malformed("command payload");
        unsigned long long argc = 0;
        if (!parse_uint(f[first + 1], n - 2, argc) || argc != n - 2) malformed("command argc");
        Command command;
        command.name = decodeText(f[first], "command name");
        for (std::size_t i = first + 2; i < f.size(); ++i) {
            command.args.push_back(decodeText(f[i], "command argument"));
        }
        return command;
    }
    }
    malformed("kind");
}

}

std::string base64Encode(std::string_view data) {
    const char* tbl = b64_table();
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= data.size()) {
        const unsigned char b0 = static_cast<unsigned char>(data[i]);
        const unsigned char b1 = static_cast<unsigned char>(data[i + 1]);
        const unsigned char b2 = static_cast<unsigned char>(data[i + 2]);
        i += 3;

        out.push_back(tbl[(b0 >> 2) & 0x3F]);
        out.push_back(tbl[((b0 & 0x03) << 4) | ((b1 >> 4) & 0x0F)]);
        out.push_back(tbl[((b1 & 0x0F) << 2) | ((b2 >> 6) & 0x03)]);
        out.push_back(tbl[b2 & 0x3F]);
    }

    const size_t rem = data.size() - i;
    if (rem == 1) {
        const unsigned char b0 = static_cast<unsigned char>(data[i]);
        out.push_back(tbl[(b0 >> 2) & 0x3F]);
        out.push_back(tbl[(b0 & 0x03) << 4]);
        out.push_back('=');
        out.push_back('=');
    } else if (rem == 2) {
        const unsigned char b0 = static_cast<unsigned char>(data[i]);
        const unsigned char b1 = static_cast<unsigned char>(data[i + 1]);
        out.push_back(tbl[(b0 >> 2) & 0x3F]);
        out.push_back(tbl[((b0 & 0x03) << 4) | ((b1 >> 4) & 0x0F)]);
        out.push_back(tbl[(b1 & 0x0F) << 2]);
        out.push_back('=');
    }

    return out;
}

bool base64Decode(const std::string& in, std::string& out) {
    out.clear();
    if (in.empty()) return true;
    if ((in.size() % 4) != 0) return false;

    out.reserve((in.size() / 4) * 3);

    for (size_t i = 0; i < in.size(); i += 4) {
        const unsigned char c0 = static_cast<unsigned char>(in[i]);
        const unsigned char c1 = static_cast<unsigned char>(in[i + 1]);
        const unsigned char c2 = static_cast<unsigned char>(in[i + 2]);
        const unsigned char c3 = static_cast<unsigned char>(in[i + 3]);

        const bool last = (i + 4 == in.size());
        const int v0 = b64_index(c0);
        const int v1 = b64_index(c1);
        const bool pad2 = (c2 == '=');
        const bool pad3 = (c3 == '=');
        if ((pad2 || pad3) && !last) return false;
        if (pad2 && !pad3) return false;
        const int v2 = pad2 ? 0 : b64_index(c2);
        const int v3 = pad3 ? 0 : b64_index(c3);
        if (v0 < 0 || v1 < 0 || (!pad2 && v2 < 0) || (!pad3 && v3 < 0)) return false;

        const unsigned int triple = (static_cast<unsigned int>(v0) << 18)
                                  | (static_cast<unsigned int>(v1) << 12)
                                  | (static_cast<unsigned int>(v2) << 6)
                                  | static_cast<unsigned int>(v3);

        out.push_back(static_cast<char>((triple >> 16) & 0xFF));
        if (!pad2) out.push_back(static_cast<char>((triple >> 8) & 0xFF));
        if (!pad3) out.push_back(static_cast<char>(triple & 0xFF));
    }

    return true;
}

std::string encodeIdentity(const Participant& participant) {
    std::string packet(WIRE_PREFIX);
    appendField(packet, "ID");
    appendText(packet, participant.name());
    appendText(packet, participant.address());
    appendField(packet, participant.online() ? "1" : "0");
    appendText(packet, participant.avatar());
    return packet;
}

std::string encodeEvent(const ChatEvent& event, Route route) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        event.timestamp().time_since_epoch()).count();

    std::string packet(WIRE_PREFIX);
    appendField(packet, "EV");
    appendField(packet, std::string(1, static_cast<char>(route)));
    appendField(packet, toString(event.kind()));
    appendField(packet, std::to_string(millis < 0 ? 0 : millis));
    appendText(packet, event.sender().name());
    appendText(packet, event.sender().address());

    const EventPayload& payload = event.payload();
    if (const auto* p = std::get_if<ChatText>(&payload)) {
        appendText(packet, p->text);
    } else if (const auto* p = std::get_if<SystemNotice>(&payload)) {
        appendText(packet, p->text);
    } else if (const auto* p = std::get_if<FileShare>(&payload)) {
        appendText(packet, p->fileName);
        appendField(packet, std::to_string(p->sizeBytes));
    } else if (const auto* p = std::get_if<Command>(&payload)) {
        appendText(packet, p->name);
        appendField(packet, std::to_string(p->args.size()));
        for (const auto& arg : p->args) {
            appendText(packet, arg);
        }
    }
    return packet;
}

Frame decodeFrame(const std::string& payload) {
    const std::vector<std::string> f = split_fields(payload);
    if (f.size() < 2 || f[0] != WIRE_PREFIX) malformed("prefix");

    if (f[1] == "ID") {
        if (f.size() != 6) malformed("identity field count");
        if (f[4] != "0" && f[4] != "1") malformed("online flag");
        Participant participant(decodeText(f[2], "name"),
                                decodeText(f[3], "address"),
                                f[4] == "1",
                                decodeText(f[5], "avatar"));
        if (participant.name().empty()) malformed("empty name");
        return IdentityFrame{std::move(participant)};
    }

    if (f[1] != "EV") malformed("frame type");
    if (f.size() < 8) malformed("event field count");

    if (f[2].size() != 1) malformed("route");
    const char r = f[2][0];
    if (r != 'D' && r != 'B' && r != 'R') malformed("route");

    const std::optional<EventKind> kind = eventKindFromString(f[3]);
    if (!kind) malformed("kind");

    unsigned long long millis = 0;
    if (!parse_uint(f[4], static_cast<unsigned long long>(MAX_EPOCH_MILLIS), millis)) {
        malformed("timestamp");
    }
    const ChatEvent::Clock::time_point timestamp{
        std::chrono::duration_cast<ChatEvent::Clock::duration>(
            std::chrono::milliseconds(static_cast<long long>(millis)))};

    Participant sender(decodeText(f[5], "sender name"), decodeText(f[6], "sender address"));

    return EventFrame{static_cast<Route>(r),
                      ChatEvent(std::move(sender), decodePayload(*kind, f, 7), timestamp)};
}
