#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSettings>

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "LanChat/chat_manager.hpp"
#include "LanChat/config.hpp"
#include "LanChat/discovery.hpp"
#include "LanChat/history_store.hpp"
#include "LanChat/log.hpp"
#include "LanChat/profile_store.hpp"
#include "LanChat/responder.hpp"
#include "LanChat/socket_transport.hpp"

namespace {

constexpr const char* PROMPT = "[Your text] : ";
constexpr const char* BOT_NAME = "ChatBot";

class ConsoleView final : public ChatObserver {
public:
    void onParticipantAdded(const Participant& p) override {
        print("* " + p.name() + " joined (" + p.address() + ")");
    }

    void onParticipantRemoved(const Participant& p) override {
        print("* " + p.name() + " left");
    }

    void onEventAppended(const ChatEvent& event) override {
        print(event.formatForDisplay());
    }

    void print(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout   << "\r"
                    << "\33[2K"
                    << line << std::endl
                    << PROMPT
                    << std::flush;
    }

private:
    std::mutex mutex_;
};

void printHelp(ConsoleView& view) {
    view.print("/who                 list participants");
    view.print("/to <name> <text>    private message");
    view.print("/bot <text>          ask the assistant");
    view.print("/file <path>         share a file name and size");
    view.print("/cmd <name> [args]   send a command");
    view.print("/save                rewrite the history file");
    view.print("/quit                leave");
}

std::string explain(const TransportError& e, std::uint16_t port) {
    switch (e.cause()) {
    case TransportErrorCause::AddressInUse:
        return "Port " + std::to_string(port) + " is already in use. Another LanChat host may be running here; "
               "pick another one with --port.";
    case TransportErrorCause::ConnectionRefused:
        return "Nobody is accepting chat connections there (" + std::string(e.what()) + ").";
    case TransportErrorCause::HostUnreachable:
        return "That host cannot be reached from this network (" + std::string(e.what()) + ").";
    default:
        break;
    }
    return std::string("Network error: ") + e.what();
}

std::optional<Participant> findParticipant(const ChatManager& manager, const std::string& name) {
    for (const auto& p : manager.participants()) {
        if (p.name() == name && p != manager.self()) return p;
    }
    return std::nullopt;
}

std::string rest(std::istringstream& in) {
    std::string text;
    std::getline(in >> std::ws, text);
    return text;
}

void report(ConsoleView& view, DeliveryStatus status) {
    if (status != DeliveryStatus::Delivered) {
        view.print(std::string("(message ") + toString(status) + ")");
    }
}

// Returns false when the user asked to leave.
bool handleInput(const std::string& line, ChatManager& manager, ConsoleView& view,
                 const std::optional<Participant>& bot) {
    if (line.empty()) return true;
    if (line[0] != '/') {
        report(view, manager.sendLocal(line));
        return true;
    }

    std::istringstream in(line);
    std::string command;
    in >> command;

    if (command == "/quit") return false;

    if (command == "/who") {
        for (const auto& p : manager.participants()) {
            view.print("  " + p.toString() + (p == manager.self() ? " [you]" : ""));
        }
    } else if (command == "/to") {
        std::string name;
        in >> name;
        const std::string text = rest(in);
        const auto target = findParticipant(manager, name);
        if (!target || text.empty()) {
            view.print("usage: /to <name> <text> (unknown participant '" + name + "')");
        } else {
            report(view, manager.sendLocal(text, target));
        }
    } else if (command == "/bot") {
        const std::string text = rest(in);
        if (!bot) {
            view.print("the assistant is disabled");
        } else if (!text.empty()) {
            report(view, manager.sendLocal(text, bot));
        }
    } else if (command == "/file") {
        const QFileInfo info(QString::fromStdString(rest(in)));
        if (!info.isFile()) {
            view.print("no such file: " + info.filePath().toStdString());
        } else {
            report(view, manager.sendEvent(FileShare{info.fileName().toStdString(),
                                                     static_cast<std::uint64_t>(info.size())}));
        }
    } else if (command == "/cmd") {
        const std::string text = rest(in);
        if (text.empty()) {
            view.print("usage: /cmd <name> [args]");
        } else {
            report(view, manager.sendEvent(ChatEvent::payloadFromBody(EventKind::Command, text)));
        }
    } else if (command == "/save") {
        view.print(manager.saveHistory() ? "history saved" : "history could not be saved");
    } else {
        printHelp(view);
    }
    return true;
}

std::optional<std::pair<std::string, std::uint16_t>> parseHostPort(const QString& value) {
    const int colon = value.lastIndexOf(QLatin1Char(':'));
    if (colon <= 0) return std::nullopt;

    bool ok = false;
    const uint port = value.mid(colon + 1).toUInt(&ok);
    if (!ok || port == 0 || port > 65535) return std::nullopt;
    return std::make_pair(value.left(colon).toStdString(), static_cast<std::uint16_t>(port));
}

}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("LanChat");
    QCoreApplication::setApplicationName("LanChat");

    QCommandLineParser parser;
    parser.setApplicationDescription("Local network chat");
    parser.addHelpOption();
    parser.addOptions({
        {{"n", "name"}, "Nickname (saved for next time).", "name"},
        {"host", "Host a chat instead of looking for one."},
        {"join", "Only join a discovered chat, never host."},
        {{"c", "connect"}, "Join the host at <host:port> without discovery.", "host:port"},
        {{"p", "port"}, "Chat port.", "port"},
        {"discovery-port", "Discovery port.", "port"},
        {"timeout", "Discovery timeout in milliseconds.", "ms"},
        {"data-dir", "Directory for history and profiles.", "dir"},
        {"no-responder", "Do not start the assistant."},
    });
    parser.process(app);

    QSettings settings;
    AppConfig config = loadConfig(settings);

    if (parser.isSet("name")) {
        config.nickname = parser.value("name").trimmed();
        settings.setValue("user/nickname", config.nickname);
    }
    if (parser.isSet("port")) {
        const uint port = parser.value("port").toUInt();
        if (port == 0 || port > 65535) {
            std::cerr << "Invalid port: " << parser.value("port").toStdString() << std::endl;
            return 1;
        }
        config.chatPort = static_cast<std::uint16_t>(port);
    }
    if (parser.isSet("discovery-port")) {
        const uint port = parser.value("discovery-port").toUInt();
        if (port == 0 || port > 65535) {
            std::cerr << "Invalid discovery port: " << parser.value("discovery-port").toStdString() << std::endl;
            return 1;
        }
        config.discoveryPort = static_cast<std::uint16_t>(port);
    }
    if (parser.isSet("timeout")) {
        config.discoveryTimeout = std::chrono::milliseconds(parser.value("timeout").toUInt());
    }
    if (parser.isSet("data-dir")) {
        config.dataDir = parser.value("data-dir");
    }

    while (config.nickname.isEmpty()) {
        std::cout << "[Your name] : " << std::flush;
        std::string name;
        if (!std::getline(std::cin, name)) return 0;
        config.nickname = QString::fromStdString(name).trimmed();
        if (!config.nickname.isEmpty()) settings.setValue("user/nickname", config.nickname);
    }

    const std::string dataDir = config.dataDir.toStdString();
    ProfileStore profiles(QDir(config.dataDir).filePath("profiles").toStdString());

    Participant self(config.nickname.toStdString(), localAddress(), true, DEFAULT_AVATAR);
    if (auto saved = profiles.load(self.name())) {
        self.setAvatar(saved->avatar());
    }
    try {
        profiles.save(self);
    } catch (const PersistenceError& e) {
        qCWarning(lcPersistence) << "could not save profile:" << e.what();
    }

    SocketTransport transport(self, TransportOptions{config.maxConnections, true});
    HistoryStore history(dataDir);
    ConsoleView view;
    ChatManager manager(self);

    manager.attachHistory(history);
    manager.loadHistory();
    manager.addObserver(&view);
    manager.attachTransport(transport);
    manager.postSystemNotice("Chat initialized for " + self.name());

    std::unique_ptr<ProcessResponder> responder;
    std::optional<Participant> bot;
    if (!parser.isSet("no-responder")) {
        responder = std::make_unique<ProcessResponder>(config.responderProgram, config.responderArguments);
        if (responder->start()) {
            bot = Participant(BOT_NAME, "127.0.0.1");
            manager.attachResponder(*bot, *responder);
        } else {
            view.print("(assistant unavailable, continuing without it)");
        }
    }

    DiscoveryOptions discovery;
    discovery.group = config.multicastGroup.toStdString();
    discovery.port = config.discoveryPort;
    Advertiser advertiser(config.chatPort, discovery);

    auto host = [&]() {
        transport.listen(config.chatPort);
        try {
            advertiser.start();
        } catch (const TransportError& e) {
            view.print(std::string("(not discoverable: ") + e.what() + ")");
        }
        manager.postSystemNotice("Hosting on " + self.address() + ":" + std::to_string(transport.listeningPort()));
    };

    try {
        if (parser.isSet("connect")) {
            const auto target = parseHostPort(parser.value("connect"));
            if (!target) {
                std::cerr << "Expected host:port, got " << parser.value("connect").toStdString() << std::endl;
                return 1;
            }
            const Participant peer = transport.connect(target->first, target->second);
            manager.postSystemNotice("Connected to " + peer.name());
        } else if (parser.isSet("host")) {
            host();
        } else {
            view.print("Looking for a chat on the local network...");
            const auto hosts = Discoverer(discovery).discover(config.discoveryTimeout);
            if (!hosts.empty()) {
                const Participant peer = transport.connect(hosts.front().address, hosts.front().port);
                manager.postSystemNotice("Connected to " + peer.name());
            } else if (parser.isSet("join")) {
                std::cerr << "No chat found on the local network." << std::endl;
                return 1;
            } else {
                host();
            }
        }
    } catch (const TransportError& e) {
        std::cerr << explain(e, config.chatPort) << std::endl;
        return 1;
    }

    std::string input;
    while (true) {
        std::cout << PROMPT << std::flush;
        if (!std::getline(std::cin, input)) break;
        if (!handleInput(input, manager, view, bot)) break;
    }

    advertiser.stop();
    transport.stop();
    manager.removeObserver(&view);
    manager.detachTransport();
    if (responder) responder->shutdown();
    return 0;
}
