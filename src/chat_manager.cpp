#include "LanChat/chat_manager.hpp"
#include "LanChat/history_store.hpp"
#include "LanChat/log.hpp"
#include "LanChat/responder.hpp"
#include "LanChat/transport.hpp"

#include <algorithm>
#include <utility>

const char* toString(DeliveryStatus status) {
    switch (status) {
    case DeliveryStatus::Delivered:
        return "delivered";
    case DeliveryStatus::Partial:
        return "partially delivered";
    case DeliveryStatus::NotConnected:
        return "not connected";
    case DeliveryStatus::Failed:
        return "failed";
    }
    return "unknown";
}

namespace {

Participant onlineCopy(const Participant& p, bool online) {
    Participant copy = p;
    copy.setOnline(online);
    return copy;
}

}

ChatManager::ChatManager(Participant self)
    : self_(onlineCopy(self, true)) {
    participants_.push_back(self_);
}

ChatManager::~ChatManager() {
    detachTransport();
}

void ChatManager::attachTransport(Transport& transport) {
    detachTransport();

    transport.onJoin([this](const Participant& p) { addParticipant(p); });
    transport.onReceive([this](const ChatEvent& e) { receiveRemote(e); });
    transport.onLeave([this](const Participant& p) { removeParticipant(p); });

    std::lock_guard<std::mutex> lock(mutex_);
    transport_ = &transport;
}

void ChatManager::detachTransport() {
    Transport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(transport, transport_);
    }
    if (!transport) return;

    transport->onJoin(nullptr);
    transport->onReceive(nullptr);
    transport->onLeave(nullptr);
}

void ChatManager::attachHistory(HistoryStore& store) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_ = &store;
}

void ChatManager::attachResponder(const Participant& bot, ResponseGenerator& generator) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bot_ = bot;
        generator_ = &generator;
    }
    addParticipant(bot);
}

void ChatManager::addParticipant(const Participant& participant) {
    const Participant added = onlineCopy(participant, true);
    std::lock_guard<std::recursive_mutex> order(notifyMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(participants_.begin(), participants_.end(), added) != participants_.end()) {
            return;
        }
        participants_.push_back(added);
    }

    qCInfo(lcSession) << added.name().c_str() << "is online";
    observers_.notify([&added](ChatObserver& o) { o.onParticipantAdded(added); });
}

void ChatManager::removeParticipant(const Participant& participant) {
    if (participant == self_) {
        qCDebug(lcSession) << "ignoring removal of the local participant";
        return;
    }

    const Participant removed = onlineCopy(participant, false);
    std::lock_guard<std::recursive_mutex> order(notifyMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(participants_.begin(), participants_.end(), removed);
        if (it == participants_.end()) return;
        participants_.erase(it);
    }

    qCInfo(lcSession) << removed.name().c_str() << "went offline";
    observers_.notify([&removed](ChatObserver& o) { o.onParticipantRemoved(removed); });
}

DeliveryStatus ChatManager::sendLocal(const std::string& content, const std::optional<Participant>& recipient) {
    return sendEvent(ChatText{content}, recipient);
}

DeliveryStatus ChatManager::sendEvent(const EventPayload& payload, const std::optional<Participant>& recipient) {
    const ChatEvent event(self_, payload);
    append(event);

    bool toBot = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        toBot = recipient && bot_ && *recipient == *bot_;
    }
    if (toBot) return respond(event);

    return deliver(event, recipient);
}

void ChatManager::receiveRemote(const ChatEvent& event) {
    append(event);
}

void ChatManager::postSystemNotice(const std::string& text) {
    append(ChatEvent(systemParticipant(), SystemNotice{text}));
}

std::size_t ChatManager::loadHistory() {
    HistoryStore* store = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store = store_;
    }
    if (!store) return 0;

    std::vector<ChatEvent> loaded;
    try {
        loaded = store->load();
    } catch (const PersistenceError& e) {
        qCWarning(lcPersistence) << "could not load history:" << e.what();
        return 0;
    }

    {
        std::lock_guard<std::recursive_mutex> order(notifyMutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            history_.insert(history_.end(), loaded.begin(), loaded.end());
        }
        for (const auto& event : loaded) {
            observers_.notify([&event](ChatObserver& o) { o.onEventAppended(event); });
        }
    }

    qCInfo(lcSession) << "loaded" << loaded.size() << "events from" << store->filePath().c_str();
    return loaded.size();
}

bool ChatManager::saveHistory() {
    HistoryStore* store = nullptr;
    std::vector<ChatEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store = store_;
        events = history_;
    }
    if (!store) return false;

    try {
        store->save(events);
    } catch (const PersistenceError& e) {
        qCWarning(lcPersistence) << "could not save history:" << e.what();
        return false;
    }
    return true;
}

std::vector<Participant> ChatManager::participants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return participants_;
}

std::vector<ChatEvent> ChatManager::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

bool ChatManager::isActive(const Participant& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(participants_.begin(), participants_.end(), participant) != participants_.end();
}

void ChatManager::append(const ChatEvent& event) {
    // Held through the notification so observers see history order.
    std::lock_guard<std::recursive_mutex> order(notifyMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(event);

        // Under the lock so the file keeps the in-memory order.
        if (store_) {
            try {
                store_->append(event);
            } catch (const PersistenceError& e) {
                qCWarning(lcPersistence) << "history append failed:" << e.what();
            }
        }
    }

    observers_.notify([&event](ChatObserver& o) { o.onEventAppended(event); });
}

DeliveryStatus ChatManager::deliver(const ChatEvent& event, const std::optional<Participant>& recipient) {
    Transport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = transport_;
    }
    if (!transport) {
        qCWarning(lcSession) << "no transport attached, message kept locally";
        return DeliveryStatus::NotConnected;
    }

    if (recipient) {
        try {
            transport->sendTo(*recipient, event);
            return DeliveryStatus::Delivered;
        } catch (const TransportError& e) {
            qCWarning(lcSession) << "delivery to" << recipient->name().c_str() << "failed:" << e.what();
            return e.cause() == TransportErrorCause::NotConnected ? DeliveryStatus::NotConnected
                                                                  : DeliveryStatus::Failed;
        }
    }

    const BroadcastReport report = transport->broadcast(event);
    if (report.failed == 0 && report.delivered == 0) return DeliveryStatus::NotConnected;
    if (report.failed == 0) return DeliveryStatus::Delivered;
    if (report.delivered == 0) return DeliveryStatus::Failed;
    qCWarning(lcSession) << "broadcast reached" << report.delivered << "of"
                         << (report.delivered + report.failed) << "connections";
    return DeliveryStatus::Partial;
}

DeliveryStatus ChatManager::respond(const ChatEvent& request) {
    Participant bot;
    ResponseGenerator* generator = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bot = *bot_;
        generator = generator_;
    }

    std::string reply;
    try {
        reply = generator->generateResponse(request.body());
    } catch (const std::exception& e) {
        qCWarning(lcResponder) << "responder failed:" << e.what();
        return DeliveryStatus::Failed;
    }

    receiveRemote(ChatEvent(bot, ChatText{reply}));
    return DeliveryStatus::Delivered;
}
