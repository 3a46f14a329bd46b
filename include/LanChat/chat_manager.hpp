#ifndef LANCHAT_CHAT_MANAGER_HPP
#define LANCHAT_CHAT_MANAGER_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "LanChat/chat_event.hpp"
#include "LanChat/observer_list.hpp"
#include "LanChat/participant.hpp"

class HistoryStore;
class ResponseGenerator;
class Transport;

// Callbacks run on the thread that changed the session, after the change
// is visible through ChatManager's accessors. They are serialized: events
// arrive in history order even when several connections deliver at once.
// A callback may call back into the manager but must not wait on another
// thread that does.
class ChatObserver {
public:
    virtual ~ChatObserver() = default;

    virtual void onParticipantAdded(const Participant&) {}
    virtual void onParticipantRemoved(const Participant&) {}
    virtual void onEventAppended(const ChatEvent&) {}
};

enum class DeliveryStatus {
    Delivered,
    Partial,
    NotConnected,
    Failed
};

const char* toString(DeliveryStatus status);

// Owns the participants and the history of one chat session.
//
// Every appended event stays in history whatever happens to its delivery.
// The participant list always holds self.
class ChatManager {
public:
    explicit ChatManager(Participant self);
    ~ChatManager();

    ChatManager(const ChatManager&) = delete;
    ChatManager& operator=(const ChatManager&) = delete;

    bool addObserver(ChatObserver* observer) { return observers_.add(observer); }
    bool removeObserver(ChatObserver* observer) { return observers_.remove(observer); }

    // Installs join/receive/leave handlers on the transport. The transport
    // must outlive the manager or be detached first.
    //
    // Detaching clears the handlers but does not wait for calls already in
    // flight on transport threads. Call Transport::stop() before detaching
    // or destroying the manager so none can still be running.
    void attachTransport(Transport& transport);
    void detachTransport();

    void attachHistory(HistoryStore& store);

    // Registers the bot as a participant; messages addressed to it are
    // answered in-process by the generator.
    void attachResponder(const Participant& bot, ResponseGenerator& generator);

    void addParticipant(const Participant& participant);
    void removeParticipant(const Participant& participant);

    DeliveryStatus sendLocal(const std::string& content,
                             const std::optional<Participant>& recipient = std::nullopt);
    DeliveryStatus sendEvent(const EventPayload& payload,
                             const std::optional<Participant>& recipient = std::nullopt);

    void receiveRemote(const ChatEvent& event);

    // Local-only notice from the "System" participant.
    void postSystemNotice(const std::string& text);

    // Appends the stored events in file order. Returns how many were loaded.
    std::size_t loadHistory();
    bool saveHistory();

    const Participant& self() const noexcept { return self_; }
    std::vector<Participant> participants() const;
    std::vector<ChatEvent> history() const;
    bool isActive(const Participant& participant) const;

private:
    void append(const ChatEvent& event);
    DeliveryStatus deliver(const ChatEvent& event, const std::optional<Participant>& recipient);
    DeliveryStatus respond(const ChatEvent& request);

    const Participant self_;

    mutable std::mutex mutex_;
    std::recursive_mutex notifyMutex_;
    std::vector<Participant> participants_;
    std::vector<ChatEvent> history_;
    Transport* transport_ = nullptr;
    HistoryStore* store_ = nullptr;
    std::optional<Participant> bot_;
    ResponseGenerator* generator_ = nullptr;

    ObserverList<ChatObserver> observers_;
};

#endif // LANCHAT_CHAT_MANAGER_HPP
