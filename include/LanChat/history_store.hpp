#ifndef LANCHAT_HISTORY_STORE_HPP
#define LANCHAT_HISTORY_STORE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "LanChat/chat_event.hpp"

inline constexpr const char* HISTORY_FILE_NAME = "chat_history.txt";

class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Chat history as text, one "name|yyyy-MM-dd HH:mm:ss|KIND|body" line per
// event. Sender addresses are not kept; loaded events carry 0.0.0.0.
class HistoryStore {
public:
    explicit HistoryStore(std::string directory);

    // Rewrites the whole file atomically. Throws PersistenceError.
    void save(const std::vector<ChatEvent>& events) const;

    // Missing file means empty history. Malformed lines are skipped.
    // Throws PersistenceError when the file exists but cannot be read.
    std::vector<ChatEvent> load() const;

    // Throws PersistenceError.
    void append(const ChatEvent& event) const;

    // Removes the file. Throws PersistenceError.
    void clear() const;

    std::string filePath() const;

    static std::string formatLine(const ChatEvent& event);
    static std::optional<ChatEvent> parseLine(const std::string& line);

private:
    std::string directory_;
};

#endif // LANCHAT_HISTORY_STORE_HPP
