#include "LanChat/history_store.hpp"
#include "LanChat/log.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QString>
#include <QTextStream>

#include <algorithm>
#include <utility>

namespace {

const QString TIMESTAMP_FORMAT = QStringLiteral("yyyy-MM-dd HH:mm:ss");

std::string formatTimestamp(ChatEvent::Clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    return QDateTime::fromMSecsSinceEpoch(ms).toString(TIMESTAMP_FORMAT).toStdString();
}

std::optional<ChatEvent::Clock::time_point> parseTimestamp(const std::string& text) {
    const QDateTime dt = QDateTime::fromString(QString::fromStdString(text), TIMESTAMP_FORMAT);
    if (!dt.isValid()) return std::nullopt;
    return ChatEvent::Clock::time_point(std::chrono::milliseconds(dt.toMSecsSinceEpoch()));
}

// One event per line: the separator and line breaks cannot survive in
// name or body positions that are split on.
std::string flatten(std::string text) {
    std::replace(text.begin(), text.end(), '\n', ' ');
    std::replace(text.begin(), text.end(), '\r', ' ');
    return text;
}

void ensureDirectory(const QString& directory) {
    if (!QDir().mkpath(directory)) {
        throw PersistenceError("cannot create directory " + directory.toStdString());
    }
}

}

HistoryStore::HistoryStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string HistoryStore::filePath() const {
    return QDir(QString::fromStdString(directory_)).filePath(QString::fromLatin1(HISTORY_FILE_NAME)).toStdString();
}

std::string HistoryStore::formatLine(const ChatEvent& event) {
    std::string name = flatten(event.sender().name());
    std::replace(name.begin(), name.end(), '|', '_');
    return name + "|" + formatTimestamp(event.timestamp()) + "|" + toString(event.kind()) + "|" + flatten(event.body());
}

std::optional<ChatEvent> HistoryStore::parseLine(const std::string& line) {
    std::size_t fields[3];
    std::size_t from = 0;
    for (auto& pos : fields) {
        pos = line.find('|', from);
        if (pos == std::string::npos) return std::nullopt;
        from = pos + 1;
    }

    const std::string name = line.substr(0, fields[0]);
    const auto timestamp = parseTimestamp(line.substr(fields[0] + 1, fields[1] - fields[0] - 1));
    const auto kind = eventKindFromString(line.substr(fields[1] + 1, fields[2] - fields[1] - 1));
    if (name.empty() || !timestamp || !kind) return std::nullopt;

    return ChatEvent(Participant(name, UNKNOWN_ADDRESS),
                     ChatEvent::payloadFromBody(*kind, line.substr(fields[2] + 1)),
                     *timestamp);
}

void HistoryStore::save(const std::vector<ChatEvent>& events) const {
    const QString path = QString::fromStdString(filePath());
    ensureDirectory(QString::fromStdString(directory_));

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        throw PersistenceError("cannot write " + path.toStdString() + ": " + file.errorString().toStdString());
    }

    QTextStream out(&file);
    for (const auto& event : events) {
        out << QString::fromStdString(formatLine(event)) << '\n';
    }
    out.flush();

    if (!file.commit()) {
        throw PersistenceError("cannot write " + path.toStdString() + ": " + file.errorString().toStdString());
    }
    qCDebug(lcPersistence) << "saved" << events.size() << "events to" << path;
}

std::vector<ChatEvent> HistoryStore::load() const {
    std::vector<ChatEvent> events;

    QFile file(QString::fromStdString(filePath()));
    if (!file.exists()) return events;
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw PersistenceError("cannot read " + filePath() + ": " + file.errorString().toStdString());
    }

    QTextStream in(&file);
    int lineNumber = 0;
    while (!in.atEnd()) {
        const QString line = in.readLine();
        ++lineNumber;
        if (line.trimmed().isEmpty()) continue;

        auto event = parseLine(line.toStdString());
        if (!event) {
            qCWarning(lcPersistence) << "skipping malformed history line" << lineNumber << "of" << file.fileName();
            continue;
        }
        events.push_back(std::move(*event));
    }
    return events;
}

void HistoryStore::append(const ChatEvent& event) const {
    ensureDirectory(QString::fromStdString(directory_));

    QFile file(QString::fromStdString(filePath()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        throw PersistenceError("cannot append to " + filePath() + ": " + file.errorString().toStdString());
    }

    QTextStream out(&file);
    out << QString::fromStdString(formatLine(event)) << '\n';
    out.flush();
    if (out.status() != QTextStream::Ok) {
        throw PersistenceError("cannot append to " + filePath());
    }
}

void HistoryStore::clear() const {
    QFile file(QString::fromStdString(filePath()));
    if (file.exists() && !file.remove()) {
        throw PersistenceError("cannot remove " + filePath() + ": " + file.errorString().toStdString());
    }
}
