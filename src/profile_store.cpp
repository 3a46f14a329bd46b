#include "LanChat/profile_store.hpp"
#include "LanChat/history_store.hpp"
#include "LanChat/log.hpp"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include <algorithm>
#include <map>
#include <utility>

namespace {

bool isPlainChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

std::map<std::string, std::string> readProperties(QFile& file) {
    std::map<std::string, std::string> props;
    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine();
        const int eq = line.indexOf(QLatin1Char('='));
        if (eq <= 0) continue;
        props[line.left(eq).trimmed().toStdString()] = line.mid(eq + 1).toStdString();
    }
    return props;
}

std::optional<Participant> readProfile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcPersistence) << "cannot read profile" << path << ":" << file.errorString();
        return std::nullopt;
    }

    const auto props = readProperties(file);
    const auto name = props.find("username");
    if (name == props.end() || name->second.empty()) return std::nullopt;

    auto value = [&props](const char* key, const std::string& fallback) {
        const auto it = props.find(key);
        return it == props.end() ? fallback : it->second;
    };

    return Participant(name->second,
                       value("address", "127.0.0.1"),
                       value("online", "false") == "true",
                       value("avatar", DEFAULT_AVATAR));
}

}

ProfileStore::ProfileStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string ProfileStore::fileNameFor(const std::string& name) {
    std::string file = name;
    std::replace_if(file.begin(), file.end(), [](char c) { return !isPlainChar(c); }, '_');
    return file + PROFILE_SUFFIX;
}

std::string ProfileStore::filePath(const std::string& name) const {
    return QDir(QString::fromStdString(directory_)).filePath(QString::fromStdString(fileNameFor(name))).toStdString();
}

void ProfileStore::save(const Participant& participant) const {
    if (!QDir().mkpath(QString::fromStdString(directory_))) {
        throw PersistenceError("cannot create directory " + directory_);
    }

    QSaveFile file(QString::fromStdString(filePath(participant.name())));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        throw PersistenceError("cannot write profile for " + participant.name() + ": " + file.errorString().toStdString());
    }

    QTextStream out(&file);
    out << "username=" << QString::fromStdString(participant.name()) << '\n'
        << "address=" << QString::fromStdString(participant.address()) << '\n'
        << "online=" << (participant.online() ? "true" : "false") << '\n'
        << "avatar=" << QString::fromStdString(participant.avatar()) << '\n';
    out.flush();

    if (!file.commit()) {
        throw PersistenceError("cannot write profile for " + participant.name() + ": " + file.errorString().toStdString());
    }
}

std::optional<Participant> ProfileStore::load(const std::string& name) const {
    const QString path = QString::fromStdString(filePath(name));
    if (!QFile::exists(path)) return std::nullopt;
    return readProfile(path);
}

std::vector<std::string> ProfileStore::savedNames() const {
    std::vector<std::string> names;

    const QDir dir(QString::fromStdString(directory_));
    const QStringList files = dir.entryList(QStringList{QStringLiteral("*") + QLatin1String(PROFILE_SUFFIX)},
                                            QDir::Files, QDir::Name);
    for (const QString& file : files) {
        if (auto profile = readProfile(dir.filePath(file))) {
            names.push_back(profile->name());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool ProfileStore::remove(const std::string& name) const {
    return QFile::remove(QString::fromStdString(filePath(name)));
}
