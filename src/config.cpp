#include "LanChat/config.hpp"
#include "LanChat/log.hpp"
#include "LanChat/responder.hpp"

#include <QDir>
#include <QStandardPaths>

namespace {

std::uint16_t readPort(const QSettings& settings, const QString& key, std::uint16_t fallback) {
    if (!settings.contains(key)) return fallback;

    bool ok = false;
    const uint value = settings.value(key).toUInt(&ok);
    if (!ok || value == 0 || value > 65535) {
        qCWarning(lcConfig) << "ignoring invalid" << key << "=" << settings.value(key).toString();
        return fallback;
    }
    return static_cast<std::uint16_t>(value);
}

qulonglong readPositive(const QSettings& settings, const QString& key, qulonglong fallback) {
    if (!settings.contains(key)) return fallback;

    bool ok = false;
    const qulonglong value = settings.value(key).toULongLong(&ok);
    if (!ok || value == 0) {
        qCWarning(lcConfig) << "ignoring invalid" << key << "=" << settings.value(key).toString();
        return fallback;
    }
    return value;
}

}

QString defaultDataDir() {
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return base.isEmpty() ? QDir::home().filePath(QStringLiteral(".lanchat")) : base;
}

AppConfig loadConfig(const QSettings& settings) {
    AppConfig config;

    config.nickname = settings.value(QStringLiteral("user/nickname")).toString().trimmed();
    config.chatPort = readPort(settings, QStringLiteral("net/chatPort"), config.chatPort);
    config.discoveryPort = readPort(settings, QStringLiteral("net/discoveryPort"), config.discoveryPort);
    config.multicastGroup = settings.value(QStringLiteral("net/multicastGroup"), config.multicastGroup).toString();
    config.discoveryTimeout = std::chrono::milliseconds(
        readPositive(settings, QStringLiteral("net/discoveryTimeoutMs"),
                     static_cast<qulonglong>(config.discoveryTimeout.count())));
    config.maxConnections = static_cast<std::size_t>(
        readPositive(settings, QStringLiteral("net/maxConnections"), config.maxConnections));
    config.dataDir = settings.value(QStringLiteral("storage/dataDir"), defaultDataDir()).toString();
    config.responderProgram = settings.value(QStringLiteral("responder/program"),
                                             QString::fromLatin1(DEFAULT_RESPONDER_PROGRAM)).toString();
    config.responderArguments = settings.value(QStringLiteral("responder/arguments"),
                                               QStringList{QString::fromLatin1(DEFAULT_RESPONDER_SCRIPT)}).toStringList();

    if (config.discoveryPort == config.chatPort) {
        qCWarning(lcConfig) << "discovery port equals chat port" << config.chatPort << ", using defaults";
        config.chatPort = DEFAULT_CHAT_PORT;
        config.discoveryPort = DEFAULT_DISCOVERY_PORT;
    }
    return config;
}

void saveConfig(QSettings& settings, const AppConfig& config) {
    settings.setValue(QStringLiteral("user/nickname"), config.nickname);
    settings.setValue(QStringLiteral("net/chatPort"), static_cast<uint>(config.chatPort));
    settings.setValue(QStringLiteral("net/discoveryPort"), static_cast<uint>(config.discoveryPort));
    settings.setValue(QStringLiteral("net/multicastGroup"), config.multicastGroup);
    settings.setValue(QStringLiteral("net/discoveryTimeoutMs"), static_cast<qulonglong>(config.discoveryTimeout.count()));
    settings.setValue(QStringLiteral("net/maxConnections"), static_cast<qulonglong>(config.maxConnections));
    settings.setValue(QStringLiteral("storage/dataDir"), config.dataDir);
    settings.setValue(QStringLiteral("responder/program"), config.responderProgram);
    settings.setValue(QStringLiteral("responder/arguments"), config.responderArguments);
}
