#ifndef LANCHAT_CONFIG_HPP
#define LANCHAT_CONFIG_HPP

#include <QSettings>
#include <QString>
#include <QStringList>

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "LanChat/discovery.hpp"
#include "LanChat/server.hpp"
#include "LanChat/transport.hpp"

struct AppConfig {
    QString nickname;
    std::uint16_t chatPort = DEFAULT_CHAT_PORT;
    std::uint16_t discoveryPort = DEFAULT_DISCOVERY_PORT;
    QString multicastGroup = QString::fromLatin1(DEFAULT_MULTICAST_GROUP);
    std::chrono::milliseconds discoveryTimeout = DEFAULT_DISCOVERY_TIMEOUT;
    std::size_t maxConnections = DEFAULT_MAX_CONNECTIONS;
    QString dataDir;
    QString responderProgram;
    QStringList responderArguments;
};

// Out-of-range or unparsable values fall back to the defaults (logged).
AppConfig loadConfig(const QSettings& settings);
void saveConfig(QSettings& settings, const AppConfig& config);

// Default directory for history and profiles.
QString defaultDataDir();

#endif // LANCHAT_CONFIG_HPP
