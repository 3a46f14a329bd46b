#ifndef LANCHAT_LOG_HPP
#define LANCHAT_LOG_HPP

#include <QLoggingCategory>

// Enable with QT_LOGGING_RULES="lanchat.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcTransport)
Q_DECLARE_LOGGING_CATEGORY(lcDiscovery)
Q_DECLARE_LOGGING_CATEGORY(lcPersistence)
Q_DECLARE_LOGGING_CATEGORY(lcResponder)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

#endif // LANCHAT_LOG_HPP
