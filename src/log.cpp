#include "LanChat/log.hpp"

Q_LOGGING_CATEGORY(lcSession, "lanchat.session", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTransport, "lanchat.transport", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDiscovery, "lanchat.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPersistence, "lanchat.persistence", QtInfoMsg)
Q_LOGGING_CATEGORY(lcResponder, "lanchat.responder", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "lanchat.config", QtInfoMsg)
