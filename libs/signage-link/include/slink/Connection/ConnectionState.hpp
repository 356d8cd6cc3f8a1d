#pragma once

#include <QJsonObject>
#include <QMetaType>
#include <QString>

#include <slink/Transport/ConnectResult.hpp>

namespace slink {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

inline const char* toString(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting:   return "Connecting";
    case ConnectionState::Connected:    return "Connected";
    case ConnectionState::Reconnecting: return "Reconnecting";
    }
    return "Unknown";
}

enum class SendResult {
    Sent,
    NotConnected,
    TransportError
};

struct GatewayEvent {
    enum class Kind {
        Opened,
        MessageReceived,
        Errored,
        Closed
    };

    Kind kind = Kind::Closed;
    QJsonObject message;                        // MessageReceived
    ConnectResult error = ConnectResult::Ok;    // Errored
    QString detail;
};

struct GatewayConfig {
    int handshakeTimeoutMs = 10000;
};

} // namespace slink

Q_DECLARE_METATYPE(slink::ConnectionState)
Q_DECLARE_METATYPE(slink::GatewayEvent)
