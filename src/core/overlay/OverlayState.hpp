#pragma once

#include <QMetaType>
#include <QString>

namespace dsc {

enum class OverlayState {
    None,
    AutoDiscovery,
    Connecting,
    NoLayoutAssigned,
    ServerOffline
};

inline const char* toString(OverlayState state)
{
    switch (state) {
    case OverlayState::None:             return "None";
    case OverlayState::AutoDiscovery:    return "AutoDiscovery";
    case OverlayState::Connecting:       return "Connecting";
    case OverlayState::NoLayoutAssigned: return "NoLayoutAssigned";
    case OverlayState::ServerOffline:    return "ServerOffline";
    }
    return "Unknown";
}

/// Everything an overlay frame depends on. Two equal snapshots render the
/// same frame.
struct OverlayParams {
    OverlayState state = OverlayState::None;
    QString address;
    QString clientId;
    QString deviceAddress;
    int attempt = 0;
    int retryIn = -1;
    bool discoveryActive = false;

    bool operator==(const OverlayParams& o) const
    {
        return state == o.state && address == o.address && clientId == o.clientId
            && deviceAddress == o.deviceAddress && attempt == o.attempt && retryIn == o.retryIn
            && discoveryActive == o.discoveryActive;
    }
    bool operator!=(const OverlayParams& o) const { return !(*this == o); }
};

} // namespace dsc

Q_DECLARE_METATYPE(dsc::OverlayState)
