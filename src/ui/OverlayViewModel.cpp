#include "ui/OverlayViewModel.hpp"

namespace dsc {

OverlayViewModel::OverlayViewModel(QObject *parent)
    : QObject(parent)
{
}

QString OverlayViewModel::titleFor(const OverlayParams& params)
{
    switch (params.state) {
    case OverlayState::None:             return {};
    case OverlayState::AutoDiscovery:    return tr("Searching for Server");
    case OverlayState::Connecting:       return tr("Connecting to Server");
    case OverlayState::NoLayoutAssigned: return tr("No Layout Assigned");
    case OverlayState::ServerOffline:    return tr("Server Offline");
    }
    return {};
}

QString OverlayViewModel::detailFor(const OverlayParams& params)
{
    switch (params.state) {
    case OverlayState::None:
        return {};
    case OverlayState::AutoDiscovery: {
        QString text = tr("Please wait while we search for available servers on the network");
        if (!params.clientId.isEmpty())
            text += QLatin1Char('\n') + tr("Client ID: %1").arg(params.clientId);
        if (!params.deviceAddress.isEmpty())
            text += QLatin1Char('\n') + tr("IP: %1").arg(params.deviceAddress);
        return text;
    }
    case OverlayState::Connecting:
        return tr("%1\nAttempt %2").arg(params.address).arg(params.attempt);
    case OverlayState::NoLayoutAssigned:
        return tr("This device is connected but has not been assigned a layout\nClient ID: %1\nServer: %2")
            .arg(params.clientId, params.address);
    case OverlayState::ServerOffline: {
        QString text = tr("Cannot reach %1 (attempt %2)").arg(params.address).arg(params.attempt);
        if (params.discoveryActive)
            text += QLatin1Char('\n') + tr("Searching the network for servers...");
        else if (params.retryIn >= 0)
            text += QLatin1Char('\n') + tr("Retrying in %1 s").arg(params.retryIn);
        return text;
    }
    }
    return {};
}

void OverlayViewModel::render(const OverlayParams& params)
{
    state_ = QString::fromLatin1(toString(params.state));
    title_ = titleFor(params);
    detail_ = detailFor(params);
    emit changed();
    setVisible(params.state != OverlayState::None);
}

void OverlayViewModel::hide()
{
    setVisible(false);
    if (state_ == QLatin1String("None"))
        return;
    state_ = QStringLiteral("None");
    title_.clear();
    detail_.clear();
    emit changed();
}

void OverlayViewModel::raise()
{
    if (visible_)
        emit raiseRequested();
}

void OverlayViewModel::setVisible(bool visible)
{
    if (visible_ == visible)
        return;
    visible_ = visible;
    emit visibleChanged();
}

} // namespace dsc
