#include "core/overlay/StatusOverlay.hpp"
#include <QMutexLocker>
#include <boost/log/trivial.hpp>

namespace dsc {

StatusOverlay::StatusOverlay(IOverlayRenderer* renderer, QObject* parent)
    : QObject(parent)
    , renderer_(renderer)
{
    qRegisterMetaType<dsc::OverlayState>();

    graceTimer_.setSingleShot(true);
    graceTimer_.setInterval(10000);
    connect(&graceTimer_, &QTimer::timeout, this, &StatusOverlay::onGraceExpired);

    keepOnTopTimer_.setInterval(5000);
    connect(&keepOnTopTimer_, &QTimer::timeout, this, &StatusOverlay::onKeepOnTop);
}

StatusOverlay::~StatusOverlay() = default;

void StatusOverlay::setNoLayoutGraceMs(int ms)
{
    graceTimer_.setInterval(ms);
}

void StatusOverlay::setKeepOnTopIntervalMs(int ms)
{
    keepOnTopTimer_.setInterval(ms);
}

void StatusOverlay::setSuppressed(bool suppressed)
{
    QMutexLocker lock(&mutex_);
    suppressed_ = suppressed;
}

bool StatusOverlay::isSuppressed() const
{
    QMutexLocker lock(&mutex_);
    return suppressed_;
}

bool StatusOverlay::isThrottledAttempt(int attempt)
{
    return attempt <= 1 || attempt % 5 == 0;
}

bool StatusOverlay::isCountdownTick(int retryIn)
{
    return retryIn >= 0 && (retryIn % 10 == 0 || retryIn <= 3);
}

void StatusOverlay::showAutoDiscovery(const QString& clientId, const QString& deviceAddress)
{
    bool changed = false;
    {
        QMutexLocker lock(&mutex_);
        if (suppressed_ || !startupPhase_)
            return;

        OverlayParams next;
        next.state = OverlayState::AutoDiscovery;
        next.clientId = clientId;
        next.deviceAddress = deviceAddress;
        next.discoveryActive = true;
        if (next == current_)
            return;
        changed = current_.state != next.state;
        renderLocked(next);
    }
    if (changed)
        emit stateChanged(OverlayState::AutoDiscovery);
}

void StatusOverlay::showConnecting(const QString& address, int attempt)
{
    bool changed = false;
    {
        QMutexLocker lock(&mutex_);
        if (suppressed_)
            return;

        OverlayParams next;
        next.state = OverlayState::Connecting;
        next.address = address;
        next.attempt = attempt;
        if (throttledLocked(next))
            return;
        changed = current_.state != next.state;
        renderLocked(next);
    }
    if (changed)
        emit stateChanged(OverlayState::Connecting);
}

void StatusOverlay::showNoLayoutAssigned(const QString& address, const QString& clientId)
{
    QMutexLocker lock(&mutex_);
    pendingNoLayout_ = OverlayParams();
    pendingNoLayout_.state = OverlayState::NoLayoutAssigned;
    pendingNoLayout_.address = address;
    pendingNoLayout_.clientId = clientId;
    contentAssigned_ = false;
    noLayoutArmed_ = true;
    QMetaObject::invokeMethod(&graceTimer_, qOverload<>(&QTimer::start));
    BOOST_LOG_TRIVIAL(debug) << "[StatusOverlay] no-layout grace window armed ("
                             << graceTimer_.interval() << " ms)";
}

void StatusOverlay::cancelNoLayoutAssigned()
{
    QMutexLocker lock(&mutex_);
    if (!noLayoutArmed_)
        return;
    BOOST_LOG_TRIVIAL(debug) << "[StatusOverlay] no-layout grace window cancelled";
    noLayoutArmed_ = false;
    pendingNoLayout_ = OverlayParams();
    QMetaObject::invokeMethod(&graceTimer_, &QTimer::stop);
}

void StatusOverlay::showServerOffline(const QString& address, int attempt, int retryIn,
                                      bool discoveryActive)
{
    bool changed = false;
    {
        QMutexLocker lock(&mutex_);
        if (suppressed_)
            return;

        OverlayParams next;
        next.state = OverlayState::ServerOffline;
        next.address = address;
        next.attempt = attempt;
        next.retryIn = retryIn;
        next.discoveryActive = discoveryActive;
        if (throttledLocked(next))
            return;
        changed = current_.state != next.state;
        renderLocked(next);
    }
    if (changed)
        emit stateChanged(OverlayState::ServerOffline);
}

void StatusOverlay::clear()
{
    {
        QMutexLocker lock(&mutex_);
        noLayoutArmed_ = false;
        QMetaObject::invokeMethod(&graceTimer_, &QTimer::stop);
        QMetaObject::invokeMethod(&keepOnTopTimer_, &QTimer::stop);
        lastSeenAttempt_ = 0;
        if (current_.state == OverlayState::None)
            return;
        BOOST_LOG_TRIVIAL(info) << "[StatusOverlay] " << toString(current_.state) << " -> None";
        current_ = OverlayParams();
        renderer_->hide();
    }
    emit stateChanged(OverlayState::None);
}

void StatusOverlay::notifyContentAssigned()
{
    bool hideNoLayout = false;
    {
        QMutexLocker lock(&mutex_);
        contentAssigned_ = true;
        if (noLayoutArmed_) {
            BOOST_LOG_TRIVIAL(debug) << "[StatusOverlay] content arrived inside grace window";
            noLayoutArmed_ = false;
            QMetaObject::invokeMethod(&graceTimer_, &QTimer::stop);
        }
        hideNoLayout = current_.state == OverlayState::NoLayoutAssigned;
    }
    if (hideNoLayout)
        clear();
}

void StatusOverlay::markStartupComplete()
{
    QMutexLocker lock(&mutex_);
    startupPhase_ = false;
}

OverlayState StatusOverlay::state() const
{
    QMutexLocker lock(&mutex_);
    return current_.state;
}

OverlayParams StatusOverlay::lastRendered() const
{
    QMutexLocker lock(&mutex_);
    return current_;
}

bool StatusOverlay::isNoLayoutGracePending() const
{
    QMutexLocker lock(&mutex_);
    return noLayoutArmed_;
}

bool StatusOverlay::throttledLocked(const OverlayParams& next)
{
    const bool newWait = next.attempt != lastSeenAttempt_;
    lastSeenAttempt_ = next.attempt;

    const auto retryState = [](OverlayState s) {
        return s == OverlayState::Connecting || s == OverlayState::ServerOffline;
    };
    const bool stateChange = next.state != current_.state;
    if (stateChange && !(retryState(next.state) && retryState(current_.state)))
        return false;
    if (next == current_)
        return true;
    if (!isThrottledAttempt(next.attempt))
        return true;
    if (newWait || stateChange)
        return false;
    return !isCountdownTick(next.retryIn);
}

void StatusOverlay::renderLocked(const OverlayParams& params)
{
    if (params.state != current_.state) {
        BOOST_LOG_TRIVIAL(info) << "[StatusOverlay] " << toString(current_.state)
                                << " -> " << toString(params.state)
                                << (params.address.isEmpty() ? "" : " ")
                                << params.address.toStdString();
    }
    current_ = params;
    renderer_->render(params);
    // Callers may sit on worker threads; the timer lives on ours
    QMetaObject::invokeMethod(&keepOnTopTimer_, qOverload<>(&QTimer::start));
}

void StatusOverlay::onGraceExpired()
{
    bool shown = false;
    {
        QMutexLocker lock(&mutex_);
        if (!noLayoutArmed_)
            return;
        noLayoutArmed_ = false;
        if (contentAssigned_ || suppressed_)
            return;
        if (pendingNoLayout_ == current_)
            return;
        shown = current_.state != OverlayState::NoLayoutAssigned;
        renderLocked(pendingNoLayout_);
    }
    if (shown)
        emit stateChanged(OverlayState::NoLayoutAssigned);
}

void StatusOverlay::onKeepOnTop()
{
    QMutexLocker lock(&mutex_);
    if (current_.state != OverlayState::None)
        renderer_->raise();
}

} // namespace dsc
