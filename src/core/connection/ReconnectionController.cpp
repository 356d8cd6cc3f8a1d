#include "core/connection/ReconnectionController.hpp"
#include "core/discovery/DiscoveryResolver.hpp"
#include "core/overlay/PresentationModeSelector.hpp"
#include "core/overlay/StatusOverlay.hpp"
#include "core/services/IConfigService.hpp"
#include <slink/Connection/ConnectionGateway.hpp>
#include <QThread>
#include <boost/log/trivial.hpp>

namespace dsc {

ReconnectionController::ReconnectionController(slink::ConnectionGateway* gateway,
                                               DiscoveryResolver* resolver,
                                               const ReconnectSettings& settings,
                                               QObject* parent)
    : QObject(parent)
    , gateway_(gateway)
    , resolver_(resolver)
    , settings_(settings)
{
    tickTimer_.setInterval(settings_.tickMs);
    connect(&tickTimer_, &QTimer::timeout, this, &ReconnectionController::onTick);
    connect(gateway_, &slink::ConnectionGateway::connectFinished,
            this, &ReconnectionController::onConnectFinished);
    if (resolver_) {
        connect(resolver_, &DiscoveryResolver::resolved,
                this, &ReconnectionController::onResolved);
    }
}

void ReconnectionController::setTarget(const QUrl& url)
{
    target_ = url;
}

void ReconnectionController::setConfigService(IConfigService* config)
{
    config_ = config;
}

void ReconnectionController::setOverlay(StatusOverlay* overlay, PresentationModeSelector* selector)
{
    overlay_ = overlay;
    selector_ = selector;
}

void ReconnectionController::setAutoDiscover(bool enabled)
{
    settings_.autoDiscover = enabled;
}

bool ReconnectionController::isDiscoveryAttempt(int attempt)
{
    return attempt == 1 || (attempt > 0 && attempt % 5 == 0);
}

void ReconnectionController::start()
{
    if (running_) {
        BOOST_LOG_TRIVIAL(debug) << "[Reconnect] already retrying, start ignored";
        return;
    }
    running_ = true;
    stopRequested_.store(false);
    attempt_ = 0;
    gateway_->setReconnecting(true);

    BOOST_LOG_TRIVIAL(info) << "[Reconnect] connection lost, starting reconnection loop to "
                            << target_.toString().toStdString();
    emit started();

    QMetaObject::invokeMethod(this, [this]() { nextAttempt(); }, Qt::QueuedConnection);
}

void ReconnectionController::stop()
{
    if (stopRequested_.exchange(true))
        return;
    if (QThread::currentThread() == thread() && running_) {
        tickTimer_.stop();
        if (phase_ == Phase::Discovering && resolver_)
            resolver_->cancel();
        finishStopped();
    }
}

bool ReconnectionController::checkStop()
{
    if (!stopRequested_.load())
        return false;
    if (running_)
        finishStopped();
    return true;
}

void ReconnectionController::finishStopped()
{
    tickTimer_.stop();
    running_ = false;
    phase_ = Phase::Idle;
    gateway_->setReconnecting(false);
    BOOST_LOG_TRIVIAL(info) << "[Reconnect] stopped after " << attempt_ << " attempt(s)";
    emit stopped();
}

bool ReconnectionController::overlayAllowed() const
{
    return overlay_ && (!selector_ || selector_->overlayAllowed());
}

void ReconnectionController::nextAttempt()
{
    if (!running_ || checkStop())
        return;
    if (gateway_->isConnected()) {
        succeed();
        return;
    }

    ++attempt_;
    const bool discover = settings_.autoDiscover && resolver_ && isDiscoveryAttempt(attempt_);
    emit attemptStarted(attempt_, target_, discover);

    if (discover) {
        phase_ = Phase::Discovering;
        BOOST_LOG_TRIVIAL(info) << "[Reconnect] attempt " << attempt_ << ": running discovery";
        emit discoveryStarted(attempt_);
        if (overlayAllowed())
            overlay_->showServerOffline(target_.host(), attempt_, -1, true);
        if (resolver_->resolve())
            return;
        BOOST_LOG_TRIVIAL(warning) << "[Reconnect] discovery busy, reusing "
                                   << target_.toString().toStdString();
    }
    connectAttempt();
}

void ReconnectionController::onResolved(bool found, const ServerCandidate& candidate)
{
    if (!running_ || phase_ != Phase::Discovering)
        return;
    if (checkStop())
        return;

    if (found) {
        applyCandidate(candidate);
    } else {
        BOOST_LOG_TRIVIAL(info) << "[Reconnect] discovery found nothing, reusing "
                                << target_.toString().toStdString();
    }
    connectAttempt();
}

void ReconnectionController::applyCandidate(const ServerCandidate& candidate)
{
    const QUrl url = candidate.url();
    if (url == target_)
        return;

    BOOST_LOG_TRIVIAL(info) << "[Reconnect] discovered " << candidate.name.toStdString()
                            << ", switching to " << url.toString().toStdString();
    target_ = url;
    if (config_ && !persistCandidate(*config_, candidate))
        BOOST_LOG_TRIVIAL(warning) << "[Reconnect] could not persist discovered server address";
}

bool ReconnectionController::persistCandidate(IConfigService& config, const ServerCandidate& candidate)
{
    bool ok = config.setValue("server.host", candidate.primaryAddress());
    ok = config.setValue("server.port", candidate.port) && ok;
    ok = config.setValue("server.endpoint_path", candidate.endpointPath) && ok;
    ok = config.setValue("server.use_ssl", candidate.url().scheme() == QLatin1String("wss")) && ok;
    return config.save() && ok;
}

void ReconnectionController::connectAttempt()
{
    if (checkStop())
        return;
    if (gateway_->isConnected()) {
        succeed();
        return;
    }

    phase_ = Phase::Connecting;
    BOOST_LOG_TRIVIAL(info) << "[Reconnect] attempt " << attempt_ << ": connecting to "
                            << target_.toString().toStdString();
    if (overlayAllowed())
        overlay_->showConnecting(target_.host(), attempt_);
    gateway_->connectTo(target_);
}

void ReconnectionController::onConnectFinished(slink::ConnectResult result)
{
    if (!running_ || phase_ != Phase::Connecting)
        return;

    if (result == slink::ConnectResult::Ok) {
        succeed();
        return;
    }

    BOOST_LOG_TRIVIAL(warning) << "[Reconnect] attempt " << attempt_ << " to "
                               << target_.toString().toStdString() << " failed: "
                               << slink::toString(result);
    emit attemptFailed(attempt_, result);
    if (checkStop())
        return;
    startWait();
}

void ReconnectionController::startWait()
{
    phase_ = Phase::Waiting;
    remaining_ = settings_.schedule.delayFor(attempt_);
    BOOST_LOG_TRIVIAL(info) << "[Reconnect] retrying in " << remaining_ << "s (attempt "
                            << attempt_ + 1 << " next)";
    emit waitScheduled(attempt_, remaining_);

    if (overlayAllowed())
        overlay_->showServerOffline(target_.host(), attempt_, remaining_, false);
    tickTimer_.start();
}

void ReconnectionController::onTick()
{
    if (checkStop())
        return;
    if (gateway_->isConnected()) {
        // Someone else got the session up while we were waiting
        succeed();
        return;
    }

    --remaining_;
    if (remaining_ <= 0) {
        tickTimer_.stop();
        nextAttempt();
        return;
    }
    emit countdown(attempt_, remaining_);
    if (overlayAllowed())
        overlay_->showServerOffline(target_.host(), attempt_, remaining_, false);
}

void ReconnectionController::succeed()
{
    tickTimer_.stop();
    running_ = false;
    phase_ = Phase::Idle;
    gateway_->setReconnecting(false);

    BOOST_LOG_TRIVIAL(info) << "[Reconnect] reconnected to " << gateway_->url().toString().toStdString()
                            << " after " << attempt_ << " attempt(s)";
    if (selector_)
        selector_->onConnectionRestored();
    emit reconnected(attempt_);
}

} // namespace dsc
