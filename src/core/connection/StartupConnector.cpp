#include "core/connection/StartupConnector.hpp"
#include <slink/Connection/ConnectionGateway.hpp>
#include <QThread>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace dsc {

StartupConnector::StartupConnector(slink::ConnectionGateway* gateway,
                                   const StartupSettings& settings, QObject* parent)
    : QObject(parent)
    , gateway_(gateway)
    , settings_(settings)
{
    waitTimer_.setSingleShot(true);
    connect(&waitTimer_, &QTimer::timeout, this, &StartupConnector::nextAttempt);
    connect(gateway_, &slink::ConnectionGateway::connectFinished,
            this, &StartupConnector::onConnectFinished);
}

void StartupConnector::setTarget(const QUrl& url)
{
    target_ = url;
}

int StartupConnector::delayAfter(int attemptInBatch) const
{
    int delay = settings_.initialDelaySeconds;
    for (int i = 1; i < attemptInBatch && delay < settings_.maxDelaySeconds; ++i)
        delay *= 2;
    return std::min(delay, settings_.maxDelaySeconds);
}

void StartupConnector::start()
{
    if (running_)
        return;
    running_ = true;
    stopRequested_.store(false);
    batch_ = 1;
    attemptInBatch_ = 0;
    nextAttempt();
}

void StartupConnector::stop()
{
    stopRequested_.store(true);
    if (QThread::currentThread() == thread())
        finish();
    else
        QMetaObject::invokeMethod(this, [this]() { finish(); }, Qt::QueuedConnection);
}

void StartupConnector::finish()
{
    if (!running_)
        return;
    waitTimer_.stop();
    running_ = false;
    connecting_ = false;
    BOOST_LOG_TRIVIAL(info) << "[Startup] connection attempts stopped";
    emit stopped();
}

void StartupConnector::nextAttempt()
{
    if (!running_ || stopRequested_.load())
        return;
    if (gateway_->isConnected()) {
        running_ = false;
        emit connected();
        return;
    }

    if (attemptInBatch_ >= settings_.attemptsPerBatch) {
        ++batch_;
        attemptInBatch_ = 0;
    }
    ++attemptInBatch_;

    BOOST_LOG_TRIVIAL(info) << "[Startup] connecting to " << target_.toString().toStdString()
                            << " (attempt " << attemptInBatch_ << "/" << settings_.attemptsPerBatch
                            << ", batch " << batch_ << ")";
    emit attemptStarted(batch_, attemptInBatch_, target_);
    connecting_ = true;
    gateway_->connectTo(target_);
}

void StartupConnector::onConnectFinished(slink::ConnectResult result)
{
    if (!running_ || !connecting_)
        return;
    connecting_ = false;

    if (result == slink::ConnectResult::Ok) {
        running_ = false;
        BOOST_LOG_TRIVIAL(info) << "[Startup] connected to " << target_.toString().toStdString();
        emit connected();
        return;
    }

    emit attemptFailed(batch_, attemptInBatch_, result);
    if (stopRequested_.load())
        return;

    if (attemptInBatch_ < settings_.attemptsPerBatch) {
        const int delay = delayAfter(attemptInBatch_);
        BOOST_LOG_TRIVIAL(warning) << "[Startup] attempt " << attemptInBatch_ << " failed ("
                                   << slink::toString(result) << "), retrying in " << delay << "s";
        scheduleWait(delay);
        return;
    }

    BOOST_LOG_TRIVIAL(error) << "[Startup] failed to connect after " << settings_.attemptsPerBatch
                             << " attempts, next batch in " << settings_.batchPauseSeconds << "s";
    emit batchFailed(batch_);
    // batchFailed handlers may have stopped us
    if (running_ && !stopRequested_.load())
        scheduleWait(settings_.batchPauseSeconds);
}

void StartupConnector::scheduleWait(int seconds)
{
    emit waitScheduled(seconds);
    waitTimer_.start(seconds * settings_.tickMs);
}

} // namespace dsc
