#include <slink/Connection/HeartbeatEmitter.hpp>
#include <slink/Connection/ConnectionGateway.hpp>
#include <QThread>
#include <boost/log/trivial.hpp>

namespace slink {

HeartbeatEmitter::HeartbeatEmitter(ConnectionGateway* gateway, QObject* parent)
    : QObject(parent)
    , gateway_(gateway)
{
    tickTimer_.setInterval(1000);
    connect(&tickTimer_, &QTimer::timeout, this, &HeartbeatEmitter::onTick);
}

void HeartbeatEmitter::setPayloadProvider(PayloadProvider provider)
{
    provider_ = std::move(provider);
}

void HeartbeatEmitter::setIntervalSeconds(int seconds)
{
    intervalSeconds_ = qMax(1, seconds);
}

void HeartbeatEmitter::setTickMs(int ms)
{
    tickTimer_.setInterval(ms);
}

void HeartbeatEmitter::start()
{
    if (isRunning()) return;
    stopRequested_.store(false);
    ticksElapsed_ = 0;
    BOOST_LOG_TRIVIAL(info) << "[Heartbeat] started, interval " << intervalSeconds_ << "s";
    sendNow();
    tickTimer_.start();
}

void HeartbeatEmitter::stop()
{
    if (stopRequested_.exchange(true)) return;
    BOOST_LOG_TRIVIAL(info) << "[Heartbeat] stopped";
    if (QThread::currentThread() == thread())
        tickTimer_.stop();
}

bool HeartbeatEmitter::isRunning() const
{
    return !stopRequested_.load();
}

bool HeartbeatEmitter::sendNow()
{
    if (!provider_) {
        BOOST_LOG_TRIVIAL(warning) << "[Heartbeat] no payload provider set";
        return false;
    }

    const SendResult result = gateway_->send(provider_());
    if (result != SendResult::Sent) {
        BOOST_LOG_TRIVIAL(warning) << "[Heartbeat] send failed ("
                                   << (result == SendResult::NotConnected ? "not connected" : "transport error")
                                   << "), will retry next interval";
        emit heartbeatFailed();
        return false;
    }
    emit heartbeatSent();
    return true;
}

void HeartbeatEmitter::onTick()
{
    if (stopRequested_.load()) {
        tickTimer_.stop();
        return;
    }
    if (++ticksElapsed_ < intervalSeconds_)
        return;
    ticksElapsed_ = 0;
    sendNow();
}

} // namespace slink
