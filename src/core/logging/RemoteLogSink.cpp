#include "core/logging/RemoteLogSink.hpp"
#include "core/logging/Logging.hpp"
#include <QMutexLocker>
#include <QTimer>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/make_shared.hpp>
#include <slink/Protocol/Messages.hpp>

namespace dsc {
namespace logging {

namespace bl = boost::log;

namespace {

thread_local bool tl_shipping = false;

struct ShippingGuard {
    ShippingGuard() { tl_shipping = true; }
    ~ShippingGuard() { tl_shipping = false; }
};

using RemoteSink = bl::sinks::synchronous_sink<RemoteLogBackend>;
QList<boost::shared_ptr<RemoteSink>> g_remoteSinks;
QMutex g_sinksMutex;

} // namespace

RemoteLogShipper::RemoteLogShipper(Sender send, ConnectedProbe connected, const Settings& settings)
    : send_(std::move(send))
    , connected_(std::move(connected))
    , settings_(settings)
{
    settings_.batchSize = qMax(1, settings_.batchSize);
    settings_.maxQueue = qMax(1, settings_.maxQueue);
    thread_.setObjectName("RemoteLog");
}

RemoteLogShipper::~RemoteLogShipper()
{
    stop();
}

void RemoteLogShipper::setClientId(const QString& clientId)
{
    QMutexLocker lock(&mutex_);
    clientId_ = clientId;
}

void RemoteLogShipper::start()
{
    if (thread_.isRunning())
        return;

    timer_ = new QTimer;
    timer_->setInterval(settings_.intervalMs);
    timer_->moveToThread(&thread_);
    QObject::connect(timer_, &QTimer::timeout, timer_, [this]() { flush(); });
    QObject::connect(&thread_, &QThread::finished, timer_, &QObject::deleteLater);
    thread_.start();
    QMetaObject::invokeMethod(timer_, qOverload<>(&QTimer::start), Qt::QueuedConnection);
}

void RemoteLogShipper::stop()
{
    if (!thread_.isRunning())
        return;
    thread_.quit();
    thread_.wait();
    timer_ = nullptr;
}

bool RemoteLogShipper::isShippingThread()
{
    return tl_shipping;
}

bool RemoteLogShipper::push(const QString& level, const QString& message, const QString& exception)
{
    if (tl_shipping)
        return false;
    if (!connected_ || !connected_())
        return false;

    bool full = false;
    {
        QMutexLocker lock(&mutex_);
        queue_.append(slink::messages::log(clientId_, level, message, exception));
        while (queue_.size() > settings_.maxQueue) {
            queue_.removeFirst();
            dropped_.fetch_add(1);
        }
        full = queue_.size() >= settings_.batchSize;
    }
    if (full)
        scheduleFlush();
    return true;
}

void RemoteLogShipper::scheduleFlush()
{
    if (!timer_ || flushScheduled_.exchange(true))
        return;
    QMetaObject::invokeMethod(timer_, [this]() {
        flushScheduled_.store(false);
        flush();
    }, Qt::QueuedConnection);
}

int RemoteLogShipper::flush()
{
    if (!connected_ || !connected_())
        return 0;

    QList<QJsonObject> batch;
    {
        QMutexLocker lock(&mutex_);
        const int n = qMin(settings_.batchSize, int(queue_.size()));
        batch = queue_.mid(0, n);
        queue_.erase(queue_.begin(), queue_.begin() + n);
    }
    if (batch.isEmpty())
        return 0;

    ShippingGuard guard;
    int sent = 0;
    for (; sent < batch.size(); ++sent) {
        if (send_(batch.at(sent)) != slink::SendResult::Sent)
            break;
    }

    if (sent < batch.size()) {
        QMutexLocker lock(&mutex_);
        QList<QJsonObject> restored = batch.mid(sent);
        restored.append(queue_);
        queue_ = std::move(restored);
        while (queue_.size() > settings_.maxQueue) {
            queue_.removeFirst();
            dropped_.fetch_add(1);
        }
    }
    return sent;
}

int RemoteLogShipper::pending() const
{
    QMutexLocker lock(&mutex_);
    return queue_.size();
}

RemoteLogBackend::RemoteLogBackend(std::shared_ptr<RemoteLogShipper> shipper)
    : shipper_(std::move(shipper))
{
}

void RemoteLogBackend::consume(const bl::record_view& rec)
{
    const auto message = bl::extract<std::string>("Message", rec);
    if (!message)
        return;
    const auto severity = bl::extract<bl::trivial::severity_level>("Severity", rec);
    const QString level = levelName(severity ? *severity : bl::trivial::info);
    shipper_->push(level, QString::fromStdString(*message));
}

bool addRemoteSink(std::shared_ptr<RemoteLogShipper> shipper, const QString& minLevel)
{
    bool ok = false;
    const auto min = parseLevel(minLevel, &ok);

    auto sink = boost::make_shared<RemoteSink>(boost::make_shared<RemoteLogBackend>(std::move(shipper)));
    sink->set_filter(bl::trivial::severity >= min);
    bl::core::get()->add_sink(sink);

    QMutexLocker lock(&g_sinksMutex);
    g_remoteSinks.append(sink);
    return ok;
}

void removeRemoteSinks()
{
    QMutexLocker lock(&g_sinksMutex);
    for (const auto& sink : g_remoteSinks)
        bl::core::get()->remove_sink(sink);
    g_remoteSinks.clear();
}

} // namespace logging
} // namespace dsc
