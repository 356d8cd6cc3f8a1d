#pragma once

#include <QJsonObject>
#include <QList>
#include <QMutex>
#include <QString>
#include <QThread>
#include <atomic>
#include <functional>
#include <memory>

#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/trivial.hpp>
#include <slink/Connection/ConnectionState.hpp>

class QTimer;

namespace dsc {
namespace logging {

/// Buffers log records as LOG wire messages and ships them in batches
/// from a worker thread while the server session is open. Records are
/// only accepted while connected; the buffer keeps the newest maxQueue
/// entries. Anything logged while a batch is being shipped is discarded
/// so send failures cannot feed back into the queue.
class RemoteLogShipper {
public:
    using Sender = std::function<slink::SendResult(const QJsonObject&)>;
    using ConnectedProbe = std::function<bool()>;

    struct Settings {
        int batchSize = 50;
        int intervalMs = 5000;
        int maxQueue = 1000;
    };

    RemoteLogShipper(Sender send, ConnectedProbe connected, const Settings& settings = {});
    ~RemoteLogShipper();

    void setClientId(const QString& clientId);

    /// Starts the periodic shipping thread.
    void start();
    void stop();

    /// Thread-safe. Returns false when the record was not queued.
    bool push(const QString& level, const QString& message, const QString& exception = {});

    /// Ships up to one batch on the calling thread. Returns the number sent.
    int flush();

    int pending() const;
    int dropped() const { return dropped_.load(); }

    static bool isShippingThread();

private:
    void scheduleFlush();

    Sender send_;
    ConnectedProbe connected_;
    Settings settings_;

    mutable QMutex mutex_;
    QList<QJsonObject> queue_;
    QString clientId_;
    std::atomic<int> dropped_{0};
    std::atomic<bool> flushScheduled_{false};

    QThread thread_;
    QTimer* timer_ = nullptr;
};

/// Boost.Log backend feeding a RemoteLogShipper.
class RemoteLogBackend
    : public boost::log::sinks::basic_sink_backend<boost::log::sinks::concurrent_feeding> {
public:
    explicit RemoteLogBackend(std::shared_ptr<RemoteLogShipper> shipper);

    void consume(const boost::log::record_view& rec);

private:
    std::shared_ptr<RemoteLogShipper> shipper_;
};

/// Registers the shipper with the Boost.Log core for records at or above
/// minLevel. Returns false if the level name is unknown (info is used).
bool addRemoteSink(std::shared_ptr<RemoteLogShipper> shipper, const QString& minLevel);
void removeRemoteSinks();

} // namespace logging
} // namespace dsc
