#pragma once

#include <QJsonObject>
#include <QList>
#include <QMutex>
#include <functional>

#include <slink/Connection/ConnectionState.hpp>

namespace slink {

class ConnectionGateway;

/// FIFO of messages produced while no session was open. Safe to enqueue
/// from any thread; nothing touches the network under the mailbox lock.
class OutboundMailbox {
public:
    using Sender = std::function<SendResult(const QJsonObject&)>;

    void enqueue(const QJsonObject& message);

    /// Takes everything queued so far and sends it in order. Whatever could
    /// not be sent goes back behind messages queued during the flush.
    /// Returns the number of messages sent.
    int flush(ConnectionGateway& gateway);
    int flush(const Sender& send);

    int size() const;
    bool isEmpty() const;

private:
    mutable QMutex mutex_;
    QList<QJsonObject> pending_;
};

} // namespace slink
