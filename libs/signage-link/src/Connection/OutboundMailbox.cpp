#include <slink/Connection/OutboundMailbox.hpp>
#include <slink/Connection/ConnectionGateway.hpp>
#include <QMutexLocker>
#include <boost/log/trivial.hpp>

namespace slink {

void OutboundMailbox::enqueue(const QJsonObject& message)
{
    QMutexLocker lock(&mutex_);
    pending_.append(message);
}

int OutboundMailbox::flush(ConnectionGateway& gateway)
{
    return flush([&gateway](const QJsonObject& message) { return gateway.send(message); });
}

int OutboundMailbox::flush(const Sender& send)
{
    QList<QJsonObject> batch;
    {
        QMutexLocker lock(&mutex_);
        batch.swap(pending_);
    }
    if (batch.isEmpty())
        return 0;

    BOOST_LOG_TRIVIAL(info) << "[OutboundMailbox] flushing " << batch.size() << " queued messages";

    int sent = 0;
    QList<QJsonObject> unsent;
    for (int i = 0; i < batch.size(); ++i) {
        const QJsonObject& message = batch.at(i);
        if (!message.value("Type").isString()) {
            BOOST_LOG_TRIVIAL(error) << "[OutboundMailbox] dropping queued message without Type";
            continue;
        }
        if (!unsent.isEmpty()) {
            // Session already failed in this flush; keep order for the next one
            unsent.append(message);
            continue;
        }
        if (send(message) == SendResult::Sent) {
            ++sent;
        } else {
            unsent.append(message);
        }
    }

    if (!unsent.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[OutboundMailbox] " << unsent.size()
                                   << " messages re-queued after send failure";
        QMutexLocker lock(&mutex_);
        pending_.append(unsent);
    }
    return sent;
}

int OutboundMailbox::size() const
{
    QMutexLocker lock(&mutex_);
    return pending_.size();
}

bool OutboundMailbox::isEmpty() const
{
    QMutexLocker lock(&mutex_);
    return pending_.isEmpty();
}

} // namespace slink
