#include <slink/Transport/ScriptedTransport.hpp>
#include <QMutexLocker>
#include <QThread>
#include <QTimer>

namespace slink {

ScriptedTransport::ScriptedTransport(QObject* parent)
    : ITransport(parent)
{
}

ScriptedTransport::~ScriptedTransport() = default;

void ScriptedTransport::open(const QUrl& url)
{
    opened_.append(url);
    if (!hasNextResult_)
        return;

    // Deliver on the next event loop pass, like a real socket would
    const ConnectResult result = nextResult_;
    QTimer::singleShot(0, this, [this, result]() {
        if (result == ConnectResult::Ok)
            simulateConnect();
        else
            simulateError(result, QStringLiteral("scripted failure"));
    });
}

void ScriptedTransport::close()
{
    if (!connected_) return;
    connected_ = false;
    emit disconnected();
}

bool ScriptedTransport::sendText(const QString& text)
{
    if (!connected_ || failSends_)
        return false;

    const int now = ++inFlight_;
    int seen = maxInFlight_.load();
    while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {}

    if (sendDelayMs_ > 0)
        QThread::msleep(sendDelayMs_);

    {
        QMutexLocker lock(&sentMutex_);
        sent_.append(text);
    }
    --inFlight_;
    return true;
}

bool ScriptedTransport::isConnected() const
{
    return connected_;
}

void ScriptedTransport::setNextResult(ConnectResult result)
{
    hasNextResult_ = true;
    nextResult_ = result;
}

void ScriptedTransport::clearNextResult()
{
    hasNextResult_ = false;
}

void ScriptedTransport::setSendDelayMs(int ms)
{
    sendDelayMs_ = ms;
}

void ScriptedTransport::setFailSends(bool fail)
{
    failSends_ = fail;
}

void ScriptedTransport::simulateConnect()
{
    connected_ = true;
    emit connected();
}

void ScriptedTransport::simulateError(ConnectResult kind, const QString& message)
{
    emit error(kind, message);
}

void ScriptedTransport::simulateDisconnect()
{
    connected_ = false;
    emit disconnected();
}

void ScriptedTransport::feedText(const QString& text)
{
    emit textReceived(text);
}

void ScriptedTransport::feedBinary(const QByteArray& data)
{
    emit binaryReceived(data);
}

QList<QUrl> ScriptedTransport::openedUrls() const
{
    return opened_;
}

QStringList ScriptedTransport::sentFrames() const
{
    QMutexLocker lock(&sentMutex_);
    return sent_;
}

void ScriptedTransport::clearSent()
{
    QMutexLocker lock(&sentMutex_);
    sent_.clear();
}

int ScriptedTransport::maxConcurrentSends() const
{
    return maxInFlight_.load();
}

} // namespace slink
