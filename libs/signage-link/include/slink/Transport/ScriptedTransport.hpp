#pragma once

#include <slink/Transport/ITransport.hpp>
#include <QList>
#include <QMutex>
#include <atomic>

namespace slink {

/// In-process transport for tests. Records every frame handed to
/// sendText() and lets the test script connection outcomes and inbound
/// frames.
class ScriptedTransport : public ITransport {
    Q_OBJECT
public:
    explicit ScriptedTransport(QObject* parent = nullptr);
    ~ScriptedTransport() override;

    // ITransport interface
    void open(const QUrl& url) override;
    void close() override;
    bool sendText(const QString& text) override;
    bool isConnected() const override;

    // Test API
    /// Result delivered on the next open(); Ok connects immediately,
    /// anything else emits error(). Unset means open() waits for the test.
    void setNextResult(ConnectResult result);
    void clearNextResult();
    void setSendDelayMs(int ms);
    void setFailSends(bool fail);

    void simulateConnect();
    void simulateError(ConnectResult kind, const QString& message = {});
    void simulateDisconnect();
    void feedText(const QString& text);
    void feedBinary(const QByteArray& data);

    QList<QUrl> openedUrls() const;
    QStringList sentFrames() const;
    void clearSent();
    int maxConcurrentSends() const;

private:
    bool connected_ = false;
    bool hasNextResult_ = false;
    ConnectResult nextResult_ = ConnectResult::Ok;
    int sendDelayMs_ = 0;
    bool failSends_ = false;

    QList<QUrl> opened_;
    mutable QMutex sentMutex_;
    QStringList sent_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
};

} // namespace slink
