#pragma once

#include <QList>
#include <QObject>
#include "core/discovery/IDiscoveryMethod.hpp"

namespace dsc {

/// Runs discovery methods in preference order. resolve() stops at the first
/// method that yields anything; discoverAll() runs every method and returns
/// the union, unique by server name.
class DiscoveryResolver : public QObject {
    Q_OBJECT
public:
    /// Takes ownership of the methods. Order is preference order.
    explicit DiscoveryResolver(const QList<IDiscoveryMethod*>& methods, QObject* parent = nullptr);

    void setTimeoutMs(int ms);
    int timeoutMs() const { return timeoutMs_; }

    /// Returns false when a scan is already running.
    bool resolve();
    bool discoverAll();
    void cancel();
    bool isBusy() const { return mode_ != Mode::Idle; }

signals:
    void resolved(bool found, const dsc::ServerCandidate& candidate);
    void discoveredAll(const QList<dsc::ServerCandidate>& candidates);

private:
    enum class Mode { Idle, Resolve, All };

    void startMethod(int index);
    void onMethodFinished(int index, const QList<ServerCandidate>& candidates);

    QList<IDiscoveryMethod*> methods_;
    int timeoutMs_ = 5000;
    Mode mode_ = Mode::Idle;
    int current_ = -1;
    bool cancelled_ = false;
    int pending_ = 0;
    QList<QList<ServerCandidate>> results_;
};

} // namespace dsc
