#pragma once

#include <QList>
#include <QObject>
#include "core/discovery/ServerCandidate.hpp"

namespace dsc {

/// One way of finding servers. start() scans for at most timeoutMs and then
/// emits finished() exactly once; an empty list is the only failure signal.
class IDiscoveryMethod : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IDiscoveryMethod() override = default;

    virtual QString name() const = 0;
    virtual void start(int timeoutMs) = 0;
    /// Ends a running scan early; finished() still fires with what was found.
    virtual void cancel() = 0;
    virtual bool isRunning() const = 0;

signals:
    void finished(const QList<dsc::ServerCandidate>& candidates);
};

} // namespace dsc
