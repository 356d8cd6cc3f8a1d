#include "core/discovery/DiscoveryResolver.hpp"
#include <boost/log/trivial.hpp>

namespace dsc {

DiscoveryResolver::DiscoveryResolver(const QList<IDiscoveryMethod*>& methods, QObject* parent)
    : QObject(parent)
    , methods_(methods)
{
    qRegisterMetaType<dsc::ServerCandidate>();
    qRegisterMetaType<QList<dsc::ServerCandidate>>();

    for (int i = 0; i < methods_.size(); ++i) {
        methods_[i]->setParent(this);
        connect(methods_[i], &IDiscoveryMethod::finished, this,
                [this, i](const QList<ServerCandidate>& candidates) {
                    onMethodFinished(i, candidates);
                });
    }
}

void DiscoveryResolver::setTimeoutMs(int ms)
{
    timeoutMs_ = ms;
}

bool DiscoveryResolver::resolve()
{
    if (isBusy()) {
        BOOST_LOG_TRIVIAL(debug) << "[Discovery] resolve ignored, scan in progress";
        return false;
    }
    if (methods_.isEmpty()) {
        emit resolved(false, {});
        return true;
    }
    mode_ = Mode::Resolve;
    cancelled_ = false;
    startMethod(0);
    return true;
}

bool DiscoveryResolver::discoverAll()
{
    if (isBusy()) {
        BOOST_LOG_TRIVIAL(debug) << "[Discovery] discoverAll ignored, scan in progress";
        return false;
    }
    if (methods_.isEmpty()) {
        emit discoveredAll({});
        return true;
    }
    mode_ = Mode::All;
    cancelled_ = false;
    results_.clear();
    for (int i = 0; i < methods_.size(); ++i)
        results_.append(QList<ServerCandidate>());
    pending_ = methods_.size();
    for (int i = 0; i < methods_.size(); ++i) {
        BOOST_LOG_TRIVIAL(info) << "[Discovery] starting " << methods_[i]->name().toStdString();
        methods_[i]->start(timeoutMs_);
    }
    return true;
}

void DiscoveryResolver::cancel()
{
    if (mode_ == Mode::Idle)
        return;
    // Set first: a cancelled method reports finished() and must not start
    // the next one
    cancelled_ = true;
    BOOST_LOG_TRIVIAL(info) << "[Discovery] scan cancelled";
    for (auto* m : methods_) {
        if (m->isRunning())
            m->cancel();
    }
}

void DiscoveryResolver::startMethod(int index)
{
    current_ = index;
    BOOST_LOG_TRIVIAL(info) << "[Discovery] trying " << methods_[index]->name().toStdString()
                            << " (timeout " << timeoutMs_ << " ms)";
    methods_[index]->start(timeoutMs_);
}

void DiscoveryResolver::onMethodFinished(int index, const QList<ServerCandidate>& candidates)
{
    if (mode_ == Mode::Resolve) {
        if (index != current_) return;

        if (cancelled_) {
            mode_ = Mode::Idle;
            current_ = -1;
            emit resolved(false, {});
            return;
        }
        if (!candidates.isEmpty()) {
            const ServerCandidate& first = candidates.first();
            BOOST_LOG_TRIVIAL(info) << "[Discovery] resolved " << first.name.toStdString()
                                    << " via " << methods_[index]->name().toStdString()
                                    << " -> " << first.url().toString().toStdString();
            mode_ = Mode::Idle;
            current_ = -1;
            emit resolved(true, first);
            return;
        }
        if (index + 1 < methods_.size()) {
            startMethod(index + 1);
            return;
        }
        BOOST_LOG_TRIVIAL(info) << "[Discovery] no server found";
        mode_ = Mode::Idle;
        current_ = -1;
        emit resolved(false, {});
        return;
    }

    if (mode_ == Mode::All) {
        results_[index] = candidates;
        if (--pending_ > 0) return;

        QList<ServerCandidate> merged;
        for (const auto& list : results_)
            mergeUniqueByName(merged, list);
        BOOST_LOG_TRIVIAL(info) << "[Discovery] discoverAll found " << merged.size() << " unique server(s)";
        mode_ = Mode::Idle;
        emit discoveredAll(merged);
    }
}

} // namespace dsc
