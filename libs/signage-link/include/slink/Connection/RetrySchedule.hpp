#pragma once

#include <QList>

namespace slink {

/// Ordered wait durations in seconds; attempts past the end reuse the last.
class RetrySchedule {
public:
    RetrySchedule();
    explicit RetrySchedule(const QList<int>& delaysSeconds);

    /// attempt is 1-based; values below 1 are treated as 1.
    int delayFor(int attempt) const;
    QList<int> delays() const { return delays_; }

    static QList<int> defaultDelays() { return {10, 20, 30, 60, 120}; }

private:
    QList<int> delays_;
};

} // namespace slink
