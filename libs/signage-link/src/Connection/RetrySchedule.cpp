#include <slink/Connection/RetrySchedule.hpp>
#include <algorithm>

namespace slink {

RetrySchedule::RetrySchedule()
    : delays_(defaultDelays())
{
}

RetrySchedule::RetrySchedule(const QList<int>& delaysSeconds)
    : delays_(delaysSeconds)
{
    delays_.removeIf([](int d) { return d < 0; });
    if (delays_.isEmpty())
        delays_ = defaultDelays();
}

int RetrySchedule::delayFor(int attempt) const
{
    const int index = std::min(std::max(attempt, 1) - 1, static_cast<int>(delays_.size()) - 1);
    return delays_.at(index);
}

} // namespace slink
