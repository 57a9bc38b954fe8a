#include "rinkguide/schedule/ScheduleCache.hpp"

#include "rinkguide/core/Logging.hpp"
#include "rinkguide/schedule/SurfaceGrouper.hpp"

#include <QMutexLocker>
#include <QTime>

namespace rinkguide {
namespace schedule {

const std::vector<EventRecord> &ScheduleSnapshot::eventsFor(int surfaceId) const
{
    static const std::vector<EventRecord> kNoEvents;
    const auto it = groupedEvents.find(surfaceId);
    return it == groupedEvents.end() ? kNoEvents : it->second;
}

std::size_t ScheduleSnapshot::eventCount() const
{
    return countEvents(groupedEvents);
}

ScheduleCache::ScheduleCache(const SourceRegistry &registry)
    : m_registry(registry)
    , m_snapshot(std::make_shared<const ScheduleSnapshot>())
{
}

ScheduleCache::~ScheduleCache() = default;

std::shared_ptr<const ScheduleSnapshot> ScheduleCache::snapshot() const
{
    QMutexLocker locker(&m_lock);
    return m_snapshot;
}

bool ScheduleCache::hasData() const
{
    return snapshot()->lastRefreshed.isValid();
}

std::pair<QDateTime, QDateTime> ScheduleCache::refreshWindow(const QDateTime &now)
{
    const QDate today = now.date();
    return {QDateTime(today, QTime(0, 0)), QDateTime(today.addDays(2), QTime(0, 0))};
}

std::shared_ptr<const ScheduleSnapshot> ScheduleCache::refresh(const QDateTime &now)
{
    qCInfo(lcSchedule) << "Refreshing schedules from all sources...";

    const auto window = refreshWindow(now);
    RefreshResult result = m_registry.refresh(window.first, window.second);
    const QString summary = result.summary();

    auto next = std::make_shared<ScheduleSnapshot>();
    next->windowStart = window.first;
    next->windowEnd = window.second;
    next->stats = std::move(result.stats);
    next->groupedEvents = groupBySurface(std::move(result.events));
    next->lastRefreshed = QDateTime::currentDateTime();

    std::shared_ptr<const ScheduleSnapshot> published = std::move(next);
    {
        QMutexLocker locker(&m_lock);
        m_snapshot = published;
    }

    qCInfo(lcSchedule).noquote() << "Schedule refreshed:" << summary;
    qCInfo(lcSchedule) << "Cache holds" << published->groupedEvents.size() << "surfaces,"
                       << published->eventCount() << "events";
    return published;
}

} // namespace schedule
} // namespace rinkguide
