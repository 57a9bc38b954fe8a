#pragma once

#include <QDateTime>
#include <QMutex>

#include <memory>
#include <utility>
#include <vector>

#include "rinkguide/schedule/EventRecord.hpp"
#include "rinkguide/schedule/SourceRegistry.hpp"

namespace rinkguide {
namespace schedule {

struct ScheduleSnapshot
{
    GroupedEvents groupedEvents;
    QDateTime lastRefreshed; // invalid until the first refresh
    QDateTime windowStart;
    QDateTime windowEnd;
    std::vector<SourceStats> stats;

    const std::vector<EventRecord> &eventsFor(int surfaceId) const;
    std::size_t eventCount() const;
};

/**
 * Last grouped schedule of all sources.
 *
 * refresh() builds a complete snapshot before publishing it with one pointer
 * swap; readers keep whatever snapshot they fetched. Concurrent refresh()
 * calls are not serialized, the last one to finish wins.
 */
class ScheduleCache
{
public:
    explicit ScheduleCache(const SourceRegistry &registry);
    ~ScheduleCache();

    std::shared_ptr<const ScheduleSnapshot> snapshot() const;
    bool hasData() const;

    std::shared_ptr<const ScheduleSnapshot> refresh(const QDateTime &now = QDateTime::currentDateTime());

    // Today 00:00 up to the day after tomorrow 00:00, local time.
    static std::pair<QDateTime, QDateTime> refreshWindow(const QDateTime &now);

private:
    const SourceRegistry &m_registry;
    mutable QMutex m_lock;
    std::shared_ptr<const ScheduleSnapshot> m_snapshot;
};

} // namespace schedule
} // namespace rinkguide
