#pragma once

#include <QHash>
#include <QString>

#include <vector>

#include "rinkguide/schedule/EventRecord.hpp"

namespace rinkguide {
namespace schedule {

/**
 * Adapter for one facility's booking feed.
 *
 * fetchSchedule() is fail-soft: transport and payload failures are logged and
 * yield an empty result, malformed single records are skipped.
 */
class ScheduleSource
{
public:
    virtual ~ScheduleSource() = default;

    virtual QString name() const = 0;
    virtual bool isEnabled() const { return true; }

    // Facility-local identifier -> unified surface id.
    virtual QHash<QString, int> surfaceMappings() const = 0;

    // Fixed offset of the facility's wall clock from UTC, in seconds.
    virtual int utcOffsetSeconds() const = 0;

    virtual std::vector<EventRecord> fetchSchedule(const QDateTime &windowStart,
                                                   const QDateTime &windowEnd) const = 0;

    std::vector<int> surfaceIds() const;
};

} // namespace schedule
} // namespace rinkguide
