#pragma once

#include <stdexcept>
#include <utility>

#include "rinkguide/schedule/ScheduleSource.hpp"

namespace rinkguide {
namespace testing {

class StubScheduleSource : public schedule::ScheduleSource
{
public:
    StubScheduleSource(QString name, std::vector<schedule::EventRecord> events)
        : m_name(std::move(name))
        , m_events(std::move(events))
    {
    }

    QString name() const override { return m_name; }
    bool isEnabled() const override { return enabled; }
    QHash<QString, int> surfaceMappings() const override
    {
        QHash<QString, int> mappings;
        for (const auto &event : m_events) {
            mappings.insert(QString::number(event.surfaceId), event.surfaceId);
        }
        return mappings;
    }
    int utcOffsetSeconds() const override { return 0; }

    std::vector<schedule::EventRecord> fetchSchedule(const QDateTime &windowStart,
                                                     const QDateTime &windowEnd) const override
    {
        ++calls;
        lastWindowStart = windowStart;
        lastWindowEnd = windowEnd;
        if (throws) {
            throw std::runtime_error("stub source exploded");
        }
        return m_events;
    }

    bool enabled = true;
    bool throws = false;
    mutable int calls = 0;
    mutable QDateTime lastWindowStart;
    mutable QDateTime lastWindowEnd;

private:
    QString m_name;
    std::vector<schedule::EventRecord> m_events;
};

inline schedule::EventRecord makeEvent(int surfaceId, const QDateTime &start, int minutes, const QString &title)
{
    schedule::EventRecord event;
    event.surfaceId = surfaceId;
    event.start = start;
    event.end = start.addSecs(minutes * 60);
    event.title = title;
    return event;
}

} // namespace testing
} // namespace rinkguide
