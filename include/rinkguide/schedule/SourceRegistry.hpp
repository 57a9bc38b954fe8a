#pragma once

#include <QDateTime>
#include <QString>

#include <memory>
#include <vector>

#include "rinkguide/schedule/EventRecord.hpp"

namespace rinkguide {
namespace schedule {

class ScheduleSource;

struct SourceStats
{
    QString name;
    std::size_t eventCount = 0;
    bool skipped = false; // disabled
    bool failed = false;  // threw out of fetchSchedule()
};

struct RefreshResult
{
    std::vector<EventRecord> events;
    std::vector<SourceStats> stats;

    // "<n> <name> + <n> <name> = <total> total events"
    QString summary() const;
};

class SourceRegistry
{
public:
    SourceRegistry();
    ~SourceRegistry();

    SourceRegistry(SourceRegistry &&) noexcept;
    SourceRegistry &operator=(SourceRegistry &&) noexcept;

    void addSource(std::unique_ptr<ScheduleSource> source);
    std::size_t size() const;
    const ScheduleSource &sourceAt(std::size_t index) const;

    // Sources are asked in registration order; a failing source contributes
    // no events and never stops the scan.
    RefreshResult refresh(const QDateTime &windowStart, const QDateTime &windowEnd) const;

private:
    std::vector<std::unique_ptr<ScheduleSource>> m_sources;
};

} // namespace schedule
} // namespace rinkguide
