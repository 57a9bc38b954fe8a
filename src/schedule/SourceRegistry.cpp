#include "rinkguide/schedule/SourceRegistry.hpp"

#include "rinkguide/core/Logging.hpp"
#include "rinkguide/schedule/ScheduleSource.hpp"

#include <QStringList>

#include <exception>
#include <iterator>

namespace rinkguide {
namespace schedule {

QString RefreshResult::summary() const
{
    QStringList parts;
    for (const SourceStats &entry : stats) {
        if (entry.skipped) {
            continue;
        }
        parts << QStringLiteral("%1 %2").arg(entry.eventCount).arg(entry.name);
    }
    const QString joined = parts.isEmpty() ? QStringLiteral("0") : parts.join(QStringLiteral(" + "));
    return QStringLiteral("%1 = %2 total events").arg(joined).arg(events.size());
}

SourceRegistry::SourceRegistry() = default;
SourceRegistry::~SourceRegistry() = default;
SourceRegistry::SourceRegistry(SourceRegistry &&) noexcept = default;
SourceRegistry &SourceRegistry::operator=(SourceRegistry &&) noexcept = default;

void SourceRegistry::addSource(std::unique_ptr<ScheduleSource> source)
{
    if (!source) {
        return;
    }
    m_sources.push_back(std::move(source));
}

std::size_t SourceRegistry::size() const
{
    return m_sources.size();
}

const ScheduleSource &SourceRegistry::sourceAt(std::size_t index) const
{
    return *m_sources.at(index);
}

RefreshResult SourceRegistry::refresh(const QDateTime &windowStart, const QDateTime &windowEnd) const
{
    RefreshResult result;
    result.stats.reserve(m_sources.size());

    for (const auto &source : m_sources) {
        SourceStats stats;
        stats.name = source->name();

        if (!source->isEnabled()) {
            qCInfo(lcSchedule).noquote() << "Skipping" << stats.name << "(disabled)";
            stats.skipped = true;
            result.stats.push_back(stats);
            continue;
        }

        try {
            auto events = source->fetchSchedule(windowStart, windowEnd);
            stats.eventCount = events.size();
            result.events.insert(result.events.end(),
                                 std::make_move_iterator(events.begin()),
                                 std::make_move_iterator(events.end()));
            qCInfo(lcSchedule).noquote() << stats.name << ":" << stats.eventCount << "events";
        } catch (const std::exception &e) {
            stats.failed = true;
            qCCritical(lcSchedule).noquote() << stats.name << "failed:" << e.what();
        }
        result.stats.push_back(stats);
    }

    return result;
}

} // namespace schedule
} // namespace rinkguide
