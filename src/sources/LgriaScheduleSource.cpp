#include "rinkguide/sources/LgriaScheduleSource.hpp"

#include "rinkguide/core/Logging.hpp"
#include "rinkguide/net/HttpFetcher.hpp"
#include "rinkguide/sources/EmbeddedJson.hpp"

#include <QJsonArray>
#include <QJsonValue>

#include <algorithm>
#include <chrono>

namespace rinkguide {
namespace sources {

using schedule::EventRecord;

const char *const LgriaScheduleSource::kScheduleUrl = "https://lgria.finnlyconnect.com/schedule/201";
const char *const LgriaScheduleSource::kScheduleVariable = "_onlineScheduleList";

namespace {
constexpr auto TIMESTAMP_FORMAT = "yyyy-MM-dd'T'hh:mm:ss";

QString stringField(const QJsonObject &raw, const char *key)
{
    const QJsonValue value = raw.value(QLatin1String(key));
    return value.isString() ? value.toString() : QString();
}
} // namespace

LgriaScheduleSource::LgriaScheduleSource(net::HttpFetcher &fetcher)
    : m_fetcher(fetcher)
{
}

QString LgriaScheduleSource::name() const
{
    return QStringLiteral("Lou & Gib Reese Ice Arena");
}

QHash<QString, int> LgriaScheduleSource::surfaceMappings() const
{
    return {{QStringLiteral("rink1"), kSurfaceId}};
}

int LgriaScheduleSource::utcOffsetSeconds() const
{
    return kUtcOffsetSeconds;
}

std::vector<EventRecord> LgriaScheduleSource::fetchSchedule(const QDateTime &windowStart,
                                                            const QDateTime &windowEnd) const
{
    qCInfo(lcSources).noquote() << "Fetching" << name() << "schedule...";

    const auto response = m_fetcher.get(QUrl(QString::fromLatin1(kScheduleUrl)),
                                         std::chrono::seconds(kTimeoutSeconds));
    if (!response.ok()) {
        qCWarning(lcSources).noquote() << "Failed to fetch" << name() << "schedule:" << response.error();
        return {};
    }

    QString error;
    auto events = parsePage(response.value(), windowStart, windowEnd, &error);
    if (!error.isEmpty()) {
        qCWarning(lcSources).noquote() << "Failed to parse" << name() << "schedule:" << error;
        return {};
    }

    qCInfo(lcSources).noquote() << "Processed" << events.size() << name() << "events in date range";
    return events;
}

std::vector<EventRecord> LgriaScheduleSource::parsePage(const QByteArray &page,
                                                        const QDateTime &windowStart,
                                                        const QDateTime &windowEnd,
                                                        QString *error)
{
    std::vector<EventRecord> events;

    const auto array = extractJsonArray(page, kScheduleVariable);
    if (!array.ok()) {
        if (error) {
            *error = array.error();
        }
        return events;
    }
    qCDebug(lcSources) << "Found" << array.value().size() << "raw LGRIA events";

    for (const QJsonValue &value : array.value()) {
        if (!value.isObject()) {
            continue;
        }
        auto event = toEvent(value.toObject());
        if (!event) {
            continue;
        }
        if (event->start < windowStart || event->start >= windowEnd) {
            continue;
        }
        events.push_back(std::move(*event));
    }

    std::stable_sort(events.begin(), events.end(), [](const EventRecord &lhs, const EventRecord &rhs) {
        return lhs.start < rhs.start;
    });
    return events;
}

std::optional<EventRecord> LgriaScheduleSource::toEvent(const QJsonObject &raw)
{
    EventRecord event;
    event.surfaceId = kSurfaceId;
    event.start = parseTimestamp(stringField(raw, "EventStartTime"));
    event.end = parseTimestamp(stringField(raw, "EventEndTime"));
    if (!event.start.isValid() || !event.end.isValid() || event.end <= event.start) {
        return std::nullopt;
    }

    QString title = stringField(raw, "Description");
    if (title.isEmpty()) {
        title = raw.contains(QLatin1String("AccountName")) ? stringField(raw, "AccountName")
                                                            : QStringLiteral("Ice Time");
    }
    event.title = title.trimmed();
    event.description = stringField(raw, "ScheduleNotes");
    event.eventType = stringField(raw, "EventTypeName");
    event.rawData = raw.toVariantMap();
    return event;
}

QDateTime LgriaScheduleSource::parseTimestamp(const QString &value)
{
    return QDateTime::fromString(value, QLatin1String(TIMESTAMP_FORMAT));
}

} // namespace sources
} // namespace rinkguide
