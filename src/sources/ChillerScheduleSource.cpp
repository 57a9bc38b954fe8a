#include "rinkguide/sources/ChillerScheduleSource.hpp"

#include "rinkguide/core/Logging.hpp"
#include "rinkguide/net/HttpFetcher.hpp"

#include <QUrlQuery>
#include <QXmlStreamReader>

#include <chrono>

namespace rinkguide {
namespace sources {

using schedule::EventRecord;

const char *const ChillerScheduleSource::kEndpoint =
    "https://thechiller.com/admin/scheduler/init-scheduler-live.cfm";

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
constexpr auto TIMESTAMP_FORMAT = "yyyy-MM-dd hh:mm:ss";
} // namespace

ChillerScheduleSource::ChillerScheduleSource(net::HttpFetcher &fetcher)
    : m_fetcher(fetcher)
{
}

QString ChillerScheduleSource::name() const
{
    return QStringLiteral("OhioHealth Chiller");
}

QHash<QString, int> ChillerScheduleSource::surfaceMappings() const
{
    return {
        {QStringLiteral("1"), 864},  // Dublin 1
        {QStringLiteral("2"), 865},  // Dublin 2
        {QStringLiteral("5"), 867},  // Easton 1
        {QStringLiteral("6"), 866},  // Easton 2
        {QStringLiteral("8"), 868},  // North 1
        {QStringLiteral("9"), 869},  // North 2
        {QStringLiteral("13"), 872}, // Ice Haus
        {QStringLiteral("14"), 871}, // Ice Works
        {QStringLiteral("16"), 873}, // Springfield
        {QStringLiteral("24"), 870}, // North 3
    };
}

int ChillerScheduleSource::utcOffsetSeconds() const
{
    return kUtcOffsetSeconds;
}

QSet<QString> ChillerScheduleSource::iceSheetProductIds()
{
    return {QStringLiteral("1"), QStringLiteral("2"), QStringLiteral("5"), QStringLiteral("6"),
            QStringLiteral("8"), QStringLiteral("9"), QStringLiteral("13"), QStringLiteral("14"),
            QStringLiteral("16"), QStringLiteral("24")};
}

QUrl ChillerScheduleSource::requestUrl(const QDateTime &windowStart, const QDateTime &windowEnd) const
{
    // The feed wants minutes west of UTC.
    const int timeshift = -utcOffsetSeconds() / 60;

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("timeshift"), QString::number(timeshift));
    query.addQueryItem(QStringLiteral("uid"), QStringLiteral("1"));
    query.addQueryItem(QStringLiteral("from"), windowStart.date().toString(DATE_FORMAT));
    query.addQueryItem(QStringLiteral("to"), windowEnd.date().toString(DATE_FORMAT));

    QUrl url(QString::fromLatin1(kEndpoint));
    url.setQuery(query);
    return url;
}

std::vector<EventRecord> ChillerScheduleSource::fetchSchedule(const QDateTime &windowStart,
                                                              const QDateTime &windowEnd) const
{
    qCInfo(lcSources).noquote() << "Fetching" << name() << "schedule:" << windowStart.date().toString(DATE_FORMAT)
                                << "to" << windowEnd.date().toString(DATE_FORMAT);

    const auto response = m_fetcher.get(requestUrl(windowStart, windowEnd), std::chrono::seconds(kTimeoutSeconds));
    if (!response.ok()) {
        qCWarning(lcSources).noquote() << "Failed to fetch" << name() << "schedule:" << response.error();
        return {};
    }

    auto parsed = parseFeed(response.value());
    if (!parsed.ok()) {
        qCWarning(lcSources).noquote() << "Failed to parse" << name() << "schedule:" << parsed.error();
        return {};
    }

    std::vector<EventRecord> events;
    for (const QVariantMap &raw : parsed.value()) {
        auto event = toEvent(raw);
        if (event) {
            events.push_back(std::move(*event));
        }
    }

    qCInfo(lcSources).noquote() << "Found" << events.size() << name() << "ice sheet events";
    return events;
}

schedule::StageResult<std::vector<QVariantMap>> ChillerScheduleSource::parseFeed(const QByteArray &xml)
{
    using Result = schedule::StageResult<std::vector<QVariantMap>>;

    QXmlStreamReader reader(xml);
    std::vector<QVariantMap> records;

    if (!reader.readNextStartElement()) {
        return Result::failure(reader.hasError() ? reader.errorString() : QStringLiteral("empty document"));
    }

    // Only direct <event> children of the root are events.
    while (reader.readNextStartElement()) {
        if (reader.name() != QLatin1String("event")) {
            reader.skipCurrentElement();
            continue;
        }

        QVariantMap record;
        record.insert(QStringLiteral("id"), reader.attributes().value(QLatin1String("id")).toString());
        while (reader.readNextStartElement()) {
            const QString field = reader.name().toString();
            const QString text = reader.readElementText(QXmlStreamReader::IncludeChildElements);
            record.insert(field, text.trimmed());
        }
        records.push_back(std::move(record));
    }

    if (reader.hasError()) {
        return Result::failure(QStringLiteral("line %1: %2").arg(reader.lineNumber()).arg(reader.errorString()));
    }
    return Result::success(std::move(records));
}

std::optional<EventRecord> ChillerScheduleSource::toEvent(const QVariantMap &raw) const
{
    const QString productId = raw.value(QStringLiteral("productid")).toString();
    if (!iceSheetProductIds().contains(productId)) {
        return std::nullopt;
    }

    const auto mappings = surfaceMappings();
    const auto mapping = mappings.constFind(productId);
    if (mapping == mappings.constEnd()) {
        return std::nullopt;
    }

    EventRecord event;
    event.surfaceId = mapping.value();
    event.start = parseTimestamp(raw.value(QStringLiteral("start_date")).toString());
    event.end = parseTimestamp(raw.value(QStringLiteral("end_date")).toString());
    if (!event.start.isValid() || !event.end.isValid() || event.end <= event.start) {
        qCDebug(lcSources) << "Dropping Chiller event" << raw.value(QStringLiteral("id")).toString()
                           << "with unusable times";
        return std::nullopt;
    }

    event.title = raw.value(QStringLiteral("text"), QStringLiteral("Ice Time")).toString().trimmed();
    event.rawData = raw;
    return event;
}

QDateTime ChillerScheduleSource::parseTimestamp(const QString &value)
{
    const int dot = value.lastIndexOf('.');
    if (dot < 0) {
        return {};
    }

    const QString fraction = value.mid(dot + 1);
    if (fraction.isEmpty() || fraction.size() > 6) {
        return {};
    }
    for (const QChar ch : fraction) {
        if (!ch.isDigit()) {
            return {};
        }
    }

    QDateTime dt = QDateTime::fromString(value.left(dot), QLatin1String(TIMESTAMP_FORMAT));
    if (!dt.isValid()) {
        return {};
    }
    const int msecs = fraction.leftJustified(3, '0').left(3).toInt();
    return dt.addMSecs(msecs);
}

} // namespace sources
} // namespace rinkguide
