#pragma once

#include <QByteArray>
#include <QSet>
#include <QUrl>

#include <optional>

#include "rinkguide/schedule/ScheduleSource.hpp"
#include "rinkguide/schedule/StageResult.hpp"

namespace rinkguide {
namespace net {
class HttpFetcher;
}

namespace sources {

// OhioHealth Chiller rinks: XML scheduler feed queried by date range.
class ChillerScheduleSource : public schedule::ScheduleSource
{
public:
    static const char *const kEndpoint;
    static constexpr int kUtcOffsetSeconds = -5 * 60 * 60;
    static constexpr int kTimeoutSeconds = 15;

    explicit ChillerScheduleSource(net::HttpFetcher &fetcher);

    QString name() const override;
    QHash<QString, int> surfaceMappings() const override;
    int utcOffsetSeconds() const override;
    std::vector<schedule::EventRecord> fetchSchedule(const QDateTime &windowStart,
                                                     const QDateTime &windowEnd) const override;

    // Product ids of the ice sheets; rooms and gyms are not listed.
    static QSet<QString> iceSheetProductIds();

    QUrl requestUrl(const QDateTime &windowStart, const QDateTime &windowEnd) const;

    // One map of child-element text per <event>, plus its "id" attribute.
    static schedule::StageResult<std::vector<QVariantMap>> parseFeed(const QByteArray &xml);

    std::optional<schedule::EventRecord> toEvent(const QVariantMap &raw) const;

    // "yyyy-MM-dd HH:mm:ss.f" with one to six fractional digits.
    static QDateTime parseTimestamp(const QString &value);

private:
    net::HttpFetcher &m_fetcher;
};

} // namespace sources
} // namespace rinkguide
