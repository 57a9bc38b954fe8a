#pragma once

#include <QJsonObject>
#include <QUrl>

#include <optional>

#include "rinkguide/schedule/ScheduleSource.hpp"

namespace rinkguide {
namespace net {
class HttpFetcher;
}

namespace sources {

// Lou & Gib Reese Ice Arena: a single sheet whose schedule is embedded as a
// JSON array in the booking page.
class LgriaScheduleSource : public schedule::ScheduleSource
{
public:
    static const char *const kScheduleUrl;
    static const char *const kScheduleVariable;
    static constexpr int kSurfaceId = 2445;
    static constexpr int kUtcOffsetSeconds = -5 * 60 * 60;
    static constexpr int kTimeoutSeconds = 15;

    explicit LgriaScheduleSource(net::HttpFetcher &fetcher);

    QString name() const override;
    QHash<QString, int> surfaceMappings() const override;
    int utcOffsetSeconds() const override;
    std::vector<schedule::EventRecord> fetchSchedule(const QDateTime &windowStart,
                                                     const QDateTime &windowEnd) const override;

    // Normalizes the embedded array; keeps events starting in the window.
    static std::vector<schedule::EventRecord> parsePage(const QByteArray &page,
                                                        const QDateTime &windowStart,
                                                        const QDateTime &windowEnd,
                                                        QString *error = nullptr);

    static std::optional<schedule::EventRecord> toEvent(const QJsonObject &raw);

    // ISO-8601 "yyyy-MM-ddThh:mm:ss" without offset.
    static QDateTime parseTimestamp(const QString &value);

private:
    net::HttpFetcher &m_fetcher;
};

} // namespace sources
} // namespace rinkguide
