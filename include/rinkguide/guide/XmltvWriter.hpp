#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QString>

#include <vector>

#include "rinkguide/catalog/SurfaceInfo.hpp"
#include "rinkguide/schedule/EventRecord.hpp"

namespace rinkguide {
namespace schedule {
struct ScheduleSnapshot;
}

namespace guide {

struct GuideOptions
{
    QDateTime now = QDateTime::currentDateTime();
    QString generatorUrl;
    // Surfaces without bookings get one "LIVE:" block instead of Open Ice.
    bool livePlaceholder = false;
};

// Programmes for one surface over the snapshot window (or the default
// refresh window when the cache is still empty).
std::vector<schedule::ProgrammeBlock> programmesFor(const catalog::SurfaceInfo &surface,
                                                    const schedule::ScheduleSnapshot &snapshot,
                                                    const GuideOptions &options);

QByteArray buildXmltv(const std::vector<catalog::SurfaceInfo> &favorites,
                      const schedule::ScheduleSnapshot &snapshot,
                      const GuideOptions &options);

// "yyyyMMddhhmmss +hhmm" using the value's own UTC offset.
QString formatXmltvTime(const QDateTime &value);

} // namespace guide
} // namespace rinkguide
