#pragma once

#include <QDateTime>
#include <QString>

namespace rinkguide {
namespace catalog {

struct SurfaceInfo
{
    int surfaceId = 0;
    QString venueName;
    QString surfaceName;
    QString city;
    QString state;
    bool favorite = false;
    QString streamUrl; // last captured HLS playlist, may be empty
    QDateTime streamCapturedAt;
};

} // namespace catalog
} // namespace rinkguide
