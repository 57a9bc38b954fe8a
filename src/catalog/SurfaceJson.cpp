#include "rinkguide/catalog/SurfaceJson.hpp"

namespace rinkguide {
namespace catalog {

std::optional<SurfaceInfo> surfaceFromJson(const QJsonObject &object)
{
    const int surfaceId = object.value(QLatin1String("surfaceId")).toInt(0);
    if (surfaceId <= 0) {
        return std::nullopt;
    }

    SurfaceInfo surface;
    surface.surfaceId = surfaceId;
    surface.venueName = object.value(QLatin1String("venueName")).toString();
    surface.surfaceName = object.value(QLatin1String("surfaceName")).toString();
    surface.city = object.value(QLatin1String("city")).toString();
    surface.state = object.value(QLatin1String("state")).toString();
    surface.favorite = object.value(QLatin1String("favorite")).toBool(false);
    surface.streamUrl = object.value(QLatin1String("streamUrl")).toString();
    surface.streamCapturedAt = QDateTime::fromString(object.value(QLatin1String("streamCapturedAt")).toString(),
                                                     Qt::ISODate);
    return surface;
}

QJsonObject surfaceToJson(const SurfaceInfo &surface)
{
    QJsonObject object;
    object.insert(QStringLiteral("surfaceId"), surface.surfaceId);
    object.insert(QStringLiteral("venueName"), surface.venueName);
    object.insert(QStringLiteral("surfaceName"), surface.surfaceName);
    if (!surface.city.isEmpty()) {
        object.insert(QStringLiteral("city"), surface.city);
    }
    if (!surface.state.isEmpty()) {
        object.insert(QStringLiteral("state"), surface.state);
    }
    object.insert(QStringLiteral("favorite"), surface.favorite);
    if (!surface.streamUrl.isEmpty()) {
        object.insert(QStringLiteral("streamUrl"), surface.streamUrl);
    }
    if (surface.streamCapturedAt.isValid()) {
        object.insert(QStringLiteral("streamCapturedAt"), surface.streamCapturedAt.toString(Qt::ISODate));
    }
    return object;
}

} // namespace catalog
} // namespace rinkguide
