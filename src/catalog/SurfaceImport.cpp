#include "rinkguide/catalog/SurfaceImport.hpp"

#include "rinkguide/catalog/SurfaceCatalog.hpp"
#include "rinkguide/catalog/SurfaceJson.hpp"
#include "rinkguide/core/Logging.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace rinkguide {
namespace catalog {

schedule::StageResult<int> importSurfaces(SurfaceCatalog &catalog, const QByteArray &json)
{
    using Result = schedule::StageResult<int>;

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return Result::failure(QStringLiteral("invalid JSON at offset %1: %2")
                                   .arg(parseError.offset)
                                   .arg(parseError.errorString()));
    }

    QJsonArray entries;
    if (document.isArray()) {
        entries = document.array();
    } else if (document.object().value(QLatin1String("surfaces")).isArray()) {
        entries = document.object().value(QLatin1String("surfaces")).toArray();
    } else {
        return Result::failure(QStringLiteral("no surfaces array"));
    }

    int imported = 0;
    for (const QJsonValue &value : entries) {
        auto surface = surfaceFromJson(value.toObject());
        if (!surface) {
            qCDebug(lcCatalog) << "Skipping imported entry without a surface id";
            continue;
        }

        const auto existing = catalog.findSurface(surface->surfaceId);
        if (existing) {
            surface->favorite = existing->favorite;
            surface->streamUrl = existing->streamUrl;
            surface->streamCapturedAt = existing->streamCapturedAt;
        }
        catalog.addOrUpdateSurface(*surface);
        ++imported;
    }

    qCInfo(lcCatalog) << "Imported" << imported << "surfaces";
    return Result::success(imported);
}

} // namespace catalog
} // namespace rinkguide
