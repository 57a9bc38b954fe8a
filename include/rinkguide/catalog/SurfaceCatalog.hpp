#pragma once

#include <QDateTime>
#include <QString>

#include <optional>
#include <vector>

#include "rinkguide/catalog/SurfaceInfo.hpp"

namespace rinkguide {
namespace catalog {

class SurfaceCatalog
{
public:
    virtual ~SurfaceCatalog() = default;

    // Favorited surfaces ordered by venue name, then surface name.
    virtual std::vector<SurfaceInfo> favorites() const = 0;
    virtual std::optional<SurfaceInfo> findSurface(int surfaceId) const = 0;
    virtual SurfaceInfo addOrUpdateSurface(SurfaceInfo surface) = 0;
    virtual bool setFavorite(int surfaceId, bool favorite) = 0;
    virtual bool storeStreamUrl(int surfaceId, const QString &url, const QDateTime &capturedAt) = 0;
};

} // namespace catalog
} // namespace rinkguide
