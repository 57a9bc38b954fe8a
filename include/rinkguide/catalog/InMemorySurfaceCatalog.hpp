#pragma once

#include <QHash>

#include "rinkguide/catalog/SurfaceCatalog.hpp"

namespace rinkguide {
namespace catalog {

class InMemorySurfaceCatalog : public SurfaceCatalog
{
public:
    InMemorySurfaceCatalog();
    ~InMemorySurfaceCatalog() override;

    std::vector<SurfaceInfo> favorites() const override;
    std::optional<SurfaceInfo> findSurface(int surfaceId) const override;
    SurfaceInfo addOrUpdateSurface(SurfaceInfo surface) override;
    bool setFavorite(int surfaceId, bool favorite) override;
    bool storeStreamUrl(int surfaceId, const QString &url, const QDateTime &capturedAt) override;

private:
    QHash<int, SurfaceInfo> m_surfaces;
};

// Orders surfaces by venue name, surface name, then id.
void sortForDisplay(std::vector<SurfaceInfo> &surfaces);

} // namespace catalog
} // namespace rinkguide
