#pragma once

#include <QHash>
#include <QString>

#include "rinkguide/catalog/SurfaceCatalog.hpp"

namespace rinkguide {
namespace catalog {

/**
 * Catalog kept in a JSON file:
 *
 *   { "surfaces": [ { "surfaceId": 864, "venueName": "...", "surfaceName": "...",
 *                     "city": "...", "state": "...", "favorite": true,
 *                     "streamUrl": "...", "streamCapturedAt": "2025-01-01T09:00:00" } ] }
 *
 * Every change is written back atomically. A file that exists but cannot be
 * read leaves the catalog unloaded, and it is never overwritten.
 */
class FileSurfaceCatalog : public SurfaceCatalog
{
public:
    explicit FileSurfaceCatalog(QString filePath);
    ~FileSurfaceCatalog() override;

    bool isLoaded() const;
    const QString &filePath() const;

    std::vector<SurfaceInfo> favorites() const override;
    std::optional<SurfaceInfo> findSurface(int surfaceId) const override;
    SurfaceInfo addOrUpdateSurface(SurfaceInfo surface) override;
    bool setFavorite(int surfaceId, bool favorite) override;
    bool storeStreamUrl(int surfaceId, const QString &url, const QDateTime &capturedAt) override;

private:
    bool load();
    bool save() const;

    QString m_filePath;
    QHash<int, SurfaceInfo> m_surfaces;
    bool m_loaded = false;
};

} // namespace catalog
} // namespace rinkguide
