#include "rinkguide/catalog/InMemorySurfaceCatalog.hpp"

#include <algorithm>
#include <tuple>

namespace rinkguide {
namespace catalog {

void sortForDisplay(std::vector<SurfaceInfo> &surfaces)
{
    std::sort(surfaces.begin(), surfaces.end(), [](const SurfaceInfo &lhs, const SurfaceInfo &rhs) {
        return std::tie(lhs.venueName, lhs.surfaceName, lhs.surfaceId)
            < std::tie(rhs.venueName, rhs.surfaceName, rhs.surfaceId);
    });
}

InMemorySurfaceCatalog::InMemorySurfaceCatalog() = default;
InMemorySurfaceCatalog::~InMemorySurfaceCatalog() = default;

std::vector<SurfaceInfo> InMemorySurfaceCatalog::favorites() const
{
    std::vector<SurfaceInfo> result;
    for (const auto &surface : m_surfaces) {
        if (surface.favorite) {
            result.push_back(surface);
        }
    }
    sortForDisplay(result);
    return result;
}

std::optional<SurfaceInfo> InMemorySurfaceCatalog::findSurface(int surfaceId) const
{
    if (m_surfaces.contains(surfaceId)) {
        return m_surfaces.value(surfaceId);
    }
    return std::nullopt;
}

SurfaceInfo InMemorySurfaceCatalog::addOrUpdateSurface(SurfaceInfo surface)
{
    m_surfaces.insert(surface.surfaceId, surface);
    return surface;
}

bool InMemorySurfaceCatalog::setFavorite(int surfaceId, bool favorite)
{
    auto it = m_surfaces.find(surfaceId);
    if (it == m_surfaces.end()) {
        return false;
    }
    it->favorite = favorite;
    return true;
}

bool InMemorySurfaceCatalog::storeStreamUrl(int surfaceId, const QString &url, const QDateTime &capturedAt)
{
    auto it = m_surfaces.find(surfaceId);
    if (it == m_surfaces.end()) {
        return false;
    }
    it->streamUrl = url;
    it->streamCapturedAt = capturedAt;
    return true;
}

} // namespace catalog
} // namespace rinkguide
