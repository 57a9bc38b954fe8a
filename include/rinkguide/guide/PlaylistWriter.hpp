#pragma once

#include <QString>

#include <vector>

#include "rinkguide/catalog/SurfaceInfo.hpp"

namespace rinkguide {
namespace guide {

// M3U playlist with Channels DVR guide tags; every channel points at the
// local proxy endpoint for its surface.
QString buildPlaylist(const std::vector<catalog::SurfaceInfo> &favorites, const QString &host, int port);

QString proxyUrl(const QString &host, int port, int surfaceId);

} // namespace guide
} // namespace rinkguide
