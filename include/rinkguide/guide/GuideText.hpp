#pragma once

#include <QString>

#include "rinkguide/catalog/SurfaceInfo.hpp"

namespace rinkguide {
namespace guide {

// Replaces control characters and \/:*?"<>| with spaces, collapses
// whitespace and trims, so DVRs can use the text in file names.
QString sanitizeTitle(const QString &text);

// Replaces characters XML 1.0 cannot carry (controls other than tab, LF,
// CR, and U+FFFE/U+FFFF) with spaces. Other text is left alone.
QString xmlSafeText(const QString &text);

// "Venue - Surface", sanitized.
QString channelTitle(const catalog::SurfaceInfo &surface);

// "City, State", or whichever of the two is present.
QString locationLabel(const catalog::SurfaceInfo &surface);

} // namespace guide
} // namespace rinkguide
