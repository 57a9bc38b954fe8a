#pragma once

#include <QDateTime>
#include <QString>

#include <optional>

namespace rinkguide {
namespace catalog {

constexpr qint64 kStreamRefreshMarginSeconds = 5 * 60;

// Expiry carried by the "exp=<unix seconds>" field of a tokenized HLS URL.
std::optional<QDateTime> streamUrlExpiry(const QString &url);

// True when there is no URL, or its token expires within the margin.
bool streamUrlNeedsRefresh(const QString &url,
                           const QDateTime &now,
                           qint64 marginSeconds = kStreamRefreshMarginSeconds);

} // namespace catalog
} // namespace rinkguide
