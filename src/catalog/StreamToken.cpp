#include "rinkguide/catalog/StreamToken.hpp"

#include <QRegularExpression>

namespace rinkguide {
namespace catalog {

std::optional<QDateTime> streamUrlExpiry(const QString &url)
{
    static const QRegularExpression expiryPattern(QStringLiteral("exp=(\\d+)"));
    const QRegularExpressionMatch match = expiryPattern.match(url);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const qint64 seconds = match.captured(1).toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return QDateTime::fromSecsSinceEpoch(seconds);
}

bool streamUrlNeedsRefresh(const QString &url, const QDateTime &now, qint64 marginSeconds)
{
    if (url.isEmpty()) {
        return true;
    }
    const auto expiry = streamUrlExpiry(url);
    if (!expiry) {
        return false;
    }
    return now.secsTo(*expiry) < marginSeconds;
}

} // namespace catalog
} // namespace rinkguide
