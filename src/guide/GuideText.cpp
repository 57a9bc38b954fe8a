#include "rinkguide/guide/GuideText.hpp"

#include <QStringList>

namespace rinkguide {
namespace guide {

QString sanitizeTitle(const QString &text)
{
    static const QString kInvalidChars = QStringLiteral("\\/:*?\"<>|");

    QString cleaned;
    cleaned.reserve(text.size());
    for (const QChar ch : text) {
        if (ch.unicode() < 32 || kInvalidChars.contains(ch)) {
            cleaned.append(QLatin1Char(' '));
        } else {
            cleaned.append(ch);
        }
    }
    return cleaned.simplified();
}

QString xmlSafeText(const QString &text)
{
    QString cleaned = text;
    for (QChar &ch : cleaned) {
        const ushort code = ch.unicode();
        const bool control = code < 0x20 && code != '\t' && code != '\n' && code != '\r';
        if (control || code == 0xFFFE || code == 0xFFFF) {
            ch = QLatin1Char(' ');
        }
    }
    return cleaned;
}

QString channelTitle(const catalog::SurfaceInfo &surface)
{
    if (surface.venueName.isEmpty() && surface.surfaceName.isEmpty()) {
        return QStringLiteral("Surface %1").arg(surface.surfaceId);
    }
    return sanitizeTitle(QStringLiteral("%1 - %2").arg(surface.venueName, surface.surfaceName));
}

QString locationLabel(const catalog::SurfaceInfo &surface)
{
    QStringList parts;
    if (!surface.city.isEmpty()) {
        parts << surface.city;
    }
    if (!surface.state.isEmpty()) {
        parts << surface.state;
    }
    return parts.join(QStringLiteral(", "));
}

} // namespace guide
} // namespace rinkguide
