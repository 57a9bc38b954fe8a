#include "rinkguide/guide/PlaylistWriter.hpp"

#include "rinkguide/guide/GuideText.hpp"

#include <QStringList>

namespace rinkguide {
namespace guide {

QString proxyUrl(const QString &host, int port, int surfaceId)
{
    return QStringLiteral("http://%1:%2/proxy/%3").arg(host).arg(port).arg(surfaceId);
}

QString buildPlaylist(const std::vector<catalog::SurfaceInfo> &favorites, const QString &host, int port)
{
    QStringList lines;
    lines << QStringLiteral("#EXTM3U");

    for (const auto &surface : favorites) {
        const QString title = channelTitle(surface);
        const QString location = locationLabel(surface);
        const QString id = QString::number(surface.surfaceId);

        QString description = QStringLiteral("Live camera feed from %1 - %2").arg(surface.venueName, surface.surfaceName);
        if (!surface.city.isEmpty() && !surface.state.isEmpty()) {
            description += QStringLiteral(" in %1, %2").arg(surface.city, surface.state);
        }
        description.replace(QLatin1Char('"'), QLatin1Char('\''));

        QString extinf = QStringLiteral("#EXTINF:-1 channel-id=\"%1\" channel-number=\"%1\" tvg-id=\"%1\" "
                                        "tvg-name=\"%2\" group-title=\"LiveBarn\" "
                                        "tvc-guide-title=\"LIVE: %2\" tvc-guide-description=\"%3\" "
                                        "tvc-guide-tags=\"Live, HDTV\" tvc-guide-genres=\"Sports\" "
                                        "tvc-guide-placeholders=\"3600\",%2")
                             .arg(id, title, description);
        if (!location.isEmpty()) {
            extinf += QStringLiteral(" (%1)").arg(location);
        }

        lines << extinf;
        lines << proxyUrl(host, port, surface.surfaceId);
    }

    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace guide
} // namespace rinkguide
