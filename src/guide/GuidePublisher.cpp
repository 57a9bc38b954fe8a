#include "rinkguide/guide/GuidePublisher.hpp"

#include "rinkguide/catalog/StreamToken.hpp"
#include "rinkguide/catalog/SurfaceCatalog.hpp"
#include "rinkguide/core/Logging.hpp"
#include "rinkguide/guide/PlaylistWriter.hpp"
#include "rinkguide/guide/XmltvWriter.hpp"
#include "rinkguide/schedule/ScheduleCache.hpp"

#include <QDateTime>
#include <QDir>
#include <QSaveFile>

namespace rinkguide {
namespace guide {

GuidePublisher::GuidePublisher(PublishSettings settings)
    : m_settings(std::move(settings))
{
}

const PublishSettings &GuidePublisher::settings() const
{
    return m_settings;
}

QString GuidePublisher::playlistPath() const
{
    return QDir(m_settings.outputDir).filePath(QStringLiteral("playlist.m3u"));
}

QString GuidePublisher::guidePath() const
{
    return QDir(m_settings.outputDir).filePath(QStringLiteral("guide.xml"));
}

bool GuidePublisher::publish(const catalog::SurfaceCatalog &catalog, const schedule::ScheduleSnapshot &snapshot) const
{
    const auto favorites = catalog.favorites();
    if (favorites.empty()) {
        qCWarning(lcGuide) << "No favorite surfaces; guide will be empty";
    }

    const QDateTime now = QDateTime::currentDateTime();
    int staleStreams = 0;
    for (const auto &surface : favorites) {
        if (catalog::streamUrlNeedsRefresh(surface.streamUrl, now)) {
            ++staleStreams;
            qCDebug(lcGuide) << "Stream for surface" << surface.surfaceId << "needs a new capture";
        }
    }

    GuideOptions options;
    options.now = now;
    options.livePlaceholder = m_settings.livePlaceholder;
    options.generatorUrl = QStringLiteral("http://%1:%2").arg(m_settings.host).arg(m_settings.port);

    const QString playlist = buildPlaylist(favorites, m_settings.host, m_settings.port);
    const QByteArray xmltv = buildXmltv(favorites, snapshot, options);

    const bool ok = writeFile(playlistPath(), playlist.toUtf8()) && writeFile(guidePath(), xmltv);
    if (ok) {
        qCInfo(lcGuide).noquote() << "Published" << favorites.size() << "channels to" << m_settings.outputDir
                                  << QStringLiteral("(%1 streams awaiting capture)").arg(staleStreams);
    }
    return ok;
}

bool GuidePublisher::writeFile(const QString &path, const QByteArray &content) const
{
    QDir dir(m_settings.outputDir);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCCritical(lcGuide).noquote() << "Cannot write" << path << ":" << file.errorString();
        return false;
    }
    file.write(content);
    if (!file.commit()) {
        qCCritical(lcGuide).noquote() << "Failed to commit" << path << ":" << file.errorString();
        return false;
    }
    return true;
}

} // namespace guide
} // namespace rinkguide
