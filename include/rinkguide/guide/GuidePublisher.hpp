#pragma once

#include <QString>

namespace rinkguide {
namespace catalog {
class SurfaceCatalog;
}
namespace schedule {
struct ScheduleSnapshot;
}

namespace guide {

struct PublishSettings
{
    QString outputDir;
    QString host;
    int port = 5000;
    bool livePlaceholder = false;
};

// Writes playlist.m3u and guide.xml for the catalog's favorites.
class GuidePublisher
{
public:
    explicit GuidePublisher(PublishSettings settings);

    bool publish(const catalog::SurfaceCatalog &catalog, const schedule::ScheduleSnapshot &snapshot) const;

    QString playlistPath() const;
    QString guidePath() const;
    const PublishSettings &settings() const;

private:
    bool writeFile(const QString &path, const QByteArray &content) const;

    PublishSettings m_settings;
};

} // namespace guide
} // namespace rinkguide
