#include "rinkguide/catalog/FileSurfaceCatalog.hpp"

#include "rinkguide/catalog/InMemorySurfaceCatalog.hpp"
#include "rinkguide/catalog/SurfaceJson.hpp"
#include "rinkguide/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include <algorithm>

namespace rinkguide {
namespace catalog {

FileSurfaceCatalog::FileSurfaceCatalog(QString filePath)
    : m_filePath(std::move(filePath))
{
    m_loaded = load();
}

FileSurfaceCatalog::~FileSurfaceCatalog() = default;

bool FileSurfaceCatalog::isLoaded() const
{
    return m_loaded;
}

const QString &FileSurfaceCatalog::filePath() const
{
    return m_filePath;
}

std::vector<SurfaceInfo> FileSurfaceCatalog::favorites() const
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

std::optional<SurfaceInfo> FileSurfaceCatalog::findSurface(int surfaceId) const
{
    if (m_surfaces.contains(surfaceId)) {
        return m_surfaces.value(surfaceId);
    }
    return std::nullopt;
}

SurfaceInfo FileSurfaceCatalog::addOrUpdateSurface(SurfaceInfo surface)
{
    m_surfaces.insert(surface.surfaceId, surface);
    if (!save()) {
        qCWarning(lcCatalog) << "Surface" << surface.surfaceId << "is only kept in memory";
    }
    return surface;
}

bool FileSurfaceCatalog::setFavorite(int surfaceId, bool favorite)
{
    auto it = m_surfaces.find(surfaceId);
    if (it == m_surfaces.end()) {
        return false;
    }
    it->favorite = favorite;
    return save();
}

bool FileSurfaceCatalog::storeStreamUrl(int surfaceId, const QString &url, const QDateTime &capturedAt)
{
    auto it = m_surfaces.find(surfaceId);
    if (it == m_surfaces.end()) {
        return false;
    }
    it->streamUrl = url;
    it->streamCapturedAt = capturedAt;
    return save();
}

bool FileSurfaceCatalog::load()
{
    m_surfaces.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        qCInfo(lcCatalog).noquote() << "No catalog at" << m_filePath << "- starting empty";
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcCatalog).noquote() << "Cannot open catalog" << m_filePath << ":" << file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(lcCatalog).noquote() << "Catalog" << m_filePath << "is not a JSON object:"
                                       << parseError.errorString();
        return false;
    }

    const QJsonArray surfaces = document.object().value(QLatin1String("surfaces")).toArray();
    for (const QJsonValue &value : surfaces) {
        const auto surface = surfaceFromJson(value.toObject());
        if (!surface) {
            qCDebug(lcCatalog) << "Skipping catalog entry without a surface id";
            continue;
        }
        m_surfaces.insert(surface->surfaceId, *surface);
    }

    qCInfo(lcCatalog).noquote() << "Loaded" << m_surfaces.size() << "surfaces from" << m_filePath;
    return true;
}

bool FileSurfaceCatalog::save() const
{
    if (m_filePath.isEmpty()) {
        return false;
    }
    if (!m_loaded) {
        qCWarning(lcCatalog).noquote() << "Not overwriting unreadable catalog" << m_filePath;
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    std::vector<SurfaceInfo> ordered;
    ordered.reserve(static_cast<size_t>(m_surfaces.size()));
    for (const auto &surface : m_surfaces) {
        ordered.push_back(surface);
    }
    std::sort(ordered.begin(), ordered.end(), [](const SurfaceInfo &lhs, const SurfaceInfo &rhs) {
        return lhs.surfaceId < rhs.surfaceId;
    });

    QJsonArray surfaces;
    for (const SurfaceInfo &surface : ordered) {
        surfaces.append(surfaceToJson(surface));
    }
    QJsonObject root;
    root.insert(QStringLiteral("surfaces"), surfaces);

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcCatalog).noquote() << "Cannot write catalog" << m_filePath << ":" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCWarning(lcCatalog).noquote() << "Failed to commit catalog" << m_filePath << ":" << file.errorString();
        return false;
    }
    return true;
}

} // namespace catalog
} // namespace rinkguide
