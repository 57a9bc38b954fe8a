#include "rinkguide/core/CatalogCommands.hpp"

#include "rinkguide/catalog/SurfaceCatalog.hpp"
#include "rinkguide/catalog/SurfaceImport.hpp"
#include "rinkguide/core/Logging.hpp"

#include <QFile>

namespace rinkguide {
namespace core {

namespace {

bool fail(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
    return false;
}

bool applyFavorite(catalog::SurfaceCatalog &catalog, const QString &value, bool favorite, QString *error)
{
    const auto surfaceId = parseSurfaceId(value);
    if (!surfaceId) {
        return fail(error, QStringLiteral("invalid surface id '%1'").arg(value));
    }
    if (!catalog.setFavorite(*surfaceId, favorite)) {
        return fail(error, QStringLiteral("cannot update surface %1").arg(*surfaceId));
    }
    qCInfo(lcCatalog) << "Surface" << *surfaceId << (favorite ? "added to" : "removed from") << "favorites";
    return true;
}

} // namespace

bool CatalogEdits::isEmpty() const
{
    return importFiles.isEmpty() && favorites.isEmpty() && unfavorites.isEmpty() && streams.isEmpty();
}

std::optional<int> parseSurfaceId(const QString &value)
{
    bool ok = false;
    const int surfaceId = value.trimmed().toInt(&ok);
    if (!ok || surfaceId <= 0) {
        return std::nullopt;
    }
    return surfaceId;
}

std::optional<std::pair<int, QString>> parseStreamAssignment(const QString &value)
{
    const int separator = value.indexOf(QLatin1Char('='));
    if (separator <= 0) {
        return std::nullopt;
    }
    const auto surfaceId = parseSurfaceId(value.left(separator));
    const QString url = value.mid(separator + 1).trimmed();
    if (!surfaceId || url.isEmpty()) {
        return std::nullopt;
    }
    return std::make_pair(*surfaceId, url);
}

bool applyCatalogEdits(catalog::SurfaceCatalog &catalog,
                       const CatalogEdits &edits,
                       const QDateTime &now,
                       QString *error)
{
    for (const QString &path : edits.importFiles) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            return fail(error, QStringLiteral("cannot open %1: %2").arg(path, file.errorString()));
        }
        const auto imported = catalog::importSurfaces(catalog, file.readAll());
        if (!imported.ok()) {
            return fail(error, QStringLiteral("%1: %2").arg(path, imported.error()));
        }
    }

    for (const QString &value : edits.favorites) {
        if (!applyFavorite(catalog, value, true, error)) {
            return false;
        }
    }
    for (const QString &value : edits.unfavorites) {
        if (!applyFavorite(catalog, value, false, error)) {
            return false;
        }
    }

    for (const QString &value : edits.streams) {
        const auto assignment = parseStreamAssignment(value);
        if (!assignment) {
            return fail(error, QStringLiteral("expected <surface id>=<url>, got '%1'").arg(value));
        }
        if (!catalog.storeStreamUrl(assignment->first, assignment->second, now)) {
            return fail(error, QStringLiteral("cannot store stream for surface %1").arg(assignment->first));
        }
        qCInfo(lcCatalog) << "Stored stream URL for surface" << assignment->first;
    }

    return true;
}

} // namespace core
} // namespace rinkguide
