#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <optional>
#include <utility>

namespace rinkguide {
namespace catalog {
class SurfaceCatalog;
}

namespace core {

// Catalog changes requested on the command line.
struct CatalogEdits
{
    QStringList importFiles;
    QStringList favorites;   // surface ids
    QStringList unfavorites; // surface ids
    QStringList streams;     // "<surface id>=<url>"

    bool isEmpty() const;
};

/**
 * Applies imports, then favorites, unfavorites and stream URLs, in that
 * order. Stops at the first edit that cannot be applied (unreadable file,
 * malformed id, unknown surface) and describes it in *error.
 */
bool applyCatalogEdits(catalog::SurfaceCatalog &catalog,
                       const CatalogEdits &edits,
                       const QDateTime &now,
                       QString *error);

std::optional<int> parseSurfaceId(const QString &value);

// "<id>=<url>"; the URL may contain '=' itself.
std::optional<std::pair<int, QString>> parseStreamAssignment(const QString &value);

} // namespace core
} // namespace rinkguide
