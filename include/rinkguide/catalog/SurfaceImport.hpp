#pragma once

#include <QByteArray>

#include "rinkguide/schedule/StageResult.hpp"

namespace rinkguide {
namespace catalog {

class SurfaceCatalog;

/**
 * Adds or updates surfaces from a JSON document in the catalog file format
 * (an object with a "surfaces" array, or the bare array).
 *
 * Venue, surface and location fields are taken from the document. Surfaces
 * already in the catalog keep their favorite flag and captured stream; new
 * ones take "favorite" from the document. Entries without a surfaceId are
 * skipped. Returns the number of surfaces written.
 */
schedule::StageResult<int> importSurfaces(SurfaceCatalog &catalog, const QByteArray &json);

} // namespace catalog
} // namespace rinkguide
