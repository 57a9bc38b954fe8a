#pragma once

#include <QJsonObject>

#include <optional>

#include "rinkguide/catalog/SurfaceInfo.hpp"

namespace rinkguide {
namespace catalog {

// One entry of the "surfaces" array; nullopt without a positive surfaceId.
std::optional<SurfaceInfo> surfaceFromJson(const QJsonObject &object);
QJsonObject surfaceToJson(const SurfaceInfo &surface);

} // namespace catalog
} // namespace rinkguide
