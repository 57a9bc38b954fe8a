#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QString>

#include "rinkguide/schedule/StageResult.hpp"

namespace rinkguide {
namespace sources {

// Finds "<variable> =" in a page and returns the bracket-balanced array
// literal that follows it, e.g. the [...] of `var list = [{...}, ...];`.
schedule::StageResult<QByteArray> extractArrayLiteral(const QByteArray &page, const QByteArray &variable);

// extractArrayLiteral() followed by a JSON parse that must yield an array.
schedule::StageResult<QJsonArray> extractJsonArray(const QByteArray &page, const QByteArray &variable);

} // namespace sources
} // namespace rinkguide
