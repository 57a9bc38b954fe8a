#include "rinkguide/sources/EmbeddedJson.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

namespace rinkguide {
namespace sources {

schedule::StageResult<QByteArray> extractArrayLiteral(const QByteArray &page, const QByteArray &variable)
{
    using Result = schedule::StageResult<QByteArray>;

    const QByteArray marker = variable + " =";
    const int markerIndex = page.indexOf(marker);
    if (markerIndex < 0) {
        return Result::failure(QStringLiteral("variable %1 not found").arg(QString::fromUtf8(variable)));
    }

    const int start = page.indexOf('[', markerIndex + marker.size());
    if (start < 0) {
        return Result::failure(QStringLiteral("no '[' after %1 assignment").arg(QString::fromUtf8(variable)));
    }

    // Brackets inside string literals do not count.
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (int i = start; i < page.size(); ++i) {
        const char ch = page.at(i);
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                inString = false;
            }
            continue;
        }
        if (ch == '"') {
            inString = true;
        } else if (ch == '[') {
            ++depth;
        } else if (ch == ']') {
            --depth;
            if (depth == 0) {
                return Result::success(page.mid(start, i - start + 1));
            }
        }
    }
    return Result::failure(QStringLiteral("no matching ']' for %1").arg(QString::fromUtf8(variable)));
}

schedule::StageResult<QJsonArray> extractJsonArray(const QByteArray &page, const QByteArray &variable)
{
    using Result = schedule::StageResult<QJsonArray>;

    const auto literal = extractArrayLiteral(page, variable);
    if (!literal.ok()) {
        return Result::failure(literal.error());
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(literal.value(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return Result::failure(QStringLiteral("invalid JSON at offset %1: %2")
                                   .arg(parseError.offset)
                                   .arg(parseError.errorString()));
    }
    if (!document.isArray()) {
        return Result::failure(QStringLiteral("%1 is not an array").arg(QString::fromUtf8(variable)));
    }
    return Result::success(document.array());
}

} // namespace sources
} // namespace rinkguide
