#include "rinkguide/core/Logging.hpp"

#include <QStringList>

Q_LOGGING_CATEGORY(lcSources, "rinkguide.sources", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSchedule, "rinkguide.schedule", QtInfoMsg)
Q_LOGGING_CATEGORY(lcGuide, "rinkguide.guide", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCatalog, "rinkguide.catalog", QtInfoMsg)
Q_LOGGING_CATEGORY(lcApp, "rinkguide.app", QtInfoMsg)

namespace rinkguide {
namespace core {

QString loggingFilterRules(const QString &level)
{
    const QString normalized = level.trimmed().toUpper();

    int threshold = 1; // INFO
    if (normalized == QLatin1String("DEBUG")) {
        threshold = 0;
    } else if (normalized == QLatin1String("WARNING") || normalized == QLatin1String("WARN")) {
        threshold = 2;
    } else if (normalized == QLatin1String("ERROR") || normalized == QLatin1String("CRITICAL")) {
        threshold = 3;
    }

    static const char *const kLevels[] = {"debug", "info", "warning", "critical"};
    QStringList rules;
    for (int i = 0; i < 4; ++i) {
        rules << QStringLiteral("rinkguide.*.%1=%2")
                     .arg(QLatin1String(kLevels[i]), i >= threshold ? QStringLiteral("true") : QStringLiteral("false"));
    }
    return rules.join('\n');
}

void configureLogging(const QString &level)
{
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss} [%{type}] %{category}: %{message}"));
    QLoggingCategory::setFilterRules(loggingFilterRules(level));
}

} // namespace core
} // namespace rinkguide
