#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcSources)
Q_DECLARE_LOGGING_CATEGORY(lcSchedule)
Q_DECLARE_LOGGING_CATEGORY(lcGuide)
Q_DECLARE_LOGGING_CATEGORY(lcCatalog)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace rinkguide {
namespace core {

// Applies a minimum level ("DEBUG", "INFO", "WARNING", "ERROR") to all
// rinkguide categories and installs the message pattern.
void configureLogging(const QString &level);

// Filter rules for the given level; unknown levels fall back to INFO.
QString loggingFilterRules(const QString &level);

} // namespace core
} // namespace rinkguide
