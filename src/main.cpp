#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QObject>
#include <QString>

#include "version.h"

#include "rinkguide/core/AppConfig.hpp"
#include "rinkguide/core/AppContext.hpp"
#include "rinkguide/core/CatalogCommands.hpp"
#include "rinkguide/core/Logging.hpp"
#include "rinkguide/schedule/RefreshScheduler.hpp"
#include "rinkguide/schedule/ScheduleCache.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("RinkGuide"));
    QCoreApplication::setApplicationName(QStringLiteral("rinkguide"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kRinkGuideVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Builds an M3U playlist and XMLTV guide for rink cameras"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QObject::tr("Read settings from <file>."),
                                          QObject::tr("file"));
    const QCommandLineOption onceOption(QStringLiteral("once"),
                                        QObject::tr("Refresh schedules, write the guide and exit."));
    const QCommandLineOption importOption(QStringLiteral("import"),
                                          QObject::tr("Add or update surfaces from a JSON <file>."),
                                          QObject::tr("file"));
    const QCommandLineOption favoriteOption(QStringLiteral("favorite"),
                                            QObject::tr("Add surface <id> to the guide."),
                                            QObject::tr("id"));
    const QCommandLineOption unfavoriteOption(QStringLiteral("unfavorite"),
                                              QObject::tr("Remove surface <id> from the guide."),
                                              QObject::tr("id"));
    const QCommandLineOption streamOption(QStringLiteral("stream"),
                                          QObject::tr("Store a captured stream URL for a surface."),
                                          QObject::tr("id=url"));
    parser.addOption(configOption);
    parser.addOption(onceOption);
    parser.addOption(importOption);
    parser.addOption(favoriteOption);
    parser.addOption(unfavoriteOption);
    parser.addOption(streamOption);
    parser.process(app);

    rinkguide::core::CatalogEdits edits;
    edits.importFiles = parser.values(importOption);
    edits.favorites = parser.values(favoriteOption);
    edits.unfavorites = parser.values(unfavoriteOption);
    edits.streams = parser.values(streamOption);

    const auto config = rinkguide::core::AppConfig::load(parser.value(configOption));
    rinkguide::core::configureLogging(config.logLevel);
    qCInfo(lcApp).noquote() << "Rink Guide" << QCoreApplication::applicationVersion();

    rinkguide::core::AppContext context(config);

    if (!edits.isEmpty()) {
        if (!context.catalogLoaded()) {
            qCCritical(lcApp).noquote() << "Catalog" << config.catalogPath << "is unreadable; not editing it";
            return 1;
        }
        QString error;
        if (!rinkguide::core::applyCatalogEdits(context.catalog(), edits, QDateTime::currentDateTime(), &error)) {
            qCCritical(lcApp).noquote() << "Catalog edit failed:" << error;
            return 1;
        }
        if (!parser.isSet(onceOption)) {
            return 0;
        }
    }

    if (parser.isSet(onceOption)) {
        context.scheduleCache().refresh();
        return context.publishGuide() ? 0 : 1;
    }

    auto &scheduler = context.refreshScheduler();
    QObject::connect(&scheduler, &rinkguide::schedule::RefreshScheduler::refreshed, &app, [&context]() {
        if (!context.publishGuide()) {
            qCWarning(lcApp) << "Guide was not published after refresh";
        }
    });
    scheduler.start();

    return app.exec();
}
