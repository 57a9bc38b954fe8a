#include "rinkguide/core/AppConfig.hpp"

#include "rinkguide/core/Logging.hpp"

#include <QDir>
#include <QHostAddress>
#include <QNetworkInterface>
#include <QSettings>
#include <QStandardPaths>

namespace rinkguide {
namespace core {

namespace {

QString lookup(QSettings &settings,
               const QProcessEnvironment &environment,
               const QString &key,
               const QString &envName,
               const QString &fallback)
{
    if (environment.contains(envName)) {
        return environment.value(envName);
    }
    return settings.value(key, fallback).toString();
}

int lookupPort(QSettings &settings,
               const QProcessEnvironment &environment,
               const QString &key,
               const QString &envName,
               int fallback)
{
    bool ok = false;
    const int port = lookup(settings, environment, key, envName, QString::number(fallback)).toInt(&ok);
    if (!ok || port <= 0 || port > 65535) {
        qCWarning(lcApp).noquote() << "Ignoring invalid port for" << envName << "- using" << fallback;
        return fallback;
    }
    return port;
}

bool parseFlag(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QLatin1String("1") || normalized == QLatin1String("true")
        || normalized == QLatin1String("yes") || normalized == QLatin1String("on");
}

QString defaultDataDir()
{
    QString folder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (folder.isEmpty()) {
        folder = QDir::homePath() + QStringLiteral("/.local/share/rinkguide");
    }
    return folder;
}

} // namespace

AppConfig AppConfig::load(const QString &iniPath)
{
    if (iniPath.isEmpty()) {
        QSettings settings;
        return fromSettings(settings, QProcessEnvironment::systemEnvironment());
    }
    QSettings settings(iniPath, QSettings::IniFormat);
    return fromSettings(settings, QProcessEnvironment::systemEnvironment());
}

AppConfig AppConfig::fromSettings(QSettings &settings, const QProcessEnvironment &environment)
{
    AppConfig config;
    const QString dataDir = defaultDataDir();

    const int serverPort = lookupPort(settings, environment, QStringLiteral("server/port"),
                                      QStringLiteral("SERVER_PORT"), kDefaultPort);
    config.publicPort = lookupPort(settings, environment, QStringLiteral("server/publicPort"),
                                   QStringLiteral("PUBLIC_PORT"), serverPort);
    config.lanIp = lookup(settings, environment, QStringLiteral("server/lanIp"), QStringLiteral("LAN_IP"), {}).trimmed();
    config.logLevel = lookup(settings, environment, QStringLiteral("logging/level"),
                             QStringLiteral("LOG_LEVEL"), config.logLevel);
    config.catalogPath = lookup(settings, environment, QStringLiteral("catalog/path"), QStringLiteral("CATALOG_PATH"),
                                QDir(dataDir).filePath(QStringLiteral("catalog.json")));
    config.outputDir = lookup(settings, environment, QStringLiteral("guide/outputDir"),
                              QStringLiteral("OUTPUT_DIR"), dataDir);
    config.livePlaceholder = parseFlag(lookup(settings, environment, QStringLiteral("guide/livePlaceholder"),
                                              QStringLiteral("LIVE_PLACEHOLDER"), QStringLiteral("false")));

    const QString refreshTime = lookup(settings, environment, QStringLiteral("schedule/refreshTime"),
                                       QStringLiteral("REFRESH_TIME"), QStringLiteral("03:00"));
    const QTime parsed = QTime::fromString(refreshTime.trimmed(), QStringLiteral("hh:mm"));
    if (parsed.isValid()) {
        config.refreshTime = parsed;
    } else {
        qCWarning(lcApp).noquote() << "Ignoring invalid refresh time" << refreshTime << "- using 03:00";
    }

    return config;
}

QString AppConfig::serverHost() const
{
    return lanIp.isEmpty() ? detectLanIp() : lanIp;
}

QString detectLanIp()
{
    const auto addresses = QNetworkInterface::allAddresses();
    for (const QHostAddress &address : addresses) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback()) {
            return address.toString();
        }
    }
    return QStringLiteral("127.0.0.1");
}

} // namespace core
} // namespace rinkguide
