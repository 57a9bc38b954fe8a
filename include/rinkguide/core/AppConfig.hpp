#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <QTime>

class QSettings;

namespace rinkguide {
namespace core {

struct AppConfig
{
    static constexpr int kDefaultPort = 5000;

    // Port written into playlist URLs: PUBLIC_PORT, else the stream proxy's
    // SERVER_PORT, else 5000. Nothing in this process listens on it.
    int publicPort = kDefaultPort;
    QString lanIp;
    QString logLevel = QStringLiteral("INFO");
    QString catalogPath;
    QString outputDir;
    QTime refreshTime = QTime(3, 0);
    bool livePlaceholder = false;

    // Reads the INI file (if any), then applies environment overrides.
    static AppConfig load(const QString &iniPath);
    static AppConfig fromSettings(QSettings &settings, const QProcessEnvironment &environment);

    // Host clients should use in playlist URLs.
    QString serverHost() const;
};

// First non-loopback IPv4 address, or 127.0.0.1.
QString detectLanIp();

} // namespace core
} // namespace rinkguide
