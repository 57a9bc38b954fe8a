#include <QtTest/QtTest>

#include "rinkguide/core/AppConfig.hpp"
#include "rinkguide/core/Logging.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace rinkguide::core;

class AppConfigTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWithoutSettings();
    void readsIniFile();
    void environmentOverridesIni();
    void invalidValuesFallBack();
    void serverPortIsPublicPortFallback();
    void filterRulesFollowLevel();
};

void AppConfigTest::defaultsWithoutSettings()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);

    const AppConfig config = AppConfig::fromSettings(settings, QProcessEnvironment());
    QCOMPARE(config.publicPort, AppConfig::kDefaultPort);
    QVERIFY(config.lanIp.isEmpty());
    QCOMPARE(config.logLevel, QStringLiteral("INFO"));
    QCOMPARE(config.refreshTime, QTime(3, 0));
    QVERIFY(!config.livePlaceholder);
    QVERIFY(config.catalogPath.endsWith(QStringLiteral("catalog.json")));
    QVERIFY(!config.outputDir.isEmpty());
    QVERIFY(!config.serverHost().isEmpty());
}

void AppConfigTest::readsIniFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("rinkguide.ini"));
    {
        QSettings writer(path, QSettings::IniFormat);
        writer.setValue(QStringLiteral("server/port"), 6000);
        writer.setValue(QStringLiteral("server/lanIp"), QStringLiteral("192.168.1.20"));
        writer.setValue(QStringLiteral("catalog/path"), dir.filePath(QStringLiteral("c.json")));
        writer.setValue(QStringLiteral("guide/outputDir"), dir.filePath(QStringLiteral("out")));
        writer.setValue(QStringLiteral("guide/livePlaceholder"), QStringLiteral("yes"));
        writer.setValue(QStringLiteral("schedule/refreshTime"), QStringLiteral("04:30"));
        writer.setValue(QStringLiteral("logging/level"), QStringLiteral("DEBUG"));
    }

    QSettings settings(path, QSettings::IniFormat);
    const AppConfig config = AppConfig::fromSettings(settings, QProcessEnvironment());
    QCOMPARE(config.publicPort, 6000);
    QCOMPARE(config.serverHost(), QStringLiteral("192.168.1.20"));
    QCOMPARE(config.catalogPath, dir.filePath(QStringLiteral("c.json")));
    QCOMPARE(config.outputDir, dir.filePath(QStringLiteral("out")));
    QVERIFY(config.livePlaceholder);
    QCOMPARE(config.refreshTime, QTime(4, 30));
    QCOMPARE(config.logLevel, QStringLiteral("DEBUG"));
}

void AppConfigTest::environmentOverridesIni()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("rinkguide.ini"));
    {
        QSettings writer(path, QSettings::IniFormat);
        writer.setValue(QStringLiteral("server/port"), 6000);
        writer.setValue(QStringLiteral("guide/livePlaceholder"), true);
    }

    QProcessEnvironment environment;
    environment.insert(QStringLiteral("SERVER_PORT"), QStringLiteral("7000"));
    environment.insert(QStringLiteral("PUBLIC_PORT"), QStringLiteral("80"));
    environment.insert(QStringLiteral("LAN_IP"), QStringLiteral(" 10.0.0.5 "));
    environment.insert(QStringLiteral("LIVE_PLACEHOLDER"), QStringLiteral("0"));
    environment.insert(QStringLiteral("REFRESH_TIME"), QStringLiteral("02:15"));

    QSettings settings(path, QSettings::IniFormat);
    const AppConfig config = AppConfig::fromSettings(settings, environment);
    QCOMPARE(config.publicPort, 80);
    QCOMPARE(config.lanIp, QStringLiteral("10.0.0.5"));
    QVERIFY(!config.livePlaceholder);
    QCOMPARE(config.refreshTime, QTime(2, 15));
}

void AppConfigTest::invalidValuesFallBack()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);

    QProcessEnvironment environment;
    environment.insert(QStringLiteral("SERVER_PORT"), QStringLiteral("http"));
    environment.insert(QStringLiteral("PUBLIC_PORT"), QStringLiteral("70000"));
    environment.insert(QStringLiteral("REFRESH_TIME"), QStringLiteral("25:99"));

    const AppConfig config = AppConfig::fromSettings(settings, environment);
    QCOMPARE(config.publicPort, 5000);
    QCOMPARE(config.refreshTime, QTime(3, 0));
}

void AppConfigTest::serverPortIsPublicPortFallback()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);

    QProcessEnvironment environment;
    environment.insert(QStringLiteral("SERVER_PORT"), QStringLiteral("7000"));
    QCOMPARE(AppConfig::fromSettings(settings, environment).publicPort, 7000);

    environment.insert(QStringLiteral("PUBLIC_PORT"), QStringLiteral("443"));
    QCOMPARE(AppConfig::fromSettings(settings, environment).publicPort, 443);
}

void AppConfigTest::filterRulesFollowLevel()
{
    QCOMPARE(loggingFilterRules(QStringLiteral("debug")),
             QStringLiteral("rinkguide.*.debug=true\nrinkguide.*.info=true\n"
                            "rinkguide.*.warning=true\nrinkguide.*.critical=true"));
    QCOMPARE(loggingFilterRules(QStringLiteral("WARNING")),
             QStringLiteral("rinkguide.*.debug=false\nrinkguide.*.info=false\n"
                            "rinkguide.*.warning=true\nrinkguide.*.critical=true"));
    QCOMPARE(loggingFilterRules(QStringLiteral("ERROR")), loggingFilterRules(QStringLiteral("critical")));
    QCOMPARE(loggingFilterRules(QStringLiteral("verbose")), loggingFilterRules(QStringLiteral("INFO")));
}

QTEST_GUILESS_MAIN(AppConfigTest)
#include "AppConfigTest.moc"
