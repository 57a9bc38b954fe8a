#include <QtTest/QtTest>

#include "rinkguide/sources/EmbeddedJson.hpp"
#include "rinkguide/sources/LgriaScheduleSource.hpp"

#include "support/FakeHttpFetcher.hpp"

using namespace rinkguide::sources;
using rinkguide::testing::FakeHttpFetcher;

namespace {

const QByteArray PAGE = R"(<html><head><script>
var siteConfig = { items: [1, 2, 3] };
var _onlineScheduleList = [
  {"EventStartTime": "2025-01-01T20:00:00", "EventEndTime": "2025-01-01T21:00:00",
   "Description": " Adult Hockey [Drop-in] ", "ScheduleNotes": "Full gear", "EventTypeName": "Hockey",
   "Tags": ["a", ["b"]]},
  {"EventStartTime": "2025-01-01T06:00:00", "EventEndTime": "2025-01-01T07:30:00",
   "Description": "", "AccountName": "Newark Youth Hockey"},
  {"EventStartTime": "2025-01-02T09:00:00", "EventEndTime": "2025-01-02T10:00:00"},
  {"EventStartTime": "2024-12-31T23:00:00", "EventEndTime": "2025-01-01T00:30:00", "Description": "Yesterday"},
  {"EventStartTime": "2025-01-03T00:00:00", "EventEndTime": "2025-01-03T01:00:00", "Description": "Too late"},
  {"EventStartTime": "not a time", "EventEndTime": "2025-01-01T12:00:00", "Description": "Broken"}
];
</script></head></html>
)";

QDateTime at(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2025, 1, day), QTime(hour, minute));
}

} // namespace

class LgriaScheduleSourceTest : public QObject
{
    Q_OBJECT

private slots:
    void extractsNestedArray();
    void ignoresBracketsInsideStrings();
    void reportsMissingVariable();
    void reportsUnbalancedArray();
    void keepsEventsStartingInWindow();
    void fallsBackThroughTitleFields();
    void keepsMetadata();
    void fetchUsesScheduleUrl();
    void badPageYieldsNoEvents();
};

void LgriaScheduleSourceTest::extractsNestedArray()
{
    const auto literal = extractArrayLiteral("var x = [[1, 2], [3, [4]]]; var y = [5];", "x");
    QVERIFY(literal.ok());
    QCOMPARE(literal.value(), QByteArray("[[1, 2], [3, [4]]]"));

    const auto array = extractJsonArray("var y = [5];", "y");
    QVERIFY(array.ok());
    QCOMPARE(array.value().size(), 1);
}

void LgriaScheduleSourceTest::ignoresBracketsInsideStrings()
{
    const auto array = extractJsonArray(R"(list = [{"a": "]"}, {"b": "[\"]"}];)", "list");
    QVERIFY2(array.ok(), qPrintable(array.error()));
    QCOMPARE(array.value().size(), 2);
    QCOMPARE(array.value().at(1).toObject().value(QStringLiteral("b")).toString(), QStringLiteral("[\"]"));
}

void LgriaScheduleSourceTest::reportsMissingVariable()
{
    const auto literal = extractArrayLiteral("var other = [];", "_onlineScheduleList");
    QVERIFY(!literal.ok());
    QVERIFY(!literal.error().isEmpty());

    QVERIFY(!extractArrayLiteral("var list = null;", "list").ok());
}

void LgriaScheduleSourceTest::reportsUnbalancedArray()
{
    QVERIFY(!extractArrayLiteral("var list = [[1, 2];", "list").ok());
    QVERIFY(!extractJsonArray("var list = [1, 2,,];", "list").ok());
}

void LgriaScheduleSourceTest::keepsEventsStartingInWindow()
{
    QString error;
    const auto events = LgriaScheduleSource::parsePage(PAGE, at(1, 0), at(3, 0), &error);
    QVERIFY(error.isEmpty());

    QCOMPARE(events.size(), static_cast<size_t>(3));
    QCOMPARE(events[0].start, at(1, 6));
    QCOMPARE(events[1].start, at(1, 20));
    QCOMPARE(events[2].start, at(2, 9));
    for (const auto &event : events) {
        QCOMPARE(event.surfaceId, 2445);
    }
}

void LgriaScheduleSourceTest::fallsBackThroughTitleFields()
{
    const auto events = LgriaScheduleSource::parsePage(PAGE, at(1, 0), at(3, 0));
    QCOMPARE(events[0].title, QStringLiteral("Newark Youth Hockey"));
    QCOMPARE(events[1].title, QStringLiteral("Adult Hockey [Drop-in]"));
    QCOMPARE(events[2].title, QStringLiteral("Ice Time"));
}

void LgriaScheduleSourceTest::keepsMetadata()
{
    const auto events = LgriaScheduleSource::parsePage(PAGE, at(1, 0), at(3, 0));
    const auto &hockey = events[1];
    QCOMPARE(hockey.end, at(1, 21));
    QCOMPARE(hockey.description, QStringLiteral("Full gear"));
    QCOMPARE(hockey.eventType, QStringLiteral("Hockey"));
    QCOMPARE(hockey.rawData.value(QStringLiteral("Description")).toString(),
             QStringLiteral(" Adult Hockey [Drop-in] "));
    QVERIFY(events[0].description.isEmpty());
}

void LgriaScheduleSourceTest::fetchUsesScheduleUrl()
{
    FakeHttpFetcher fetcher;
    fetcher.respond(PAGE);
    LgriaScheduleSource source(fetcher);

    const auto events = source.fetchSchedule(at(1, 0), at(2, 0));
    QCOMPARE(events.size(), static_cast<size_t>(2));
    QCOMPARE(fetcher.requests.size(), 1);
    QCOMPARE(fetcher.requests.front(), QUrl(QStringLiteral("https://lgria.finnlyconnect.com/schedule/201")));
    QCOMPARE(fetcher.lastTimeout, std::chrono::seconds(15));
    QVERIFY(source.surfaceIds() == std::vector<int>{2445});
}

void LgriaScheduleSourceTest::badPageYieldsNoEvents()
{
    FakeHttpFetcher fetcher;
    LgriaScheduleSource source(fetcher);
    QVERIFY(source.fetchSchedule(at(1, 0), at(3, 0)).empty());

    fetcher.respond("<html>maintenance</html>");
    QVERIFY(source.fetchSchedule(at(1, 0), at(3, 0)).empty());

    QString error;
    QVERIFY(LgriaScheduleSource::parsePage("<html></html>", at(1, 0), at(3, 0), &error).empty());
    QVERIFY(!error.isEmpty());
}

QTEST_GUILESS_MAIN(LgriaScheduleSourceTest)
#include "LgriaScheduleSourceTest.moc"
