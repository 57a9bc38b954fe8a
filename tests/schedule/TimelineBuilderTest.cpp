#include <QtTest/QtTest>

#include "rinkguide/schedule/TimelineBuilder.hpp"

using namespace rinkguide::schedule;

namespace {

QDateTime at(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2025, 1, day), QTime(hour, minute));
}

EventRecord booking(const QDateTime &start, const QDateTime &end, const QString &title)
{
    EventRecord record;
    record.surfaceId = 864;
    record.start = start;
    record.end = end;
    record.title = title;
    return record;
}

void verifyTiles(const std::vector<ProgrammeBlock> &blocks, const QDateTime &start, const QDateTime &end)
{
    QVERIFY(!blocks.empty());
    QCOMPARE(blocks.front().start, start);
    QCOMPARE(blocks.back().end, end);
    qint64 covered = 0;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        QVERIFY(blocks[i].start < blocks[i].end);
        covered += blocks[i].start.secsTo(blocks[i].end);
        if (i + 1 < blocks.size()) {
            QCOMPARE(blocks[i].end, blocks[i + 1].start);
        }
    }
    QCOMPARE(covered, start.secsTo(end));
}

} // namespace

class TimelineBuilderTest : public QObject
{
    Q_OBJECT

private slots:
    void fillsTwoDayWindowAroundSingleEvent();
    void emptyScheduleIsAllOpenIce();
    void tilesWindowWithBackToBackEvents();
    void fillerBlocksNeverExceedAnHour();
    void blankTitleFallsBackToIceTime();
    void reversedWindowYieldsNothing();
    void emptyWindowYieldsNothing();
    void emptyWindowIgnoresEvents();
    void containedEventMovesCursorBack();
    void skipsEventsWithInvalidTimes();
};

void TimelineBuilderTest::fillsTwoDayWindowAroundSingleEvent()
{
    const auto blocks = buildTimeline({booking(at(1, 9, 30), at(1, 11), QStringLiteral("Public Skate"))},
                                      at(1, 0), at(3, 0));

    QCOMPARE(blocks.size(), static_cast<size_t>(48));
    for (int hour = 0; hour < 9; ++hour) {
        QCOMPARE(blocks[hour], (ProgrammeBlock{at(1, hour), at(1, hour + 1), kOpenIceTitle}));
    }
    QCOMPARE(blocks[9], (ProgrammeBlock{at(1, 9), at(1, 9, 30), kOpenIceTitle}));
    QCOMPARE(blocks[10], (ProgrammeBlock{at(1, 9, 30), at(1, 11), QStringLiteral("Public Skate")}));
    QCOMPARE(blocks[11], (ProgrammeBlock{at(1, 11), at(1, 12), kOpenIceTitle}));
    QCOMPARE(blocks.back(), (ProgrammeBlock{at(2, 23), at(3, 0), kOpenIceTitle}));
    verifyTiles(blocks, at(1, 0), at(3, 0));
}

void TimelineBuilderTest::emptyScheduleIsAllOpenIce()
{
    const auto blocks = buildTimeline({}, at(1, 0), at(1, 2, 30));

    QCOMPARE(blocks.size(), static_cast<size_t>(3));
    QCOMPARE(blocks[0], (ProgrammeBlock{at(1, 0), at(1, 1), kOpenIceTitle}));
    QCOMPARE(blocks[1], (ProgrammeBlock{at(1, 1), at(1, 2), kOpenIceTitle}));
    QCOMPARE(blocks[2], (ProgrammeBlock{at(1, 2), at(1, 2, 30), kOpenIceTitle}));
}

void TimelineBuilderTest::tilesWindowWithBackToBackEvents()
{
    const std::vector<EventRecord> events = {
        booking(at(1, 6), at(1, 7, 15), QStringLiteral("Learn to Skate")),
        booking(at(1, 7, 15), at(1, 8), QStringLiteral("Stick & Puck")),
        booking(at(1, 13, 40), at(1, 15, 10), QStringLiteral("Adult League")),
        booking(at(1, 22), at(2, 1), QStringLiteral("Late Hockey")),
    };

    const auto blocks = buildTimeline(events, at(1, 0), at(2, 0));

    verifyTiles(blocks, at(1, 0), at(2, 1));
    int real = 0;
    for (const auto &block : blocks) {
        if (!isFillerBlock(block)) {
            ++real;
        }
    }
    QCOMPARE(real, 4);
    QCOMPARE(blocks.back().title, QStringLiteral("Late Hockey"));
}

void TimelineBuilderTest::fillerBlocksNeverExceedAnHour()
{
    const auto blocks = buildTimeline({booking(at(2, 5, 5), at(2, 6), QStringLiteral("Figure Skating"))},
                                      at(1, 0, 20), at(3, 0));

    verifyTiles(blocks, at(1, 0, 20), at(3, 0));
    for (const auto &block : blocks) {
        if (isFillerBlock(block)) {
            QVERIFY(block.start.secsTo(block.end) <= kFillerBlockSeconds);
        }
    }
}

void TimelineBuilderTest::blankTitleFallsBackToIceTime()
{
    const std::vector<EventRecord> events = {
        booking(at(1, 1), at(1, 2), QString()),
        booking(at(1, 2), at(1, 3), QStringLiteral("   \t")),
        booking(at(1, 3), at(1, 4), QStringLiteral("  Freestyle  ")),
    };

    const auto blocks = buildTimeline(events, at(1, 1), at(1, 4));

    QCOMPARE(blocks.size(), static_cast<size_t>(3));
    QCOMPARE(blocks[0].title, kDefaultEventTitle);
    QCOMPARE(blocks[1].title, QStringLiteral("Ice Time"));
    QCOMPARE(blocks[2].title, QStringLiteral("Freestyle"));
}

void TimelineBuilderTest::reversedWindowYieldsNothing()
{
    const auto blocks = buildTimeline({booking(at(1, 9), at(1, 10), QStringLiteral("Hockey"))}, at(2, 0), at(1, 0));
    QVERIFY(blocks.empty());
}

void TimelineBuilderTest::emptyWindowYieldsNothing()
{
    QVERIFY(buildTimeline({}, at(1, 5), at(1, 5)).empty());
    QVERIFY(buildTimeline({}, QDateTime(), at(1, 5)).empty());
}

void TimelineBuilderTest::emptyWindowIgnoresEvents()
{
    const std::vector<EventRecord> events = {
        booking(at(1, 3), at(1, 4), QStringLiteral("Early Hockey")),
        booking(at(1, 9), at(1, 10), QStringLiteral("Public Skate")),
    };
    QVERIFY(buildTimeline(events, at(1, 5), at(1, 5)).empty());
}

void TimelineBuilderTest::containedEventMovesCursorBack()
{
    const std::vector<EventRecord> events = {
        booking(at(1, 10), at(1, 12), QStringLiteral("Tournament")),
        booking(at(1, 10, 30), at(1, 11), QStringLiteral("Zamboni")),
    };

    const auto blocks = buildTimeline(events, at(1, 10), at(1, 13));

    QCOMPARE(blocks.size(), static_cast<size_t>(4));
    QCOMPARE(blocks[0].title, QStringLiteral("Tournament"));
    QCOMPARE(blocks[1].title, QStringLiteral("Zamboni"));
    QCOMPARE(blocks[2], (ProgrammeBlock{at(1, 11), at(1, 12), kOpenIceTitle}));
    QCOMPARE(blocks[3], (ProgrammeBlock{at(1, 12), at(1, 13), kOpenIceTitle}));
}

void TimelineBuilderTest::skipsEventsWithInvalidTimes()
{
    const std::vector<EventRecord> events = {
        booking(QDateTime(), at(1, 2), QStringLiteral("Broken")),
        booking(at(1, 2), at(1, 3), QStringLiteral("Hockey")),
    };

    const auto blocks = buildTimeline(events, at(1, 0), at(1, 4));

    verifyTiles(blocks, at(1, 0), at(1, 4));
    for (const auto &block : blocks) {
        QVERIFY(block.title != QStringLiteral("Broken"));
    }
}

QTEST_GUILESS_MAIN(TimelineBuilderTest)
#include "TimelineBuilderTest.moc"
