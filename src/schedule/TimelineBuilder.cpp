#include "rinkguide/schedule/TimelineBuilder.hpp"

#include "rinkguide/core/Logging.hpp"

#include <algorithm>

namespace rinkguide {
namespace schedule {

const QString kOpenIceTitle = QStringLiteral("Open Ice");
const QString kDefaultEventTitle = QStringLiteral("Ice Time");

namespace {

void appendFiller(std::vector<ProgrammeBlock> &blocks, QDateTime &cursor, const QDateTime &until)
{
    while (cursor < until) {
        const QDateTime blockEnd = std::min(cursor.addSecs(kFillerBlockSeconds), until);
        blocks.push_back({cursor, blockEnd, kOpenIceTitle});
        cursor = blockEnd;
    }
}

} // namespace

std::vector<ProgrammeBlock> buildTimeline(const std::vector<EventRecord> &events,
                                          const QDateTime &windowStart,
                                          const QDateTime &windowEnd)
{
    std::vector<ProgrammeBlock> blocks;
    if (!windowStart.isValid() || !windowEnd.isValid()) {
        qCWarning(lcSchedule) << "Timeline window has an invalid bound";
        return blocks;
    }
    if (windowStart > windowEnd) {
        qCWarning(lcSchedule) << "Timeline window is reversed:" << windowStart << windowEnd;
        return blocks;
    }
    if (windowStart == windowEnd) {
        return blocks;
    }

    QDateTime cursor = windowStart;
    for (const EventRecord &event : events) {
        if (!event.start.isValid() || !event.end.isValid()) {
            continue;
        }

        appendFiller(blocks, cursor, event.start);

        const QString title = event.title.trimmed();
        blocks.push_back({event.start, event.end, title.isEmpty() ? kDefaultEventTitle : title});

        if (event.end < cursor) {
            qCWarning(lcSchedule) << "Event on surface" << event.surfaceId << "at" << event.start
                                  << "ends before the previous one; timeline overlaps";
        }
        cursor = event.end;
    }

    appendFiller(blocks, cursor, windowEnd);
    return blocks;
}

bool isFillerBlock(const ProgrammeBlock &block)
{
    return block.title == kOpenIceTitle;
}

} // namespace schedule
} // namespace rinkguide
