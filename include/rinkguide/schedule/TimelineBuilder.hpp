#pragma once

#include <QDateTime>
#include <QString>

#include <vector>

#include "rinkguide/schedule/EventRecord.hpp"

namespace rinkguide {
namespace schedule {

extern const QString kOpenIceTitle;
extern const QString kDefaultEventTitle;
constexpr qint64 kFillerBlockSeconds = 60 * 60;

/**
 * Turns one surface's start-sorted events into a programme timeline covering
 * [windowStart, windowEnd).
 *
 * Gaps are tiled with "Open Ice" blocks of at most one hour. Events keep
 * their own bounds; an empty or blank title becomes "Ice Time". After each
 * event the cursor jumps to its end, so an event contained in its
 * predecessor moves the cursor backward and the following coverage is
 * duplicated (a warning is logged).
 *
 * Returns an empty timeline when windowStart is not before windowEnd or
 * either bound is invalid. Events with invalid bounds are skipped.
 */
std::vector<ProgrammeBlock> buildTimeline(const std::vector<EventRecord> &events,
                                          const QDateTime &windowStart,
                                          const QDateTime &windowEnd);

bool isFillerBlock(const ProgrammeBlock &block);

} // namespace schedule
} // namespace rinkguide
