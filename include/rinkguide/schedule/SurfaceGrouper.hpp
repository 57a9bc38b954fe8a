#pragma once

#include <vector>

#include "rinkguide/schedule/EventRecord.hpp"

namespace rinkguide {
namespace schedule {

// Partitions events by surface id; each partition is stable-sorted by start.
GroupedEvents groupBySurface(std::vector<EventRecord> events);

std::size_t countEvents(const GroupedEvents &grouped);

} // namespace schedule
} // namespace rinkguide
