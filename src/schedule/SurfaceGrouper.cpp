#include "rinkguide/schedule/SurfaceGrouper.hpp"

#include <algorithm>

namespace rinkguide {
namespace schedule {

GroupedEvents groupBySurface(std::vector<EventRecord> events)
{
    GroupedEvents grouped;
    for (auto &event : events) {
        grouped[event.surfaceId].push_back(std::move(event));
    }
    for (auto &entry : grouped) {
        std::stable_sort(entry.second.begin(), entry.second.end(),
                         [](const EventRecord &lhs, const EventRecord &rhs) {
                             return lhs.start < rhs.start;
                         });
    }
    return grouped;
}

std::size_t countEvents(const GroupedEvents &grouped)
{
    std::size_t total = 0;
    for (const auto &entry : grouped) {
        total += entry.second.size();
    }
    return total;
}

} // namespace schedule
} // namespace rinkguide
