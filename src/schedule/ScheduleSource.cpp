#include "rinkguide/schedule/ScheduleSource.hpp"

#include <algorithm>

namespace rinkguide {
namespace schedule {

std::vector<int> ScheduleSource::surfaceIds() const
{
    const auto mappings = surfaceMappings();
    std::vector<int> ids;
    ids.reserve(static_cast<size_t>(mappings.size()));
    for (auto it = mappings.constBegin(); it != mappings.constEnd(); ++it) {
        ids.push_back(it.value());
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

} // namespace schedule
} // namespace rinkguide
