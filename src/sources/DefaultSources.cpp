#include "rinkguide/sources/DefaultSources.hpp"

#include "rinkguide/sources/ChillerScheduleSource.hpp"
#include "rinkguide/sources/LgriaScheduleSource.hpp"

#include <memory>

namespace rinkguide {
namespace sources {

schedule::SourceRegistry createDefaultRegistry(net::HttpFetcher &fetcher)
{
    schedule::SourceRegistry registry;
    registry.addSource(std::make_unique<ChillerScheduleSource>(fetcher));
    registry.addSource(std::make_unique<LgriaScheduleSource>(fetcher));
    return registry;
}

} // namespace sources
} // namespace rinkguide
