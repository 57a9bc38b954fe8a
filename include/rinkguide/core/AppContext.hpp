#pragma once

#include <memory>

#include "rinkguide/core/AppConfig.hpp"

namespace rinkguide {
namespace net {
class QtHttpFetcher;
}
namespace catalog {
class SurfaceCatalog;
class FileSurfaceCatalog;
}
namespace schedule {
class SourceRegistry;
class ScheduleCache;
class RefreshScheduler;
}
namespace guide {
class GuidePublisher;
}

namespace core {

class AppContext
{
public:
    explicit AppContext(AppConfig config);
    ~AppContext();

    catalog::SurfaceCatalog &catalog();
    // False when the catalog file exists but could not be read.
    bool catalogLoaded() const;
    schedule::ScheduleCache &scheduleCache();
    schedule::RefreshScheduler &refreshScheduler();

    // Renders the current snapshot into the output directory.
    bool publishGuide();

private:
    AppConfig m_config;
    std::unique_ptr<net::QtHttpFetcher> m_fetcher;
    std::unique_ptr<schedule::SourceRegistry> m_sourceRegistry;
    std::unique_ptr<schedule::ScheduleCache> m_scheduleCache;
    std::unique_ptr<schedule::RefreshScheduler> m_refreshScheduler;
    std::unique_ptr<catalog::FileSurfaceCatalog> m_catalog;
    std::unique_ptr<guide::GuidePublisher> m_publisher;
};

} // namespace core
} // namespace rinkguide
