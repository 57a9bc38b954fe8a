#include "rinkguide/core/AppContext.hpp"

#include "rinkguide/catalog/FileSurfaceCatalog.hpp"
#include "rinkguide/core/Logging.hpp"
#include "rinkguide/guide/GuidePublisher.hpp"
#include "rinkguide/net/QtHttpFetcher.hpp"
#include "rinkguide/schedule/RefreshScheduler.hpp"
#include "rinkguide/schedule/ScheduleCache.hpp"
#include "rinkguide/schedule/SourceRegistry.hpp"
#include "rinkguide/sources/DefaultSources.hpp"

namespace rinkguide {
namespace core {

AppContext::AppContext(AppConfig config)
    : m_config(std::move(config))
    , m_fetcher(std::make_unique<net::QtHttpFetcher>())
{
    m_sourceRegistry = std::make_unique<schedule::SourceRegistry>(sources::createDefaultRegistry(*m_fetcher));
    m_scheduleCache = std::make_unique<schedule::ScheduleCache>(*m_sourceRegistry);
    m_refreshScheduler = std::make_unique<schedule::RefreshScheduler>(*m_scheduleCache, m_config.refreshTime);
    m_catalog = std::make_unique<catalog::FileSurfaceCatalog>(m_config.catalogPath);

    guide::PublishSettings settings;
    settings.outputDir = m_config.outputDir;
    settings.host = m_config.serverHost();
    settings.port = m_config.publicPort;
    settings.livePlaceholder = m_config.livePlaceholder;
    m_publisher = std::make_unique<guide::GuidePublisher>(settings);

    qCInfo(lcApp).noquote() << "Catalog:" << m_config.catalogPath;
    qCInfo(lcApp).noquote() << "Guide output:" << m_config.outputDir << "for host" << settings.host;
}

AppContext::~AppContext()
{
    if (m_refreshScheduler) {
        m_refreshScheduler->stop();
    }
}

catalog::SurfaceCatalog &AppContext::catalog()
{
    return *m_catalog;
}

bool AppContext::catalogLoaded() const
{
    return m_catalog->isLoaded();
}

schedule::ScheduleCache &AppContext::scheduleCache()
{
    return *m_scheduleCache;
}

schedule::RefreshScheduler &AppContext::refreshScheduler()
{
    return *m_refreshScheduler;
}

bool AppContext::publishGuide()
{
    const auto snapshot = m_scheduleCache->snapshot();
    return m_publisher->publish(*m_catalog, *snapshot);
}

} // namespace core
} // namespace rinkguide
