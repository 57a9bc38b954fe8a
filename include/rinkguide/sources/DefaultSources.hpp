#pragma once

#include "rinkguide/schedule/SourceRegistry.hpp"

namespace rinkguide {
namespace net {
class HttpFetcher;
}

namespace sources {

// Registry of every facility the guide knows about. The fetcher must
// outlive the registry.
schedule::SourceRegistry createDefaultRegistry(net::HttpFetcher &fetcher);

} // namespace sources
} // namespace rinkguide
