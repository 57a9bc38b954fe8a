#pragma once

#include <QByteArray>
#include <QUrl>

#include <chrono>

#include "rinkguide/schedule/StageResult.hpp"

namespace rinkguide {
namespace net {

using FetchResult = schedule::StageResult<QByteArray>;

class HttpFetcher
{
public:
    virtual ~HttpFetcher() = default;

    // Body of a 2xx response, or a transport failure (network error,
    // timeout, non-2xx status).
    virtual FetchResult get(const QUrl &url, std::chrono::seconds timeout) = 0;
};

} // namespace net
} // namespace rinkguide
