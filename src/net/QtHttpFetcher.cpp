#include "rinkguide/net/QtHttpFetcher.hpp"

#include "rinkguide/core/Logging.hpp"

#include "version.h"

#include <QEventLoop>
#include <QMutexLocker>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <memory>

namespace rinkguide {
namespace net {

QtHttpFetcher::QtHttpFetcher(QObject *parent)
    : QObject(parent)
    , m_userAgent(QByteArray("RinkGuide/") + kRinkGuideVersion)
{
}

QtHttpFetcher::~QtHttpFetcher() = default;

FetchResult QtHttpFetcher::get(const QUrl &url, std::chrono::seconds timeout)
{
    QMutexLocker locker(&m_lock);

    QNetworkRequest request(url);
    request.setRawHeader("User-Agent", m_userAgent);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);

    std::unique_ptr<QNetworkReply> reply(m_manager.get(request));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(timeout);

    if (!reply->isFinished()) {
        loop.exec();
    }

    if (!reply->isFinished()) {
        reply->abort();
        return FetchResult::failure(QStringLiteral("timed out after %1 s fetching %2")
                                        .arg(timeout.count())
                                        .arg(url.toDisplayString()));
    }
    timer.stop();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() != QNetworkReply::NoError) {
        return FetchResult::failure(QStringLiteral("%1 (HTTP %2)").arg(reply->errorString()).arg(status));
    }
    if (status != 0 && (status < 200 || status >= 300)) {
        return FetchResult::failure(QStringLiteral("HTTP %1 from %2").arg(status).arg(url.toDisplayString()));
    }

    const QByteArray body = reply->readAll();
    qCDebug(lcSources) << "Fetched" << body.size() << "bytes from" << url.toDisplayString();
    return FetchResult::success(body);
}

} // namespace net
} // namespace rinkguide
