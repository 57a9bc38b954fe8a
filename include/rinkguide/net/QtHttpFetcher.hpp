#pragma once

#include <QByteArray>
#include <QMutex>
#include <QNetworkAccessManager>
#include <QObject>

#include "rinkguide/net/HttpFetcher.hpp"

namespace rinkguide {
namespace net {

// Blocking GET on top of QNetworkAccessManager; runs a local event loop
// until the reply finishes or the timeout fires.
class QtHttpFetcher : public QObject, public HttpFetcher
{
    Q_OBJECT

public:
    explicit QtHttpFetcher(QObject *parent = nullptr);
    ~QtHttpFetcher() override;

    FetchResult get(const QUrl &url, std::chrono::seconds timeout) override;

private:
    QNetworkAccessManager m_manager;
    QMutex m_lock;
    QByteArray m_userAgent;
};

} // namespace net
} // namespace rinkguide
