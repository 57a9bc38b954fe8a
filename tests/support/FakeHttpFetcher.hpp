#pragma once

#include <QHash>
#include <QList>
#include <QUrl>

#include "rinkguide/net/HttpFetcher.hpp"

namespace rinkguide {
namespace testing {

// Serves canned bodies; any URL without a response fails as a transport error.
class FakeHttpFetcher : public net::HttpFetcher
{
public:
    void respond(const QByteArray &body) { m_defaultBody = body; m_hasDefault = true; }
    void fail(const QString &error) { m_error = error; m_hasDefault = false; }

    net::FetchResult get(const QUrl &url, std::chrono::seconds timeout) override
    {
        requests << url;
        lastTimeout = timeout;
        if (m_hasDefault) {
            return net::FetchResult::success(m_defaultBody);
        }
        return net::FetchResult::failure(m_error.isEmpty() ? QStringLiteral("connection refused") : m_error);
    }

    QList<QUrl> requests;
    std::chrono::seconds lastTimeout{0};

private:
    QByteArray m_defaultBody;
    QString m_error;
    bool m_hasDefault = false;
};

} // namespace testing
} // namespace rinkguide
