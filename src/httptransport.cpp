/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "httptransport.hpp"

#include <QNetworkRequest>
#include <QTimer>
#include <utility>

#include "logger.hpp"

namespace ecp {

QUrl HttpTransport::makeUrl(const QUrl& url, const std::vector<param>& params) {
    if (params.empty()) return url;

    QByteArray query;
    for (const auto& [key, value] : params) {
        if (!query.isEmpty()) query.append('&');
        query.append(QUrl::toPercentEncoding(key))
            .append('=')
            .append(QUrl::toPercentEncoding(value));
    }

    QUrl result{url};
    result.setQuery(QString::fromLatin1(query), QUrl::StrictMode);

    return result;
}

QtHttpTransport::QtHttpTransport(std::shared_ptr<QNetworkAccessManager> nam,
                                 int timeout, QObject* parent)
    : QObject{parent},
      m_nam{nam ? std::move(nam)
                : std::make_shared<QNetworkAccessManager>()},
      m_timeout{timeout} {}

Result<HttpTransport::Response> QtHttpTransport::makeResult(
    QNetworkReply::NetworkError error, const QString& errorString, int status,
    QByteArray body) {
    if (error != QNetworkReply::NetworkError::NoError)
        return Error{
            Error::Kind::Transport,
            QStringLiteral("%1 (status %2)").arg(errorString).arg(status)};

    if (status < 200 || status > 299)
        return Error{Error::Kind::Transport,
                     QStringLiteral("unexpected HTTP status %1").arg(status)};

    return Response{status, std::move(body)};
}

void QtHttpTransport::request(Method method, const QUrl& url,
                              const std::vector<param>& params,
                              Handler handler) {
    QNetworkRequest request{makeUrl(url, params)};
#if QT_VERSION >= QT_VERSION_CHECK(5, 9, 0)
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
#else
    request.setAttribute(QNetworkRequest::FollowRedirectsAttribute, true);
#endif

    LOGD("ECP call: " << (method == Method::Get ? "GET " : "POST ")
                      << request.url());

    QNetworkReply* reply = nullptr;
    if (method == Method::Get) {
        reply = m_nam->get(request);
    } else {
        request.setHeader(QNetworkRequest::ContentTypeHeader,
                          QStringLiteral("application/x-www-form-urlencoded"));
        reply = m_nam->post(request, QByteArray{});
    }

    if (m_timeout > 0)
        QTimer::singleShot(m_timeout, reply, &QNetworkReply::abort);

    connect(reply, &QNetworkReply::finished, this,
            [reply, handler = std::move(handler)] {
                reply->deleteLater();

                auto result = makeResult(
                    reply->error(), reply->errorString(),
                    reply->attribute(QNetworkRequest::HttpStatusCodeAttribute)
                        .toInt(),
                    reply->readAll());

                if (auto* err = std::get_if<Error>(&result)) {
                    LOGW("ECP call failed: " << reply->url() << ": " << *err);
                } else {
                    LOGT("ECP call response: "
                         << std::get<Response>(result).body);
                }

                handler(std::move(result));
            });
}

}  // namespace ecp
