/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_HTTPTRANSPORT_H
#define ECP_HTTPTRANSPORT_H

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QString>
#include <QObject>
#include <QUrl>
#include <functional>
#include <memory>
#include <vector>

#include "error.hpp"
#include "models.hpp"

namespace ecp {

class HttpTransport {
   public:
    enum class Method { Get, Post };

    struct Response {
        int status = 0;
        QByteArray body;
    };

    using Handler = std::function<void(Result<Response>)>;

    virtual ~HttpTransport() = default;

    /**
     * Performs one request and calls handler exactly once with the response
     * or with a transport error. Statuses outside 2xx are errors.
     */
    virtual void request(Method method, const QUrl& url,
                         const std::vector<param>& params,
                         Handler handler) = 0;

    /**
     * Appends params to url as a form encoded query. Keys and values are
     * percent-encoded in full, so '+', '&' and '=' survive as data.
     */
    static QUrl makeUrl(const QUrl& url, const std::vector<param>& params);
};

class QtHttpTransport : public QObject, public HttpTransport {
    Q_OBJECT
   public:
    // timeout in ms, 0 means no timeout
    explicit QtHttpTransport(std::shared_ptr<QNetworkAccessManager> nam = {},
                             int timeout = 0, QObject* parent = nullptr);

    void request(Method method, const QUrl& url,
                 const std::vector<param>& params, Handler handler) override;

    // Maps a finished reply to the result handed to request() handlers
    static Result<Response> makeResult(QNetworkReply::NetworkError error,
                                       const QString& errorString, int status,
                                       QByteArray body);

   private:
    std::shared_ptr<QNetworkAccessManager> m_nam;
    int m_timeout = 0;
};

}  // namespace ecp

#endif  // ECP_HTTPTRANSPORT_H
