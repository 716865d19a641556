/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_SSDPSEARCHER_H
#define ECP_SSDPSEARCHER_H

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QUdpSocket>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "error.hpp"

namespace ecp {

class SsdpSearcher {
   public:
    struct Response {
        QString location;
        QString searchTarget;
        QString usn;
        QString server;
    };

    using ResponseHandler = std::function<void(const Response&)>;
    using FinishedHandler = std::function<void(Status)>;

    virtual ~SsdpSearcher() = default;

    /**
     * Sends a search for target and reports every matching response until
     * the window elapses. onFinished is called once, with an error if the
     * transport failed. Nothing is reported after cancel().
     */
    virtual void search(const QString& target, std::chrono::seconds window,
                        int retransmissions, ResponseHandler onResponse,
                        FinishedHandler onFinished) = 0;
    virtual void cancel() = 0;

    static std::optional<Response> parseResponse(const QByteArray& datagram);
    static QByteArray makeRequest(const QString& target, int mx);
};

/**
 * One running search. Responses whose search target does not match are
 * ignored. Finishing is reported at most once and nothing is reported
 * after finish() or cancel().
 */
class SsdpSearch {
   public:
    SsdpSearch(QString target, SsdpSearcher::ResponseHandler onResponse,
               SsdpSearcher::FinishedHandler onFinished);

    inline bool active() const { return m_active; }

    void handleDatagram(const QByteArray& datagram);
    void finish(Status status);
    void cancel();

   private:
    QString m_target;
    SsdpSearcher::ResponseHandler m_onResponse;
    SsdpSearcher::FinishedHandler m_onFinished;
    bool m_active = true;
};

class QtSsdpSearcher : public QObject, public SsdpSearcher {
    Q_OBJECT
   public:
    static const QString multicastAddress;
    static const quint16 port = 1900;

    explicit QtSsdpSearcher(QObject* parent = nullptr);
    ~QtSsdpSearcher() override;

    void search(const QString& target, std::chrono::seconds window,
                int retransmissions, ResponseHandler onResponse,
                FinishedHandler onFinished) override;
    void cancel() override;

   private slots:
    void handleReadyRead();
    void handleSocketError(QAbstractSocket::SocketError error);

   private:
    QUdpSocket m_socket;
    QTimer m_windowTimer;
    QTimer m_resendTimer;
    int m_resendsLeft = 0;
    QByteArray m_request;
    std::shared_ptr<SsdpSearch> m_search;

    bool send();
    void finish(Status status);
    void stop();
};

}  // namespace ecp

#endif  // ECP_SSDPSEARCHER_H
