/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "ssdpsearcher.hpp"

#include <QHostAddress>
#include <QNetworkDatagram>
#include <QStringList>
#include <algorithm>
#include <iterator>
#include <utility>

#include "logger.hpp"

namespace ecp {

const QString QtSsdpSearcher::multicastAddress =
    QStringLiteral("239.255.255.250");

QByteArray SsdpSearcher::makeRequest(const QString& target, int mx) {
    return QStringLiteral(
               "M-SEARCH * HTTP/1.1\r\n"
               "HOST: 239.255.255.250:1900\r\n"
               "MAN: \"ssdp:discover\"\r\n"
               "MX: %1\r\n"
               "ST: %2\r\n\r\n")
        .arg(mx)
        .arg(target)
        .toLatin1();
}

std::optional<SsdpSearcher::Response> SsdpSearcher::parseResponse(
    const QByteArray& datagram) {
    const auto lines =
        QString::fromLatin1(datagram).split(QStringLiteral("\r\n"));
    if (lines.isEmpty() ||
        !lines.first().startsWith(QLatin1String("HTTP/1.1 200"))) {
        return std::nullopt;
    }

    Response response;
    for (auto it = std::next(lines.cbegin()); it != lines.cend(); ++it) {
        const auto idx = it->indexOf(QLatin1Char(':'));
        if (idx <= 0) continue;

        const auto name = it->left(idx).trimmed().toUpper();
        const auto value = it->mid(idx + 1).trimmed();

        if (name == QLatin1String("LOCATION"))
            response.location = value;
        else if (name == QLatin1String("ST"))
            response.searchTarget = value;
        else if (name == QLatin1String("USN"))
            response.usn = value;
        else if (name == QLatin1String("SERVER"))
            response.server = value;
    }

    if (response.location.isEmpty()) {
        LOGW("SSDP response without LOCATION");
        return std::nullopt;
    }

    return response;
}

SsdpSearch::SsdpSearch(QString target,
                       SsdpSearcher::ResponseHandler onResponse,
                       SsdpSearcher::FinishedHandler onFinished)
    : m_target{std::move(target)},
      m_onResponse{std::move(onResponse)},
      m_onFinished{std::move(onFinished)} {}

void SsdpSearch::handleDatagram(const QByteArray& datagram) {
    if (!m_active) return;

    auto response = SsdpSearcher::parseResponse(datagram);
    if (!response) return;

    if (response->searchTarget.compare(m_target, Qt::CaseInsensitive) != 0) {
        LOGD("ignoring SSDP response for: " << response->searchTarget);
        return;
    }

    LOGD("SSDP response: " << response->location << " " << response->usn);

    // handler may cancel the search
    auto handler = m_onResponse;
    if (handler) handler(*response);
}

void SsdpSearch::finish(Status status) {
    if (!m_active) return;
    m_active = false;

    auto handler = std::move(m_onFinished);
    m_onFinished = nullptr;
    m_onResponse = nullptr;

    if (status)
        LOGW("SSDP search failed: " << *status);
    else
        LOGD("SSDP search finished: " << m_target);

    if (handler) handler(std::move(status));
}

void SsdpSearch::cancel() {
    if (!m_active) return;
    m_active = false;

    LOGD("SSDP search cancelled: " << m_target);

    m_onFinished = nullptr;
    m_onResponse = nullptr;
}

QtSsdpSearcher::QtSsdpSearcher(QObject* parent) : QObject{parent} {
    m_windowTimer.setSingleShot(true);
    connect(&m_windowTimer, &QTimer::timeout, this,
            [this] { finish(std::nullopt); });
    connect(&m_resendTimer, &QTimer::timeout, this, [this] {
        if (m_resendsLeft <= 0) {
            m_resendTimer.stop();
            return;
        }
        --m_resendsLeft;
        if (!send())
            finish(Error{Error::Kind::Transport,
                         QStringLiteral("cannot send SSDP search: %1")
                             .arg(m_socket.errorString())});
    });
    connect(&m_socket, &QUdpSocket::readyRead, this,
            &QtSsdpSearcher::handleReadyRead);
#if QT_VERSION >= QT_VERSION_CHECK(5, 15, 0)
    connect(&m_socket, &QUdpSocket::errorOccurred, this,
            &QtSsdpSearcher::handleSocketError);
#else
    connect(&m_socket,
            QOverload<QAbstractSocket::SocketError>::of(&QUdpSocket::error),
            this, &QtSsdpSearcher::handleSocketError);
#endif
}

QtSsdpSearcher::~QtSsdpSearcher() { cancel(); }

void QtSsdpSearcher::search(const QString& target, std::chrono::seconds window,
                            int retransmissions, ResponseHandler onResponse,
                            FinishedHandler onFinished) {
    if (m_search) {
        LOGW("SSDP search is active, cancelling it");
        cancel();
    }

    m_search = std::make_shared<SsdpSearch>(target, std::move(onResponse),
                                            std::move(onFinished));
    m_resendsLeft = std::max(0, retransmissions);

    // Devices must answer before the window closes
    const auto windowSecs = static_cast<int>(window.count());
    m_request = makeRequest(target, std::max(1, windowSecs - 1));

    LOGD("SSDP search: " << target << ", window: " << windowSecs
                         << "s, retransmissions: " << m_resendsLeft);

    if (!m_socket.bind(QHostAddress{QHostAddress::AnyIPv4}, 0)) {
        finish(Error{Error::Kind::Transport,
                     QStringLiteral("cannot bind SSDP socket: %1")
                         .arg(m_socket.errorString())});
        return;
    }

    if (!send()) {
        finish(Error{Error::Kind::Transport,
                     QStringLiteral("cannot send SSDP search: %1")
                         .arg(m_socket.errorString())});
        return;
    }

    m_windowTimer.start(std::chrono::milliseconds{window});
    if (m_resendsLeft > 0)
        m_resendTimer.start(std::chrono::milliseconds{window} /
                            (m_resendsLeft + 1));
}

bool QtSsdpSearcher::send() {
    return m_socket.writeDatagram(m_request, QHostAddress{multicastAddress},
                                  port) == m_request.size();
}

void QtSsdpSearcher::handleReadyRead() {
    // handler may cancel or restart the search
    auto search = m_search;
    while (search && search->active() && m_socket.hasPendingDatagrams())
        search->handleDatagram(m_socket.receiveDatagram().data());
}

void QtSsdpSearcher::handleSocketError(QAbstractSocket::SocketError error) {
    if (!m_search) return;

    LOGW("SSDP socket error: " << error << ", " << m_socket.errorString());

    finish(Error{Error::Kind::Transport, m_socket.errorString()});
}

void QtSsdpSearcher::finish(Status status) {
    auto search = std::exchange(m_search, nullptr);
    stop();

    if (search) search->finish(std::move(status));
}

void QtSsdpSearcher::cancel() {
    auto search = std::exchange(m_search, nullptr);
    stop();

    if (search) search->cancel();
}

void QtSsdpSearcher::stop() {
    m_windowTimer.stop();
    m_resendTimer.stop();
    m_socket.close();
}

}  // namespace ecp
