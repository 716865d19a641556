/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "device.hpp"

#include <utility>

#include "logger.hpp"
#include "modeldecoder.hpp"
#include "settings.h"

namespace ecp {

static std::shared_ptr<HttpTransport> defaultTransport() {
    return std::make_shared<QtHttpTransport>(
        nullptr, Settings::instance()->getHttpTimeout());
}

// Key tokens and app ids end up as a single path segment
static QString segment(const QString& value) {
    return QString::fromLatin1(QUrl::toPercentEncoding(value));
}

Device::Device(QUrl url, std::shared_ptr<HttpTransport> transport)
    : m_url{std::move(url)},
      m_transport{transport ? std::move(transport) : defaultTransport()} {}

Result<Device> Device::fromAddress(const QString& address,
                                   std::shared_ptr<HttpTransport> transport) {
    QUrl url{address.trimmed(), QUrl::StrictMode};

    if (!url.isValid() || url.isRelative() || url.host().isEmpty()) {
        LOGW("invalid device address: " << address << ", "
                                        << url.errorString());
        return Error{
            Error::Kind::AddressParse,
            QStringLiteral("invalid device address: %1").arg(address)};
    }

    return Device{std::move(url), std::move(transport)};
}

QUrl Device::resolve(const QString& path) const {
    return m_url.resolved(QUrl{path});
}

template <typename T>
void Device::query(const QString& path, Callback<T> done) const {
    m_transport->request(
        HttpTransport::Method::Get, resolve(path), {},
        [done = std::move(done), path](Result<HttpTransport::Response> result) {
            if (auto* err = std::get_if<Error>(&result)) {
                done(std::move(*err));
                return;
            }

            const auto& response = std::get<HttpTransport::Response>(result);
            auto decoded = Decoder<T>::decode(response.body);
            if (auto* err = std::get_if<Error>(&decoded))
                LOGW("cannot decode response of " << path << ": " << *err);

            done(std::move(decoded));
        });
}

void Device::command(const QString& path, const std::vector<param>& params,
                     StatusCallback done) const {
    m_transport->request(
        HttpTransport::Method::Post, resolve(path), params,
        [done = std::move(done)](Result<HttpTransport::Response> result) {
            if (auto* err = std::get_if<Error>(&result)) {
                done(std::move(*err));
                return;
            }
            done(std::nullopt);
        });
}

void Device::queryApps(Callback<AppList> done) const {
    query(QStringLiteral("query/apps"), std::move(done));
}

void Device::queryActiveApp(Callback<ActiveApp> done) const {
    query(QStringLiteral("query/active-app"), std::move(done));
}

void Device::queryMediaPlayer(Callback<MediaPlayer> done) const {
    query(QStringLiteral("query/media-player"), std::move(done));
}

void Device::queryDeviceInfo(Callback<DeviceInfo> done) const {
    query(QStringLiteral("query/device-info"), std::move(done));
}

void Device::keyDown(const Key& key, StatusCallback done) const {
    command(QStringLiteral("keydown/") + segment(key.toString()), {},
            std::move(done));
}

void Device::keyUp(const Key& key, StatusCallback done) const {
    command(QStringLiteral("keyup/") + segment(key.toString()), {},
            std::move(done));
}

void Device::keyPress(const Key& key, StatusCallback done) const {
    command(QStringLiteral("keypress/") + segment(key.toString()), {},
            std::move(done));
}

void Device::appCommand(const QString& action, const App& app,
                        StatusCallback done) const {
    if (!app.id) {
        LOGW("cannot " << action << " app without id: " << app.name);
        done(Error{Error::Kind::Argument, QStringLiteral("app.id required")});
        return;
    }

    command(action + QLatin1Char('/') + segment(*app.id), {}, std::move(done));
}

void Device::launch(const App& app, StatusCallback done) const {
    appCommand(QStringLiteral("launch"), app, std::move(done));
}

void Device::install(const App& app, StatusCallback done) const {
    appCommand(QStringLiteral("install"), app, std::move(done));
}

void Device::sendInput(const std::vector<param>& input,
                       StatusCallback done) const {
    command(QStringLiteral("input"), input, std::move(done));
}

void Device::search(Search search, StatusCallback done) const {
    command(QStringLiteral("search"), std::move(search).build(),
            std::move(done));
}

}  // namespace ecp
