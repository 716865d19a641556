/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_DEVICE_H
#define ECP_DEVICE_H

#include <QString>
#include <QUrl>
#include <functional>
#include <memory>
#include <vector>

#include "error.hpp"
#include "httptransport.hpp"
#include "key.hpp"
#include "models.hpp"
#include "search.hpp"

namespace ecp {

/**
 * Client of a single device.
 *
 * Each operation performs one HTTP request against a path relative to the
 * device's base URL and reports through its callback exactly once.
 * Callbacks run in the thread of the transport.
 */
class Device {
   public:
    template <typename T>
    using Callback = std::function<void(Result<T>)>;
    using StatusCallback = std::function<void(Status)>;

    // Uses QtHttpTransport configured from Settings when transport is empty
    explicit Device(QUrl url, std::shared_ptr<HttpTransport> transport = {});

    static Result<Device> fromAddress(
        const QString& address, std::shared_ptr<HttpTransport> transport = {});

    inline const auto& url() const { return m_url; }
    QUrl resolve(const QString& path) const;

    void queryApps(Callback<AppList> done) const;
    void queryActiveApp(Callback<ActiveApp> done) const;
    void queryMediaPlayer(Callback<MediaPlayer> done) const;
    void queryDeviceInfo(Callback<DeviceInfo> done) const;

    void keyDown(const Key& key, StatusCallback done) const;
    void keyUp(const Key& key, StatusCallback done) const;
    void keyPress(const Key& key, StatusCallback done) const;

    void launch(const App& app, StatusCallback done) const;
    void install(const App& app, StatusCallback done) const;

    // Pairs are sent as query parameters as given
    void sendInput(const std::vector<param>& input, StatusCallback done) const;
    void search(Search search, StatusCallback done) const;

   private:
    QUrl m_url;
    std::shared_ptr<HttpTransport> m_transport;

    template <typename T>
    void query(const QString& path, Callback<T> done) const;
    void command(const QString& path, const std::vector<param>& params,
                 StatusCallback done) const;
    void appCommand(const QString& action, const App& app,
                    StatusCallback done) const;
};

}  // namespace ecp

#endif  // ECP_DEVICE_H
