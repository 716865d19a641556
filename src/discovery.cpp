/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "discovery.hpp"

#include <QSet>
#include <QUrl>
#include <utility>

#include "logger.hpp"
#include "settings.h"

namespace ecp {

const QString Discovery::searchTarget = QStringLiteral("roku:ecp");

namespace {
struct DiscoveryState {
    std::weak_ptr<SsdpSearcher> searcher;
    std::shared_ptr<HttpTransport> transport;
    DiscoveryOptions options;
    Discovery::Callback done;
    std::vector<Device> devices;
    QSet<QString> locations;
    bool finished = false;

    void complete(Result<std::vector<Device>> result) {
        if (finished) return;
        finished = true;
        auto handler = std::move(done);
        handler(std::move(result));
    }
};
}  // namespace

void Discovery::discover(std::shared_ptr<SsdpSearcher> searcher,
                         Callback done, DiscoveryOptions options,
                         std::shared_ptr<HttpTransport> transport) {
    LOGD("discover: " << searchTarget
                      << ", deduplicate: " << options.deduplicate);

    auto state = std::make_shared<DiscoveryState>();
    state->searcher = searcher;
    state->transport =
        transport ? std::move(transport)
                  : std::make_shared<QtHttpTransport>(
                        nullptr, Settings::instance()->getHttpTimeout());
    state->options = options;
    state->done = std::move(done);

    searcher->search(
        searchTarget, window, maxRetransmissions,
        [state](const SsdpSearcher::Response& response) {
            if (state->finished) return;

            auto device =
                Device::fromAddress(response.location, state->transport);
            if (auto* err = std::get_if<Error>(&device)) {
                LOGE("malformed location in SSDP response: "
                     << response.location);
                if (auto searcher = state->searcher.lock())
                    searcher->cancel();
                state->complete(std::move(*err));
                return;
            }

            auto& dev = std::get<Device>(device);
            const auto location = dev.url().toString();
            if (state->options.deduplicate &&
                state->locations.contains(location)) {
                LOGD("duplicate device: " << location);
                return;
            }

            LOGD("device found: " << location);
            state->locations.insert(location);
            state->devices.push_back(std::move(dev));
        },
        [state](Status status) {
            if (status) {
                LOGE("discovery failed: " << *status);
                state->complete(std::move(*status));
                return;
            }
            LOGI("discovery finished, devices: " << state->devices.size());
            state->complete(std::move(state->devices));
        });
}

}  // namespace ecp
