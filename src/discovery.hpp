/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_DISCOVERY_H
#define ECP_DISCOVERY_H

#include <QString>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include "device.hpp"
#include "error.hpp"
#include "httptransport.hpp"
#include "ssdpsearcher.hpp"

namespace ecp {

struct DiscoveryOptions {
    // Keep only the first device for every location
    bool deduplicate = false;
};

class Discovery {
   public:
    using Callback = std::function<void(Result<std::vector<Device>>)>;

    static const QString searchTarget;
    static constexpr std::chrono::seconds window{3};
    static constexpr int maxRetransmissions = 2;

    /**
     * Searches for devices and reports them in arrival order once the
     * window elapses. A location that is not a valid URL fails the whole
     * discovery. Devices share transport, which defaults to QtHttpTransport.
     * The searcher must outlive the discovery.
     */
    static void discover(std::shared_ptr<SsdpSearcher> searcher,
                         Callback done, DiscoveryOptions options = {},
                         std::shared_ptr<HttpTransport> transport = {});
};

}  // namespace ecp

#endif  // ECP_DISCOVERY_H
