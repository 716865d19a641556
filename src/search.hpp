/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_SEARCH_H
#define ECP_SEARCH_H

#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>
#include <vector>

#include "models.hpp"

namespace ecp {

class Search {
   public:
    enum class Type { Movie, TvShow, Person, Channel, Game };

    explicit Search(QString keyword);

    Search& launch(bool launch);
    Search& matchAny(bool matchAny);
    Search& provider(const QString& provider);
    Search& providerId(const QString& providerId);
    Search& type(Type type);
    Search& season(uint32_t season);
    Search& showUnavailable(bool showUnavailable);
    Search& title(QString title);
    Search& tmsid(QString tmsid);

    /**
     * Query parameters in the order the device expects them: keyword first,
     * then launch, match-any, provider-id, provider, type, season,
     * show-unavailable, title and tmsid, each only if it was set.
     */
    std::vector<param> build() &&;

    static QString typeToString(Type type);

   private:
    QString m_keyword;
    std::optional<bool> m_launch;
    std::optional<bool> m_matchAny;
    std::optional<QStringList> m_providers;
    std::optional<QStringList> m_providerIds;
    std::optional<Type> m_type;
    std::optional<uint32_t> m_season;
    std::optional<bool> m_showUnavailable;
    std::optional<QString> m_title;
    std::optional<QString> m_tmsid;
};

}  // namespace ecp

#endif  // ECP_SEARCH_H
