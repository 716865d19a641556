/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "search.hpp"

namespace ecp {

static inline QString boolToString(bool value) {
    return value ? QStringLiteral("true") : QStringLiteral("false");
}

Search::Search(QString keyword) : m_keyword{std::move(keyword)} {}

Search& Search::launch(bool launch) {
    m_launch = launch;
    return *this;
}

Search& Search::matchAny(bool matchAny) {
    m_matchAny = matchAny;
    return *this;
}

Search& Search::provider(const QString& provider) {
    if (!m_providers) m_providers.emplace();
    m_providers->push_back(provider);
    return *this;
}

Search& Search::providerId(const QString& providerId) {
    if (!m_providerIds) m_providerIds.emplace();
    m_providerIds->push_back(providerId);
    return *this;
}

Search& Search::type(Type type) {
    m_type = type;
    return *this;
}

Search& Search::season(uint32_t season) {
    m_season = season;
    return *this;
}

Search& Search::showUnavailable(bool showUnavailable) {
    m_showUnavailable = showUnavailable;
    return *this;
}

Search& Search::title(QString title) {
    m_title = std::move(title);
    return *this;
}

Search& Search::tmsid(QString tmsid) {
    m_tmsid = std::move(tmsid);
    return *this;
}

QString Search::typeToString(Type type) {
    switch (type) {
        case Type::Movie:
            return QStringLiteral("movie");
        case Type::TvShow:
            return QStringLiteral("tv-show");
        case Type::Person:
            return QStringLiteral("person");
        case Type::Channel:
            return QStringLiteral("channel");
        case Type::Game:
            return QStringLiteral("game");
    }
    return {};
}

std::vector<param> Search::build() && {
    std::vector<param> params;
    params.reserve(10);

    params.emplace_back(QStringLiteral("keyword"), std::move(m_keyword));
    if (m_launch)
        params.emplace_back(QStringLiteral("launch"), boolToString(*m_launch));
    if (m_matchAny)
        params.emplace_back(QStringLiteral("match-any"),
                            boolToString(*m_matchAny));
    if (m_providerIds)
        params.emplace_back(QStringLiteral("provider-id"),
                            m_providerIds->join(','));
    if (m_providers)
        params.emplace_back(QStringLiteral("provider"), m_providers->join(','));
    if (m_type)
        params.emplace_back(QStringLiteral("type"), typeToString(*m_type));
    if (m_season)
        params.emplace_back(QStringLiteral("season"),
                            QString::number(*m_season));
    if (m_showUnavailable)
        params.emplace_back(QStringLiteral("show-unavailable"),
                            boolToString(*m_showUnavailable));
    if (m_title)
        params.emplace_back(QStringLiteral("title"), std::move(*m_title));
    if (m_tmsid)
        params.emplace_back(QStringLiteral("tmsid"), std::move(*m_tmsid));

    return params;
}

}  // namespace ecp
