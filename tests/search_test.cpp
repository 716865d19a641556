/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "search.hpp"

#include <QString>
#include <catch2/catch_test_macros.hpp>
#include <utility>

using ecp::param;
using ecp::Search;

TEST_CASE("Search parameters", "[search]") {
    SECTION("Keyword only") {
        auto params = Search{QStringLiteral("breaking bad")}.build();

        REQUIRE(params.size() == 1);
        REQUIRE(params[0] ==
                param{QStringLiteral("keyword"),
                      QStringLiteral("breaking bad")});
    }

    SECTION("Optional parameters follow the fixed order") {
        Search search{QStringLiteral("star")};
        search.tmsid(QStringLiteral("MV000123"))
            .title(QStringLiteral("Star Wars"))
            .showUnavailable(false)
            .season(2)
            .type(Search::Type::TvShow)
            .provider(QStringLiteral("Netflix"))
            .providerId(QStringLiteral("12"))
            .matchAny(true)
            .launch(true);

        auto params = std::move(search).build();

        REQUIRE(params.size() == 10);
        REQUIRE(params[0].first == QStringLiteral("keyword"));
        REQUIRE(params[1] ==
                param{QStringLiteral("launch"), QStringLiteral("true")});
        REQUIRE(params[2] ==
                param{QStringLiteral("match-any"), QStringLiteral("true")});
        REQUIRE(params[3] ==
                param{QStringLiteral("provider-id"), QStringLiteral("12")});
        REQUIRE(params[4] ==
                param{QStringLiteral("provider"), QStringLiteral("Netflix")});
        REQUIRE(params[5] ==
                param{QStringLiteral("type"), QStringLiteral("tv-show")});
        REQUIRE(params[6] ==
                param{QStringLiteral("season"), QStringLiteral("2")});
        REQUIRE(params[7] == param{QStringLiteral("show-unavailable"),
                                   QStringLiteral("false")});
        REQUIRE(params[8] ==
                param{QStringLiteral("title"), QStringLiteral("Star Wars")});
        REQUIRE(params[9] ==
                param{QStringLiteral("tmsid"), QStringLiteral("MV000123")});
    }

    SECTION("Only set parameters are present") {
        Search search{QStringLiteral("x")};
        search.season(10).launch(false);

        auto params = std::move(search).build();

        REQUIRE(params.size() == 3);
        REQUIRE(params[0].first == QStringLiteral("keyword"));
        REQUIRE(params[1] ==
                param{QStringLiteral("launch"), QStringLiteral("false")});
        REQUIRE(params[2] ==
                param{QStringLiteral("season"), QStringLiteral("10")});
    }

    SECTION("Providers are appended and joined with commas") {
        Search search{QStringLiteral("x")};
        search.provider(QStringLiteral("a"))
            .provider(QStringLiteral("b"))
            .provider(QStringLiteral("c"))
            .providerId(QStringLiteral("1"));

        auto params = std::move(search).build();

        REQUIRE(params.size() == 3);
        REQUIRE(params[1] ==
                param{QStringLiteral("provider-id"), QStringLiteral("1")});
        REQUIRE(params[2] ==
                param{QStringLiteral("provider"), QStringLiteral("a,b,c")});
    }

    SECTION("Search types map to wire tokens") {
        REQUIRE(Search::typeToString(Search::Type::Movie) ==
                QStringLiteral("movie"));
        REQUIRE(Search::typeToString(Search::Type::TvShow) ==
                QStringLiteral("tv-show"));
        REQUIRE(Search::typeToString(Search::Type::Person) ==
                QStringLiteral("person"));
        REQUIRE(Search::typeToString(Search::Type::Channel) ==
                QStringLiteral("channel"));
        REQUIRE(Search::typeToString(Search::Type::Game) ==
                QStringLiteral("game"));
    }

    SECTION("Setting a scalar twice keeps the last value") {
        Search search{QStringLiteral("x")};
        search.title(QStringLiteral("first")).title(QStringLiteral("second"));

        auto params = std::move(search).build();

        REQUIRE(params.size() == 2);
        REQUIRE(params[1] ==
                param{QStringLiteral("title"), QStringLiteral("second")});
    }
}
