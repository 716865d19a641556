/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "device.hpp"

#include <QString>
#include <QUrl>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <optional>

#include "testtransport.hpp"

using namespace ecp;

static Device makeDevice(const std::shared_ptr<SpyTransport>& spy) {
    return Device{QUrl{QStringLiteral("http://203.0.113.5:8060/")}, spy};
}

TEST_CASE("Device address", "[device]") {
    auto spy = std::make_shared<SpyTransport>();

    SECTION("Relative path is joined to base address") {
        auto device = makeDevice(spy);

        REQUIRE(device.resolve(QStringLiteral("query/device-info")) ==
                QUrl{QStringLiteral("http://203.0.113.5:8060/query/device-info")});
    }

    SECTION("Base address without trailing slash") {
        auto result =
            Device::fromAddress(QStringLiteral("http://10.0.0.2:8060"), spy);

        REQUIRE(std::holds_alternative<Device>(result));
        REQUIRE(std::get<Device>(result).resolve(QStringLiteral("query/apps")) ==
                QUrl{QStringLiteral("http://10.0.0.2:8060/query/apps")});
    }

    SECTION("Invalid addresses fail with address parse error") {
        for (const auto& address :
             {QStringLiteral("not a url"), QStringLiteral("http://"),
              QStringLiteral("/query/apps"), QString{}}) {
            auto result = Device::fromAddress(address, spy);

            REQUIRE(std::holds_alternative<Error>(result));
            REQUIRE(std::get<Error>(result).kind() ==
                    Error::Kind::AddressParse);
        }
    }
}

TEST_CASE("Device queries", "[device]") {
    auto spy = std::make_shared<SpyTransport>();
    auto device = makeDevice(spy);

    SECTION("Device info is fetched with GET") {
        spy->reply = HttpTransport::Response{200, QByteArrayLiteral("<foo/>")};

        std::optional<Result<DeviceInfo>> result;
        device.queryDeviceInfo([&](Result<DeviceInfo> r) { result = r; });

        REQUIRE(spy->calls.size() == 1);
        REQUIRE(spy->calls[0].method == HttpTransport::Method::Get);
        REQUIRE(spy->calls[0].url.toString() ==
                QStringLiteral("http://203.0.113.5:8060/query/device-info"));
        REQUIRE(spy->calls[0].params.empty());
        REQUIRE(result.has_value());
        REQUIRE(std::holds_alternative<Error>(*result));
        REQUIRE(std::get<Error>(*result).kind() == Error::Kind::Decode);
    }

    SECTION("Apps are decoded") {
        spy->reply = HttpTransport::Response{
            200, QByteArrayLiteral("<apps><app id=\"12\" version=\"4.1.218\">"
                                   "Netflix</app><app id=\"837\">YouTube</app>"
                                   "</apps>")};

        std::optional<Result<AppList>> result;
        device.queryApps([&](Result<AppList> r) { result = r; });

        REQUIRE(spy->calls.size() == 1);
        REQUIRE(spy->calls[0].url.path() == QStringLiteral("/query/apps"));
        REQUIRE(result.has_value());
        REQUIRE(std::holds_alternative<AppList>(*result));
        REQUIRE(std::get<AppList>(*result).size() == 2);
        REQUIRE(std::get<AppList>(*result)[1].name ==
                QStringLiteral("YouTube"));
    }

    SECTION("Active app and media player endpoints") {
        spy->reply = HttpTransport::Response{
            200, QByteArrayLiteral("<active-app><app>Roku</app></active-app>")};

        std::optional<Result<ActiveApp>> active;
        device.queryActiveApp([&](Result<ActiveApp> r) { active = r; });

        spy->reply = HttpTransport::Response{
            200, QByteArrayLiteral("<player error=\"false\" state=\"pause\"/>")};

        std::optional<Result<MediaPlayer>> player;
        device.queryMediaPlayer([&](Result<MediaPlayer> r) { player = r; });

        REQUIRE(spy->calls.size() == 2);
        REQUIRE(spy->calls[0].url.path() ==
                QStringLiteral("/query/active-app"));
        REQUIRE(spy->calls[1].url.path() ==
                QStringLiteral("/query/media-player"));
        REQUIRE(std::holds_alternative<ActiveApp>(*active));
        REQUIRE(std::holds_alternative<MediaPlayer>(*player));
        REQUIRE(std::get<MediaPlayer>(*player).state ==
                QStringLiteral("pause"));
    }

    SECTION("Transport error is passed through") {
        spy->reply = Error{Error::Kind::Transport,
                           QStringLiteral("Connection refused")};

        std::optional<Result<AppList>> result;
        device.queryApps([&](Result<AppList> r) { result = r; });

        REQUIRE(result.has_value());
        REQUIRE(std::holds_alternative<Error>(*result));
        REQUIRE(std::get<Error>(*result).kind() == Error::Kind::Transport);
    }
}

TEST_CASE("Device commands", "[device]") {
    auto spy = std::make_shared<SpyTransport>();
    auto device = makeDevice(spy);

    std::optional<Status> status;
    auto done = [&](Status s) { status = s; };

    SECTION("Key presses are posted with the key token") {
        device.keyPress(Key::Lit('5'), done);
        device.keyDown(Key::VolumeMute, done);
        device.keyUp(Key::VolumeMute, done);

        REQUIRE(spy->calls.size() == 3);
        REQUIRE(spy->calls[0].method == HttpTransport::Method::Post);
        REQUIRE(spy->calls[0].url.toString() ==
                QStringLiteral("http://203.0.113.5:8060/keypress/Lit_5"));
        REQUIRE(spy->calls[1].url.path() ==
                QStringLiteral("/keydown/VolumeMute"));
        REQUIRE(spy->calls[2].url.path() ==
                QStringLiteral("/keyup/VolumeMute"));
        REQUIRE(status.has_value());
        REQUIRE_FALSE(status->has_value());
    }

    SECTION("Literal key stays a single path segment") {
        device.keyPress(Key::Lit('/'), done);

        REQUIRE(spy->calls.size() == 1);
        REQUIRE(spy->calls[0].url.path(QUrl::FullyEncoded) ==
                QStringLiteral("/keypress/Lit_%2F"));
    }

    SECTION("Literal key outside the BMP is sent as UTF-8") {
        device.keyPress(Key::Lit(U'\U0001F600'), done);

        REQUIRE(spy->calls.size() == 1);
        REQUIRE(spy->calls[0].url.path(QUrl::FullyEncoded) ==
                QStringLiteral("/keypress/Lit_%F0%9F%98%80"));
    }

    SECTION("Launch and install without app id make no request") {
        App app;
        app.name = QStringLiteral("Roku");

        device.launch(app, done);

        REQUIRE(spy->calls.empty());
        REQUIRE(status.has_value());
        REQUIRE(status->has_value());
        REQUIRE((*status)->kind() == Error::Kind::Argument);

        status.reset();
        device.install(app, done);

        REQUIRE(spy->calls.empty());
        REQUIRE(status.has_value());
        REQUIRE((*status)->kind() == Error::Kind::Argument);
    }

    SECTION("Launch and install with app id") {
        App app;
        app.id = QStringLiteral("12");
        app.name = QStringLiteral("Netflix");

        device.launch(app, done);
        device.install(app, done);

        REQUIRE(spy->calls.size() == 2);
        REQUIRE(spy->calls[0].method == HttpTransport::Method::Post);
        REQUIRE(spy->calls[0].url.path() == QStringLiteral("/launch/12"));
        REQUIRE(spy->calls[1].url.path() == QStringLiteral("/install/12"));
        REQUIRE_FALSE(status->has_value());
    }

    SECTION("Input pairs are passed verbatim") {
        std::vector<param> input{{QStringLiteral("acceleration.x"),
                                  QStringLiteral("0.0")},
                                 {QStringLiteral("touch.0.op"),
                                  QStringLiteral("down")}};

        device.sendInput(input, done);

        REQUIRE(spy->calls.size() == 1);
        REQUIRE(spy->calls[0].url.path() == QStringLiteral("/input"));
        REQUIRE(spy->calls[0].params == input);
    }

    SECTION("Search posts built parameters") {
        Search search{QStringLiteral("The Office")};
        search.type(Search::Type::TvShow).season(3);

        device.search(std::move(search), done);

        REQUIRE(spy->calls.size() == 1);
        REQUIRE(spy->calls[0].url.path() == QStringLiteral("/search"));
        REQUIRE(spy->calls[0].params.size() == 3);
        REQUIRE(spy->calls[0].params[0] ==
                param{QStringLiteral("keyword"), QStringLiteral("The Office")});
        REQUIRE(spy->calls[0].params[1] ==
                param{QStringLiteral("type"), QStringLiteral("tv-show")});
        REQUIRE(spy->calls[0].params[2] ==
                param{QStringLiteral("season"), QStringLiteral("3")});
    }

    SECTION("Command transport error is reported") {
        spy->reply = Error{Error::Kind::Transport,
                           QStringLiteral("unexpected HTTP status 404")};

        device.keyPress(Key::Home, done);

        REQUIRE(status.has_value());
        REQUIRE(status->has_value());
        REQUIRE((*status)->kind() == Error::Kind::Transport);
    }
}
