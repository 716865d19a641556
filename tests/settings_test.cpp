/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "settings.h"

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <catch2/catch_test_macros.hpp>

using ecp::Logger;
using ecp::Settings;

TEST_CASE("Settings", "[settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("settings.conf"));

    SECTION("Defaults") {
        Settings settings{path};

        REQUIRE(settings.getLogLevel() == Logger::Level::Error);
        REQUIRE(settings.getLogLevelName() == QStringLiteral("error"));
        REQUIRE(settings.getLogFile().isEmpty());
        REQUIRE_FALSE(settings.getDiscoveryDeduplicate());
        REQUIRE(settings.getHttpTimeout() == 0);
        REQUIRE_FALSE(settings.discoveryOptions().deduplicate);
    }

    SECTION("Values are persisted") {
        {
            Settings settings{path};
            settings.setDiscoveryDeduplicate(true);
            settings.setLogLevel(Logger::Level::Debug);
            settings.setHttpTimeout(2500);
            settings.sync();
        }

        Settings settings{path};
        REQUIRE(settings.getDiscoveryDeduplicate());
        REQUIRE(settings.discoveryOptions().deduplicate);
        REQUIRE(settings.getHttpTimeout() == 2500);
        REQUIRE(settings.getLogLevel() == Logger::Level::Debug);
        REQUIRE(settings.getLogLevelName() == QStringLiteral("debug"));
    }

    SECTION("Invalid values fall back to defaults") {
        Settings settings{path};
        settings.setValue(QStringLiteral("loglevel"), QStringLiteral("loud"));
        settings.setValue(QStringLiteral("http/timeout"), -5);

        REQUIRE(settings.getLogLevel() == Logger::Level::Error);
        REQUIRE(settings.getHttpTimeout() == 0);
    }

    SECTION("Log level names are case insensitive") {
        Settings settings{path};
        settings.setLogLevelName(QStringLiteral("Warning"));

        REQUIRE(settings.getLogLevel() == Logger::Level::Warning);
    }

    SECTION("Settings directory is created only when writing") {
        const auto nested =
            dir.filePath(QStringLiteral("ecpclient/settings.conf"));
        {
            Settings settings{nested};
            REQUIRE(settings.getHttpTimeout() == 0);
            REQUIRE_FALSE(settings.getDiscoveryDeduplicate());
        }
        REQUIRE_FALSE(QDir{dir.filePath(QStringLiteral("ecpclient"))}.exists());

        {
            Settings settings{nested};
            settings.setHttpTimeout(1000);
            settings.sync();
        }
        REQUIRE(QFileInfo::exists(nested));
    }

    SECTION("Default path points to the config location") {
        REQUIRE(Settings::settingsFilepath().endsWith(
            QStringLiteral("/ecpclient/settings.conf")));
    }
}
