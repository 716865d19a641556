/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "settings.h"

#include <QStandardPaths>
#include <algorithm>

#include "qtlogger.hpp"

namespace ecp {

Settings* Settings::instance() {
    static Settings inst;
    return &inst;
}

QString Settings::settingsFilepath() {
    return QStandardPaths::writableLocation(QStandardPaths::ConfigLocation) +
           QStringLiteral("/ecpclient/") + QLatin1String(settingsFilename);
}

Settings::Settings(const QString& filepath, QObject* parent)
    : QSettings{filepath, QSettings::NativeFormat, parent} {}

void Settings::initLogger() const {
    Logger::init(getLogLevel(), getLogFile().toStdString());

    initQtLogger();

    LOGI("settings file: " << fileName());
}

Logger::Level Settings::getLogLevel() const {
    const auto name = getLogLevelName();
    if (auto level = Logger::levelFromName(name.toStdString())) return *level;

    LOGW("unknown log level: " << name);
    return Logger::Level::Error;
}

void Settings::setLogLevel(Logger::Level value) {
    if (getLogLevel() != value) {
        setValue(QStringLiteral("loglevel"),
                 QLatin1String(Logger::levelName(value)));
        emit logLevelChanged();

        Logger::setLevel(value);
    }
}

QString Settings::getLogLevelName() const {
    return value(QStringLiteral("loglevel"), QStringLiteral("error"))
        .toString()
        .trimmed()
        .toLower();
}

void Settings::setLogLevelName(const QString& value) {
    const auto name = value.trimmed().toLower();
    if (auto level = Logger::levelFromName(name.toStdString()))
        setLogLevel(*level);
    else
        LOGW("unknown log level: " << value);
}

QString Settings::getLogFile() const {
    return value(QStringLiteral("logfile"), QString{}).toString();
}

void Settings::setLogFile(const QString& value) {
    if (getLogFile() != value) {
        setValue(QStringLiteral("logfile"), value);
        emit logFileChanged();

        Logger::setFile(value.toStdString());
    }
}

bool Settings::getDiscoveryDeduplicate() const {
    return value(QStringLiteral("discovery/deduplicate"), false).toBool();
}

void Settings::setDiscoveryDeduplicate(bool value) {
    if (getDiscoveryDeduplicate() != value) {
        setValue(QStringLiteral("discovery/deduplicate"), value);
        emit discoveryDeduplicateChanged();
    }
}

int Settings::getHttpTimeout() const {
    return std::max(0, value(QStringLiteral("http/timeout"), 0).toInt());
}

void Settings::setHttpTimeout(int value) {
    if (getHttpTimeout() != value) {
        setValue(QStringLiteral("http/timeout"), value);
        emit httpTimeoutChanged();
    }
}

DiscoveryOptions Settings::discoveryOptions() const {
    DiscoveryOptions options;
    options.deduplicate = getDiscoveryDeduplicate();
    return options;
}

}  // namespace ecp
