/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_SETTINGS_H
#define ECP_SETTINGS_H

#include <QObject>
#include <QSettings>
#include <QString>

#include "discovery.hpp"
#include "logger.hpp"

namespace ecp {

class Settings : public QSettings {
    Q_OBJECT
    Q_PROPERTY(QString logLevel READ getLogLevelName WRITE setLogLevelName
                   NOTIFY logLevelChanged)
    Q_PROPERTY(
        QString logFile READ getLogFile WRITE setLogFile NOTIFY logFileChanged)
    Q_PROPERTY(bool discoveryDeduplicate READ getDiscoveryDeduplicate WRITE
                   setDiscoveryDeduplicate NOTIFY discoveryDeduplicateChanged)
    Q_PROPERTY(int httpTimeout READ getHttpTimeout WRITE setHttpTimeout NOTIFY
                   httpTimeoutChanged)

   public:
    static constexpr const char* settingsFilename = "settings.conf";

    static Settings* instance();
    // Directory is created on first write, not here
    static QString settingsFilepath();

    explicit Settings(const QString& filepath = settingsFilepath(),
                      QObject* parent = nullptr);

    void initLogger() const;

    Logger::Level getLogLevel() const;
    void setLogLevel(Logger::Level value);
    QString getLogLevelName() const;
    void setLogLevelName(const QString& value);
    QString getLogFile() const;
    void setLogFile(const QString& value);
    bool getDiscoveryDeduplicate() const;
    void setDiscoveryDeduplicate(bool value);
    int getHttpTimeout() const;
    void setHttpTimeout(int value);

    DiscoveryOptions discoveryOptions() const;

   signals:
    void logLevelChanged();
    void logFileChanged();
    void discoveryDeduplicateChanged();
    void httpTimeoutChanged();
};

}  // namespace ecp

#endif  // ECP_SETTINGS_H
