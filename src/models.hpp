/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_MODELS_H
#define ECP_MODELS_H

#include <QString>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace ecp {

// Query parameter, sent as key=value
using param = std::pair<QString, QString>;

struct App {
    // Absent for pseudo-apps that cannot be launched, e.g. the home screen
    std::optional<QString> id;
    QString name;
    std::optional<QString> type;
    std::optional<QString> version;
};

using AppList = std::vector<App>;

struct Screensaver {
    std::optional<bool> black;
    QString id;
    QString name;
    QString type;
    QString version;
};

struct ActiveApp {
    App app;
    std::optional<Screensaver> screensaver;
};

struct Plugin {
    QString bandwidth;
    QString id;
    QString name;
};

struct Format {
    QString audio;
    QString captions;
    QString container;
    QString drm;
    QString video;
    QString videoRes;
};

struct Buffering {
    uint32_t current = 0;
    uint32_t max = 0;
    uint32_t target = 0;
};

struct NewStream {
    QString speed;
};

struct StreamSegment {
    uint32_t bitrate = 0;
    uint32_t mediaSequence = 0;
    QString segmentType;
    uint32_t time = 0;
};

struct MediaPlayer {
    std::optional<Buffering> buffering;
    std::optional<QString> duration;
    bool error = false;
    std::optional<Format> format;
    std::optional<bool> isLive;
    std::optional<NewStream> newStream;
    std::optional<Plugin> plugin;
    std::optional<QString> position;
    std::optional<QString> runtime;
    QString state;
    std::optional<StreamSegment> streamSegment;
};

struct DeviceInfo {
    QString advertisingId;
    QString buildNumber;
    bool canUseWifiExtender = false;
    QString clockFormat;
    QString country;
    QString davinciVersion;
    QString defaultDeviceName;
    bool developerEnabled = false;
    QString deviceId;
    std::optional<QString> ethernetMac;
    bool findRemoteIsPossible = false;
    QString friendlyDeviceName;
    QString friendlyModelName;
    QString grandcentralVersion;
    bool hasMobileScreensaver = false;
    bool hasPlayOnRoku = false;
    bool hasWifi5gSupport = false;
    bool hasWifiExtender = false;
    bool headphonesConnected = false;
    bool isStick = false;
    bool isTv = false;
    QString keyedDeveloperId;
    QString language;
    QString locale;
    QString modelName;
    QString modelNumber;
    QString modelRegion;
    QString networkName;
    QString networkType;
    bool notificationsEnabled = false;
    bool notificationsFirstUse = false;
    QString powerMode;
    bool searchChannelsEnabled = false;
    bool searchEnabled = false;
    bool secureDevice = false;
    QString serialNumber;
    QString softwareBuild;
    QString softwareVersion;
    QString supportUrl;
    bool supportsAudioGuide = false;
    bool supportsEcsMicrophone = false;
    bool supportsEcsTextedit = false;
    bool supportsEthernet = false;
    bool supportsFindRemote = false;
    bool supportsPrivateListening = false;
    bool supportsRva = false;
    bool supportsSuspend = false;
    bool supportsWakeOnWlan = false;
    QString timeZone;
    bool timeZoneAuto = false;
    QString timeZoneName;
    int32_t timeZoneOffset = 0;
    QString timeZoneTz;
    QString udn;
    uint32_t uptime = 0;
    QString userDeviceLocation;
    QString userDeviceName;
    QString vendorName;
    bool voiceSearchEnabled = false;
    QString wifiDriver;
    QString wifiMac;
};

}  // namespace ecp

#endif  // ECP_MODELS_H
