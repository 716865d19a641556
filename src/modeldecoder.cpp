/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "modeldecoder.hpp"

#include <QDomDocument>
#include <QDomElement>
#include <QDomNode>
#include <QString>
#include <type_traits>
#include <variant>

#include "logger.hpp"

namespace ecp::decoder {

namespace {
class Reader {
   public:
    inline bool ok() const { return !m_error.has_value(); }
    inline Error error() const { return *m_error; }

    void fail(const QDomElement& e, const QString& msg) {
        if (!m_error)
            m_error.emplace(Error::Kind::Decode,
                            QStringLiteral("%1: %2").arg(e.tagName(), msg));
    }

    static std::optional<QString> lookup(const QDomElement& e,
                                         const QString& name) {
        if (e.hasAttribute(name)) return e.attribute(name);
        auto child = e.firstChildElement(name);
        if (!child.isNull()) return child.text();
        return std::nullopt;
    }

    // Text content of the element itself
    QString content(const QDomElement& e) {
        auto text = e.text();
        if (text.isEmpty()) fail(e, QStringLiteral("missing text content"));
        return text;
    }

    std::optional<QString> optString(const QDomElement& e,
                                     const QString& name) {
        return lookup(e, name);
    }

    QString string(const QDomElement& e, const QString& name) {
        auto value = lookup(e, name);
        if (!value) {
            fail(e, QStringLiteral("missing field %1").arg(name));
            return {};
        }
        return *value;
    }

    std::optional<bool> optBoolean(const QDomElement& e,
                                   const QString& name) {
        auto value = lookup(e, name);
        if (!value) return std::nullopt;
        if (*value == QLatin1String("true")) return true;
        if (*value == QLatin1String("false")) return false;
        fail(e, QStringLiteral("invalid boolean in field %1: %2")
                    .arg(name, *value));
        return std::nullopt;
    }

    bool boolean(const QDomElement& e, const QString& name) {
        if (!lookup(e, name)) {
            fail(e, QStringLiteral("missing field %1").arg(name));
            return false;
        }
        return optBoolean(e, name).value_or(false);
    }

    uint32_t uint32(const QDomElement& e, const QString& name) {
        auto value = string(e, name);
        if (!ok()) return 0;
        bool valid = false;
        auto number = value.trimmed().toUInt(&valid);
        if (!valid)
            fail(e, QStringLiteral("invalid unsigned integer in field %1: %2")
                        .arg(name, value));
        return number;
    }

    int32_t int32(const QDomElement& e, const QString& name) {
        auto value = string(e, name);
        if (!ok()) return 0;
        bool valid = false;
        auto number = value.trimmed().toInt(&valid);
        if (!valid)
            fail(e, QStringLiteral("invalid integer in field %1: %2")
                        .arg(name, value));
        return number;
    }

   private:
    std::optional<Error> m_error;
};

using DeviceInfoField =
    std::variant<QString DeviceInfo::*, std::optional<QString> DeviceInfo::*,
                 bool DeviceInfo::*, int32_t DeviceInfo::*,
                 uint32_t DeviceInfo::*>;

struct DeviceInfoMapping {
    const char* name;
    DeviceInfoField field;
    // Wire name when it does not follow the kebab-case name
    const char* alias = nullptr;

    inline QString wireName() const {
        return QString::fromLatin1(alias ? alias : name);
    }
};

const DeviceInfoMapping deviceInfoMappings[] = {
    {"advertising-id", &DeviceInfo::advertisingId},
    {"build-number", &DeviceInfo::buildNumber},
    {"can-use-wifi-extender", &DeviceInfo::canUseWifiExtender},
    {"clock-format", &DeviceInfo::clockFormat},
    {"country", &DeviceInfo::country},
    {"davinci-version", &DeviceInfo::davinciVersion},
    {"default-device-name", &DeviceInfo::defaultDeviceName},
    {"developer-enabled", &DeviceInfo::developerEnabled},
    {"device-id", &DeviceInfo::deviceId},
    {"ethernet-mac", &DeviceInfo::ethernetMac},
    {"find-remote-is-possible", &DeviceInfo::findRemoteIsPossible},
    {"friendly-device-name", &DeviceInfo::friendlyDeviceName},
    {"friendly-model-name", &DeviceInfo::friendlyModelName},
    {"grandcentral-version", &DeviceInfo::grandcentralVersion},
    {"has-mobile-screensaver", &DeviceInfo::hasMobileScreensaver},
    {"has-play-on-roku", &DeviceInfo::hasPlayOnRoku},
    {"has-wifi-5g-support", &DeviceInfo::hasWifi5gSupport,
     "has-wifi-5G-support"},
    {"has-wifi-extender", &DeviceInfo::hasWifiExtender},
    {"headphones-connected", &DeviceInfo::headphonesConnected},
    {"is-stick", &DeviceInfo::isStick},
    {"is-tv", &DeviceInfo::isTv},
    {"keyed-developer-id", &DeviceInfo::keyedDeveloperId},
    {"language", &DeviceInfo::language},
    {"locale", &DeviceInfo::locale},
    {"model-name", &DeviceInfo::modelName},
    {"model-number", &DeviceInfo::modelNumber},
    {"model-region", &DeviceInfo::modelRegion},
    {"network-name", &DeviceInfo::networkName},
    {"network-type", &DeviceInfo::networkType},
    {"notifications-enabled", &DeviceInfo::notificationsEnabled},
    {"notifications-first-use", &DeviceInfo::notificationsFirstUse},
    {"power-mode", &DeviceInfo::powerMode},
    {"search-channels-enabled", &DeviceInfo::searchChannelsEnabled},
    {"search-enabled", &DeviceInfo::searchEnabled},
    {"secure-device", &DeviceInfo::secureDevice},
    {"serial-number", &DeviceInfo::serialNumber},
    {"software-build", &DeviceInfo::softwareBuild},
    {"software-version", &DeviceInfo::softwareVersion},
    {"support-url", &DeviceInfo::supportUrl},
    {"supports-audio-guide", &DeviceInfo::supportsAudioGuide},
    {"supports-ecs-microphone", &DeviceInfo::supportsEcsMicrophone},
    {"supports-ecs-textedit", &DeviceInfo::supportsEcsTextedit},
    {"supports-ethernet", &DeviceInfo::supportsEthernet},
    {"supports-find-remote", &DeviceInfo::supportsFindRemote},
    {"supports-private-listening", &DeviceInfo::supportsPrivateListening},
    {"supports-rva", &DeviceInfo::supportsRva},
    {"supports-suspend", &DeviceInfo::supportsSuspend},
    {"supports-wake-on-wlan", &DeviceInfo::supportsWakeOnWlan},
    {"time-zone", &DeviceInfo::timeZone},
    {"time-zone-auto", &DeviceInfo::timeZoneAuto},
    {"time-zone-name", &DeviceInfo::timeZoneName},
    {"time-zone-offset", &DeviceInfo::timeZoneOffset},
    {"time-zone-tz", &DeviceInfo::timeZoneTz},
    {"udn", &DeviceInfo::udn},
    {"uptime", &DeviceInfo::uptime},
    {"user-device-location", &DeviceInfo::userDeviceLocation},
    {"user-device-name", &DeviceInfo::userDeviceName},
    {"vendor-name", &DeviceInfo::vendorName},
    {"voice-search-enabled", &DeviceInfo::voiceSearchEnabled},
    {"wifi-driver", &DeviceInfo::wifiDriver},
    {"wifi-mac", &DeviceInfo::wifiMac},
};
}  // namespace

static Result<QDomDocument> parse(const QByteArray& data,
                                  const QString& rootName) {
    QDomDocument doc;

    QString error;
    int line = 0;
    if (!doc.setContent(data, false, &error, &line)) {
        LOGW("parse error: " << error << ", line: " << line);
        return Error{Error::Kind::Decode,
                     QStringLiteral("malformed document (line %1): %2")
                         .arg(line)
                         .arg(error)};
    }

    if (auto root = doc.documentElement(); root.tagName() != rootName) {
        LOGW("unexpected root element: " << root.tagName());
        return Error{Error::Kind::Decode,
                     QStringLiteral("expected <%1> but got <%2>")
                         .arg(rootName, root.tagName())};
    }

    return doc;
}

static App readApp(Reader& reader, const QDomElement& e) {
    App app;
    app.id = reader.optString(e, QStringLiteral("id"));
    app.name = reader.content(e);
    app.type = reader.optString(e, QStringLiteral("type"));
    app.version = reader.optString(e, QStringLiteral("version"));
    return app;
}

Result<AppList> decodeApps(const QByteArray& data) {
    auto doc = parse(data, QStringLiteral("apps"));
    if (auto* err = std::get_if<Error>(&doc)) return *err;

    Reader reader;
    AppList apps;

    auto root = std::get<QDomDocument>(doc).documentElement();
    for (auto e = root.firstChildElement(QStringLiteral("app")); !e.isNull();
         e = e.nextSiblingElement(QStringLiteral("app"))) {
        apps.push_back(readApp(reader, e));
        if (!reader.ok()) return reader.error();
    }

    return apps;
}

Result<ActiveApp> decodeActiveApp(const QByteArray& data) {
    auto doc = parse(data, QStringLiteral("active-app"));
    if (auto* err = std::get_if<Error>(&doc)) return *err;

    Reader reader;
    ActiveApp active;

    auto root = std::get<QDomDocument>(doc).documentElement();

    auto app = root.firstChildElement(QStringLiteral("app"));
    if (app.isNull()) {
        reader.fail(root, QStringLiteral("missing field app"));
        return reader.error();
    }
    active.app = readApp(reader, app);

    if (auto e = root.firstChildElement(QStringLiteral("screensaver"));
        !e.isNull()) {
        Screensaver ss;
        ss.black = reader.optBoolean(e, QStringLiteral("black"));
        ss.id = reader.string(e, QStringLiteral("id"));
        ss.name = reader.content(e);
        ss.type = reader.string(e, QStringLiteral("type"));
        ss.version = reader.string(e, QStringLiteral("version"));
        active.screensaver = std::move(ss);
    }

    if (!reader.ok()) return reader.error();

    return active;
}

Result<MediaPlayer> decodeMediaPlayer(const QByteArray& data) {
    auto doc = parse(data, QStringLiteral("player"));
    if (auto* err = std::get_if<Error>(&doc)) return *err;

    Reader reader;
    MediaPlayer player;

    auto root = std::get<QDomDocument>(doc).documentElement();

    player.error = reader.boolean(root, QStringLiteral("error"));
    player.state = reader.string(root, QStringLiteral("state"));
    player.duration = reader.optString(root, QStringLiteral("duration"));
    player.isLive = reader.optBoolean(root, QStringLiteral("is_live"));
    player.position = reader.optString(root, QStringLiteral("position"));
    player.runtime = reader.optString(root, QStringLiteral("runtime"));

    if (auto e = root.firstChildElement(QStringLiteral("buffering"));
        !e.isNull()) {
        Buffering buffering;
        buffering.current = reader.uint32(e, QStringLiteral("current"));
        buffering.max = reader.uint32(e, QStringLiteral("max"));
        buffering.target = reader.uint32(e, QStringLiteral("target"));
        player.buffering = buffering;
    }

    if (auto e = root.firstChildElement(QStringLiteral("format"));
        !e.isNull()) {
        Format format;
        format.audio = reader.string(e, QStringLiteral("audio"));
        format.captions = reader.string(e, QStringLiteral("captions"));
        format.container = reader.string(e, QStringLiteral("container"));
        format.drm = reader.string(e, QStringLiteral("drm"));
        format.video = reader.string(e, QStringLiteral("video"));
        format.videoRes = reader.string(e, QStringLiteral("video_res"));
        player.format = std::move(format);
    }

    if (auto e = root.firstChildElement(QStringLiteral("new_stream"));
        !e.isNull()) {
        player.newStream = NewStream{reader.string(e, QStringLiteral("speed"))};
    }

    if (auto e = root.firstChildElement(QStringLiteral("plugin"));
        !e.isNull()) {
        Plugin plugin;
        plugin.bandwidth = reader.string(e, QStringLiteral("bandwidth"));
        plugin.id = reader.string(e, QStringLiteral("id"));
        plugin.name = reader.string(e, QStringLiteral("name"));
        player.plugin = std::move(plugin);
    }

    if (auto e = root.firstChildElement(QStringLiteral("stream_segment"));
        !e.isNull()) {
        StreamSegment segment;
        segment.bitrate = reader.uint32(e, QStringLiteral("bitrate"));
        segment.mediaSequence =
            reader.uint32(e, QStringLiteral("media_sequence"));
        segment.segmentType = reader.string(e, QStringLiteral("segment_type"));
        segment.time = reader.uint32(e, QStringLiteral("time"));
        player.streamSegment = std::move(segment);
    }

    if (!reader.ok()) return reader.error();

    return player;
}

Result<DeviceInfo> decodeDeviceInfo(const QByteArray& data) {
    auto doc = parse(data, QStringLiteral("device-info"));
    if (auto* err = std::get_if<Error>(&doc)) return *err;

    Reader reader;
    DeviceInfo info;

    auto root = std::get<QDomDocument>(doc).documentElement();

    for (const auto& mapping : deviceInfoMappings) {
        const auto name = mapping.wireName();
        std::visit(
            [&](auto member) {
                using T = std::decay_t<decltype(info.*member)>;
                if constexpr (std::is_same_v<T, QString>)
                    info.*member = reader.string(root, name);
                else if constexpr (std::is_same_v<T, std::optional<QString>>)
                    info.*member = reader.optString(root, name);
                else if constexpr (std::is_same_v<T, bool>)
                    info.*member = reader.boolean(root, name);
                else if constexpr (std::is_same_v<T, int32_t>)
                    info.*member = reader.int32(root, name);
                else if constexpr (std::is_same_v<T, uint32_t>)
                    info.*member = reader.uint32(root, name);
            },
            mapping.field);
        if (!reader.ok()) return reader.error();
    }

    return info;
}

}  // namespace ecp::decoder
