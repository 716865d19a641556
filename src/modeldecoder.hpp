/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_MODELDECODER_H
#define ECP_MODELDECODER_H

#include <QByteArray>

#include "error.hpp"
#include "models.hpp"

namespace ecp {

/**
 * Decoders of ECP query responses.
 *
 * A scalar field is read from the attribute of the owning element with the
 * field's wire name or, when there is no such attribute, from the text of the
 * child element with that name. Missing required fields and malformed values
 * fail with Error::Kind::Decode.
 */
namespace decoder {
Result<AppList> decodeApps(const QByteArray& data);
Result<ActiveApp> decodeActiveApp(const QByteArray& data);
Result<MediaPlayer> decodeMediaPlayer(const QByteArray& data);
Result<DeviceInfo> decodeDeviceInfo(const QByteArray& data);
}  // namespace decoder

template <typename T>
struct Decoder;

template <>
struct Decoder<AppList> {
    static auto decode(const QByteArray& data) {
        return decoder::decodeApps(data);
    }
};

template <>
struct Decoder<ActiveApp> {
    static auto decode(const QByteArray& data) {
        return decoder::decodeActiveApp(data);
    }
};

template <>
struct Decoder<MediaPlayer> {
    static auto decode(const QByteArray& data) {
        return decoder::decodeMediaPlayer(data);
    }
};

template <>
struct Decoder<DeviceInfo> {
    static auto decode(const QByteArray& data) {
        return decoder::decodeDeviceInfo(data);
    }
};

}  // namespace ecp

#endif  // ECP_MODELDECODER_H
