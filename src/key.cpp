/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "key.hpp"

namespace ecp {

Key Key::Lit(char32_t character) { return Key{character}; }

static QString nameToString(Key::Name name) {
    switch (name) {
        case Key::Back:
            return QStringLiteral("Back");
        case Key::Backspace:
            return QStringLiteral("Backspace");
        case Key::ChannelDown:
            return QStringLiteral("ChannelDown");
        case Key::ChannelUp:
            return QStringLiteral("ChannelUp");
        case Key::Down:
            return QStringLiteral("Down");
        case Key::Enter:
            return QStringLiteral("Enter");
        case Key::FindRemote:
            return QStringLiteral("FindRemote");
        case Key::Fwd:
            return QStringLiteral("Fwd");
        case Key::Home:
            return QStringLiteral("Home");
        case Key::Info:
            return QStringLiteral("Info");
        case Key::InputAV1:
            return QStringLiteral("InputAV1");
        case Key::InputHDMI1:
            return QStringLiteral("InputHDMI1");
        case Key::InputHDMI2:
            return QStringLiteral("InputHDMI2");
        case Key::InputHDMI3:
            return QStringLiteral("InputHDMI3");
        case Key::InputHDMI4:
            return QStringLiteral("InputHDMI4");
        case Key::InputTuner:
            return QStringLiteral("InputTuner");
        case Key::InstantReplay:
            return QStringLiteral("InstantReplay");
        case Key::Left:
            return QStringLiteral("Left");
        case Key::Play:
            return QStringLiteral("Play");
        case Key::PowerOff:
            return QStringLiteral("PowerOff");
        case Key::Rev:
            return QStringLiteral("Rev");
        case Key::Right:
            return QStringLiteral("Right");
        case Key::Search:
            return QStringLiteral("Search");
        case Key::Select:
            return QStringLiteral("Select");
        case Key::Up:
            return QStringLiteral("Up");
        case Key::VolumeDown:
            return QStringLiteral("VolumeDown");
        case Key::VolumeMute:
            return QStringLiteral("VolumeMute");
        case Key::VolumeUp:
            return QStringLiteral("VolumeUp");
    }
    return {};
}

QString Key::toString() const {
    if (const auto* c = std::get_if<char32_t>(&m_value)) {
        const uint ucs4 = *c;
        return QStringLiteral("Lit_") + QString::fromUcs4(&ucs4, 1);
    }
    return nameToString(std::get<Name>(m_value));
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
    os << key.toString().toStdString();
    return os;
}

}  // namespace ecp
